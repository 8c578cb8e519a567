#include "types/Task.hpp"
#include "types/json_util.hpp"

#include <stdexcept>

using namespace cuisine::types::json_util;

namespace cuisine::types {

std::string to_string(const TaskCategory category) {
    switch (category) {
        case TaskCategory::Entrees: return "entrees";
        case TaskCategory::Plats: return "plats";
        case TaskCategory::Desserts: return "desserts";
        case TaskCategory::MiseEnPlace: return "mise_en_place";
        case TaskCategory::Nettoyage: return "nettoyage";
        case TaskCategory::Commandes: return "commandes";
        case TaskCategory::Autre: return "autre";
        default: throw std::invalid_argument("Unknown TaskCategory enum value");
    }
}

std::string to_string(const TaskPriority priority) {
    switch (priority) {
        case TaskPriority::High: return "high";
        case TaskPriority::Normal: return "normal";
        case TaskPriority::Low: return "low";
        default: throw std::invalid_argument("Unknown TaskPriority enum value");
    }
}

std::string to_string(const Recurrence recurrence) {
    switch (recurrence) {
        case Recurrence::Daily: return "daily";
        case Recurrence::Weekly: return "weekly";
        default: throw std::invalid_argument("Unknown Recurrence enum value");
    }
}

std::optional<TaskCategory> task_category_from_string(const std::string_view str) {
    if (str == "entrees") return TaskCategory::Entrees;
    if (str == "plats") return TaskCategory::Plats;
    if (str == "desserts") return TaskCategory::Desserts;
    if (str == "mise_en_place") return TaskCategory::MiseEnPlace;
    if (str == "nettoyage") return TaskCategory::Nettoyage;
    if (str == "commandes") return TaskCategory::Commandes;
    if (str == "autre") return TaskCategory::Autre;
    return std::nullopt;
}

std::optional<TaskPriority> task_priority_from_string(const std::string_view str) {
    if (str == "high") return TaskPriority::High;
    if (str == "normal") return TaskPriority::Normal;
    if (str == "low") return TaskPriority::Low;
    return std::nullopt;
}

std::optional<Recurrence> recurrence_from_string(const std::string_view str) {
    if (str == "daily") return Recurrence::Daily;
    if (str == "weekly") return Recurrence::Weekly;
    return std::nullopt;
}

template <typename E>
static E require(const std::optional<E>& value, const std::string& raw, const char* what) {
    if (!value) throw std::invalid_argument(std::string("Invalid ") + what + " string: " + raw);
    return *value;
}

void to_json(nlohmann::json& j, const Task& t) {
    j = {
        {"id", t.id},
        {"title", t.title},
        {"category", to_string(t.category)},
        {"priority", to_string(t.priority)},
        {"completed", t.completed},
        {"recurring", t.recurring ? nlohmann::json(to_string(*t.recurring)) : nlohmann::json(nullptr)},
        {"createdAt", timestamp(t.created_at)},
        {"archived", t.archived},
        {"order", t.order}
    };
    put_optional(j, "estimatedTime", t.estimated_time);
    put_optional(j, "notes", t.notes);
    put_optional(j, "completedAt", t.completed_at);
}

void from_json(const nlohmann::json& j, Task& t) {
    t.id = j.at("id").get<std::string>();
    t.title = j.at("title").get<std::string>();

    const auto category = j.at("category").get<std::string>();
    t.category = require(task_category_from_string(category), category, "TaskCategory");
    const auto priority = j.at("priority").get<std::string>();
    t.priority = require(task_priority_from_string(priority), priority, "TaskPriority");

    t.completed = j.at("completed").get<bool>();
    t.estimated_time = get_optional<double>(j, "estimatedTime");
    t.notes = get_optional<std::string>(j, "notes");

    if (const auto recurring = get_optional<std::string>(j, "recurring"))
        t.recurring = require(recurrence_from_string(*recurring), *recurring, "Recurrence");
    else
        t.recurring.reset();

    t.created_at = get_timestamp(j, "createdAt");
    t.completed_at = get_optional_timestamp(j, "completedAt");
    t.archived = j.at("archived").get<bool>();
    t.order = j.at("order").get<int64_t>();
}

}
