#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cuisine::types {

enum class TaskCategory { Entrees, Plats, Desserts, MiseEnPlace, Nettoyage, Commandes, Autre };
enum class TaskPriority { High, Normal, Low };
enum class Recurrence { Daily, Weekly };

std::string to_string(TaskCategory category);
std::string to_string(TaskPriority priority);
std::string to_string(Recurrence recurrence);

std::optional<TaskCategory> task_category_from_string(std::string_view str);
std::optional<TaskPriority> task_priority_from_string(std::string_view str);
std::optional<Recurrence> recurrence_from_string(std::string_view str);

struct Task {
    std::string id;
    std::string title;
    TaskCategory category{TaskCategory::Autre};
    TaskPriority priority{TaskPriority::Normal};
    bool completed{false};
    std::optional<double> estimated_time;        // minutes
    std::optional<std::string> notes;
    std::optional<Recurrence> recurring;         // nullopt == one-off task, serialized as null
    util::Timestamp created_at{};
    std::optional<util::Timestamp> completed_at;
    bool archived{false};
    int64_t order{0};

    bool operator==(const Task&) const = default;
};

void to_json(nlohmann::json& j, const Task& t);
void from_json(const nlohmann::json& j, Task& t);

}
