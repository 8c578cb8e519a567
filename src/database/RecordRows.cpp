#include "database/RecordRows.hpp"

#include <algorithm>
#include <array>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace cuisine::types;

namespace cuisine::database {

std::vector<RecordRow> toRecordRows(const Dataset& data) {
    std::vector<RecordRow> rows;
    rows.reserve(data.totalRecords());

    for (const auto c : ALL_COLLECTIONS) {
        const auto name = to_string(c);
        int64_t position = 0;
        for (const auto& doc : collectionToJson(data, c)) {
            rows.push_back({
                .collection = name,
                .id = doc.at("id").get<std::string>(),
                .position = position++,
                .doc = doc.dump()
            });
        }
    }
    return rows;
}

Dataset fromRecordRows(std::vector<RecordRow> rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const RecordRow& a, const RecordRow& b) {
        return a.position < b.position;
    });

    std::array<nlohmann::json, ALL_COLLECTIONS.size()> docs;
    docs.fill(nlohmann::json::array());

    for (const auto& row : rows) {
        const auto c = collection_from_string(row.collection);
        if (!c) throw std::invalid_argument("Unknown collection in cuisine_records: " + row.collection);
        docs[static_cast<size_t>(*c)].push_back(nlohmann::json::parse(row.doc));
    }

    Dataset data;
    for (const auto c : ALL_COLLECTIONS) collectionFromJson(data, c, docs[static_cast<size_t>(c)]);
    return data;
}

}
