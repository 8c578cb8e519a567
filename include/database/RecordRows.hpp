#pragma once

#include "types/Dataset.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cuisine::database {

// One row of cuisine_records: an entity in storage form plus its place in the collection.
struct RecordRow {
    std::string collection;
    std::string id;
    int64_t position{0};
    std::string doc;

    bool operator==(const RecordRow&) const = default;
};

// Positions count from 0 within each collection, in record order.
std::vector<RecordRow> toRecordRows(const types::Dataset& data);

// Rows may arrive in any order; each collection is rebuilt by ascending position.
// Throws std::invalid_argument on an unknown collection name.
types::Dataset fromRecordRows(std::vector<RecordRow> rows);

}
