#pragma once

#include "types/Dataset.hpp"

namespace cuisine::storage {

// Local collection store. bulkReplace must be all-or-nothing: no reader may observe a state
// where only some collections were replaced. A record id repeated within one collection
// throws and leaves the stored data untouched.
class DataStore {
public:
    virtual ~DataStore() = default;

    [[nodiscard]] virtual types::Dataset getAll() const = 0;

    virtual void bulkReplace(const types::Dataset& data) = 0;

    virtual void clear() = 0;
};

}
