#pragma once

#include "storage/DataStore.hpp"
#include "types/BackupPayload.hpp"
#include "util/timestamp.hpp"

#include <memory>

namespace cuisine::backup {

class PayloadBuilder {
public:
    explicit PayloadBuilder(std::shared_ptr<storage::DataStore> store, util::Clock clock = util::systemClock);

    // Current dataset as an export-ready payload (version 1, exportedAt = now).
    [[nodiscard]] types::BackupPayload build() const;

    // Drops product photos, invoice page images and the OCR API key.
    [[nodiscard]] static types::Dataset stripForExport(types::Dataset data);

private:
    std::shared_ptr<storage::DataStore> store_;
    util::Clock clock_;
};

}
