#include "backup/PayloadBuilder.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::types;
using namespace cuisine::logging;

namespace cuisine::backup {

PayloadBuilder::PayloadBuilder(std::shared_ptr<storage::DataStore> store, util::Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) throw std::invalid_argument("PayloadBuilder requires a data store");
    if (!clock_) throw std::invalid_argument("PayloadBuilder requires a clock");
}

Dataset PayloadBuilder::stripForExport(Dataset data) {
    for (auto& p : data.product_traces) p.photo.reset();
    for (auto& i : data.invoices) i.images.clear();
    for (auto& s : data.settings) s.ocr_api_key.reset();
    return data;
}

BackupPayload PayloadBuilder::build() const {
    BackupPayload payload{
        .version = CURRENT_BACKUP_VERSION,
        .exported_at = clock_(),
        .data = stripForExport(store_->getAll())
    };

    LogRegistry::backup()->debug("[PayloadBuilder::build] Built payload with {} records", payload.data.totalRecords());
    return payload;
}

}
