#pragma once

#include "types/BackupPayload.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string_view>

namespace cuisine::backup {

// All-or-nothing validation of an untrusted backup document. Absent collections read as empty;
// a single bad element anywhere rejects the whole document. Unknown top-level keys are ignored.
[[nodiscard]] std::optional<types::BackupPayload> validateBackupImportPayload(const nlohmann::json& value);

// Parses JSON text first; text that is not JSON is rejected like any other invalid document.
[[nodiscard]] std::optional<types::BackupPayload> validateBackupImportText(std::string_view text);

}
