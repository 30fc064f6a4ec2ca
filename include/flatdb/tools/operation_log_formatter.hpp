#pragma once

#include "flatdb/engine/engine_telemetry.hpp"

#include <string>

namespace flatdb::tools {

// One JSON object without a trailing newline, suitable for JSON Lines output.
[[nodiscard]] std::string format_operation_log_json(const flatdb::engine::OperationRecord& record);

}  // namespace flatdb::tools
