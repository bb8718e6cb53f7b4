// flowsema/basic/diagnostic_json.hpp - Machine-readable diagnostic output
#pragma once

#include <nlohmann/json.hpp>

#include "flowsema/basic/diagnostic.hpp"
#include "flowsema/basic/source_manager.hpp"

namespace flowsema
{

/**
 * One diagnostic as JSON:
 * ```json
 * {"code": "must-return", "severity": "error", "message": "...",
 *  "args": ["function"], "file": "main.bal",
 *  "range": {"startByte": 4, "endByte": 9, "startLine": 1, ...}}
 * ```
 * Line and column members are 0 when the file content is unknown.
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag, const SourceRegistry & sources);

/// {"diagnostics": [...], "errors": n, "warnings": n}
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags, const SourceRegistry & sources);

}  // namespace flowsema
