#pragma once

#include "audit/audit_record.hpp"
#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <string>

namespace llmshield {

// glz::json_t builders. Field names are snake_case; absent optionals are
// omitted. Durations are emitted in milliseconds as floating point.

[[nodiscard]] glz::json_t to_json(const Violation& v);
[[nodiscard]] glz::json_t to_json(const ScanMeta& m);
[[nodiscard]] glz::json_t to_json(const ScanResult& r);
[[nodiscard]] glz::json_t to_json(const AuditRecord& r);

/// Compact single-line JSON
/// @throws ShieldError (INTERNAL_ERROR) if glaze fails to serialize
[[nodiscard]] std::string dump_json(const glz::json_t& j);

template<typename T>
[[nodiscard]] std::string to_json_string(const T& value) {
    return dump_json(to_json(value));
}

} // namespace llmshield
