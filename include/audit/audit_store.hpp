#pragma once

#include "audit/audit_record.hpp"

#include <string>
#include <vector>

namespace llmshield {

/**
 * @brief Abstract interface for audit record destinations
 *
 * The AuditLogger serializes all calls, so implementations need no locking
 * of their own unless they are shared elsewhere. Failures are reported by
 * throwing; the logger catches and counts them.
 */
class IAuditStore {
public:
    virtual ~IAuditStore() = default;

    virtual void write(const AuditRecord& record) = 0;

    virtual void write_batch(const std::vector<AuditRecord>& records) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void close() = 0;

    /// Human-readable store name for logging (e.g. "file:/var/log/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace llmshield
