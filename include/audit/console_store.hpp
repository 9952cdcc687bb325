#pragma once

#include "audit/audit_store.hpp"

#include <iosfwd>
#include <mutex>

namespace llmshield {

/**
 * @brief Development store: one summary line per record
 *
 *   [LLM-Shield] BLOCK | 1.2ms | agent=- | 3f2a9c1b... [Ignore previous instructions]
 *
 * Writes to stderr by default so application output stays clean.
 */
class ConsoleAuditStore : public IAuditStore {
public:
    ConsoleAuditStore();
    explicit ConsoleAuditStore(std::ostream& out) : out_(out) {}

    void write(const AuditRecord& record) override;
    void write_batch(const std::vector<AuditRecord>& records) override;
    void flush() override;
    void close() override;
    [[nodiscard]] std::string name() const override { return "console"; }

    [[nodiscard]] static std::string format_line(const AuditRecord& record);

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace llmshield
