#pragma once

#include "audit/audit_store.hpp"

#include <cstddef>
#include <mutex>

namespace llmshield {

/**
 * @brief Test store: accumulates records for assertion
 */
class MemoryAuditStore : public IAuditStore {
public:
    void write(const AuditRecord& record) override;
    void write_batch(const std::vector<AuditRecord>& records) override;
    void flush() override;
    void close() override;
    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] std::vector<AuditRecord> records() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t batch_count() const;
    [[nodiscard]] size_t flush_count() const;
    [[nodiscard]] bool closed() const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
    size_t batch_count_ = 0;
    size_t flush_count_ = 0;
    bool closed_ = false;
};

} // namespace llmshield
