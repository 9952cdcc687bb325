#include "audit/memory_store.hpp"

namespace llmshield {

void MemoryAuditStore::write(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

void MemoryAuditStore::write_batch(const std::vector<AuditRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.insert(records_.end(), records.begin(), records.end());
    ++batch_count_;
}

void MemoryAuditStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++flush_count_;
}

void MemoryAuditStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

std::vector<AuditRecord> MemoryAuditStore::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t MemoryAuditStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t MemoryAuditStore::batch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_count_;
}

size_t MemoryAuditStore::flush_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_count_;
}

bool MemoryAuditStore::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace llmshield
