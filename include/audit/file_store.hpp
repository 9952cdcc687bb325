#pragma once

#include "audit/audit_store.hpp"

#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace llmshield {

/**
 * @brief JSON Lines audit store with size-based rotation
 *
 * Appends one JSON object per record. When the file reaches
 * max_file_size_bytes it is rotated: audit.jsonl -> audit.jsonl.1,
 * .1 -> .2, ... and anything beyond max_files is deleted. With
 * retention_days > 0, rotated files older than that are removed on rotation.
 *
 * Called under the AuditLogger write lock, no locking of its own.
 */
class FileAuditStore : public IAuditStore {
public:
    struct Config {
        std::string output_file = "audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
        int retention_days = 0;                             // 0 = keep
    };

    /// @throws ShieldError(STORE_ERROR) if the file cannot be opened
    explicit FileAuditStore(const Config& config);
    ~FileAuditStore() override;

    void write(const AuditRecord& record) override;
    void write_batch(const std::vector<AuditRecord>& records) override;
    void flush() override;
    void close() override;
    [[nodiscard]] std::string name() const override;

    /// Number of rotations performed (for stats/testing)
    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }

    /// Current file size in bytes
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void append_line(const std::string& line);
    void check_rotation();
    void rotate_file();
    void remove_expired();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace llmshield
