#include "audit/file_store.hpp"
#include "audit/audit_json.hpp"
#include "core/error.hpp"

#include <filesystem>
#include <format>

namespace llmshield {

FileAuditStore::FileAuditStore(const Config& config)
    : config_(config) {
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw ShieldError(ErrorCategory::STORE_ERROR,
            "Failed to open audit file: " + config_.output_file);
    }

    // Determine current file size for size-based rotation
    std::error_code ec;
    auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileAuditStore::~FileAuditStore() {
    close();
}

void FileAuditStore::append_line(const std::string& line) {
    if (!file_stream_.is_open()) {
        throw ShieldError(ErrorCategory::STORE_ERROR,
            "Audit file is closed: " + config_.output_file);
    }
    check_rotation();
    file_stream_ << line << '\n';
    current_file_size_ += line.size() + 1;
    if (!file_stream_.good()) {
        throw ShieldError(ErrorCategory::STORE_ERROR,
            "Failed to write audit file: " + config_.output_file);
    }
}

void FileAuditStore::write(const AuditRecord& record) {
    append_line(to_json_string(record));
}

void FileAuditStore::write_batch(const std::vector<AuditRecord>& records) {
    for (const auto& r : records) {
        append_line(to_json_string(r));
    }
}

void FileAuditStore::flush() {
    file_stream_.flush();
}

void FileAuditStore::close() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileAuditStore::name() const {
    return "file:" + config_.output_file;
}

void FileAuditStore::check_rotation() {
    if (config_.max_file_size_bytes > 0 &&
        current_file_size_ >= config_.max_file_size_bytes) {
        rotate_file();
    }
}

void FileAuditStore::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    // Delete the oldest file if it exceeds max_files
    auto oldest = std::format("{}.{}", config_.output_file, config_.max_files);
    std::filesystem::remove(oldest, ec);

    // Shift existing rotated files: .N -> .N+1
    for (int i = config_.max_files - 1; i >= 1; --i) {
        auto old_name = std::format("{}.{}", config_.output_file, i);
        auto new_name = std::format("{}.{}", config_.output_file, i + 1);
        std::filesystem::rename(old_name, new_name, ec);
        // Ignore errors for missing files
    }

    // Rename current file -> .1
    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);

    remove_expired();

    // Reopen fresh file
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw ShieldError(ErrorCategory::STORE_ERROR,
            "Failed to reopen audit file after rotation: " + config_.output_file);
    }
    current_file_size_ = 0;
    ++rotation_count_;
}

void FileAuditStore::remove_expired() {
    if (config_.retention_days <= 0) return;

    namespace fs = std::filesystem;
    const auto cutoff = fs::file_time_type::clock::now()
        - std::chrono::hours(24 * config_.retention_days);

    for (int i = 1; i <= config_.max_files; ++i) {
        const auto path = std::format("{}.{}", config_.output_file, i);
        std::error_code ec;
        const auto mtime = fs::last_write_time(path, ec);
        if (!ec && mtime < cutoff) {
            fs::remove(path, ec);
        }
    }
}

} // namespace llmshield
