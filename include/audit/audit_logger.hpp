#pragma once

#include "audit/audit_record.hpp"
#include "audit/audit_store.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace llmshield {

/**
 * @brief Batched, best-effort audit writer
 *
 * Records are buffered in memory and handed to the store as one write_batch:
 *   - log():     synchronously, in the caller's thread, once the buffer
 *                reaches batch_size
 *   - enqueue(): never touches the store; wakes the background writer once
 *                the buffer reaches batch_size
 *   - every flush_interval, from the background writer thread
 *
 * Store failures never reach the caller: they are logged, counted, and the
 * batch is dropped. close() stops the writer exactly once, performs a final
 * flush and closes the store. Records logged after close() are discarded.
 *
 * Architecture:
 *   [scan threads] --enqueue()--> [buffer] --timer / batch--> [writer] --> IAuditStore
 */
class AuditLogger {
public:
    struct Config {
        size_t batch_size = 100;
        std::chrono::milliseconds flush_interval{1000};
    };

    /// Starts the background writer immediately
    explicit AuditLogger(std::shared_ptr<IAuditStore> store);
    AuditLogger(std::shared_ptr<IAuditStore> store, const Config& config);
    ~AuditLogger();

    // Non-copyable, non-movable (owns the writer thread)
    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;
    AuditLogger(AuditLogger&&) = delete;
    AuditLogger& operator=(AuditLogger&&) = delete;

    [[nodiscard]] static AuditRecord build_record(std::string_view input,
                                                  const ScanResult& result,
                                                  const ScanContext& context,
                                                  const AuditExtras& extras = {});

    void log(std::string_view input, const ScanResult& result,
             const ScanContext& context, const AuditExtras& extras = {});

    void enqueue(std::string_view input, const ScanResult& result,
                 const ScanContext& context, const AuditExtras& extras = {});

    /// Write everything buffered. No-op on an empty buffer.
    void flush();

    void close();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t buffered() const;

    struct Stats {
        uint64_t total_logged;       ///< Records accepted into the buffer
        uint64_t total_written;      ///< Records handed to the store successfully
        uint64_t flush_count;        ///< Successful write_batch calls
        uint64_t store_failures;     ///< Failed store calls
        uint64_t records_dropped;    ///< Lost to store failures or logged after close
    };

    [[nodiscard]] Stats get_stats() const;

private:
    /// Buffer one record; returns true when the buffer reached batch_size
    bool push(AuditRecord record);
    void writer_thread_func();

    std::shared_ptr<IAuditStore> store_;
    Config config_;

    std::vector<AuditRecord> buffer_;
    mutable std::mutex buffer_mutex_;
    std::mutex write_mutex_;            // Serializes store calls

    std::thread writer_thread_;
    std::atomic<bool> running_{false};
    std::condition_variable flush_cv_;
    bool flush_requested_ = false;      // Guarded by buffer_mutex_

    std::atomic<uint64_t> total_logged_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> store_failures_{0};
    std::atomic<uint64_t> records_dropped_{0};
};

} // namespace llmshield
