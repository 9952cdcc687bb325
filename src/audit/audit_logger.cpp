#include "audit/audit_logger.hpp"
#include "core/error.hpp"
#include "core/hash.hpp"
#include "core/utils.hpp"

#include <format>

namespace llmshield {

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditLogger::AuditLogger(std::shared_ptr<IAuditStore> store)
    : AuditLogger(std::move(store), Config{}) {}

AuditLogger::AuditLogger(std::shared_ptr<IAuditStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {
    if (!store_) {
        throw ShieldError(ErrorCategory::CONFIG_ERROR, "AuditLogger requires a store");
    }
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
    if (config_.flush_interval.count() <= 0) {
        throw ShieldError(ErrorCategory::CONFIG_ERROR,
            std::format("Audit flush interval must be positive, got {}ms",
                        config_.flush_interval.count()));
    }
    buffer_.reserve(config_.batch_size);

    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditLogger::writer_thread_func, this);
    utils::log::info(std::format("Audit logger started (store={}, batch={}, interval={}ms)",
        store_->name(), config_.batch_size, config_.flush_interval.count()));
}

AuditLogger::~AuditLogger() {
    close();
}

// ============================================================================
// Record Construction
// ============================================================================

AuditRecord AuditLogger::build_record(std::string_view input,
                                      const ScanResult& result,
                                      const ScanContext& context,
                                      const AuditExtras& extras) {
    AuditRecord record;
    record.id = utils::generate_uuid();
    record.timestamp = utils::now();
    record.session_id = context.session_id;
    record.agent_id = context.agent_id;
    if (!context.user_id.empty()) {
        record.user_id_hash = hash::sha256_hex(context.user_id).substr(0, 16);
    }

    record.request_type = context.tools.empty() ? RequestType::CHAT : RequestType::TOOL_CALL;
    record.input_hash = hash::sha256_hex(input);
    record.input_token_count = (input.size() + 3) / 4;
    record.model = extras.model;

    record.security_decision = result.decision;
    for (size_t i = 0; i < result.violations.size(); ++i) {
        if (i > 0) record.security_reason += "; ";
        record.security_reason += result.violations[i].message;
    }
    record.violations = result.violations;
    record.scan_duration = result.meta.scan_duration;

    record.output_token_count = extras.output_token_count;
    record.tools_called = extras.tools_called;
    record.cost_usd = extras.cost_usd;
    return record;
}

// ============================================================================
// Public Interface
// ============================================================================

bool AuditLogger::push(AuditRecord record) {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    if (!running_.load(std::memory_order_acquire)) {
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    buffer_.push_back(std::move(record));
    total_logged_.fetch_add(1, std::memory_order_relaxed);
    return buffer_.size() >= config_.batch_size;
}

void AuditLogger::log(std::string_view input, const ScanResult& result,
                      const ScanContext& context, const AuditExtras& extras) {
    if (push(build_record(input, result, context, extras))) {
        flush();
    }
}

void AuditLogger::enqueue(std::string_view input, const ScanResult& result,
                          const ScanContext& context, const AuditExtras& extras) {
    if (push(build_record(input, result, context, extras))) {
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            flush_requested_ = true;
        }
        flush_cv_.notify_one();
    }
}

void AuditLogger::flush() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    std::vector<AuditRecord> batch;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (buffer_.empty()) return;
        batch.swap(buffer_);
        buffer_.reserve(config_.batch_size);
    }

    try {
        store_->write_batch(batch);
        total_written_.fetch_add(batch.size(), std::memory_order_relaxed);
        flush_count_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        store_failures_.fetch_add(1, std::memory_order_relaxed);
        records_dropped_.fetch_add(batch.size(), std::memory_order_relaxed);
        utils::log::warn(std::format("Audit store '{}' failed, dropped {} records: {}",
                                     store_->name(), batch.size(), e.what()));
    }
}

void AuditLogger::close() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    {
        // Pairs with the predicate check in the writer
        std::lock_guard<std::mutex> lock(buffer_mutex_);
    }
    flush_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    flush();

    std::lock_guard<std::mutex> write_lock(write_mutex_);
    try {
        store_->flush();
        store_->close();
    } catch (const std::exception& e) {
        store_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Audit store '{}' failed to close: {}",
                                     store_->name(), e.what()));
    }
    utils::log::info(std::format("Audit logger closed ({} written, {} dropped)",
        total_written_.load(std::memory_order_relaxed),
        records_dropped_.load(std::memory_order_relaxed)));
}

size_t AuditLogger::buffered() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return buffer_.size();
}

AuditLogger::Stats AuditLogger::get_stats() const {
    return Stats{
        .total_logged = total_logged_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .store_failures = store_failures_.load(std::memory_order_relaxed),
        .records_dropped = records_dropped_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void AuditLogger::writer_thread_func() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(buffer_mutex_);
            flush_cv_.wait_for(lock, config_.flush_interval, [this] {
                return flush_requested_ || !running_.load(std::memory_order_acquire);
            });
            flush_requested_ = false;
            if (!running_.load(std::memory_order_acquire)) {
                // close() performs the final flush
                return;
            }
        }
        flush();
    }
}

} // namespace llmshield
