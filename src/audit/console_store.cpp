#include "audit/console_store.hpp"

#include <format>
#include <iostream>

namespace llmshield {

ConsoleAuditStore::ConsoleAuditStore() : out_(std::cerr) {}

std::string ConsoleAuditStore::format_line(const AuditRecord& record) {
    const char* tag = "ALLOW";
    switch (record.security_decision) {
        case Decision::BLOCK: tag = "BLOCK"; break;
        case Decision::WARN:  tag = "WARN "; break;
        case Decision::ALLOW: tag = "ALLOW"; break;
    }

    std::string violations;
    if (!record.violations.empty()) {
        violations = " [";
        for (size_t i = 0; i < record.violations.size(); ++i) {
            if (i > 0) violations += ", ";
            violations += record.violations[i].message;
        }
        violations += ']';
    }

    const double ms = static_cast<double>(record.scan_duration.count()) / 1000.0;
    return std::format("[LLM-Shield] {} | {:.1f}ms | agent={} | {}...{}",
        tag, ms,
        record.agent_id.empty() ? "-" : record.agent_id,
        record.input_hash.substr(0, 8),
        violations);
}

void ConsoleAuditStore::write(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << format_line(record) << '\n';
}

void ConsoleAuditStore::write_batch(const std::vector<AuditRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : records) {
        out_ << format_line(r) << '\n';
    }
}

void ConsoleAuditStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

void ConsoleAuditStore::close() {
    flush();
}

} // namespace llmshield
