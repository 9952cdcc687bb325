#include "scanner/scanner_chain.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace llmshield {

ScannerChain& ScannerChain::add(std::shared_ptr<const IScanner> scanner) {
    if (!scanner) {
        throw ShieldError(ErrorCategory::CONFIG_ERROR, "Cannot add a null scanner to the chain");
    }
    scanners_.push_back(std::move(scanner));
    return *this;
}

std::vector<std::string> ScannerChain::scanner_names() const {
    std::vector<std::string> names;
    names.reserve(scanners_.size());
    for (const auto& s : scanners_) {
        names.emplace_back(s->name());
    }
    return names;
}

ScanResult ScannerChain::run(std::string_view input, const ScanContext& context) const {
    const utils::Timer timer;

    ScanResult result;
    result.sanitized = std::string(input);

    if (config_.max_input_bytes > 0 && input.size() > config_.max_input_bytes) {
        result.violations.push_back(Violation{
            .type = ViolationType::CONTENT_POLICY,
            .scanner = "chain",
            .score = static_cast<double>(input.size()),
            .threshold = static_cast<double>(config_.max_input_bytes),
            .message = "Input exceeds maximum size",
            .detail = std::format("{} bytes, limit {}", input.size(), config_.max_input_bytes),
        });
        result.decision = Decision::BLOCK;
        result.safe = false;
        result.meta.scan_duration = timer.elapsed_us();
        return result;
    }

    Decision running = Decision::ALLOW;

    for (const auto& scanner : scanners_) {
        ScannerResult sr;
        try {
            sr = scanner->scan(result.sanitized, context);
        } catch (const ShieldError&) {
            throw;
        } catch (const std::exception& e) {
            throw ShieldError(ErrorCategory::SCANNER_ERROR,
                std::format("Scanner '{}' failed: {}", scanner->name(), e.what()));
        }
        result.meta.scanners_run.emplace_back(scanner->name());

        for (auto& v : sr.violations) {
            result.violations.push_back(std::move(v));
        }

        if (sr.sanitized) {
            result.sanitized = std::move(*sr.sanitized);
        }

        running = escalate(running, sr.decision);

        if (config_.early_exit && running == Decision::BLOCK) {
            break;
        }
    }

    result.decision = running;
    result.safe = (running == Decision::ALLOW);
    result.meta.scan_duration = timer.elapsed_us();
    result.meta.cached = false;
    return result;
}

} // namespace llmshield
