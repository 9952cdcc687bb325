#pragma once

#include "scanner/iscanner.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief Runs scanners in registration order and aggregates their results
 *
 * - Violations are concatenated in chain order.
 * - Sanitization composes: a scanner's rewritten text feeds the next one.
 * - The running decision only escalates (ALLOW < WARN < BLOCK).
 * - With early exit (default), iteration stops once the running decision
 *   is BLOCK; later scanners never run and are absent from scanners_run.
 *
 * A scanner that throws aborts the chain with ShieldError(SCANNER_ERROR).
 *
 * Input larger than max_input_bytes is blocked with a content_policy
 * violation before any scanner runs.
 */
class ScannerChain {
public:
    struct Config {
        bool early_exit = true;
        size_t max_input_bytes = 0;     // 0 = unlimited
    };

    ScannerChain() : ScannerChain(Config{}) {}
    explicit ScannerChain(const Config& config) : config_(config) {}

    ScannerChain& add(std::shared_ptr<const IScanner> scanner);

    [[nodiscard]] ScanResult run(std::string_view input, const ScanContext& context) const;

    [[nodiscard]] size_t size() const { return scanners_.size(); }
    [[nodiscard]] bool early_exit() const { return config_.early_exit; }
    [[nodiscard]] size_t max_input_bytes() const { return config_.max_input_bytes; }
    [[nodiscard]] std::vector<std::string> scanner_names() const;

private:
    Config config_;
    std::vector<std::shared_ptr<const IScanner>> scanners_;
};

} // namespace llmshield
