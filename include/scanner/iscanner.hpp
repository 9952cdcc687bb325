#pragma once

#include "core/types.hpp"
#include <string_view>

namespace llmshield {

/**
 * @brief Abstract scanner interface
 *
 * Each scanner in the chain implements this interface. Scanners are
 * stateless between calls and safe to run concurrently on independent
 * inputs.
 *
 * Result semantics:
 * - decision:   ALLOW, WARN or BLOCK for this scanner alone
 * - violations: findings, appended to the chain aggregate in order
 * - sanitized:  set only when the scanner rewrote the text; the rewritten
 *               text is what the next scanner sees
 */
class IScanner {
public:
    virtual ~IScanner() = default;

    [[nodiscard]] virtual ScannerResult scan(std::string_view input,
                                             const ScanContext& context) const = 0;

    /// Scanner name recorded in violations and ScanMeta::scanners_run
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace llmshield
