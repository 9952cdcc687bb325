#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace llmshield {

/// USD per one million tokens
struct ModelPricing {
    double input_per_1m = 0.0;
    double output_per_1m = 0.0;
};

/**
 * @brief Model price table
 *
 * Lookup order: exact model name, then the longest registered name that is a
 * prefix of the model (dated snapshots such as "gpt-4o-2024-08-06"), then the
 * fallback rate.
 */
class PricingTable {
public:
    static constexpr ModelPricing kFallback{0.15, 0.60};

    /// Built-in OpenAI and Anthropic prices plus aliases
    PricingTable();

    void set(std::string model, ModelPricing pricing);

    [[nodiscard]] ModelPricing lookup(std::string_view model) const;

    [[nodiscard]] double estimate_cost(std::string_view model,
                                       uint64_t input_tokens,
                                       uint64_t output_tokens) const;

    [[nodiscard]] const std::map<std::string, ModelPricing, std::less<>>& entries() const {
        return prices_;
    }

    [[nodiscard]] static const PricingTable& builtin();

private:
    std::map<std::string, ModelPricing, std::less<>> prices_;
};

/// Cost against the built-in table
[[nodiscard]] double estimate_cost(std::string_view model,
                                   uint64_t input_tokens,
                                   uint64_t output_tokens);

} // namespace llmshield
