#pragma once

#include <vector>

namespace llmshield {

struct AnomalyResult {
    bool is_anomaly = false;
    double z_score = 0.0;
    double current_value = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;
};

/**
 * @brief Z-score check of a value against its history
 *
 * Fewer than 3 samples: never an anomaly (mean reported as the current value).
 * Zero deviation: anomaly iff the value differs from the constant mean, with an
 * infinite z-score. Otherwise anomaly iff z > threshold. Population statistics.
 */
[[nodiscard]] AnomalyResult detect_anomaly(double current_value,
                                           const std::vector<double>& history,
                                           double threshold = 2.5);

} // namespace llmshield
