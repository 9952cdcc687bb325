#include "finops/anomaly_detector.hpp"

#include <cmath>
#include <limits>
#include <numeric>

namespace llmshield {

AnomalyResult detect_anomaly(double current_value,
                             const std::vector<double>& history,
                             double threshold) {
    AnomalyResult result;
    result.current_value = current_value;

    if (history.size() < 3) {
        result.mean = current_value;
        return result;
    }

    const auto n = static_cast<double>(history.size());
    const double mean = std::accumulate(history.begin(), history.end(), 0.0) / n;

    double variance = 0.0;
    for (double v : history) {
        variance += (v - mean) * (v - mean);
    }
    variance /= n;

    result.mean = mean;
    result.std_dev = std::sqrt(variance);

    if (result.std_dev == 0.0) {
        result.is_anomaly = current_value != mean;
        result.z_score = result.is_anomaly ? std::numeric_limits<double>::infinity() : 0.0;
        return result;
    }

    result.z_score = (current_value - mean) / result.std_dev;
    result.is_anomaly = result.z_score > threshold;
    return result;
}

} // namespace llmshield
