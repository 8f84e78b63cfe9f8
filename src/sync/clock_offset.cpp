// Clock Offset Estimation Implementation
#include "sync/clock_offset.hpp"
#include "core/errors.hpp"
#include "math/signal_math.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>

namespace kam {

LagEstimate estimate_lag(const VectorXd& reference,
                         const VectorXd& other,
                         int max_lag,
                         int min_overlap) {
    const auto n_ref = static_cast<int>(reference.size());
    const auto n_other = static_cast<int>(other.size());

    LagEstimate best;
    bool found = false;

    for (int lag = -max_lag; lag <= max_lag; lag++) {
        // Overlapping reference indices i with 0 <= i + lag < n_other
        const int begin = std::max(0, -lag);
        const int end = std::min(n_ref, n_other - lag);
        const int count = end - begin;
        if (count < min_overlap) {
            continue;
        }

        const double rho = pearson_correlation(reference.segment(begin, count),
                                               other.segment(begin + lag, count));
        if (!found || rho > best.correlation) {
            best.lag_samples = lag;
            best.correlation = rho;
            found = true;
        }
    }

    if (!found) {
        throw SynchronizationError("Cross-correlation: no lag with at least " +
                                   std::to_string(min_overlap) + " overlapping samples");
    }
    return best;
}

namespace {

std::vector<int> field_columns(const ConditionedStream& stream, const std::vector<std::string>& fields) {
    std::vector<int> columns;
    for (const auto& field : fields) {
        auto it = std::find(stream.channel_names.begin(), stream.channel_names.end(), field);
        if (it == stream.channel_names.end()) {
            throw SynchronizationError("Stream " + stream.sensor_id + " has no channel " + field);
        }
        columns.push_back(static_cast<int>(it - stream.channel_names.begin()));
    }
    return columns;
}

}  // namespace

double estimate_clock_offset_s(const ConditionedStream& reference,
                               const std::vector<std::string>& reference_fields,
                               const ConditionedStream& other,
                               const std::vector<std::string>& other_fields,
                               double max_lag_s) {
    if (reference.segments.empty() || other.segments.empty()) {
        throw SynchronizationError("Clock offset: stream without valid segments");
    }

    const UniformSegment& ref_seg = reference.segments.front();
    const UniformSegment& other_seg = other.segments.front();
    const double rate = ref_seg.rate_hz;

    const VectorXd ref_signal = row_norm(ref_seg.samples, field_columns(reference, reference_fields));

    // Other signal on its own clock, resampled to the reference rate
    VectorXd other_signal = row_norm(other_seg.samples, field_columns(other, other_fields));
    if (std::abs(other_seg.rate_hz - rate) > 1e-9) {
        const VectorXd src_times = uniform_grid(0.0, other_seg.rate_hz, other_seg.num_samples());
        const Eigen::Index count = grid_point_count(0.0, other_seg.duration_s(), rate);
        const VectorXd dst_times = uniform_grid(0.0, rate, count);
        other_signal = interpolate_rows(src_times, other_signal, dst_times).col(0);
    }

    const int max_lag = static_cast<int>(std::lround(max_lag_s * rate));
    const LagEstimate lag = estimate_lag(ref_signal, other_signal, max_lag);

    const double offset = (ref_seg.start_s - other_seg.start_s) - lag.lag_samples / rate;

    LOG_INFO("Clock offset %s -> %s: lag %d samples, rho=%.3f, offset=%.4f s",
             other.sensor_id.c_str(), reference.sensor_id.c_str(),
             lag.lag_samples, lag.correlation, offset);

    return offset;
}

}  // namespace kam
