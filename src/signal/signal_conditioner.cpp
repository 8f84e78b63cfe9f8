// Signal Conditioner Implementation
#include "signal/signal_conditioner.hpp"
#include "core/errors.hpp"
#include "filter/butterworth.hpp"
#include "math/signal_math.hpp"
#include "utils/logger.hpp"

#include <optional>
#include <stdexcept>

namespace kam {

SignalConditioner::SignalConditioner(const ConditionerConfig& config)
    : config_(config) {

    if (config_.target_rate_hz < 0.0) {
        throw std::invalid_argument("target_rate_hz must be >= 0");
    }
    if (config_.filter_order < 1) {
        throw std::invalid_argument("filter_order must be >= 1");
    }
    if (config_.max_gap_s <= 0.0) {
        throw std::invalid_argument("max_gap_s must be > 0");
    }
    if (config_.min_samples < 2) {
        throw std::invalid_argument("min_samples must be >= 2 for interpolation");
    }
}

void SignalConditioner::validate(const SensorStream& stream) const {
    if (static_cast<size_t>(stream.samples.rows()) != stream.timestamps_ns.size() ||
        static_cast<size_t>(stream.samples.cols()) != stream.channel_names.size()) {
        throw PipelineError("Stream " + stream.sensor_id + ": sample matrix shape does not match " +
                            "timestamps/channels");
    }
    if (!stream.channel_units.empty() && stream.channel_units.size() != stream.channel_names.size()) {
        throw PipelineError("Stream " + stream.sensor_id + ": one unit per channel required");
    }
    if (!stream.timestamps_strictly_increasing()) {
        throw PipelineError("Stream " + stream.sensor_id + ": timestamps not strictly increasing");
    }
}

SensorStream SignalConditioner::to_si_units(const SensorStream& stream) {
    SensorStream out = stream;
    for (size_t c = 0; c < out.channel_units.size(); c++) {
        const auto col = static_cast<Eigen::Index>(c);
        switch (out.channel_units[c]) {
            case Unit::StandardGravity:
                out.samples.col(col) *= GRAVITY;
                out.channel_units[c] = Unit::MetersPerSecondSq;
                break;
            case Unit::DegreesPerSecond:
                out.samples.col(col) *= DEG_TO_RAD;
                out.channel_units[c] = Unit::RadiansPerSecond;
                break;
            default:
                break;
        }
    }
    return out;
}

std::vector<std::pair<size_t, size_t>> SignalConditioner::split_at_gaps(const SensorStream& stream) const {
    std::vector<std::pair<size_t, size_t>> ranges;
    const size_t n = stream.num_samples();
    if (n == 0) {
        return ranges;
    }

    size_t begin = 0;
    for (size_t i = 1; i < n; i++) {
        const double dt = ns_to_seconds(stream.timestamps_ns[i] - stream.timestamps_ns[i - 1]);
        if (dt > config_.max_gap_s) {
            ranges.emplace_back(begin, i);
            begin = i;
        }
    }
    ranges.emplace_back(begin, n);
    return ranges;
}

UniformSegment SignalConditioner::resample_segment(const SensorStream& stream,
                                                   size_t begin, size_t end,
                                                   double rate_hz) const {
    const auto count = static_cast<Eigen::Index>(end - begin);

    // Times relative to the segment start keep full double precision
    const timestamp_t t0_ns = stream.timestamps_ns[begin];
    VectorXd times(count);
    for (Eigen::Index i = 0; i < count; i++) {
        times(i) = ns_to_seconds(stream.timestamps_ns[begin + static_cast<size_t>(i)] - t0_ns);
    }

    const Eigen::Index grid_count = grid_point_count(0.0, times(count - 1), rate_hz);
    const VectorXd grid = uniform_grid(0.0, rate_hz, grid_count);

    UniformSegment segment;
    segment.start_s = ns_to_seconds(t0_ns);
    segment.rate_hz = rate_hz;
    segment.samples = interpolate_rows(times, stream.samples.middleRows(static_cast<Eigen::Index>(begin), count), grid);
    return segment;
}

ConditionedStream SignalConditioner::condition(const SensorStream& raw,
                                               const SensorAlignment* alignment) const {
    validate(raw);

    if (raw.num_samples() < config_.min_samples) {
        throw InsufficientDataError("Stream " + raw.sensor_id + ": " +
                                    std::to_string(raw.num_samples()) + " sample(s), at least " +
                                    std::to_string(config_.min_samples) + " required");
    }

    const double rate_hz = config_.target_rate_hz > 0.0 ? config_.target_rate_hz : raw.nominal_rate_hz;
    if (rate_hz <= 0.0) {
        throw std::invalid_argument("Stream " + raw.sensor_id + ": no target or nominal rate");
    }

    SensorStream stream = config_.convert_units ? to_si_units(raw) : raw;
    if (alignment != nullptr) {
        apply_sensor_alignment(*alignment, stream, config_.remove_gyro_bias);
    }

    // Filter designed once per stream (all segments share the rate)
    std::optional<ButterworthLowPass> lowpass;
    if (config_.lowpass_cutoff_hz > 0.0 && config_.lowpass_cutoff_hz < 0.5 * rate_hz) {
        lowpass.emplace(config_.filter_order, config_.lowpass_cutoff_hz, rate_hz);
    } else if (config_.lowpass_cutoff_hz > 0.0) {
        LOG_WARN("Stream %s: cutoff %.1f Hz >= Nyquist of %.1f Hz, low-pass disabled",
                 raw.sensor_id.c_str(), config_.lowpass_cutoff_hz, rate_hz);
    }

    ConditionedStream out;
    out.sensor_id = raw.sensor_id;
    out.nominal_rate_hz = raw.nominal_rate_hz;
    out.channel_names = raw.channel_names;

    const auto ranges = split_at_gaps(stream);
    if (ranges.size() > 1) {
        LOG_INFO("Stream %s: split into %zu segments at gaps > %.3f s",
                 raw.sensor_id.c_str(), ranges.size(), config_.max_gap_s);
    }

    for (const auto& range : ranges) {
        if (range.second - range.first < config_.min_samples) {
            LOG_WARN("Stream %s: dropping %zu-sample segment (min %zu)",
                     raw.sensor_id.c_str(), range.second - range.first, config_.min_samples);
            continue;
        }

        UniformSegment segment = resample_segment(stream, range.first, range.second, rate_hz);
        if (static_cast<size_t>(segment.num_samples()) < config_.min_samples) {
            LOG_WARN("Stream %s: dropping segment of %.3f s (< %zu grid samples)",
                     raw.sensor_id.c_str(), segment.duration_s(), config_.min_samples);
            continue;
        }

        if (lowpass) {
            segment.samples = lowpass->filtfilt_columns(segment.samples);
        }

        out.segments.push_back(std::move(segment));
    }

    if (out.segments.empty()) {
        throw InsufficientDataError("Stream " + raw.sensor_id + ": no segment with at least " +
                                    std::to_string(config_.min_samples) + " samples");
    }

    return out;
}

}  // namespace kam
