// Signal Conditioner - per-sensor resampling, filtering and unit normalization
//
// Purpose: Turn one raw, irregularly sampled SensorStream into one or more
//          uniformly sampled, low-pass filtered segments in SI units.
//
// Processing order:
//   1. Validate (timestamps strictly increasing, shapes consistent)
//   2. Convert units to SI (g -> m/s², deg/s -> rad/s)
//   3. Optional static bias/orientation correction
//   4. Split at gaps longer than max_gap_s (segments are never merged)
//   5. Linearly interpolate each segment onto a uniform grid at the target rate
//      (short gaps are bridged by this interpolation)
//   6. Zero-phase Butterworth low-pass per channel
//
// Sample Usage:
//   SignalConditioner conditioner(config);
//   ConditionedStream out = conditioner.condition(raw_stream);
//
// Expected Output:
//   - out.segments[k].samples: uniform rows at out.segments[k].rate_hz
//   - InsufficientDataError if no segment has at least min_samples samples

#pragma once

#include "core/sensor_types.hpp"
#include "core/types.hpp"
#include "signal/static_calibration.hpp"

#include <string>
#include <utility>
#include <vector>

namespace kam {

/**
 * @brief Conditioner configuration
 */
struct ConditionerConfig {
    double target_rate_hz;        ///< Output rate [Hz] (0 = stream's nominal rate)
    double lowpass_cutoff_hz;     ///< Low-pass cutoff [Hz] (<= 0 disables)
    int filter_order;             ///< Butterworth order
    double max_gap_s;             ///< Longer gaps split the stream [s]
    size_t min_samples;           ///< Minimum samples per usable segment
    bool convert_units;           ///< Convert g and deg/s to SI
    bool remove_gyro_bias;        ///< Subtract static gyro bias when calibrating

    ConditionerConfig()
        : target_rate_hz(0.0),
          lowpass_cutoff_hz(15.0),
          filter_order(4),
          max_gap_s(0.1),
          min_samples(3),
          convert_units(true),
          remove_gyro_bias(true) {}
};

/**
 * @brief One contiguous, uniformly sampled piece of a conditioned stream
 */
struct UniformSegment {
    double start_s;         ///< Time of row 0 [s]
    double rate_hz;         ///< Row spacing = 1 / rate_hz
    MatrixXd samples;       ///< rows × channels

    UniformSegment() : start_s(0.0), rate_hz(0.0) {}

    Eigen::Index num_samples() const { return samples.rows(); }
    double time_at(Eigen::Index i) const { return start_s + static_cast<double>(i) / rate_hz; }
    double end_s() const { return num_samples() > 0 ? time_at(num_samples() - 1) : start_s; }
    double duration_s() const { return end_s() - start_s; }
};

/**
 * @brief Output of the conditioner for one sensor
 */
struct ConditionedStream {
    std::string sensor_id;
    double nominal_rate_hz;
    std::vector<std::string> channel_names;
    std::vector<UniformSegment> segments;   ///< Ordered by time, disjoint

    ConditionedStream() : nominal_rate_hz(0.0) {}

    double valid_duration_s() const {
        double total = 0.0;
        for (const auto& seg : segments) {
            total += seg.duration_s();
        }
        return total;
    }
};

class SignalConditioner {
public:
    /**
     * @throws std::invalid_argument on invalid configuration
     */
    explicit SignalConditioner(const ConditionerConfig& config = ConditionerConfig());

    /**
     * @brief Condition one raw stream
     *
     * @param stream Raw stream as produced by ingestion
     * @param alignment Optional static correction for this sensor (nullptr = none)
     * @return Uniform, filtered segments in SI units
     * @throws InsufficientDataError if no segment is long enough
     * @throws PipelineError on malformed input (non-increasing timestamps, shape mismatch)
     */
    ConditionedStream condition(const SensorStream& stream,
                                const SensorAlignment* alignment = nullptr) const;

    /**
     * @brief Convert g -> m/s² and deg/s -> rad/s (other units unchanged)
     */
    static SensorStream to_si_units(const SensorStream& stream);

    /**
     * @brief Sample index ranges [begin, end) separated by gaps > max_gap_s
     */
    std::vector<std::pair<size_t, size_t>> split_at_gaps(const SensorStream& stream) const;

    const ConditionerConfig& config() const { return config_; }

private:
    UniformSegment resample_segment(const SensorStream& stream,
                                    size_t begin, size_t end,
                                    double rate_hz) const;

    void validate(const SensorStream& stream) const;

    ConditionerConfig config_;
};

}  // namespace kam
