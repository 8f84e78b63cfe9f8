// Step Segmenter - gait event detection and step annotation
//
// Purpose: Detect heel-strike events in a synchronized session and cut the
//          frame sequence into gait cycles (steps) between consecutive events.
//
// Detection signal:
//   s_i = || frames(i, detection_channels) ||₂
//   (default: right-foot gyroscope norm, which spikes at heel strike)
//
// Event rules:
//   1. Candidate: s_i is the maximum of its detection window
//      [i - w, i + w] (first index wins on a plateau) and s_i >= threshold
//   2. Threshold: absolute_threshold if > 0, otherwise mean(s) + k·std(s)
//   3. Edge: candidates whose window is clipped by the recording start/end
//      are discarded (cannot be confirmed as a peak)
//   4. Minimum distance: of two candidates closer than min_event_distance_s
//      the larger one is kept (earlier one on equal magnitude)
//
// Steps are [event_k, event_{k+1}); spans longer than max_step_duration_s
// (walking pauses) are skipped. Ids run 0, 1, ... in time order.
//
// Sample Usage:
//   StepSegmenter segmenter(config);
//   SegmentedSession seg = segmenter.segment(synchronized);
//
// Expected Output:
//   - 5 clean heel strikes 1 s apart -> 4 steps of 1 s
//   - InsufficientStepsError when fewer than min_steps steps remain

#pragma once

#include "core/sensor_types.hpp"

#include <string>
#include <vector>

namespace kam {

/**
 * @brief Step segmenter configuration
 */
struct SegmenterConfig {
    std::vector<std::string> detection_channels;  ///< Schema names whose norm is the detection signal
    double absolute_threshold;       ///< Peak threshold (<= 0: adaptive)
    double threshold_std_factor;     ///< k in mean + k·std for the adaptive threshold
    double detection_window_s;       ///< Full width of the local-maximum window [s]
    double min_event_distance_s;     ///< Minimum spacing between events [s]
    double max_step_duration_s;      ///< Longer spans are not gait cycles [s]
    size_t min_steps;                ///< Fewer steps flag the session
    BodySide side;                   ///< Side label (Unknown: session's side)

    SegmenterConfig()
        : detection_channels({"GyroX_R_FOOT", "GyroY_R_FOOT", "GyroZ_R_FOOT"}),
          absolute_threshold(0.0),
          threshold_std_factor(1.0),
          detection_window_s(0.2),
          min_event_distance_s(0.6),
          max_step_duration_s(2.5),
          min_steps(3),
          side(BodySide::Unknown) {}
};

/**
 * @brief One detected gait event
 */
struct GaitEvent {
    Eigen::Index frame;
    double magnitude;
};

class StepSegmenter {
public:
    /**
     * @throws std::invalid_argument on invalid configuration
     */
    explicit StepSegmenter(const SegmenterConfig& config = SegmenterConfig());

    /**
     * @brief Segment a synchronized session into steps
     *
     * @throws SchemaMismatchError if a detection channel is not in the schema
     * @throws InsufficientStepsError if fewer than min_steps steps are found
     */
    SegmentedSession segment(const SynchronizedSession& session) const;

    /**
     * @brief Detect events in a detection signal sampled at rate_hz
     *
     * @return Events sorted by frame
     */
    std::vector<GaitEvent> detect_events(const VectorXd& signal, double rate_hz) const;

    /**
     * @brief Threshold applied to a detection signal
     */
    double detection_threshold(const VectorXd& signal) const;

    const SegmenterConfig& config() const { return config_; }

private:
    SegmenterConfig config_;
};

}  // namespace kam
