/**
 * @file sensor_types.hpp
 * @brief Sensor stream, session and step data structures
 *
 * Purpose: Define the data model flowing through the pipeline:
 *   Session (raw SensorStreams + optional ground truth)
 *     -> SynchronizedSession (one frame matrix on a common grid)
 *     -> SegmentedSession (frames + read-only Step annotation)
 *
 * References:
 * - DESIGN.md: Data model section
 *
 * Sample Input:
 *   - R_FOOT IMU at 100 Hz: [AccelX..Z, GyroX..Z] in g and deg/s
 *   - WAIST IMU at 60 Hz, same fields
 *
 * Expected Output:
 *   - SynchronizedSession at 60 Hz with 12 channels "AccelX_R_FOOT" ...
 */

#ifndef KAM_CORE_SENSOR_TYPES_HPP
#define KAM_CORE_SENSOR_TYPES_HPP

#include "types.hpp"
#include "channel_schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kam {

// ========== Units and labels ==========

/**
 * @brief Physical unit of one raw channel
 *
 * The signal conditioner converts everything to SI (m/s², rad/s, N·m).
 */
enum class Unit : uint8_t {
    MetersPerSecondSq,
    StandardGravity,          ///< g, converted to m/s²
    RadiansPerSecond,
    DegreesPerSecond,         ///< converted to rad/s
    NewtonMeters,
    NewtonMetersPerKilogram,  ///< body-weight normalized moment
    Dimensionless
};

enum class BodySide : uint8_t {
    Unknown = 0,
    Left,
    Right
};

inline const char* to_string(BodySide side) {
    switch (side) {
        case BodySide::Left: return "left";
        case BodySide::Right: return "right";
        default: return "unknown";
    }
}

// ========== Raw Sensor Stream ==========

/**
 * @brief One physical sensor's raw recording
 *
 * Timestamps must be strictly increasing. The sampling rate is nominal only;
 * actual sample spacing may drift and contain gaps.
 */
struct SensorStream {
    std::string sensor_id;                    ///< e.g. "R_FOOT", "WAIST"
    double nominal_rate_hz;                   ///< Vendor-reported rate [Hz]
    std::vector<std::string> channel_names;   ///< Field names, e.g. "AccelX"
    std::vector<Unit> channel_units;          ///< One unit per channel
    std::vector<timestamp_t> timestamps_ns;   ///< One per sample
    MatrixXd samples;                         ///< num_samples × num_channels

    SensorStream() : nominal_rate_hz(0.0) {}

    size_t num_samples() const { return timestamps_ns.size(); }
    size_t num_channels() const { return channel_names.size(); }

    timestamp_t start_timestamp_ns() const {
        return timestamps_ns.empty() ? 0 : timestamps_ns.front();
    }

    bool timestamps_strictly_increasing() const {
        for (size_t i = 1; i < timestamps_ns.size(); i++) {
            if (timestamps_ns[i] <= timestamps_ns[i - 1]) {
                return false;
            }
        }
        return true;
    }
};

// ========== Session ==========

/**
 * @brief Subject/trial metadata attached to a session
 */
struct SessionInfo {
    std::string subject_id;
    std::string trial_id;
    BodySide side;              ///< Side the ground-truth moments refer to
    double body_weight_kg;      ///< 0 if unknown
    double body_height_m;       ///< 0 if unknown

    SessionInfo()
        : side(BodySide::Unknown), body_weight_kg(0.0), body_height_m(0.0) {}

    /// "subject/trial", used to tag every log line about this session.
    std::string label() const { return subject_id + "/" + trial_id; }
};

/**
 * @brief One walking trial: ownership root of its sensor streams
 *
 * ground_truth, when present, holds the two moment channels
 * (adduction, flexion) on its own clock. static_streams optionally hold a
 * standing recording per sensor for bias/orientation correction.
 */
struct Session {
    SessionInfo info;
    std::vector<SensorStream> streams;
    std::optional<SensorStream> ground_truth;
    std::vector<SensorStream> static_streams;
};

// ========== Synchronized Session ==========

/**
 * @brief One sample row on the common time base
 */
struct SynchronizedFrame {
    double time_s;
    RowVectorXd values;     ///< One value per schema channel
};

/**
 * @brief All sensors of a session on one shared uniform grid
 *
 * frames(i, c) is channel schema.name(c) at time start_s + i / rate_hz.
 * labels has the same number of rows as frames when ground truth exists,
 * zero rows otherwise.
 */
struct SynchronizedSession {
    SessionInfo info;
    ChannelSchema schema;
    ChannelSchema label_schema;
    double start_s;
    double rate_hz;
    MatrixXd frames;
    MatrixXd labels;

    SynchronizedSession() : start_s(0.0), rate_hz(0.0) {}

    Eigen::Index num_frames() const { return frames.rows(); }
    bool has_labels() const { return labels.rows() > 0 && labels.rows() == frames.rows(); }
    double time_at(Eigen::Index i) const { return start_s + static_cast<double>(i) / rate_hz; }
    double end_s() const { return num_frames() > 0 ? time_at(num_frames() - 1) : start_s; }

    SynchronizedFrame frame(Eigen::Index i) const {
        return SynchronizedFrame{time_at(i), frames.row(i)};
    }
};

// ========== Steps ==========

/**
 * @brief One gait cycle: frames [begin_frame, end_frame) between two events
 */
struct Step {
    int id;                     ///< Unique within session, increasing with time
    Eigen::Index begin_frame;   ///< First frame (gait event)
    Eigen::Index end_frame;     ///< One past the last frame (next gait event)
    BodySide side;
    double start_s;
    double duration_s;

    Step()
        : id(-1), begin_frame(0), end_frame(0), side(BodySide::Unknown),
          start_s(0.0), duration_s(0.0) {}

    Eigen::Index length() const { return end_frame - begin_frame; }
};

/**
 * @brief Synchronized session plus its step annotation
 *
 * Intermediate form between the segmenter and the assembler. frame_step_ids
 * holds the step id of every frame, -1 for frames outside any step.
 */
struct SegmentedSession {
    SynchronizedSession sync;
    std::vector<Step> steps;
    std::vector<int> frame_step_ids;
};

} // namespace kam

#endif // KAM_CORE_SENSOR_TYPES_HPP
