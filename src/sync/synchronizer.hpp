// Synchronizer - align conditioned streams onto one session time base
//
// Purpose: Produce one frame matrix per session on a common uniform grid
//          covering only the time range every sensor actually recorded.
//
// Alignment policy:
//   - Grid rate = nominal rate of the reference sensor (configurable; default
//     the slowest sensor so no resolution is fabricated)
//   - Grid range = intersection of every sensor's valid segments (and of the
//     ground-truth stream when present). When gaps leave several disjoint
//     overlap intervals, the longest one is used.
//   - Every stream is linearly interpolated onto the grid; no grid point lies
//     outside any contributing segment (no extrapolation)
//   - Optional per-sensor clock offsets are added to that sensor's times first
//
// Channel order: sensors in SyncConfig::sensor_order (remaining sensors sorted
// by id), fields in each stream's channel order. Names "<field>_<sensor>".
//
// Sample Usage:
//   Synchronizer sync(config);
//   SynchronizedSession s = sync.synchronize(info, conditioned, &conditioned_gt);
//
// Expected Output:
//   - s.frames: N × C, s.labels: N × 2 (or empty without ground truth)
//   - SynchronizationError if the overlap is empty or shorter than min_overlap_s

#pragma once

#include "core/sensor_types.hpp"
#include "signal/signal_conditioner.hpp"

#include <map>
#include <string>
#include <vector>

namespace kam {

/**
 * @brief Synchronizer configuration
 */
struct SyncConfig {
    std::string reference_sensor;                   ///< Grid source ("" = slowest sensor)
    std::vector<std::string> sensor_order;          ///< Channel order ("" = sorted ids)
    double min_overlap_s;                           ///< Minimum usable overlap [s]
    std::map<std::string, double> clock_offsets_s;  ///< Added to a sensor's times [s]

    SyncConfig()
        : min_overlap_s(2.0) {}
};

/**
 * @brief Closed time interval [start_s, end_s]
 */
struct TimeInterval {
    double start_s;
    double end_s;

    double duration_s() const { return end_s - start_s; }
};

/**
 * @brief Intersection of two sorted, disjoint interval lists
 */
std::vector<TimeInterval> intersect_intervals(const std::vector<TimeInterval>& a,
                                              const std::vector<TimeInterval>& b);

class Synchronizer {
public:
    explicit Synchronizer(const SyncConfig& config = SyncConfig());

    /**
     * @brief Synchronize the conditioned streams of one session
     *
     * @param info Session metadata (copied into the output)
     * @param streams Conditioned sensor streams (unique sensor ids)
     * @param ground_truth Conditioned moment stream, or nullptr
     * @throws SynchronizationError on empty/short overlap or duplicate sensors
     */
    SynchronizedSession synchronize(const SessionInfo& info,
                                    const std::vector<ConditionedStream>& streams,
                                    const ConditionedStream* ground_truth = nullptr) const;

    /**
     * @brief Valid intervals of a stream on the session clock (offset applied)
     */
    std::vector<TimeInterval> valid_intervals(const ConditionedStream& stream) const;

    /**
     * @brief Streams reordered by sensor_order, then by sensor id
     */
    std::vector<const ConditionedStream*> ordered_streams(const std::vector<ConditionedStream>& streams) const;

    const SyncConfig& config() const { return config_; }

private:
    double clock_offset(const std::string& sensor_id) const;

    const ConditionedStream& reference_stream(const std::vector<const ConditionedStream*>& ordered) const;

    // Interpolate the segment of `stream` covering `interval` onto `grid`
    MatrixXd sample_on_grid(const ConditionedStream& stream,
                            const TimeInterval& interval,
                            const VectorXd& grid) const;

    SyncConfig config_;
};

}  // namespace kam
