// Synchronizer Implementation
#include "sync/synchronizer.hpp"
#include "core/errors.hpp"
#include "math/signal_math.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace kam {

namespace {

// Slack for floating-point comparisons of interval boundaries [s]
constexpr double TIME_EPS = 1e-9;

}  // namespace

std::vector<TimeInterval> intersect_intervals(const std::vector<TimeInterval>& a,
                                              const std::vector<TimeInterval>& b) {
    std::vector<TimeInterval> out;
    size_t i = 0;
    size_t j = 0;

    while (i < a.size() && j < b.size()) {
        const double start = std::max(a[i].start_s, b[j].start_s);
        const double end = std::min(a[i].end_s, b[j].end_s);
        if (end >= start) {
            out.push_back(TimeInterval{start, end});
        }

        // Advance whichever interval ends first
        if (a[i].end_s < b[j].end_s) {
            i++;
        } else {
            j++;
        }
    }

    return out;
}

Synchronizer::Synchronizer(const SyncConfig& config)
    : config_(config) {
    if (config_.min_overlap_s < 0.0) {
        throw std::invalid_argument("min_overlap_s must be >= 0");
    }
}

double Synchronizer::clock_offset(const std::string& sensor_id) const {
    auto it = config_.clock_offsets_s.find(sensor_id);
    return it == config_.clock_offsets_s.end() ? 0.0 : it->second;
}

std::vector<TimeInterval> Synchronizer::valid_intervals(const ConditionedStream& stream) const {
    const double offset = clock_offset(stream.sensor_id);

    std::vector<TimeInterval> intervals;
    intervals.reserve(stream.segments.size());
    for (const auto& seg : stream.segments) {
        intervals.push_back(TimeInterval{seg.start_s + offset, seg.end_s() + offset});
    }
    std::sort(intervals.begin(), intervals.end(),
              [](const TimeInterval& x, const TimeInterval& y) { return x.start_s < y.start_s; });
    return intervals;
}

std::vector<const ConditionedStream*> Synchronizer::ordered_streams(
    const std::vector<ConditionedStream>& streams) const {

    std::vector<const ConditionedStream*> ordered;
    std::set<std::string> taken;

    for (const auto& id : config_.sensor_order) {
        for (const auto& stream : streams) {
            if (stream.sensor_id == id && taken.insert(id).second) {
                ordered.push_back(&stream);
            }
        }
    }

    std::vector<const ConditionedStream*> rest;
    for (const auto& stream : streams) {
        if (taken.count(stream.sensor_id) == 0) {
            rest.push_back(&stream);
        }
    }
    std::sort(rest.begin(), rest.end(),
              [](const ConditionedStream* x, const ConditionedStream* y) {
                  return x->sensor_id < y->sensor_id;
              });

    ordered.insert(ordered.end(), rest.begin(), rest.end());
    return ordered;
}

const ConditionedStream& Synchronizer::reference_stream(
    const std::vector<const ConditionedStream*>& ordered) const {

    if (!config_.reference_sensor.empty()) {
        for (const auto* stream : ordered) {
            if (stream->sensor_id == config_.reference_sensor) {
                return *stream;
            }
        }
        throw SynchronizationError("Reference sensor " + config_.reference_sensor + " not in session");
    }

    // Slowest nominal rate; ties keep channel order
    const ConditionedStream* slowest = ordered.front();
    for (const auto* stream : ordered) {
        if (stream->nominal_rate_hz < slowest->nominal_rate_hz) {
            slowest = stream;
        }
    }
    return *slowest;
}

MatrixXd Synchronizer::sample_on_grid(const ConditionedStream& stream,
                                      const TimeInterval& interval,
                                      const VectorXd& grid) const {
    const double offset = clock_offset(stream.sensor_id);

    for (const auto& seg : stream.segments) {
        const double seg_start = seg.start_s + offset;
        const double seg_end = seg.end_s() + offset;
        if (seg_start <= interval.start_s + TIME_EPS && seg_end >= interval.end_s - TIME_EPS) {
            const VectorXd times = uniform_grid(seg_start, seg.rate_hz, seg.num_samples());
            return interpolate_rows(times, seg.samples, grid);
        }
    }

    // Unreachable when interval came from intersect_intervals over this stream
    throw SynchronizationError("Stream " + stream.sensor_id + " does not cover the overlap interval");
}

SynchronizedSession Synchronizer::synchronize(const SessionInfo& info,
                                              const std::vector<ConditionedStream>& streams,
                                              const ConditionedStream* ground_truth) const {
    if (streams.empty()) {
        throw SynchronizationError(info.label() + ": no sensor streams");
    }

    std::set<std::string> ids;
    for (const auto& stream : streams) {
        if (!ids.insert(stream.sensor_id).second) {
            throw SynchronizationError(info.label() + ": duplicate sensor " + stream.sensor_id);
        }
        if (stream.segments.empty()) {
            throw SynchronizationError(info.label() + ": sensor " + stream.sensor_id +
                                       " has no valid segment");
        }
    }

    const auto ordered = ordered_streams(streams);
    const ConditionedStream& reference = reference_stream(ordered);
    const double rate_hz = reference.nominal_rate_hz;
    if (rate_hz <= 0.0) {
        throw SynchronizationError(info.label() + ": reference sensor " + reference.sensor_id +
                                   " has no nominal rate");
    }

    // === 1. Common valid range ===
    std::vector<TimeInterval> overlap = valid_intervals(*ordered.front());
    for (size_t k = 1; k < ordered.size(); k++) {
        overlap = intersect_intervals(overlap, valid_intervals(*ordered[k]));
    }
    if (ground_truth != nullptr) {
        overlap = intersect_intervals(overlap, valid_intervals(*ground_truth));
    }

    if (overlap.empty()) {
        throw SynchronizationError(info.label() + ": sensors share no common time range");
    }

    const TimeInterval best = *std::max_element(
        overlap.begin(), overlap.end(),
        [](const TimeInterval& x, const TimeInterval& y) { return x.duration_s() < y.duration_s(); });

    if (best.duration_s() < config_.min_overlap_s) {
        throw SynchronizationError(info.label() + ": overlap of " + std::to_string(best.duration_s()) +
                                   " s is shorter than " + std::to_string(config_.min_overlap_s) + " s");
    }
    if (overlap.size() > 1) {
        LOG_WARN("%s: %zu disjoint overlap intervals, using the longest (%.2f s)",
                 info.label().c_str(), overlap.size(), best.duration_s());
    }

    // === 2. Common grid ===
    const Eigen::Index num_frames = grid_point_count(best.start_s, best.end_s, rate_hz);
    const VectorXd grid = uniform_grid(best.start_s, rate_hz, num_frames);

    SynchronizedSession out;
    out.info = info;
    out.start_s = best.start_s;
    out.rate_hz = rate_hz;

    Eigen::Index num_channels = 0;
    for (const auto* stream : ordered) {
        num_channels += static_cast<Eigen::Index>(stream->channel_names.size());
    }
    out.frames.resize(num_frames, num_channels);

    // === 3. Resample every stream onto the grid ===
    Eigen::Index col = 0;
    for (const auto* stream : ordered) {
        const MatrixXd block = sample_on_grid(*stream, best, grid);
        out.frames.middleCols(col, block.cols()) = block;
        col += block.cols();

        for (const auto& field : stream->channel_names) {
            out.schema.append(ChannelSchema::channel_name(field, stream->sensor_id));
        }
    }

    // === 4. Ground truth labels ===
    if (ground_truth != nullptr) {
        if (ground_truth->channel_names.size() < static_cast<size_t>(NUM_MOMENTS)) {
            throw SynchronizationError(info.label() + ": ground truth needs adduction and flexion channels");
        }

        const MatrixXd gt = sample_on_grid(*ground_truth, best, grid);

        // Named columns when available, otherwise [adduction, flexion] order
        out.label_schema = ChannelSchema::moment_labels();
        const ChannelSchema gt_schema(ground_truth->channel_names);
        int kam_col = gt_schema.index_of(KNEE_ADDUCTION_MOMENT);
        int kfm_col = gt_schema.index_of(KNEE_FLEXION_MOMENT);
        if (kam_col < 0 || kfm_col < 0) {
            kam_col = 0;
            kfm_col = 1;
        }

        out.labels.resize(num_frames, NUM_MOMENTS);
        out.labels.col(0) = gt.col(kam_col);
        out.labels.col(1) = gt.col(kfm_col);
    }

    LOG_DEBUG("%s: synchronized %zu sensors on %.1f Hz grid (ref %s), %ld frames, %.2f s",
              info.label().c_str(), ordered.size(), rate_hz, reference.sensor_id.c_str(),
              static_cast<long>(num_frames), best.duration_s());

    return out;
}

}  // namespace kam
