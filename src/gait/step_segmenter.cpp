// Step Segmenter Implementation
#include "gait/step_segmenter.hpp"
#include "core/errors.hpp"
#include "math/signal_math.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <stdexcept>

namespace kam {

StepSegmenter::StepSegmenter(const SegmenterConfig& config)
    : config_(config) {

    if (config_.detection_channels.empty()) {
        throw std::invalid_argument("At least one detection channel required");
    }
    if (config_.detection_window_s <= 0.0 || config_.min_event_distance_s < 0.0) {
        throw std::invalid_argument("Detection window must be > 0 and event distance >= 0");
    }
    if (config_.max_step_duration_s <= 0.0) {
        throw std::invalid_argument("max_step_duration_s must be > 0");
    }
}

double StepSegmenter::detection_threshold(const VectorXd& signal) const {
    if (config_.absolute_threshold > 0.0) {
        return config_.absolute_threshold;
    }
    if (signal.size() == 0) {
        return 0.0;
    }

    const double mean = signal.mean();
    const double stddev = std::sqrt((signal.array() - mean).square().mean());
    return mean + config_.threshold_std_factor * stddev;
}

std::vector<GaitEvent> StepSegmenter::detect_events(const VectorXd& signal, double rate_hz) const {
    const Eigen::Index n = signal.size();
    const auto half_window = std::max<Eigen::Index>(
        1, static_cast<Eigen::Index>(std::lround(0.5 * config_.detection_window_s * rate_hz)));
    const auto min_distance = static_cast<Eigen::Index>(
        std::lround(config_.min_event_distance_s * rate_hz));
    const double threshold = detection_threshold(signal);

    // === 1. Local maxima over a fully contained window ===
    std::vector<GaitEvent> candidates;
    for (Eigen::Index i = half_window; i + half_window < n; i++) {
        const double v = signal(i);
        if (v < threshold) {
            continue;
        }

        bool is_peak = true;
        for (Eigen::Index j = i - half_window; j <= i + half_window && is_peak; j++) {
            if (j < i && signal(j) >= v) {
                is_peak = false;    // plateau: the first index already claimed it
            } else if (j > i && signal(j) > v) {
                is_peak = false;
            }
        }
        if (is_peak) {
            candidates.push_back(GaitEvent{i, v});
        }
    }

    // === 2. Minimum inter-event distance: keep the larger ===
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const GaitEvent& a, const GaitEvent& b) { return a.magnitude > b.magnitude; });

    std::set<Eigen::Index> accepted_frames;
    std::vector<GaitEvent> events;
    for (const auto& candidate : candidates) {
        auto next = accepted_frames.lower_bound(candidate.frame);
        if (next != accepted_frames.end() && *next - candidate.frame < min_distance) {
            continue;
        }
        if (next != accepted_frames.begin() && candidate.frame - *std::prev(next) < min_distance) {
            continue;
        }
        accepted_frames.insert(candidate.frame);
        events.push_back(candidate);
    }

    std::sort(events.begin(), events.end(),
              [](const GaitEvent& a, const GaitEvent& b) { return a.frame < b.frame; });
    return events;
}

SegmentedSession StepSegmenter::segment(const SynchronizedSession& session) const {
    const std::vector<int> columns = session.schema.indices_of(config_.detection_channels);
    const VectorXd signal = row_norm(session.frames, columns);
    const std::vector<GaitEvent> events = detect_events(signal, session.rate_hz);

    SegmentedSession out;
    out.sync = session;
    out.frame_step_ids.assign(static_cast<size_t>(session.num_frames()), -1);

    const BodySide side = config_.side != BodySide::Unknown ? config_.side : session.info.side;

    int skipped = 0;
    for (size_t k = 0; k + 1 < events.size(); k++) {
        Step step;
        step.begin_frame = events[k].frame;
        step.end_frame = events[k + 1].frame;
        step.start_s = session.time_at(step.begin_frame);
        step.duration_s = static_cast<double>(step.length()) / session.rate_hz;
        step.side = side;

        if (step.duration_s > config_.max_step_duration_s) {
            skipped++;
            continue;
        }

        step.id = static_cast<int>(out.steps.size());
        for (Eigen::Index f = step.begin_frame; f < step.end_frame; f++) {
            out.frame_step_ids[static_cast<size_t>(f)] = step.id;
        }
        out.steps.push_back(step);
    }

    if (skipped > 0) {
        LOG_DEBUG("%s: skipped %d span(s) longer than %.2f s",
                  session.info.label().c_str(), skipped, config_.max_step_duration_s);
    }

    if (out.steps.size() < config_.min_steps) {
        throw InsufficientStepsError(session.info.label() + ": " + std::to_string(out.steps.size()) +
                                     " step(s) detected from " + std::to_string(events.size()) +
                                     " event(s), at least " + std::to_string(config_.min_steps) +
                                     " required");
    }

    LOG_DEBUG("%s: %zu events, %zu steps", session.info.label().c_str(),
              events.size(), out.steps.size());

    return out;
}

}  // namespace kam
