// Step Segmenter Unit Tests
//
// Purpose: Validate heel-strike detection and step annotation
// Tests:
//   1. 5 clean heel strikes 1 s apart -> 4 steps of 1 s, frames annotated
//   2. Close candidates: the larger (or earlier) event wins
//   3. Peak with a clipped window at the recording edge is discarded
//   4. Walking pause longer than max_step_duration_s is not a step
//   5. Too few steps / missing detection channel / bad config

#include "core/errors.hpp"
#include "gait/step_segmenter.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace kam;

namespace {

constexpr double RATE_HZ = 100.0;
constexpr double PULSE_SIGMA_S = 0.03;

// Gyro Z carries a Gaussian pulse (6 rad/s) at every heel strike
SynchronizedSession make_session(const std::vector<double>& heel_strikes_s, double duration_s) {
    SynchronizedSession session;
    session.info.subject_id = "S01";
    session.info.trial_id = "seg";
    session.info.side = BodySide::Right;
    session.schema = ChannelSchema({"AccelX_R_FOOT", "GyroX_R_FOOT", "GyroY_R_FOOT", "GyroZ_R_FOOT"});
    session.start_s = 0.0;
    session.rate_hz = RATE_HZ;

    const auto n = static_cast<Eigen::Index>(std::lround(duration_s * RATE_HZ));
    session.frames = MatrixXd::Zero(n, 4);
    for (Eigen::Index i = 0; i < n; i++) {
        const double t = session.time_at(i);
        session.frames(i, 0) = 9.81 + 0.5 * std::sin(2.0 * M_PI * t);
        for (double t_hs : heel_strikes_s) {
            const double d = (t - t_hs) / PULSE_SIGMA_S;
            session.frames(i, 3) += 6.0 * std::exp(-0.5 * d * d);
        }
    }
    return session;
}

}  // namespace

// Test 1: Regular walking
bool test_regular_steps() {
    std::cout << "\n=== Test 1: Regular Steps ===" << std::endl;

    const SynchronizedSession session = make_session({1.0, 2.0, 3.0, 4.0, 5.0}, 10.0);
    StepSegmenter segmenter;
    const SegmentedSession out = segmenter.segment(session);

    bool ordered = true;
    double max_duration_error = 0.0;
    for (size_t k = 0; k < out.steps.size(); k++) {
        const Step& step = out.steps[k];
        max_duration_error = std::max(max_duration_error, std::abs(step.duration_s - 1.0));
        if (step.id != static_cast<int>(k) || step.side != BodySide::Right) {
            ordered = false;
        }
        if (k > 0 && step.begin_frame < out.steps[k - 1].end_frame) {
            ordered = false;
        }
    }

    std::cout << "Steps: " << out.steps.size() << std::endl;
    for (const auto& step : out.steps) {
        std::cout << "  step " << step.id << ": frames [" << step.begin_frame << ", "
                  << step.end_frame << "), start " << step.start_s << " s, "
                  << step.duration_s << " s" << std::endl;
    }

    bool passed = out.steps.size() == 4 &&
                  ordered &&
                  max_duration_error < 1e-9 &&
                  out.steps.front().begin_frame == 100 &&
                  out.steps.back().end_frame == 500 &&
                  out.frame_step_ids.size() == 1000 &&
                  out.frame_step_ids[99] == -1 &&
                  out.frame_step_ids[100] == 0 &&
                  out.frame_step_ids[199] == 0 &&
                  out.frame_step_ids[200] == 1 &&
                  out.frame_step_ids[499] == 3 &&
                  out.frame_step_ids[500] == -1 &&
                  out.sync.num_frames() == session.num_frames();

    if (passed) {
        std::cout << "✓ Test 1: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 1: FAILED" << std::endl;
    }
    return passed;
}

// Test 2: Minimum event distance
bool test_close_candidates() {
    std::cout << "\n=== Test 2: Close Candidates ===" << std::endl;

    SegmenterConfig config;
    config.absolute_threshold = 1.0;
    StepSegmenter segmenter(config);

    VectorXd signal = VectorXd::Zero(300);
    signal(100) = 5.0;      // equal pair 0.3 s apart: earlier wins
    signal(130) = 5.0;
    signal(200) = 3.0;      // unequal pair: larger wins
    signal(230) = 4.0;

    const std::vector<GaitEvent> events = segmenter.detect_events(signal, RATE_HZ);

    std::cout << "Events:";
    for (const auto& e : events) {
        std::cout << " " << e.frame << " (" << e.magnitude << ")";
    }
    std::cout << std::endl;

    bool passed = events.size() == 2 &&
                  events[0].frame == 100 &&
                  events[1].frame == 230 &&
                  std::abs(events[1].magnitude - 4.0) < 1e-12;

    if (passed) {
        std::cout << "✓ Test 2: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 2: FAILED" << std::endl;
    }
    return passed;
}

// Test 3: Edge peaks
bool test_edge_peak_discarded() {
    std::cout << "\n=== Test 3: Edge Peak Discarded ===" << std::endl;

    SegmenterConfig config;
    config.absolute_threshold = 1.0;
    StepSegmenter segmenter(config);

    VectorXd signal = VectorXd::Zero(200);
    signal(5) = 10.0;       // window [-5, 15] is clipped
    signal(100) = 5.0;
    signal(195) = 10.0;     // window [185, 205] is clipped

    const std::vector<GaitEvent> events = segmenter.detect_events(signal, RATE_HZ);

    std::cout << "Events: " << events.size() << std::endl;

    bool passed = events.size() == 1 && events[0].frame == 100;

    if (passed) {
        std::cout << "✓ Test 3: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 3: FAILED" << std::endl;
    }
    return passed;
}

// Test 4: Pauses
bool test_pause_skipped() {
    std::cout << "\n=== Test 4: Walking Pause Skipped ===" << std::endl;

    const SynchronizedSession session = make_session({1.0, 2.0, 3.0, 4.0, 7.5, 8.5}, 10.0);
    StepSegmenter segmenter;
    const SegmentedSession out = segmenter.segment(session);

    bool ids_contiguous = true;
    for (size_t k = 0; k < out.steps.size(); k++) {
        ids_contiguous &= out.steps[k].id == static_cast<int>(k);
    }

    std::cout << "Steps: " << out.steps.size() << std::endl;
    std::cout << "Frame 500 (pause) step id: " << out.frame_step_ids[500] << std::endl;

    bool passed = out.steps.size() == 4 &&
                  ids_contiguous &&
                  out.steps[3].begin_frame == 750 &&
                  out.frame_step_ids[500] == -1 &&
                  out.frame_step_ids[800] == 3;

    if (passed) {
        std::cout << "✓ Test 4: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 4: FAILED" << std::endl;
    }
    return passed;
}

// Test 5: Failure modes
bool test_segmenter_errors() {
    std::cout << "\n=== Test 5: Segmenter Errors ===" << std::endl;

    StepSegmenter segmenter;

    bool too_few_rejected = false;
    try {
        segmenter.segment(make_session({1.0, 2.0, 3.0}, 5.0));
    } catch (const InsufficientStepsError& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        too_few_rejected = true;
    }

    bool missing_channel_rejected = false;
    SynchronizedSession no_gyro = make_session({1.0, 2.0, 3.0, 4.0, 5.0}, 6.0);
    no_gyro.schema = ChannelSchema({"AccelX_R_FOOT", "AccelY_R_FOOT", "AccelZ_R_FOOT", "GyroZ_WAIST"});
    try {
        segmenter.segment(no_gyro);
    } catch (const SchemaMismatchError& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        missing_channel_rejected = true;
    }

    bool bad_config_rejected = false;
    try {
        SegmenterConfig config;
        config.detection_window_s = 0.0;
        StepSegmenter bad(config);
    } catch (const std::invalid_argument& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        bad_config_rejected = true;
    }

    bool passed = too_few_rejected && missing_channel_rejected && bad_config_rejected;

    if (passed) {
        std::cout << "✓ Test 5: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 5: FAILED" << std::endl;
    }
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Step Segmenter Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    bool all_passed = true;

    all_passed &= test_regular_steps();
    all_passed &= test_close_candidates();
    all_passed &= test_edge_peak_discarded();
    all_passed &= test_pause_skipped();
    all_passed &= test_segmenter_errors();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL STEP SEGMENTER TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}
