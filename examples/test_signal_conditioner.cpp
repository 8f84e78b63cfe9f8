// Signal Conditioner Unit Tests
//
// Purpose: Validate conditioning of raw sensor streams
// Tests:
//   1. Butterworth low-pass: unity DC gain, stop-band attenuation, zero phase
//   2. Resampling of jittered timestamps onto a uniform grid
//   3. Gap policy: long gaps split the stream, short segments are dropped
//   4. InsufficientDataError below min_samples
//   5. Unit normalization (g, deg/s -> SI)
//   6. Static calibration recovers mounting tilt and gyro bias
//   7. One low-pass design filters every segment of a split stream

#include "core/errors.hpp"
#include "filter/butterworth.hpp"
#include "signal/signal_conditioner.hpp"
#include "signal/static_calibration.hpp"
#include "validation/synthetic_gait.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace kam;

namespace {

SensorStream make_stream(const std::string& id, double rate_hz, const std::vector<double>& times_s,
                         double (*f)(double)) {
    SensorStream s;
    s.sensor_id = id;
    s.nominal_rate_hz = rate_hz;
    s.channel_names = {"AccelX"};
    s.channel_units = {Unit::MetersPerSecondSq};
    s.samples.resize(static_cast<Eigen::Index>(times_s.size()), 1);
    for (size_t i = 0; i < times_s.size(); i++) {
        s.timestamps_ns.push_back(seconds_to_ns(times_s[i]));
        s.samples(static_cast<Eigen::Index>(i), 0) = f(times_s[i]);
    }
    return s;
}

double ramp(double t) { return 2.0 * t + 1.0; }

// 1 Hz motion plus 30 Hz vibration
double two_tone(double t) {
    return std::sin(2.0 * M_PI * t) + 0.3 * std::sin(2.0 * M_PI * 30.0 * t);
}

}  // namespace

// Test 1: Butterworth response
bool test_butterworth() {
    std::cout << "\n=== Test 1: Butterworth Low-Pass ===" << std::endl;

    const double fs = 100.0;
    ButterworthLowPass lp(4, 10.0, fs);

    const int n = 1000;
    VectorXd dc = VectorXd::Constant(n, 3.0);
    VectorXd slow(n), fast(n);
    for (int i = 0; i < n; i++) {
        const double t = i / fs;
        slow(i) = std::sin(2.0 * M_PI * 1.0 * t);
        fast(i) = std::sin(2.0 * M_PI * 40.0 * t);
    }

    const double dc_error = (lp.filtfilt(dc).array() - 3.0).abs().maxCoeff();

    // Interior only: edges carry padding effects
    const VectorXd slow_f = lp.filtfilt(slow);
    const double slow_error = (slow_f - slow).segment(100, 800).cwiseAbs().maxCoeff();
    const double fast_gain = lp.filtfilt(fast).segment(100, 800).cwiseAbs().maxCoeff();

    bool rejected = false;
    try {
        ButterworthLowPass bad(4, 50.0, fs);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }

    std::cout << "Sections: " << lp.num_sections() << std::endl;
    std::cout << "DC error: " << dc_error << std::endl;
    std::cout << "1 Hz passband error (zero phase): " << slow_error << std::endl;
    std::cout << "40 Hz residual amplitude: " << fast_gain << std::endl;

    bool passed = lp.num_sections() == 2 && dc_error < 1e-9 && slow_error < 1e-3 &&
                  fast_gain < 1e-3 && rejected;

    if (passed) {
        std::cout << "✓ Test 1: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 1: FAILED" << std::endl;
    }
    return passed;
}

// Test 2: Jittered timestamps -> uniform grid
bool test_uniform_resampling() {
    std::cout << "\n=== Test 2: Uniform Resampling ===" << std::endl;

    std::vector<double> times;
    for (int i = 0; i <= 200; i++) {
        const double jitter = (i % 3 == 1) ? 0.002 : ((i % 3 == 2) ? -0.001 : 0.0);
        times.push_back(i * 0.01 + (i == 0 || i == 200 ? 0.0 : jitter));
    }

    ConditionerConfig config;
    config.lowpass_cutoff_hz = 0.0;     // isolate the resampling
    SignalConditioner conditioner(config);

    const ConditionedStream out = conditioner.condition(make_stream("R_FOOT", 100.0, times, ramp));
    const UniformSegment& seg = out.segments.front();

    double max_error = 0.0;
    for (Eigen::Index i = 0; i < seg.num_samples(); i++) {
        max_error = std::max(max_error, std::abs(seg.samples(i, 0) - ramp(seg.time_at(i))));
    }

    std::cout << "Segments: " << out.segments.size() << ", samples: " << seg.num_samples()
              << ", rate: " << seg.rate_hz << " Hz" << std::endl;
    std::cout << "Max interpolation error on ramp: " << max_error << std::endl;

    bool passed = out.segments.size() == 1 && seg.num_samples() == 201 &&
                  std::abs(seg.rate_hz - 100.0) < 1e-12 && max_error < 1e-6;

    if (passed) {
        std::cout << "✓ Test 2: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 2: FAILED" << std::endl;
    }
    return passed;
}

// Test 3: Gap policy
bool test_gap_policy() {
    std::cout << "\n=== Test 3: Gap Policy ===" << std::endl;

    // 0..1 s, 0.5 s gap, 1.5..3 s, 0.3 s gap, two lone samples
    std::vector<double> times;
    for (int i = 0; i <= 100; i++) times.push_back(i * 0.01);
    for (int i = 150; i <= 300; i++) times.push_back(i * 0.01);
    times.push_back(3.3);
    times.push_back(3.31);

    ConditionerConfig config;
    config.lowpass_cutoff_hz = 0.0;
    SignalConditioner conditioner(config);

    const SensorStream stream = make_stream("WAIST", 100.0, times, ramp);
    const auto ranges = conditioner.split_at_gaps(stream);
    const ConditionedStream out = conditioner.condition(stream);

    std::cout << "Ranges: " << ranges.size() << ", segments kept: " << out.segments.size() << std::endl;
    for (const auto& seg : out.segments) {
        std::cout << "  [" << seg.start_s << ", " << seg.end_s() << "] s" << std::endl;
    }

    bool passed = ranges.size() == 3 && out.segments.size() == 2 &&
                  std::abs(out.segments[0].end_s() - 1.0) < 1e-9 &&
                  std::abs(out.segments[1].start_s - 1.5) < 1e-9 &&
                  std::abs(out.segments[1].end_s() - 3.0) < 1e-9;

    if (passed) {
        std::cout << "✓ Test 3: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 3: FAILED" << std::endl;
    }
    return passed;
}

// Test 4: Too few samples
bool test_insufficient_data() {
    std::cout << "\n=== Test 4: Insufficient Data ===" << std::endl;

    SignalConditioner conditioner;

    bool short_rejected = false;
    try {
        conditioner.condition(make_stream("R_FOOT", 100.0, {0.0, 0.01}, ramp));
    } catch (const InsufficientDataError& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        short_rejected = true;
    }

    // Every segment shorter than min_samples
    bool fragmented_rejected = false;
    try {
        conditioner.condition(make_stream("R_FOOT", 100.0, {0.0, 0.01, 1.0, 1.01, 2.0, 2.01}, ramp));
    } catch (const InsufficientDataError& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        fragmented_rejected = true;
    }

    bool unordered_rejected = false;
    try {
        conditioner.condition(make_stream("R_FOOT", 100.0, {0.0, 0.02, 0.01, 0.03}, ramp));
    } catch (const PipelineError& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        unordered_rejected = true;
    }

    bool passed = short_rejected && fragmented_rejected && unordered_rejected;

    if (passed) {
        std::cout << "✓ Test 4: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 4: FAILED" << std::endl;
    }
    return passed;
}

// Test 5: Unit normalization
bool test_unit_conversion() {
    std::cout << "\n=== Test 5: Unit Normalization ===" << std::endl;

    SensorStream s;
    s.sensor_id = "SHANK";
    s.nominal_rate_hz = 100.0;
    s.channel_names = {"AccelZ", "GyroX", "Force"};
    s.channel_units = {Unit::StandardGravity, Unit::DegreesPerSecond, Unit::NewtonMeters};
    s.samples.resize(1, 3);
    s.samples << 1.0, 180.0, 5.0;
    s.timestamps_ns = {0};

    const SensorStream si = SignalConditioner::to_si_units(s);

    std::cout << "1 g -> " << si.samples(0, 0) << " m/s²" << std::endl;
    std::cout << "180 deg/s -> " << si.samples(0, 1) << " rad/s" << std::endl;

    bool passed = std::abs(si.samples(0, 0) - GRAVITY) < 1e-12 &&
                  std::abs(si.samples(0, 1) - M_PI) < 1e-12 &&
                  si.samples(0, 2) == 5.0 &&
                  si.channel_units[0] == Unit::MetersPerSecondSq &&
                  si.channel_units[1] == Unit::RadiansPerSecond;

    if (passed) {
        std::cout << "✓ Test 5: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 5: FAILED" << std::endl;
    }
    return passed;
}

// Test 6: Static calibration
bool test_static_calibration() {
    std::cout << "\n=== Test 6: Static Calibration ===" << std::endl;

    SyntheticGait::Params params;
    params.gyro_bias_rad_s = 0.05;
    params.accel_noise_std = 0.01;
    params.gyro_noise_std = 0.002;
    SyntheticGait gait(params, 7);

    SyntheticGait::SensorSpec spec("R_THIGH", 100.0, false);
    spec.roll_rad = 10.0 * DEG_TO_RAD;
    spec.pitch_rad = -15.0 * DEG_TO_RAD;

    const SensorStream standing = gait.generate_static_stream(spec);
    const SensorAlignment alignment = estimate_sensor_alignment(standing);

    SensorStream corrected = standing;
    apply_sensor_alignment(alignment, corrected, true);
    const Vector3d accel_mean(corrected.samples.col(0).mean(),
                              corrected.samples.col(1).mean(),
                              corrected.samples.col(2).mean());
    const Vector3d gyro_mean(corrected.samples.col(3).mean(),
                             corrected.samples.col(4).mean(),
                             corrected.samples.col(5).mean());

    std::cout << "Roll: " << alignment.roll_rad / DEG_TO_RAD << " deg (true 10)" << std::endl;
    std::cout << "Pitch: " << alignment.pitch_rad / DEG_TO_RAD << " deg (true -15)" << std::endl;
    std::cout << "Aligned gravity: " << accel_mean.transpose() << std::endl;
    std::cout << "Residual gyro: " << gyro_mean.transpose() << std::endl;

    bool mismatch_rejected = false;
    SensorStream other = standing;
    other.sensor_id = "WAIST";
    try {
        apply_sensor_alignment(alignment, other, true);
    } catch (const std::invalid_argument&) {
        mismatch_rejected = true;
    }

    bool passed = std::abs(alignment.roll_rad - spec.roll_rad) < 0.2 * DEG_TO_RAD &&
                  std::abs(alignment.pitch_rad - spec.pitch_rad) < 0.2 * DEG_TO_RAD &&
                  accel_mean.head<2>().norm() < 0.01 &&
                  std::abs(accel_mean.z() - GRAVITY) < 0.01 &&
                  gyro_mean.norm() < 1e-3 &&
                  mismatch_rejected;

    if (passed) {
        std::cout << "✓ Test 6: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 6: FAILED" << std::endl;
    }
    return passed;
}

// Test 7: Low-pass across segments
bool test_segment_filtering() {
    std::cout << "\n=== Test 7: Segment Filtering ===" << std::endl;

    // 0..2 s, 0.5 s gap, 2.5..5 s
    std::vector<double> times;
    for (int i = 0; i <= 200; i++) times.push_back(i * 0.01);
    for (int i = 250; i <= 500; i++) times.push_back(i * 0.01);
    const SensorStream stream = make_stream("R_FOOT", 100.0, times, two_tone);

    ConditionerConfig filtered_config;
    filtered_config.lowpass_cutoff_hz = 10.0;
    ConditionerConfig raw_config;
    raw_config.lowpass_cutoff_hz = 0.0;
    ConditionerConfig above_nyquist_config;
    above_nyquist_config.lowpass_cutoff_hz = 60.0;

    const ConditionedStream filtered = SignalConditioner(filtered_config).condition(stream);
    const ConditionedStream raw = SignalConditioner(raw_config).condition(stream);
    const ConditionedStream above_nyquist = SignalConditioner(above_nyquist_config).condition(stream);

    const ButterworthLowPass reference(filtered_config.filter_order, 10.0, 100.0);

    bool shapes_match = filtered.segments.size() == 2 && raw.segments.size() == 2 &&
                        above_nyquist.segments.size() == 2;
    double max_design_diff = 0.0;
    double max_unfiltered_diff = 0.0;
    double max_vibration = 0.0;
    for (size_t k = 0; shapes_match && k < 2; k++) {
        const MatrixXd expected = reference.filtfilt_columns(raw.segments[k].samples);
        max_design_diff = std::max(max_design_diff,
                                   (filtered.segments[k].samples - expected).cwiseAbs().maxCoeff());
        max_unfiltered_diff = std::max(max_unfiltered_diff,
                                       (above_nyquist.segments[k].samples - raw.segments[k].samples)
                                           .cwiseAbs().maxCoeff());

        // Residual 30 Hz content away from the segment edges
        const UniformSegment& seg = filtered.segments[k];
        for (Eigen::Index i = 50; i + 50 < seg.num_samples(); i++) {
            max_vibration = std::max(max_vibration,
                                     std::abs(seg.samples(i, 0) - std::sin(2.0 * M_PI * seg.time_at(i))));
        }
    }

    std::cout << "Segments: " << filtered.segments.size() << std::endl;
    std::cout << "Max difference to a single filter design: " << max_design_diff << std::endl;
    std::cout << "Max residual vibration: " << max_vibration << std::endl;

    bool passed = shapes_match &&
                  max_design_diff < 1e-12 &&
                  max_unfiltered_diff == 0.0 &&
                  max_vibration < 0.02;

    if (passed) {
        std::cout << "✓ Test 7: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 7: FAILED" << std::endl;
    }
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Signal Conditioner Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    bool all_passed = true;

    all_passed &= test_butterworth();
    all_passed &= test_uniform_resampling();
    all_passed &= test_gap_policy();
    all_passed &= test_insufficient_data();
    all_passed &= test_unit_conversion();
    all_passed &= test_static_calibration();
    all_passed &= test_segment_filtering();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL SIGNAL CONDITIONER TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}
