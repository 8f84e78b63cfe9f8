/**
 * @file synthetic_gait.cpp
 * @brief Implementation of synthetic gait generator
 */

#include "synthetic_gait.hpp"
#include "signal/static_calibration.hpp"

#include <chrono>
#include <cmath>

namespace kam {

namespace {

constexpr double TWO_PI = 2.0 * M_PI;

// Width of the heel-strike gyro pulse [s]
constexpr double HEEL_STRIKE_SIGMA_S = 0.03;

// Width and phase of the swing-phase gyro bump
constexpr double SWING_SIGMA_S = 0.08;
constexpr double SWING_PHASE = 0.75;

// Sensor frame -> level frame, same convention as estimate_sensor_alignment
Matrix3d mounting_rotation(double roll_rad, double pitch_rad) {
    return (Eigen::AngleAxisd(pitch_rad, Vector3d::UnitY()) *
            Eigen::AngleAxisd(roll_rad, Vector3d::UnitX())).toRotationMatrix();
}

std::vector<std::string> imu_fields() {
    return {ACCEL_FIELDS[0], ACCEL_FIELDS[1], ACCEL_FIELDS[2],
            GYRO_FIELDS[0], GYRO_FIELDS[1], GYRO_FIELDS[2]};
}

}  // namespace

SyntheticGait::SyntheticGait(const Params& params, uint32_t seed)
    : params_(params),
      normal_dist_(0.0, 1.0) {
    if (seed == 0) {
        seed = static_cast<uint32_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }
    rng_.seed(seed);
}

double SyntheticGait::sample_normal(double std_dev) {
    return std_dev * normal_dist_(rng_);
}

std::vector<double> SyntheticGait::heel_strike_times() const {
    std::vector<double> times;
    for (double t = params_.first_heel_strike_s; t < params_.duration_s; t += params_.stride_period_s) {
        times.push_back(t);
    }
    return times;
}

double SyntheticGait::phase_at(double t) const {
    if (t < params_.first_heel_strike_s) {
        return 0.0;
    }
    const double since = std::fmod(t - params_.first_heel_strike_s, params_.stride_period_s);
    return since / params_.stride_period_s;
}

double SyntheticGait::adduction_moment(double phase) const {
    if (phase >= params_.stance_fraction) {
        return 0.0;
    }
    const double s = phase / params_.stance_fraction;
    return params_.adduction_peak * (std::sin(M_PI * s) + 0.4 * std::sin(3.0 * M_PI * s));
}

double SyntheticGait::flexion_moment(double phase) const {
    if (phase >= params_.stance_fraction) {
        return 0.0;
    }
    const double s = phase / params_.stance_fraction;
    return params_.flexion_peak * std::sin(TWO_PI * s);
}

double SyntheticGait::heel_strike_pulse(double t) const {
    double pulse = 0.0;
    for (double t_hs : heel_strike_times()) {
        const double d = (t - t_hs) / HEEL_STRIKE_SIGMA_S;
        if (std::abs(d) < 8.0) {
            pulse += std::exp(-0.5 * d * d);
        }
    }
    return pulse;
}

Vector3d SyntheticGait::true_accel(const SensorSpec& spec, double t) const {
    const double phi = phase_at(t);
    const double swing_scale = spec.foot ? 1.5 : 0.5;
    return Vector3d(1.0 * std::sin(TWO_PI * phi),
                    0.5 * std::sin(2.0 * TWO_PI * phi),
                    GRAVITY + swing_scale * std::cos(TWO_PI * phi));
}

Vector3d SyntheticGait::true_gyro(const SensorSpec& spec, double t) const {
    const double phi = phase_at(t);
    if (!spec.foot) {
        return Vector3d(0.5 * std::sin(TWO_PI * phi),
                        0.3 * std::cos(TWO_PI * phi),
                        0.4 * std::sin(2.0 * TWO_PI * phi));
    }

    const double swing_d = (phi - SWING_PHASE) * params_.stride_period_s / SWING_SIGMA_S;
    const double swing = t >= params_.first_heel_strike_s
                             ? params_.swing_peak_rad_s * std::exp(-0.5 * swing_d * swing_d)
                             : 0.0;
    return Vector3d(0.4 * std::sin(TWO_PI * phi),
                    0.2 * std::cos(TWO_PI * phi),
                    params_.heel_strike_peak_rad_s * heel_strike_pulse(t) + swing);
}

SensorStream SyntheticGait::generate_stream(const SensorSpec& spec) {
    SensorStream stream;
    stream.sensor_id = spec.sensor_id;
    stream.nominal_rate_hz = spec.rate_hz;
    stream.channel_names = imu_fields();
    stream.channel_units = params_.vendor_units
        ? std::vector<Unit>{Unit::StandardGravity, Unit::StandardGravity, Unit::StandardGravity,
                            Unit::DegreesPerSecond, Unit::DegreesPerSecond, Unit::DegreesPerSecond}
        : std::vector<Unit>{Unit::MetersPerSecondSq, Unit::MetersPerSecondSq, Unit::MetersPerSecondSq,
                            Unit::RadiansPerSecond, Unit::RadiansPerSecond, Unit::RadiansPerSecond};

    const Matrix3d to_sensor = mounting_rotation(spec.roll_rad, spec.pitch_rad).transpose();
    const double end_s = params_.duration_s - spec.end_trim_s;
    const double accel_scale = params_.vendor_units ? 1.0 / GRAVITY : 1.0;
    const double gyro_scale = params_.vendor_units ? 1.0 / DEG_TO_RAD : 1.0;

    std::vector<RowVectorXd> rows;
    for (long k = 0;; k++) {
        const double t = spec.start_offset_s + static_cast<double>(k) / spec.rate_hz;
        if (t > end_s) {
            break;
        }
        if (spec.gap_start_s >= 0.0 && t >= spec.gap_start_s &&
            t < spec.gap_start_s + spec.gap_duration_s) {
            continue;
        }

        const Vector3d accel = to_sensor * true_accel(spec, t);
        const Vector3d gyro = to_sensor * true_gyro(spec, t);

        RowVectorXd row(6);
        for (int axis = 0; axis < 3; axis++) {
            row(axis) = (accel(axis) + sample_normal(params_.accel_noise_std)) * accel_scale;
            row(3 + axis) = (gyro(axis) + params_.gyro_bias_rad_s +
                             sample_normal(params_.gyro_noise_std)) * gyro_scale;
        }
        rows.push_back(row);
        stream.timestamps_ns.push_back(seconds_to_ns(t + spec.clock_offset_s));
    }

    stream.samples.resize(static_cast<Eigen::Index>(rows.size()), 6);
    for (size_t i = 0; i < rows.size(); i++) {
        stream.samples.row(static_cast<Eigen::Index>(i)) = rows[i];
    }
    return stream;
}

SensorStream SyntheticGait::generate_static_stream(const SensorSpec& spec) {
    SensorStream stream;
    stream.sensor_id = spec.sensor_id;
    stream.nominal_rate_hz = spec.rate_hz;
    stream.channel_names = imu_fields();
    stream.channel_units = std::vector<Unit>{
        Unit::MetersPerSecondSq, Unit::MetersPerSecondSq, Unit::MetersPerSecondSq,
        Unit::RadiansPerSecond, Unit::RadiansPerSecond, Unit::RadiansPerSecond};

    const Vector3d gravity_sensor =
        mounting_rotation(spec.roll_rad, spec.pitch_rad).transpose() * Vector3d(0.0, 0.0, GRAVITY);

    const auto n = static_cast<Eigen::Index>(std::floor(params_.static_duration_s * spec.rate_hz)) + 1;
    stream.samples.resize(n, 6);
    for (Eigen::Index i = 0; i < n; i++) {
        for (int axis = 0; axis < 3; axis++) {
            stream.samples(i, axis) = gravity_sensor(axis) + sample_normal(params_.accel_noise_std);
            stream.samples(i, 3 + axis) = params_.gyro_bias_rad_s + sample_normal(params_.gyro_noise_std);
        }
        stream.timestamps_ns.push_back(seconds_to_ns(static_cast<double>(i) / spec.rate_hz));
    }
    return stream;
}

SensorStream SyntheticGait::generate_ground_truth() {
    SensorStream gt;
    gt.sensor_id = "FORCE_PLATE";
    gt.nominal_rate_hz = params_.ground_truth_rate_hz;
    gt.channel_names = {KNEE_ADDUCTION_MOMENT, KNEE_FLEXION_MOMENT};
    gt.channel_units = {Unit::NewtonMetersPerKilogram, Unit::NewtonMetersPerKilogram};

    const auto n = static_cast<Eigen::Index>(
        std::floor(params_.duration_s * params_.ground_truth_rate_hz)) + 1;
    gt.samples.resize(n, NUM_MOMENTS);
    for (Eigen::Index i = 0; i < n; i++) {
        const double t = static_cast<double>(i) / params_.ground_truth_rate_hz;
        const double phi = phase_at(t);
        gt.samples(i, 0) = adduction_moment(phi);
        gt.samples(i, 1) = flexion_moment(phi);
        gt.timestamps_ns.push_back(seconds_to_ns(t + params_.ground_truth_offset_s));
    }
    return gt;
}

Session SyntheticGait::generate_session(const std::string& subject_id, const std::string& trial_id) {
    Session session;
    session.info.subject_id = subject_id;
    session.info.trial_id = trial_id;
    session.info.side = BodySide::Right;
    session.info.body_weight_kg = 70.0;
    session.info.body_height_m = 1.75;

    for (const auto& spec : params_.sensors) {
        session.streams.push_back(generate_stream(spec));
        if (params_.static_recording) {
            session.static_streams.push_back(generate_static_stream(spec));
        }
    }

    if (params_.ground_truth) {
        session.ground_truth = generate_ground_truth();
    }

    return session;
}

} // namespace kam
