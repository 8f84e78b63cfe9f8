/**
 * @file synthetic_gait.hpp
 * @brief Synthetic walking-session generator for software-first validation
 *
 * Purpose: Generate multi-sensor IMU sessions with known heel-strike times
 * and ground-truth knee moment curves, so that every pipeline stage can be
 * tested without lab recordings.
 *
 * Signal model (per sensor, gait phase φ ∈ [0, 1) since the last heel strike):
 * - Foot sensors: gyro norm spikes at every heel strike (Gaussian pulse) with
 *   a smaller swing-phase bump; other sensors carry phase-locked sinusoids
 * - Accelerometer: gravity on Z plus phase-locked sinusoids
 * - Optional sensor tilt (roll/pitch) applied to every triple, with a matching
 *   standing recording in Session::static_streams
 * - Ground truth: adduction (double hump) and flexion curves during stance
 *   (φ < stance_fraction), zero in swing, in N·m/kg
 *
 * Sample Input:
 *   - R_FOOT at 100 Hz, WAIST at 60 Hz, 12 s, stride period 1 s
 *
 * Expected Output:
 *   - Session with 2 streams, heel strikes at first_heel_strike_s + k·1 s
 */

#ifndef KAM_VALIDATION_SYNTHETIC_GAIT_HPP
#define KAM_VALIDATION_SYNTHETIC_GAIT_HPP

#include "core/sensor_types.hpp"

#include <random>
#include <string>
#include <vector>

namespace kam {

/**
 * @brief Synthetic gait generator with seeded noise
 */
class SyntheticGait {
public:
    /**
     * @brief One simulated IMU
     */
    struct SensorSpec {
        std::string sensor_id;
        double rate_hz;
        double start_offset_s;      ///< First sample time relative to session start [s]
        double end_trim_s;          ///< Recording stops this early [s]
        double clock_offset_s;      ///< Added to every timestamp (unsynchronized clock) [s]
        double gap_start_s;         ///< Dropout start (< 0: none) [s]
        double gap_duration_s;      ///< Dropout length [s]
        bool foot;                  ///< Heel-strike spikes on the gyroscope
        double roll_rad;            ///< Mounting tilt
        double pitch_rad;

        SensorSpec(const std::string& id = "R_FOOT", double rate = 100.0, bool is_foot = true)
            : sensor_id(id), rate_hz(rate), start_offset_s(0.0), end_trim_s(0.0),
              clock_offset_s(0.0), gap_start_s(-1.0), gap_duration_s(0.0),
              foot(is_foot), roll_rad(0.0), pitch_rad(0.0) {}
    };

    /**
     * @brief Session-level parameters
     */
    struct Params {
        std::vector<SensorSpec> sensors;
        double duration_s;
        double stride_period_s;
        double first_heel_strike_s;
        double stance_fraction;
        double heel_strike_peak_rad_s;
        double swing_peak_rad_s;
        double accel_noise_std;         ///< [m/s²]
        double gyro_noise_std;          ///< [rad/s]
        double gyro_bias_rad_s;         ///< Constant bias on every gyro axis
        bool vendor_units;              ///< Emit g and deg/s instead of SI
        bool ground_truth;
        double ground_truth_rate_hz;
        double ground_truth_offset_s;   ///< Ground-truth clock offset [s]
        bool static_recording;
        double static_duration_s;
        double adduction_peak;          ///< [N·m/kg]
        double flexion_peak;            ///< [N·m/kg]

        Params()
            : sensors({SensorSpec("R_FOOT", 100.0, true), SensorSpec("WAIST", 60.0, false)}),
              duration_s(12.0),
              stride_period_s(1.0),
              first_heel_strike_s(1.0),
              stance_fraction(0.6),
              heel_strike_peak_rad_s(6.0),
              swing_peak_rad_s(1.0),
              accel_noise_std(0.05),
              gyro_noise_std(0.02),
              gyro_bias_rad_s(0.0),
              vendor_units(false),
              ground_truth(true),
              ground_truth_rate_hz(100.0),
              ground_truth_offset_s(0.0),
              static_recording(false),
              static_duration_s(2.0),
              adduction_peak(0.5),
              flexion_peak(0.6) {}
    };

    /**
     * @brief Constructor
     * @param params Session parameters
     * @param seed Random seed (0 = random)
     */
    explicit SyntheticGait(const Params& params = Params(), uint32_t seed = 42);

    /**
     * @brief Generate a complete session
     */
    Session generate_session(const std::string& subject_id, const std::string& trial_id);

    /**
     * @brief Generate one sensor's walking stream
     */
    SensorStream generate_stream(const SensorSpec& spec);

    /**
     * @brief Generate one sensor's standing recording (before the walk)
     */
    SensorStream generate_static_stream(const SensorSpec& spec);

    /**
     * @brief Ground-truth [adduction, flexion] stream
     */
    SensorStream generate_ground_truth();

    /// Heel-strike times within the session [s].
    std::vector<double> heel_strike_times() const;

    /// Gait phase at t (0 before the first heel strike).
    double phase_at(double t) const;

    double adduction_moment(double phase) const;
    double flexion_moment(double phase) const;

    const Params& params() const { return params_; }

private:
    Vector3d true_accel(const SensorSpec& spec, double t) const;
    Vector3d true_gyro(const SensorSpec& spec, double t) const;
    double heel_strike_pulse(double t) const;
    double sample_normal(double std_dev);

    Params params_;
    std::mt19937 rng_;
    std::normal_distribution<double> normal_dist_;
};

} // namespace kam

#endif // KAM_VALIDATION_SYNTHETIC_GAIT_HPP
