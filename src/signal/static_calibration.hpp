// Static Bias/Orientation Correction
//
// Purpose: Align each IMU's vertical axis with gravity using a standing
//          (static) recording, and optionally remove the gyroscope bias.
// Reference: "Tilt Sensing Using a Three-Axis Accelerometer" - Freescale AN3461
//
// Math:
//   ā = mean accelerometer vector while standing still
//   roll  = atan2(ā_y, ā_z)
//   pitch = atan2(-ā_x, sqrt(ā_y² + ā_z²))
//   R = Ry(pitch) · Rx(roll)          so that R · ā = [0, 0, |ā|]
//
//   Every accelerometer and gyroscope triple of that sensor is then rotated:
//   a' = R · a,  ω' = R · (ω - b_g)
//
// Yaw is unobservable from gravity and left unchanged.
//
// Sample Usage:
//   SensorAlignment align = estimate_sensor_alignment(static_stream);
//   apply_sensor_alignment(align, walking_stream, true);
//
// Expected Output:
//   - Static accelerometer mean mapped onto +Z
//   - Gyroscope mean ≈ 0 after bias removal

#pragma once

#include "core/sensor_types.hpp"
#include "core/types.hpp"

#include <array>
#include <string>

namespace kam {

// Channel field names used by IMU streams
const std::array<std::string, 3> ACCEL_FIELDS = {"AccelX", "AccelY", "AccelZ"};
const std::array<std::string, 3> GYRO_FIELDS = {"GyroX", "GyroY", "GyroZ"};

/**
 * @brief Per-sensor correction estimated from a static recording
 */
struct SensorAlignment {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    std::string sensor_id;
    Matrix3d rotation;      ///< Sensor frame -> gravity-aligned frame
    Vector3d gyro_bias;     ///< Mean static angular rate [rad/s]
    double roll_rad;
    double pitch_rad;

    SensorAlignment()
        : rotation(Matrix3d::Identity()), gyro_bias(Vector3d::Zero()),
          roll_rad(0.0), pitch_rad(0.0) {}
};

/**
 * @brief Column indices of a 3-axis field triple, or -1 entries if absent
 */
std::array<int, 3> find_axis_columns(const SensorStream& stream,
                                     const std::array<std::string, 3>& fields);

/**
 * @brief Estimate roll/pitch alignment and gyro bias from a static recording
 *
 * The stream must already be in SI units and contain AccelX/Y/Z.
 *
 * @throws InsufficientDataError if the stream has no samples or no accelerometer
 * @throws PipelineError if the mean acceleration is too small to define vertical
 */
SensorAlignment estimate_sensor_alignment(const SensorStream& static_stream);

/**
 * @brief Rotate accelerometer/gyroscope triples of a stream in place
 *
 * @param alignment Correction for this sensor
 * @param stream Stream in SI units (sensor ids must match)
 * @param remove_gyro_bias Subtract the static gyro bias before rotating
 */
void apply_sensor_alignment(const SensorAlignment& alignment,
                            SensorStream& stream,
                            bool remove_gyro_bias);

}  // namespace kam
