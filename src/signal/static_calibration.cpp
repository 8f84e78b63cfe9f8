// Static Bias/Orientation Correction Implementation
#include "signal/static_calibration.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"

#include <cmath>
#include <stdexcept>

namespace kam {

std::array<int, 3> find_axis_columns(const SensorStream& stream,
                                     const std::array<std::string, 3>& fields) {
    std::array<int, 3> columns = {-1, -1, -1};
    for (size_t axis = 0; axis < 3; axis++) {
        for (size_t c = 0; c < stream.channel_names.size(); c++) {
            if (stream.channel_names[c] == fields[axis]) {
                columns[axis] = static_cast<int>(c);
                break;
            }
        }
    }
    return columns;
}

namespace {

bool has_all_axes(const std::array<int, 3>& columns) {
    return columns[0] >= 0 && columns[1] >= 0 && columns[2] >= 0;
}

Vector3d mean_triple(const MatrixXd& samples, const std::array<int, 3>& columns) {
    Vector3d mean;
    for (int axis = 0; axis < 3; axis++) {
        mean(axis) = samples.col(columns[axis]).mean();
    }
    return mean;
}

void rotate_triples(MatrixXd& samples, const std::array<int, 3>& columns,
                    const Matrix3d& R, const Vector3d& offset) {
    for (Eigen::Index i = 0; i < samples.rows(); i++) {
        Vector3d v(samples(i, columns[0]), samples(i, columns[1]), samples(i, columns[2]));
        Vector3d rotated = R * (v - offset);
        for (int axis = 0; axis < 3; axis++) {
            samples(i, columns[axis]) = rotated(axis);
        }
    }
}

}  // namespace

SensorAlignment estimate_sensor_alignment(const SensorStream& static_stream) {
    if (static_stream.num_samples() == 0) {
        throw InsufficientDataError("Static recording of " + static_stream.sensor_id + " is empty");
    }

    const auto accel_cols = find_axis_columns(static_stream, ACCEL_FIELDS);
    if (!has_all_axes(accel_cols)) {
        throw InsufficientDataError("Static recording of " + static_stream.sensor_id +
                                    " has no AccelX/Y/Z channels");
    }

    const Vector3d a = mean_triple(static_stream.samples, accel_cols);
    if (a.norm() < 0.5 * GRAVITY) {
        throw PipelineError("Static recording of " + static_stream.sensor_id +
                            " does not measure gravity (|a| = " + std::to_string(a.norm()) + ")");
    }

    SensorAlignment alignment;
    alignment.sensor_id = static_stream.sensor_id;
    alignment.roll_rad = std::atan2(a.y(), a.z());
    alignment.pitch_rad = std::atan2(-a.x(), std::sqrt(a.y() * a.y() + a.z() * a.z()));

    alignment.rotation =
        (Eigen::AngleAxisd(alignment.pitch_rad, Vector3d::UnitY()) *
         Eigen::AngleAxisd(alignment.roll_rad, Vector3d::UnitX())).toRotationMatrix();

    const auto gyro_cols = find_axis_columns(static_stream, GYRO_FIELDS);
    if (has_all_axes(gyro_cols)) {
        alignment.gyro_bias = mean_triple(static_stream.samples, gyro_cols);
    }

    LOG_DEBUG("Alignment %s: roll=%.2f deg, pitch=%.2f deg, |b_g|=%.4f rad/s",
              alignment.sensor_id.c_str(),
              alignment.roll_rad / DEG_TO_RAD, alignment.pitch_rad / DEG_TO_RAD,
              alignment.gyro_bias.norm());

    return alignment;
}

void apply_sensor_alignment(const SensorAlignment& alignment,
                            SensorStream& stream,
                            bool remove_gyro_bias) {
    if (alignment.sensor_id != stream.sensor_id) {
        throw std::invalid_argument("Alignment for " + alignment.sensor_id +
                                    " applied to stream " + stream.sensor_id);
    }

    const auto accel_cols = find_axis_columns(stream, ACCEL_FIELDS);
    if (has_all_axes(accel_cols)) {
        rotate_triples(stream.samples, accel_cols, alignment.rotation, Vector3d::Zero());
    }

    const auto gyro_cols = find_axis_columns(stream, GYRO_FIELDS);
    if (has_all_axes(gyro_cols)) {
        const Vector3d offset = remove_gyro_bias ? alignment.gyro_bias : Vector3d::Zero();
        rotate_triples(stream.samples, gyro_cols, alignment.rotation, offset);
    }
}

}  // namespace kam
