/**
 * @file types.hpp
 * @brief Core type definitions using Eigen library for the gait moment pipeline
 *
 * Purpose: Provides strongly-typed aliases for all numerical containers used
 * throughout the pipeline. Time series are stored row-per-sample,
 * column-per-channel in dynamic Eigen matrices.
 *
 * References:
 * - Eigen: https://eigen.tuxfamily.org/dox/group__QuickRefPage.html
 * - DESIGN.md: Data model section
 *
 * Sample Input: N/A (type definitions only)
 * Expected Output: Compile-time type safety for all numerical operations
 */

#ifndef KAM_CORE_TYPES_HPP
#define KAM_CORE_TYPES_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <cstdint>

namespace kam {

// ========== Time series containers ==========
// Layout: one row per sample, one column per channel

using VectorXd = Eigen::VectorXd;
using RowVectorXd = Eigen::RowVectorXd;
using MatrixXd = Eigen::MatrixXd;

using Vector3d = Eigen::Vector3d;
using Matrix3d = Eigen::Matrix3d;

// ========== Constants ==========

// Standard gravity
constexpr double GRAVITY = 9.80665;  // m/s²

constexpr double DEG_TO_RAD = 0.017453292519943295;

// Predicted outputs per timestep: [adduction, flexion]
constexpr int NUM_MOMENTS = 2;

// Canonical resampled step length (samples per gait cycle)
constexpr int DEFAULT_STEP_LENGTH = 100;

// Timestamp type (nanoseconds, device clock)
using timestamp_t = int64_t;

inline double ns_to_seconds(timestamp_t t_ns) {
    return static_cast<double>(t_ns) * 1e-9;
}

inline timestamp_t seconds_to_ns(double t_s) {
    return static_cast<timestamp_t>(t_s * 1e9 + (t_s >= 0.0 ? 0.5 : -0.5));
}

} // namespace kam

#endif // KAM_CORE_TYPES_HPP
