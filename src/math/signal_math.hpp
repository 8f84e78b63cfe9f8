/**
 * @file signal_math.hpp
 * @brief Common time-series operations shared by the pipeline stages
 *
 * Purpose: Interpolation, resampling and column statistics on row-per-sample
 * Eigen matrices. Thin wrappers around Eigen for code clarity.
 *
 * References:
 * - Eigen Dense: https://eigen.tuxfamily.org/dox/group__TutorialMatrixArithmetic.html
 *
 * Sample Input:
 *   - times = [0, 1, 2], values = [[0], [10], [20]], query = [0.5, 1.25]
 * Expected Output:
 *   - interpolate_rows(...) = [[5], [12.5]]
 */

#ifndef KAM_MATH_SIGNAL_MATH_HPP
#define KAM_MATH_SIGNAL_MATH_HPP

#include "core/types.hpp"

#include <vector>

namespace kam {

/**
 * @brief Piecewise-linear interpolation of every column
 *
 * Query points outside [times.front(), times.back()] are clamped to the
 * boundary sample; callers are responsible for never querying outside the
 * recorded range when extrapolation matters.
 *
 * @param times Strictly increasing sample times (size N)
 * @param values N × C samples
 * @param query Query times (size M, any order)
 * @return M × C interpolated samples
 */
MatrixXd interpolate_rows(const VectorXd& times, const MatrixXd& values, const VectorXd& query);

/**
 * @brief Resample a sequence to a new number of rows by index-space interpolation
 *
 * Row 0 maps to row 0 and the last row to the last row, so the full shape
 * of the sequence is preserved (no cropping).
 *
 * @param values N × C samples (N >= 2, or N == 1 for a constant sequence)
 * @param target_rows Output length (>= 1)
 */
MatrixXd resample_rows(const MatrixXd& values, Eigen::Index target_rows);

/**
 * @brief Uniform time grid: start_s + k / rate_hz for k = 0..count-1
 */
VectorXd uniform_grid(double start_s, double rate_hz, Eigen::Index count);

/**
 * @brief Number of grid points at rate_hz that fit in [start_s, end_s]
 *
 * A small tolerance absorbs floating-point error at the end point.
 */
Eigen::Index grid_point_count(double start_s, double end_s, double rate_hz);

/**
 * @brief Euclidean norm of selected columns, per row
 */
VectorXd row_norm(const MatrixXd& values, const std::vector<int>& columns);

/**
 * @brief Column mean of samples
 */
RowVectorXd compute_mean(const MatrixXd& samples);

/**
 * @brief Column variance (population) of samples
 */
RowVectorXd compute_variance(const MatrixXd& samples);

/**
 * @brief Pearson correlation coefficient (0 if either input is constant)
 */
double pearson_correlation(const VectorXd& a, const VectorXd& b);

inline bool all_finite(const MatrixXd& m) {
    return m.allFinite();
}

} // namespace kam

#endif // KAM_MATH_SIGNAL_MATH_HPP
