/**
 * @file signal_math.cpp
 * @brief Implementation of time-series math utilities
 */

#include "signal_math.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace kam {

MatrixXd interpolate_rows(const VectorXd& times, const MatrixXd& values, const VectorXd& query) {
    if (times.size() == 0 || times.size() != values.rows()) {
        throw std::invalid_argument("interpolate_rows: times/values size mismatch");
    }

    const Eigen::Index n = times.size();
    MatrixXd out(query.size(), values.cols());

    const double* t_begin = times.data();
    const double* t_end = times.data() + n;

    for (Eigen::Index q = 0; q < query.size(); q++) {
        const double t = query(q);

        if (t <= times(0)) {
            out.row(q) = values.row(0);
            continue;
        }
        if (t >= times(n - 1)) {
            out.row(q) = values.row(n - 1);
            continue;
        }

        // times(i) <= t < times(i + 1)
        const Eigen::Index i = (std::upper_bound(t_begin, t_end, t) - t_begin) - 1;
        const double span = times(i + 1) - times(i);
        const double frac = (t - times(i)) / span;
        out.row(q) = (1.0 - frac) * values.row(i) + frac * values.row(i + 1);
    }

    return out;
}

MatrixXd resample_rows(const MatrixXd& values, Eigen::Index target_rows) {
    if (values.rows() == 0 || target_rows < 1) {
        throw std::invalid_argument("resample_rows: empty input or output");
    }

    const Eigen::Index n = values.rows();
    MatrixXd out(target_rows, values.cols());

    if (n == 1) {
        out = values.row(0).replicate(target_rows, 1);
        return out;
    }
    if (target_rows == 1) {
        out.row(0) = values.row(0);
        return out;
    }

    const double scale = static_cast<double>(n - 1) / static_cast<double>(target_rows - 1);
    for (Eigen::Index j = 0; j < target_rows; j++) {
        const double pos = static_cast<double>(j) * scale;
        Eigen::Index i = static_cast<Eigen::Index>(std::floor(pos));
        if (i >= n - 1) {
            out.row(j) = values.row(n - 1);
            continue;
        }
        const double frac = pos - static_cast<double>(i);
        out.row(j) = (1.0 - frac) * values.row(i) + frac * values.row(i + 1);
    }

    return out;
}

VectorXd uniform_grid(double start_s, double rate_hz, Eigen::Index count) {
    VectorXd grid(count);
    for (Eigen::Index k = 0; k < count; k++) {
        grid(k) = start_s + static_cast<double>(k) / rate_hz;
    }
    return grid;
}

Eigen::Index grid_point_count(double start_s, double end_s, double rate_hz) {
    if (rate_hz <= 0.0 || end_s < start_s) {
        return 0;
    }
    // 1e-6 sample of slack for accumulated rounding at the end point
    return static_cast<Eigen::Index>(std::floor((end_s - start_s) * rate_hz + 1e-6)) + 1;
}

VectorXd row_norm(const MatrixXd& values, const std::vector<int>& columns) {
    VectorXd sq = VectorXd::Zero(values.rows());
    for (int c : columns) {
        sq += values.col(c).cwiseAbs2();
    }
    return sq.cwiseSqrt();
}

RowVectorXd compute_mean(const MatrixXd& samples) {
    if (samples.rows() == 0) {
        return RowVectorXd::Zero(samples.cols());
    }
    return samples.colwise().mean();
}

RowVectorXd compute_variance(const MatrixXd& samples) {
    if (samples.rows() == 0) {
        return RowVectorXd::Zero(samples.cols());
    }

    RowVectorXd mean = compute_mean(samples);
    MatrixXd centered = samples.rowwise() - mean;
    return centered.cwiseAbs2().colwise().sum() / static_cast<double>(samples.rows());
}

double pearson_correlation(const VectorXd& a, const VectorXd& b) {
    if (a.size() != b.size() || a.size() < 2) {
        return 0.0;
    }

    VectorXd da = a.array() - a.mean();
    VectorXd db = b.array() - b.mean();
    const double denom = std::sqrt(da.squaredNorm() * db.squaredNorm());
    if (denom < 1e-12) {
        return 0.0;
    }
    return da.dot(db) / denom;
}

} // namespace kam
