// Moment Estimator Implementation
#include "model/moment_estimator.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace kam {

namespace {

// Row t = [x(t - pad), ..., x(t + pad)], zero rows outside the sequence
MatrixXd im2col(const MatrixXd& x, int kernel) {
    const Eigen::Index L = x.rows();
    const Eigen::Index C = x.cols();
    const int pad = kernel / 2;

    MatrixXd col = MatrixXd::Zero(L, kernel * C);
    for (Eigen::Index t = 0; t < L; t++) {
        for (int k = 0; k < kernel; k++) {
            const Eigen::Index src = t + k - pad;
            if (src >= 0 && src < L) {
                col.block(t, k * C, 1, C) = x.row(src);
            }
        }
    }
    return col;
}

// Adjoint of im2col: scatter-add column blocks back onto their source rows
MatrixXd col2im(const MatrixXd& col, int kernel, Eigen::Index channels) {
    const Eigen::Index L = col.rows();
    const int pad = kernel / 2;

    MatrixXd x = MatrixXd::Zero(L, channels);
    for (Eigen::Index t = 0; t < L; t++) {
        for (int k = 0; k < kernel; k++) {
            const Eigen::Index src = t + k - pad;
            if (src >= 0 && src < L) {
                x.row(src) += col.block(t, k * channels, 1, channels);
            }
        }
    }
    return x;
}

MatrixXd xavier_normal(Eigen::Index rows, Eigen::Index cols,
                       double fan_in, double fan_out, std::mt19937& rng) {
    std::normal_distribution<double> dist(0.0, std::sqrt(2.0 / (fan_in + fan_out)));
    MatrixXd w(rows, cols);
    for (Eigen::Index i = 0; i < rows; i++) {
        for (Eigen::Index j = 0; j < cols; j++) {
            w(i, j) = dist(rng);
        }
    }
    return w;
}

MatrixXd relu(const MatrixXd& z) {
    return z.cwiseMax(0.0);
}

// dA ⊙ 1[z > 0]
MatrixXd relu_backward(const MatrixXd& da, const MatrixXd& z) {
    return (z.array() > 0.0).select(da.array(), 0.0).matrix();
}

}  // namespace

MomentEstimator::MomentEstimator(int input_channels, const EstimatorConfig& config)
    : input_channels_(input_channels),
      config_(config) {

    if (input_channels_ < 1) {
        throw std::invalid_argument("Estimator needs at least one input channel");
    }
    if (config_.hidden_channels < 1) {
        throw std::invalid_argument("hidden_channels must be >= 1");
    }
    if (config_.kernel_size < 1 || config_.kernel_size % 2 == 0) {
        throw std::invalid_argument("kernel_size must be odd and >= 1");
    }

    const int C = input_channels_;
    const int H = config_.hidden_channels;
    const int K = config_.kernel_size;

    std::mt19937 rng(config_.seed);
    params_[CONV1_W] = xavier_normal(H, K * C, K * C, K * H, rng);
    params_[CONV1_B] = MatrixXd::Zero(1, H);
    params_[CONV2_W] = xavier_normal(H, K * H, K * H, K * H, rng);
    params_[CONV2_B] = MatrixXd::Zero(1, H);
    params_[OUT_W] = xavier_normal(NUM_MOMENTS, H, H, NUM_MOMENTS, rng);
    params_[OUT_B] = MatrixXd::Zero(1, NUM_MOMENTS);
    params_[SKIP_W] = config_.skip_connection
                          ? xavier_normal(NUM_MOMENTS, C, C, NUM_MOMENTS, rng)
                          : MatrixXd(MatrixXd::Zero(NUM_MOMENTS, C));
}

void MomentEstimator::check_inputs(const MatrixXd& inputs) const {
    if (inputs.cols() != input_channels_) {
        throw std::invalid_argument("Estimator expects " + std::to_string(input_channels_) +
                                    " channels, got " + std::to_string(inputs.cols()));
    }
    if (inputs.rows() < 1) {
        throw std::invalid_argument("Empty input sequence");
    }
}

void MomentEstimator::forward(const MatrixXd& inputs, ForwardCache& cache) const {
    const int K = config_.kernel_size;

    cache.col1 = im2col(inputs, K);
    cache.z1 = cache.col1 * params_[CONV1_W].transpose();
    cache.z1.rowwise() += params_[CONV1_B].row(0);
    cache.a1 = relu(cache.z1);

    cache.col2 = im2col(cache.a1, K);
    cache.z2 = cache.col2 * params_[CONV2_W].transpose();
    cache.z2.rowwise() += params_[CONV2_B].row(0);
    cache.a2 = relu(cache.z2);

    cache.y = cache.a2 * params_[OUT_W].transpose();
    cache.y.rowwise() += params_[OUT_B].row(0);
    if (config_.skip_connection) {
        cache.y += inputs * params_[SKIP_W].transpose();
    }
}

MatrixXd MomentEstimator::predict(const MatrixXd& inputs) const {
    check_inputs(inputs);
    ForwardCache cache;
    forward(inputs, cache);
    return cache.y;
}

std::vector<MatrixXd> MomentEstimator::predict(const std::vector<MatrixXd>& batch) const {
    std::vector<MatrixXd> out;
    out.reserve(batch.size());
    for (const auto& inputs : batch) {
        out.push_back(predict(inputs));
    }
    return out;
}

double MomentEstimator::accumulate_gradients(const MatrixXd& inputs,
                                             const MatrixXd& targets,
                                             double scale,
                                             ParameterSet& grads) const {
    check_inputs(inputs);
    if (targets.rows() != inputs.rows() || targets.cols() != NUM_MOMENTS) {
        throw std::invalid_argument("Targets must be L x 2 and match the input length");
    }

    const int K = config_.kernel_size;
    const Eigen::Index H = config_.hidden_channels;

    ForwardCache cache;
    forward(inputs, cache);

    const MatrixXd residual = cache.y - targets;
    const MatrixXd dy = scale * residual;

    // === Read-out and skip ===
    grads[OUT_W] += dy.transpose() * cache.a2;
    grads[OUT_B] += dy.colwise().sum();
    if (config_.skip_connection) {
        grads[SKIP_W] += dy.transpose() * inputs;
    }

    // === Second convolution ===
    const MatrixXd dz2 = relu_backward(dy * params_[OUT_W], cache.z2);
    grads[CONV2_W] += dz2.transpose() * cache.col2;
    grads[CONV2_B] += dz2.colwise().sum();

    // === First convolution ===
    const MatrixXd da1 = col2im(dz2 * params_[CONV2_W], K, H);
    const MatrixXd dz1 = relu_backward(da1, cache.z1);
    grads[CONV1_W] += dz1.transpose() * cache.col1;
    grads[CONV1_B] += dz1.colwise().sum();

    return residual.squaredNorm();
}

MomentEstimator::ParameterSet MomentEstimator::zero_like() const {
    ParameterSet zeros;
    for (int p = 0; p < NUM_PARAMS; p++) {
        zeros[p] = MatrixXd::Zero(params_[p].rows(), params_[p].cols());
    }
    return zeros;
}

size_t MomentEstimator::num_weights() const {
    size_t total = 0;
    for (const auto& p : params_) {
        total += static_cast<size_t>(p.size());
    }
    return total;
}

}  // namespace kam
