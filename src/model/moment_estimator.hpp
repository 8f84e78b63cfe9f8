// Moment Estimator - temporal convolutional network
//
// Purpose: Map one L × C step sample to an L × 2 sequence of knee moments
//          [adduction, flexion].
//
// Architecture (K odd, "same" zero padding, H hidden channels):
//   Z1 = conv1d(X, W1) + b1          A1 = relu(Z1)        (L × H)
//   Z2 = conv1d(A1, W2) + b2         A2 = relu(Z2)        (L × H)
//   Y  = A2·Woᵀ + bo + X·Wsᵀ                              (L × 2)
//
// conv1d is computed as im2col(X)·Wᵀ where row t of im2col(X) concatenates
// X[t - K/2], ..., X[t + K/2] (zero rows outside [0, L)). Ws is the linear
// skip path from the input channels to the outputs.
//
// Parameters are Xavier-normal initialized from a seeded generator, biases
// start at zero. Inference is const and deterministic.
//
// Sample Usage:
//   MomentEstimator model(dataset.input_schema().size(), EstimatorConfig());
//   MatrixXd moments = model.predict(sample.inputs);
//
// Expected Output:
//   - moments.rows() == sample.inputs.rows(), moments.cols() == 2

#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace kam {

/**
 * @brief Network shape and initialization
 */
struct EstimatorConfig {
    int hidden_channels;    ///< H
    int kernel_size;        ///< K (odd)
    bool skip_connection;   ///< Linear input-to-output path
    uint32_t seed;          ///< Initialization seed

    EstimatorConfig()
        : hidden_channels(32),
          kernel_size(5),
          skip_connection(true),
          seed(0) {}
};

class MomentEstimator {
public:
    // Indices into the parameter set
    enum Param {
        CONV1_W = 0,    ///< H × (K·C)
        CONV1_B,        ///< 1 × H
        CONV2_W,        ///< H × (K·H)
        CONV2_B,        ///< 1 × H
        OUT_W,          ///< 2 × H
        OUT_B,          ///< 1 × 2
        SKIP_W,         ///< 2 × C
        NUM_PARAMS
    };

    using ParameterSet = std::array<MatrixXd, NUM_PARAMS>;

    /**
     * @throws std::invalid_argument on invalid shape configuration
     */
    MomentEstimator(int input_channels, const EstimatorConfig& config = EstimatorConfig());

    /**
     * @brief Estimate moments for one step
     *
     * @param inputs L × C
     * @return L × 2
     * @throws std::invalid_argument on a channel count mismatch
     */
    MatrixXd predict(const MatrixXd& inputs) const;

    /**
     * @brief Estimate moments for a batch of steps (input order preserved)
     */
    std::vector<MatrixXd> predict(const std::vector<MatrixXd>& batch) const;

    /**
     * @brief Forward + backward pass for one labeled sample
     *
     * Backpropagates dY = scale · (Y - T) and adds the parameter gradients
     * to grads. For a mean-squared loss over N values use scale = 2 / N.
     *
     * @return Σ (Y - T)² over the sample
     */
    double accumulate_gradients(const MatrixXd& inputs,
                                const MatrixXd& targets,
                                double scale,
                                ParameterSet& grads) const;

    /**
     * @brief Zero-filled set shaped like the parameters
     */
    ParameterSet zero_like() const;

    const ParameterSet& parameters() const { return params_; }
    ParameterSet& parameters() { return params_; }

    int input_channels() const { return input_channels_; }
    const EstimatorConfig& config() const { return config_; }
    size_t num_weights() const;

private:
    struct ForwardCache {
        MatrixXd col1;
        MatrixXd z1;
        MatrixXd a1;
        MatrixXd col2;
        MatrixXd z2;
        MatrixXd a2;
        MatrixXd y;
    };

    void forward(const MatrixXd& inputs, ForwardCache& cache) const;
    void check_inputs(const MatrixXd& inputs) const;

    int input_channels_;
    EstimatorConfig config_;
    ParameterSet params_;
};

}  // namespace kam
