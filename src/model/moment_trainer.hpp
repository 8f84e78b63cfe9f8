// Moment Trainer - Adam optimization of a MomentEstimator
//
// Purpose: Single owner of the estimator parameters during training.
//          Runs shuffled mini-batch epochs, logs an epoch table and hands out
//          frozen checkpoints for concurrent read-only evaluation.
//
// Loss (batch of B labeled samples, L rows, 2 outputs):
//   loss = Σ_b Σ_t Σ_o (Y_bto - T_bto)² / (B · L · 2)
//
// Adam (per parameter matrix θ, gradient g, step n):
//   g ← g + λ·θ                        (weight decay, λ >= 0)
//   m ← β1·m + (1 - β1)·g
//   v ← β2·v + (1 - β2)·g²
//   θ ← θ - lr · (m / (1 - β1ⁿ)) / (sqrt(v / (1 - β2ⁿ)) + ε)
//
// A non-finite loss stops training before any parameter is touched and
// throws NonFiniteLossError naming the samples of the offending batch.
// A non-finite validation loss throws the same error naming the
// validation samples that produced it.
//
// Sample Usage:
//   MomentTrainer trainer(MomentEstimator(channels, model_config), train_config);
//   trainer.fit(split.train, &split.validation);
//   auto checkpoint = trainer.checkpoint();
//
// Expected Output:
//   Epoch  Train_Loss   Vali_Loss  Duration
//       1    0.412300    0.398100    12.3ms
//   ...

#pragma once

#include "dataset/step_dataset.hpp"
#include "model/moment_estimator.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace kam {

/**
 * @brief Optimizer and schedule configuration
 */
struct TrainingConfig {
    int epochs;
    size_t batch_size;
    double learning_rate;
    double weight_decay;
    double beta1;
    double beta2;
    double epsilon;
    uint32_t shuffle_seed;      ///< Fixed seed for per-epoch batch shuffling
    bool log_epochs;            ///< Print the epoch table

    TrainingConfig()
        : epochs(30),
          batch_size(16),
          learning_rate(1e-3),
          weight_decay(0.0),
          beta1(0.9),
          beta2(0.999),
          epsilon(1e-8),
          shuffle_seed(0),
          log_epochs(true) {}
};

struct EpochRecord {
    int epoch;
    double train_loss;
    double validation_loss;     ///< NaN without a validation set
    double duration_ms;
};

class MomentTrainer {
public:
    /**
     * @throws std::invalid_argument on invalid configuration
     */
    MomentTrainer(MomentEstimator estimator, const TrainingConfig& config = TrainingConfig());

    /**
     * @brief One Adam step on a labeled batch
     *
     * @return Mean-squared loss of the batch before the update
     * @throws std::invalid_argument on an empty batch or an unlabeled sample
     * @throws NonFiniteLossError if the loss is NaN or infinite
     */
    double train_step(const std::vector<const StepSample*>& batch);

    /**
     * @brief Train for config.epochs epochs
     *
     * @param train Labeled training samples
     * @param validation Optional labeled validation samples (may be nullptr or empty)
     * @return One record per epoch
     * @throws std::invalid_argument if train has no labeled sample
     * @throws NonFiniteLossError if a training or validation loss is NaN or infinite
     */
    std::vector<EpochRecord> fit(const StepDataset& train, const StepDataset* validation = nullptr);

    /**
     * @brief Mean-squared loss over every labeled sample of a dataset (no update)
     */
    double evaluate_loss(const StepDataset& dataset) const;

    /**
     * @brief Frozen copy of the current parameters
     */
    std::shared_ptr<const MomentEstimator> checkpoint() const;

    const MomentEstimator& estimator() const { return estimator_; }
    const TrainingConfig& config() const { return config_; }
    int64_t step_count() const { return step_count_; }

private:
    void apply_adam(MomentEstimator::ParameterSet& grads);

    MomentEstimator estimator_;
    TrainingConfig config_;

    MomentEstimator::ParameterSet first_moment_;
    MomentEstimator::ParameterSet second_moment_;
    int64_t step_count_;
};

}  // namespace kam
