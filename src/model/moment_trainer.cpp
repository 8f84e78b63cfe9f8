// Moment Trainer Implementation
#include "model/moment_trainer.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"
#include "utils/timing.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

namespace kam {

namespace {

std::string batch_provenance(const std::vector<const StepSample*>& batch) {
    std::string out;
    for (const auto* sample : batch) {
        if (!out.empty()) {
            out += ", ";
        }
        out += sample->provenance();
    }
    return out;
}

}  // namespace

MomentTrainer::MomentTrainer(MomentEstimator estimator, const TrainingConfig& config)
    : estimator_(std::move(estimator)),
      config_(config),
      step_count_(0) {

    if (config_.epochs < 0 || config_.batch_size == 0) {
        throw std::invalid_argument("epochs must be >= 0 and batch_size >= 1");
    }
    if (config_.learning_rate <= 0.0 || config_.weight_decay < 0.0) {
        throw std::invalid_argument("learning_rate must be > 0 and weight_decay >= 0");
    }
    if (config_.beta1 < 0.0 || config_.beta1 >= 1.0 ||
        config_.beta2 < 0.0 || config_.beta2 >= 1.0 || config_.epsilon <= 0.0) {
        throw std::invalid_argument("Adam betas must lie in [0, 1) and epsilon > 0");
    }

    first_moment_ = estimator_.zero_like();
    second_moment_ = estimator_.zero_like();
}

double MomentTrainer::train_step(const std::vector<const StepSample*>& batch) {
    if (batch.empty()) {
        throw std::invalid_argument("Empty training batch");
    }

    double num_values = 0.0;
    for (const auto* sample : batch) {
        if (!sample->has_labels()) {
            throw std::invalid_argument("Sample " + sample->provenance() + " has no ground truth");
        }
        num_values += static_cast<double>(sample->targets->size());
    }

    const double scale = 2.0 / num_values;
    MomentEstimator::ParameterSet grads = estimator_.zero_like();

    double sse = 0.0;
    for (const auto* sample : batch) {
        sse += estimator_.accumulate_gradients(sample->inputs, *sample->targets, scale, grads);
    }

    const double loss = sse / num_values;
    if (!std::isfinite(loss)) {
        throw NonFiniteLossError("Non-finite training loss at step " + std::to_string(step_count_ + 1),
                                 batch_provenance(batch));
    }

    apply_adam(grads);
    return loss;
}

void MomentTrainer::apply_adam(MomentEstimator::ParameterSet& grads) {
    step_count_++;
    const double n = static_cast<double>(step_count_);
    const double bias1 = 1.0 - std::pow(config_.beta1, n);
    const double bias2 = 1.0 - std::pow(config_.beta2, n);

    MomentEstimator::ParameterSet& params = estimator_.parameters();
    for (int p = 0; p < MomentEstimator::NUM_PARAMS; p++) {
        MatrixXd& g = grads[p];
        if (config_.weight_decay > 0.0) {
            g += config_.weight_decay * params[p];
        }

        first_moment_[p] = config_.beta1 * first_moment_[p] + (1.0 - config_.beta1) * g;
        second_moment_[p] = config_.beta2 * second_moment_[p] +
                            (1.0 - config_.beta2) * g.cwiseProduct(g);

        const auto m_hat = first_moment_[p].array() / bias1;
        const auto v_hat = second_moment_[p].array() / bias2;
        params[p].array() -= config_.learning_rate * m_hat / (v_hat.sqrt() + config_.epsilon);
    }
}

double MomentTrainer::evaluate_loss(const StepDataset& dataset) const {
    double sse = 0.0;
    double num_values = 0.0;
    for (const auto& sample : dataset.samples()) {
        if (!sample.has_labels()) {
            continue;
        }
        sse += (estimator_.predict(sample.inputs) - *sample.targets).squaredNorm();
        num_values += static_cast<double>(sample.targets->size());
    }
    return num_values > 0.0 ? sse / num_values : std::numeric_limits<double>::quiet_NaN();
}

std::vector<EpochRecord> MomentTrainer::fit(const StepDataset& train, const StepDataset* validation) {
    std::vector<const StepSample*> labeled;
    for (const auto& sample : train.samples()) {
        if (sample.has_labels()) {
            labeled.push_back(&sample);
        }
    }
    if (labeled.empty()) {
        throw std::invalid_argument("Training set has no labeled sample");
    }

    const bool has_validation = validation != nullptr && validation->num_labeled() > 0;

    LOG_INFO("Training: %zu steps, %d epochs, batch %zu, lr %.2e, %zu weights",
             labeled.size(), config_.epochs, config_.batch_size, config_.learning_rate,
             estimator_.num_weights());
    if (config_.log_epochs) {
        LOG_INFO("%6s %12s %12s %10s", "Epoch", "Train_Loss", "Vali_Loss", "Duration");
    }

    std::mt19937 rng(config_.shuffle_seed);
    std::vector<EpochRecord> history;
    history.reserve(static_cast<size_t>(config_.epochs));

    for (int epoch = 1; epoch <= config_.epochs; epoch++) {
        const int64_t start_ns = monotonic_time_ns();
        std::shuffle(labeled.begin(), labeled.end(), rng);

        double weighted_loss = 0.0;
        for (size_t begin = 0; begin < labeled.size(); begin += config_.batch_size) {
            const size_t end = std::min(begin + config_.batch_size, labeled.size());
            const std::vector<const StepSample*> batch(labeled.begin() + begin, labeled.begin() + end);
            weighted_loss += train_step(batch) * static_cast<double>(batch.size());
        }

        EpochRecord record;
        record.epoch = epoch;
        record.train_loss = weighted_loss / static_cast<double>(labeled.size());
        record.validation_loss = has_validation ? evaluate_loss(*validation)
                                                : std::numeric_limits<double>::quiet_NaN();
        if (has_validation && !std::isfinite(record.validation_loss)) {
            std::vector<const StepSample*> offending;
            for (const auto& sample : validation->samples()) {
                if (sample.has_labels() &&
                    !std::isfinite((estimator_.predict(sample.inputs) - *sample.targets).squaredNorm())) {
                    offending.push_back(&sample);
                }
            }
            throw NonFiniteLossError("Non-finite validation loss at epoch " + std::to_string(epoch),
                                     "validation: " + batch_provenance(offending));
        }
        record.duration_ms = elapsed_ms_since(start_ns);
        history.push_back(record);

        if (config_.log_epochs) {
            LOG_INFO("%6d %12.6f %12.6f %8.1fms", record.epoch, record.train_loss,
                     record.validation_loss, record.duration_ms);
        }
    }

    return history;
}

std::shared_ptr<const MomentEstimator> MomentTrainer::checkpoint() const {
    return std::make_shared<const MomentEstimator>(estimator_);
}

}  // namespace kam
