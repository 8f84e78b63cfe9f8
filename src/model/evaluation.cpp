// Moment estimation scores and cross validation
#include "model/evaluation.hpp"
#include "dataset/channel_scaler.hpp"
#include "dataset/subject_split.hpp"
#include "math/signal_math.hpp"
#include "utils/logger.hpp"

#include <array>
#include <cmath>
#include <map>
#include <string>
#include <stdexcept>

namespace kam {

namespace {

double r2_score(const VectorXd& truth, const VectorXd& prediction) {
    const double ss_res = (truth - prediction).squaredNorm();
    const double ss_tot = (truth.array() - truth.mean()).square().sum();
    if (ss_tot > 0.0) {
        return 1.0 - ss_res / ss_tot;
    }
    return ss_res == 0.0 ? 1.0 : 0.0;
}

// Entries of v whose weight is exactly 1
VectorXd scored_entries(const VectorXd& v, const VectorXd& weights) {
    VectorXd out((weights.array() == 1.0).count());
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < v.size(); i++) {
        if (weights(i) == 1.0) {
            out(k++) = v(i);
        }
    }
    return out;
}

void append(std::vector<double>& pool, const VectorXd& v) {
    pool.insert(pool.end(), v.data(), v.data() + v.size());
}

}  // namespace

MomentScores score_curve(const VectorXd& truth, const VectorXd& prediction,
                         const VectorXd* weights) {
    if (truth.size() != prediction.size() ||
        (weights != nullptr && weights->size() != truth.size())) {
        throw std::invalid_argument("Curves and weights must be of equal length");
    }
    if (weights != nullptr) {
        return score_curve(scored_entries(truth, *weights), scored_entries(prediction, *weights));
    }
    if (truth.size() == 0) {
        throw std::invalid_argument("No scored sample in curve");
    }

    const VectorXd error = truth - prediction;
    const double n = static_cast<double>(truth.size());

    MomentScores s;
    s.r2 = r2_score(truth, prediction);
    s.r2_all = s.r2;
    s.rmse = std::sqrt(error.squaredNorm() / n);
    s.mae = error.cwiseAbs().sum() / n;

    const double span = truth.maxCoeff() + prediction.maxCoeff() -
                        truth.minCoeff() - prediction.minCoeff();
    s.r_rmse = span > 0.0 ? s.rmse / span / 2.0 : 0.0;
    s.correlation = pearson_correlation(truth, prediction);
    return s;
}

std::vector<SubjectScores> evaluate_by_subject(const MomentEstimator& estimator,
                                               const StepDataset& dataset,
                                               const std::vector<MatrixXd>* weights) {
    if (weights != nullptr && weights->size() != dataset.size()) {
        throw std::invalid_argument("Expected " + std::to_string(dataset.size()) +
                                    " weight matrices, got " + std::to_string(weights->size()));
    }

    struct Pool {
        std::array<std::vector<double>, NUM_MOMENTS> truth;
        std::array<std::vector<double>, NUM_MOMENTS> prediction;
    };
    std::map<std::string, SubjectScores> by_subject;
    std::map<std::string, Pool> pools;

    for (size_t i = 0; i < dataset.size(); i++) {
        const StepSample& sample = dataset.sample(i);
        if (!sample.has_labels()) {
            continue;
        }

        const MatrixXd& targets = *sample.targets;
        const MatrixXd* w = weights != nullptr ? &(*weights)[i] : nullptr;
        if (w != nullptr && (w->rows() != targets.rows() || w->cols() != targets.cols())) {
            throw std::invalid_argument("Weights of " + sample.provenance() +
                                        " do not match its label shape");
        }

        const MatrixXd prediction = estimator.predict(sample.inputs);
        SubjectScores& acc = by_subject[sample.subject_id];
        Pool& pool = pools[sample.subject_id];
        acc.subject_id = sample.subject_id;
        acc.num_steps++;

        for (int o = 0; o < NUM_MOMENTS; o++) {
            VectorXd truth = targets.col(o);
            VectorXd predicted = prediction.col(o);
            if (w != nullptr) {
                const VectorXd weight_col = w->col(o);
                truth = scored_entries(truth, weight_col);
                predicted = scored_entries(predicted, weight_col);
                if (truth.size() == 0) {
                    throw std::invalid_argument("No scored sample in output " + std::to_string(o) +
                                                " of " + sample.provenance());
                }
            }

            const MomentScores s = score_curve(truth, predicted);
            acc.moments[o].r2 += s.r2;
            acc.moments[o].rmse += s.rmse;
            acc.moments[o].mae += s.mae;
            acc.moments[o].r_rmse += s.r_rmse;
            acc.moments[o].correlation += s.correlation;
            append(pool.truth[o], truth);
            append(pool.prediction[o], predicted);
        }
    }

    std::vector<SubjectScores> out;
    out.reserve(by_subject.size());
    for (auto& entry : by_subject) {
        SubjectScores& acc = entry.second;
        const Pool& pool = pools[entry.first];
        const double inv = 1.0 / static_cast<double>(acc.num_steps);
        for (int o = 0; o < NUM_MOMENTS; o++) {
            MomentScores& m = acc.moments[o];
            m.r2 *= inv;
            m.rmse *= inv;
            m.mae *= inv;
            m.r_rmse *= inv;
            m.correlation *= inv;

            const Eigen::Index n = static_cast<Eigen::Index>(pool.truth[o].size());
            m.r2_all = r2_score(Eigen::Map<const VectorXd>(pool.truth[o].data(), n),
                                Eigen::Map<const VectorXd>(pool.prediction[o].data(), n));
        }
        out.push_back(acc);
    }
    return out;
}

SubjectScores mean_scores(const std::vector<SubjectScores>& scores, const std::string& label) {
    SubjectScores mean;
    mean.subject_id = label;
    if (scores.empty()) {
        return mean;
    }

    for (const auto& subject : scores) {
        mean.num_steps += subject.num_steps;
        for (int o = 0; o < NUM_MOMENTS; o++) {
            mean.moments[o].r2 += subject.moments[o].r2;
            mean.moments[o].r2_all += subject.moments[o].r2_all;
            mean.moments[o].rmse += subject.moments[o].rmse;
            mean.moments[o].mae += subject.moments[o].mae;
            mean.moments[o].r_rmse += subject.moments[o].r_rmse;
            mean.moments[o].correlation += subject.moments[o].correlation;
        }
    }

    const double inv = 1.0 / static_cast<double>(scores.size());
    for (auto& m : mean.moments) {
        m.r2 *= inv;
        m.r2_all *= inv;
        m.rmse *= inv;
        m.mae *= inv;
        m.r_rmse *= inv;
        m.correlation *= inv;
    }
    return mean;
}

void log_scores_table(const std::vector<SubjectScores>& scores) {
    const ChannelSchema outputs = ChannelSchema::moment_labels();

    LOG_INFO("%-10s %-22s %6s %7s %8s %8s %7s %7s %6s",
             "Subject", "Output", "R2", "R2_all", "RMSE", "MAE", "rRMSE", "Corr", "Steps");
    for (const auto& subject : scores) {
        for (int o = 0; o < NUM_MOMENTS; o++) {
            const MomentScores& m = subject.moments[o];
            LOG_INFO("%-10s %-22s %6.3f %7.3f %8.3f %8.3f %7.3f %7.3f %6zu",
                     subject.subject_id.c_str(), outputs.name(o).c_str(),
                     m.r2, m.r2_all, m.rmse, m.mae, m.r_rmse, m.correlation, subject.num_steps);
        }
    }
}

CrossValidationResult cross_validate(const StepDataset& dataset,
                                     const std::vector<std::string>& subjects,
                                     size_t test_subjects_per_fold,
                                     const EstimatorConfig& estimator_config,
                                     const TrainingConfig& training_config) {
    const std::vector<SubjectFold> folds = cross_validation_folds(subjects, test_subjects_per_fold);

    CrossValidationResult result;
    for (size_t k = 0; k < folds.size(); k++) {
        const SubjectFold& fold = folds[k];

        std::string test_list;
        for (const auto& s : fold.test_subjects) {
            test_list += (test_list.empty() ? "" : ",") + s;
        }
        LOG_INFO("Cross validation fold %zu/%zu: test subjects [%s]",
                 k + 1, folds.size(), test_list.c_str());

        const DatasetSplit split = split_by_subject(dataset, fold.train_subjects, {}, fold.test_subjects);
        if (split.train.empty()) {
            LOG_WARN("Fold %zu: no labeled training steps, skipped", k + 1);
            continue;
        }

        ChannelScaler scaler;
        scaler.fit(split.train);
        const StepDataset train = scaler.transform(split.train);
        const StepDataset test = scaler.transform(split.test);

        MomentTrainer trainer(MomentEstimator(static_cast<int>(train.input_schema().size()),
                                              estimator_config),
                              training_config);
        trainer.fit(train);

        const auto checkpoint = trainer.checkpoint();
        const std::vector<SubjectScores> fold_scores = evaluate_by_subject(*checkpoint, test);
        log_scores_table(fold_scores);

        result.per_subject.insert(result.per_subject.end(), fold_scores.begin(), fold_scores.end());
    }

    result.mean = mean_scores(result.per_subject, "mean");
    LOG_INFO("Cross validation summary over %zu subject(s):", result.per_subject.size());
    log_scores_table({result.mean});

    return result;
}

}  // namespace kam
