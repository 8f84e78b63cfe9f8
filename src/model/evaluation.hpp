// Moment estimation scores and subject-held-out cross validation
//
// Purpose: Score predicted moment curves against ground truth per step,
//          average them per subject and log result tables.
//
// Per step and output (true curve t, predicted curve p, length L):
//   r2          = 1 - Σ(t - p)² / Σ(t - mean(t))²
//   rmse        = sqrt(mean((t - p)²))
//   mae         = mean(|t - p|)
//   r_rmse      = rmse / (max t + max p - min t - min p) / 2
//   correlation = pearson(t, p)
//
// Optional weights (same shape as the labels) restrict every score to the
// samples whose weight equals 1, e.g. the stance phase only. r2_all is the
// R² of all scored samples of one subject pooled over its steps.
//
// Sample Usage:
//   auto scores = evaluate_by_subject(*checkpoint, scaled_test);
//   log_scores_table(scores);
//
// Expected Output:
//   Subject  Output                   R2  R2_all    RMSE     MAE  rRMSE    Corr
//   S04      KNEE_ADDUCTION_MOMENT  0.91   0.934   0.121   0.094  0.041   0.962

#pragma once

#include "dataset/step_dataset.hpp"
#include "model/moment_estimator.hpp"
#include "model/moment_trainer.hpp"

#include <array>
#include <string>
#include <vector>

namespace kam {

struct MomentScores {
    double r2;
    double r2_all;          ///< Pooled over all steps (subject scores only)
    double rmse;
    double mae;
    double r_rmse;
    double correlation;

    MomentScores() : r2(0.0), r2_all(0.0), rmse(0.0), mae(0.0), r_rmse(0.0), correlation(0.0) {}
};

/**
 * @brief Scores of one subject, averaged over its steps
 */
struct SubjectScores {
    std::string subject_id;
    size_t num_steps;
    std::array<MomentScores, NUM_MOMENTS> moments;  ///< [adduction, flexion]

    SubjectScores() : num_steps(0) {}
};

/**
 * @brief Scores of one predicted curve against its ground truth
 *
 * @param weights Optional per-sample weights, only samples with weight 1 are scored
 * @throws std::invalid_argument on a size mismatch or when no sample is scored
 */
MomentScores score_curve(const VectorXd& truth, const VectorXd& prediction,
                         const VectorXd* weights = nullptr);

/**
 * @brief Predict every labeled sample and average step scores per subject
 *
 * @param weights Optional, one L × 2 weight matrix per dataset sample (in
 *                dataset order); nullptr scores every sample
 * @return One entry per subject, sorted by subject id
 * @throws std::invalid_argument if weights do not match the dataset or leave
 *         a labeled step without any scored sample
 */
std::vector<SubjectScores> evaluate_by_subject(const MomentEstimator& estimator,
                                               const StepDataset& dataset,
                                               const std::vector<MatrixXd>* weights = nullptr);

/**
 * @brief Mean of several subjects' scores (each subject weighs equally)
 */
SubjectScores mean_scores(const std::vector<SubjectScores>& scores, const std::string& label);

void log_scores_table(const std::vector<SubjectScores>& scores);

struct CrossValidationResult {
    std::vector<SubjectScores> per_subject;   ///< Every test subject of every fold
    SubjectScores mean;                       ///< Mean over per_subject
};

/**
 * @brief Leave-N-subjects-out cross validation
 *
 * Each fold trains a fresh estimator (scaler fitted on the fold's training
 * subjects only) and scores it on the held-out subjects.
 *
 * @throws std::invalid_argument on invalid subject lists (see cross_validation_folds)
 */
CrossValidationResult cross_validate(const StepDataset& dataset,
                                     const std::vector<std::string>& subjects,
                                     size_t test_subjects_per_fold,
                                     const EstimatorConfig& estimator_config,
                                     const TrainingConfig& training_config);

}  // namespace kam
