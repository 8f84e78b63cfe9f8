// Subject-held-out dataset splits
//
// Purpose: Partition a StepDataset by subject so that no subject's steps
//          appear in more than one of train / validation / test.
//
// Cross-validation folds (leave-N-subjects-out):
//   fold k tests subjects [k·N, (k+1)·N) of the given list and trains on
//   all others; ceil(S / N) folds in total.
//
// Only labeled samples enter a split; inference-only steps stay out.
//
// Sample Usage:
//   auto split = split_by_subject(dataset, {"S01", "S02"}, {"S03"}, {"S04"});
//   auto folds = cross_validation_folds(dataset.subjects(), 1);
//
// Expected Output:
//   - split.train, split.validation, split.test share no subject id

#pragma once

#include "dataset/step_dataset.hpp"

#include <string>
#include <vector>

namespace kam {

struct DatasetSplit {
    StepDataset train;
    StepDataset validation;
    StepDataset test;
};

/**
 * @brief Subject lists of one cross-validation fold
 */
struct SubjectFold {
    std::vector<std::string> train_subjects;
    std::vector<std::string> test_subjects;
};

/**
 * @brief Split a dataset by explicit subject lists
 *
 * @throws std::invalid_argument if a subject is listed in more than one split
 *         or the training list is empty
 */
DatasetSplit split_by_subject(const StepDataset& dataset,
                              const std::vector<std::string>& train_subjects,
                              const std::vector<std::string>& validation_subjects,
                              const std::vector<std::string>& test_subjects);

/**
 * @brief Leave-N-subjects-out folds over a subject list
 *
 * @throws std::invalid_argument if test_subjects_per_fold is 0, the list has
 *         duplicates, or fewer than 2 subjects are given
 */
std::vector<SubjectFold> cross_validation_folds(const std::vector<std::string>& subjects,
                                                size_t test_subjects_per_fold);

}  // namespace kam
