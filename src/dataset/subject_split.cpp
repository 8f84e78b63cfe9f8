// Subject-held-out dataset splits
#include "dataset/subject_split.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace kam {

DatasetSplit split_by_subject(const StepDataset& dataset,
                              const std::vector<std::string>& train_subjects,
                              const std::vector<std::string>& validation_subjects,
                              const std::vector<std::string>& test_subjects) {
    if (train_subjects.empty()) {
        throw std::invalid_argument("At least one training subject required");
    }

    std::set<std::string> seen;
    for (const auto* list : {&train_subjects, &validation_subjects, &test_subjects}) {
        for (const auto& subject : *list) {
            if (!seen.insert(subject).second) {
                throw std::invalid_argument("Subject " + subject + " listed in more than one split");
            }
        }
    }

    DatasetSplit split;
    split.train = dataset.select_subjects(train_subjects, true);
    split.validation = dataset.select_subjects(validation_subjects, true);
    split.test = dataset.select_subjects(test_subjects, true);

    LOG_DEBUG("Split: train=%zu steps (%zu subjects), validation=%zu, test=%zu",
              split.train.size(), train_subjects.size(), split.validation.size(), split.test.size());

    return split;
}

std::vector<SubjectFold> cross_validation_folds(const std::vector<std::string>& subjects,
                                                size_t test_subjects_per_fold) {
    if (test_subjects_per_fold == 0) {
        throw std::invalid_argument("test_subjects_per_fold must be >= 1");
    }
    if (subjects.size() < 2) {
        throw std::invalid_argument("Cross validation needs at least 2 subjects");
    }
    if (std::set<std::string>(subjects.begin(), subjects.end()).size() != subjects.size()) {
        throw std::invalid_argument("Duplicate subject ids in cross validation list");
    }

    const size_t num_folds = (subjects.size() + test_subjects_per_fold - 1) / test_subjects_per_fold;

    std::vector<SubjectFold> folds;
    folds.reserve(num_folds);
    for (size_t k = 0; k < num_folds; k++) {
        const size_t begin = k * test_subjects_per_fold;
        const size_t end = std::min(begin + test_subjects_per_fold, subjects.size());

        SubjectFold fold;
        for (size_t i = 0; i < subjects.size(); i++) {
            if (i >= begin && i < end) {
                fold.test_subjects.push_back(subjects[i]);
            } else {
                fold.train_subjects.push_back(subjects[i]);
            }
        }
        if (fold.train_subjects.empty()) {
            throw std::invalid_argument("Fold " + std::to_string(k) + " leaves no training subject");
        }
        folds.push_back(std::move(fold));
    }
    return folds;
}

}  // namespace kam
