// Step-Indexed Dataset Implementation
#include "dataset/step_dataset.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace kam {

StepDataset::StepDataset(const ChannelSchema& input_schema,
                         const ChannelSchema& label_schema,
                         int sequence_length)
    : input_schema_(input_schema),
      label_schema_(label_schema),
      sequence_length_(sequence_length) {
    if (sequence_length < 1) {
        throw std::invalid_argument("Sequence length must be >= 1");
    }
}

void StepDataset::append(StepSample sample) {
    if (!has_schema()) {
        throw std::invalid_argument("Cannot append to a dataset without schema");
    }
    if (sample.inputs.rows() != sequence_length_ ||
        sample.inputs.cols() != static_cast<Eigen::Index>(input_schema_.size())) {
        throw std::invalid_argument("Sample " + sample.provenance() + ": input shape mismatch");
    }
    if (sample.targets &&
        (sample.targets->rows() != sequence_length_ ||
         sample.targets->cols() != static_cast<Eigen::Index>(label_schema_.size()))) {
        throw std::invalid_argument("Sample " + sample.provenance() + ": target shape mismatch");
    }
    samples_.push_back(std::move(sample));
}

void StepDataset::merge(const StepDataset& other) {
    if (!other.has_schema()) {
        return;
    }
    if (!has_schema()) {
        input_schema_ = other.input_schema_;
        label_schema_ = other.label_schema_;
        sequence_length_ = other.sequence_length_;
    } else {
        if (input_schema_ != other.input_schema_) {
            throw SchemaMismatchError("Input channels differ: " +
                                      input_schema_.describe_difference(other.input_schema_));
        }
        if (label_schema_ != other.label_schema_) {
            throw SchemaMismatchError("Label channels differ: " +
                                      label_schema_.describe_difference(other.label_schema_));
        }
        if (sequence_length_ != other.sequence_length_) {
            throw SchemaMismatchError("Sequence length differs: " + std::to_string(sequence_length_) +
                                      " vs " + std::to_string(other.sequence_length_));
        }
    }

    samples_.insert(samples_.end(), other.samples_.begin(), other.samples_.end());
}

StepDataset StepDataset::select_subjects(const std::vector<std::string>& subjects,
                                         bool labeled_only) const {
    StepDataset out;
    out.input_schema_ = input_schema_;
    out.label_schema_ = label_schema_;
    out.sequence_length_ = sequence_length_;

    const std::set<std::string> wanted(subjects.begin(), subjects.end());
    for (const auto& sample : samples_) {
        if (wanted.count(sample.subject_id) == 0) {
            continue;
        }
        if (labeled_only && !sample.has_labels()) {
            continue;
        }
        out.samples_.push_back(sample);
    }
    return out;
}

std::vector<std::string> StepDataset::subjects() const {
    std::set<std::string> unique;
    for (const auto& sample : samples_) {
        unique.insert(sample.subject_id);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

size_t StepDataset::num_labeled() const {
    return static_cast<size_t>(std::count_if(samples_.begin(), samples_.end(),
                                             [](const StepSample& s) { return s.has_labels(); }));
}

}  // namespace kam
