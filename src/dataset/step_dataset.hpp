// Step-Indexed Dataset
//
// Purpose: Ordered, append-only collection of fixed-length StepSamples with
//          session/subject provenance. Every sample shares one input schema,
//          one label schema and one sequence length L.
//
// Ownership: the dataset owns its samples; once appended a sample can only be
//            read. Merging two datasets requires identical schemas and L
//            (SchemaMismatchError otherwise: silently dropping or reordering
//            channels would corrupt every downstream model).
//
// Sample Usage:
//   StepDataset merged;
//   merged.merge(session_a_steps);
//   merged.merge(session_b_steps);
//   auto subjects = merged.subjects();
//
// Expected Output:
//   - merged.size() == a.size() + b.size(), provenance preserved per sample

#pragma once

#include "core/channel_schema.hpp"
#include "core/sensor_types.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kam {

/**
 * @brief Canonical fixed-length representation of one step
 */
struct StepSample {
    std::string subject_id;
    std::string trial_id;
    int step_id;
    BodySide side;
    double duration_s;              ///< Original step duration before resampling
    MatrixXd inputs;                ///< L × C input channels
    std::optional<MatrixXd> targets;///< L × 2 [adduction, flexion], absent = inference-only

    StepSample() : step_id(-1), side(BodySide::Unknown), duration_s(0.0) {}

    bool has_labels() const { return targets.has_value(); }

    /// "subject/trial#step"
    std::string provenance() const {
        return subject_id + "/" + trial_id + "#" + std::to_string(step_id);
    }
};

class StepDataset {
public:
    StepDataset() : sequence_length_(0) {}

    StepDataset(const ChannelSchema& input_schema,
                const ChannelSchema& label_schema,
                int sequence_length);

    /**
     * @brief Append one sample
     * @throws std::invalid_argument if its shape does not match the dataset
     */
    void append(StepSample sample);

    /**
     * @brief Append every sample of another dataset
     *
     * A default-constructed (schema-less) dataset adopts the other's schema.
     *
     * @throws SchemaMismatchError if schemas or sequence length differ
     */
    void merge(const StepDataset& other);

    /**
     * @brief Samples of the given subjects, in dataset order
     */
    StepDataset select_subjects(const std::vector<std::string>& subjects, bool labeled_only) const;

    /// Sorted unique subject ids.
    std::vector<std::string> subjects() const;

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    size_t num_labeled() const;

    const std::vector<StepSample>& samples() const { return samples_; }
    const StepSample& sample(size_t index) const { return samples_.at(index); }

    const ChannelSchema& input_schema() const { return input_schema_; }
    const ChannelSchema& label_schema() const { return label_schema_; }
    int sequence_length() const { return sequence_length_; }
    bool has_schema() const { return sequence_length_ > 0; }

private:
    ChannelSchema input_schema_;
    ChannelSchema label_schema_;
    int sequence_length_;
    std::vector<StepSample> samples_;
};

}  // namespace kam
