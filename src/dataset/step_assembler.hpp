// Step Assembler - fixed-length step samples from a segmented session
//
// Purpose: Turn every detected step into a canonical L-row sample so that
//          steps of different duration can be batched together.
//
// Per step [b, e) of n = e - b frames:
//   inputs  = resample_rows(frames[b:e, :], L)          (L × C_sync)
//           + GAIT_PHASE column j / (L - 1)             (optional)
//           + BODY_WEIGHT / BODY_HEIGHT columns         (optional, constant)
//   targets = resample_rows(labels[b:e, :], L)          (L × 2, if labeled)
//
// Steps of a session without ground truth are kept as inference-only
// samples (no targets).
//
// Sample Usage:
//   StepAssembler assembler(config);
//   StepDataset steps = assembler.assemble(segmented);
//
// Expected Output:
//   - steps.size() == segmented.steps.size()
//   - every sample is L × (C_sync + supplementary channels)

#pragma once

#include "core/sensor_types.hpp"
#include "dataset/step_dataset.hpp"

namespace kam {

/**
 * @brief Step assembler configuration
 */
struct AssemblerConfig {
    int sequence_length;            ///< Canonical step length L
    bool append_phase;              ///< Add the 0..1 gait-cycle phase channel
    bool append_anthropometrics;    ///< Add body weight [kg] and height [m] channels

    AssemblerConfig()
        : sequence_length(DEFAULT_STEP_LENGTH),
          append_phase(true),
          append_anthropometrics(false) {}
};

class StepAssembler {
public:
    /**
     * @throws std::invalid_argument if sequence_length < 2
     */
    explicit StepAssembler(const AssemblerConfig& config = AssemblerConfig());

    /**
     * @brief Assemble every step of a segmented session
     *
     * @throws InsufficientDataError if a step has fewer than 2 frames
     * @throws std::invalid_argument if anthropometrics are requested but unknown
     */
    StepDataset assemble(const SegmentedSession& session) const;

    /**
     * @brief Input schema produced for a given synchronized schema
     */
    ChannelSchema input_schema(const ChannelSchema& sync_schema) const;

    const AssemblerConfig& config() const { return config_; }

private:
    AssemblerConfig config_;
};

}  // namespace kam
