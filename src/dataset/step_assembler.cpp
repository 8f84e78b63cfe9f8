// Step Assembler Implementation
#include "dataset/step_assembler.hpp"
#include "core/errors.hpp"
#include "math/signal_math.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace kam {

StepAssembler::StepAssembler(const AssemblerConfig& config)
    : config_(config) {
    if (config_.sequence_length < 2) {
        throw std::invalid_argument("Sequence length must be >= 2");
    }
}

ChannelSchema StepAssembler::input_schema(const ChannelSchema& sync_schema) const {
    ChannelSchema schema = sync_schema;
    if (config_.append_phase) {
        schema.append(GAIT_PHASE_CHANNEL);
    }
    if (config_.append_anthropometrics) {
        schema.append(BODY_WEIGHT_CHANNEL);
        schema.append(BODY_HEIGHT_CHANNEL);
    }
    return schema;
}

StepDataset StepAssembler::assemble(const SegmentedSession& session) const {
    const SynchronizedSession& sync = session.sync;
    const SessionInfo& info = sync.info;
    const int L = config_.sequence_length;

    if (config_.append_anthropometrics &&
        (info.body_weight_kg <= 0.0 || info.body_height_m <= 0.0)) {
        throw std::invalid_argument(info.label() + ": body weight/height unknown");
    }

    StepDataset dataset(input_schema(sync.schema), ChannelSchema::moment_labels(), L);

    const Eigen::Index sync_channels = sync.frames.cols();
    const Eigen::Index total_channels = static_cast<Eigen::Index>(dataset.input_schema().size());

    // Phase is the same for every step
    const VectorXd phase = VectorXd::LinSpaced(L, 0.0, 1.0);

    const bool labeled = sync.has_labels();

    for (const auto& step : session.steps) {
        if (step.length() < 2) {
            throw InsufficientDataError(info.label() + ": step " + std::to_string(step.id) +
                                        " spans fewer than 2 frames");
        }

        StepSample sample;
        sample.subject_id = info.subject_id;
        sample.trial_id = info.trial_id;
        sample.step_id = step.id;
        sample.side = step.side;
        sample.duration_s = step.duration_s;

        sample.inputs.resize(L, total_channels);
        sample.inputs.leftCols(sync_channels) =
            resample_rows(sync.frames.middleRows(step.begin_frame, step.length()), L);

        Eigen::Index col = sync_channels;
        if (config_.append_phase) {
            sample.inputs.col(col++) = phase;
        }
        if (config_.append_anthropometrics) {
            sample.inputs.col(col++).setConstant(info.body_weight_kg);
            sample.inputs.col(col++).setConstant(info.body_height_m);
        }

        if (labeled) {
            sample.targets = resample_rows(sync.labels.middleRows(step.begin_frame, step.length()), L);
        }

        dataset.append(std::move(sample));
    }

    LOG_DEBUG("%s: assembled %zu steps (%s), %zu channels x %d samples",
              info.label().c_str(), dataset.size(), labeled ? "labeled" : "inference-only",
              dataset.input_schema().size(), L);

    return dataset;
}

}  // namespace kam
