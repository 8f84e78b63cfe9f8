// Batch Pipeline - sessions to step-indexed dataset
//
// Purpose: Run conditioning, synchronization, segmentation and assembly for
//          many sessions in parallel and merge the results into one dataset.
//
// Threading Model:
// - num_workers - 1 pthreads plus the calling thread pull session indices
//   from one atomic counter
// - each session writes only its own pre-sized result slot; stages share no
//   mutable state
// - the merge runs on the calling thread, in input order, after every
//   worker has been joined: the dataset does not depend on num_workers
//
// Failure isolation:
// - a PipelineError (or invalid input) in one session is logged with the
//   session label, recorded in its slot and does not stop the batch
// - SchemaMismatchError during the merge aborts the run
// - any other exception is re-thrown on the calling thread after the join
//
// Sample Usage:
//   BatchPipeline pipeline(config);
//   BatchResult result = pipeline.run(sessions);
//   log_metrics(result.metrics);
//
// Expected Output:
//   - result.dataset.size() == Σ steps of successful sessions
//   - identical result for any num_workers

#pragma once

#include "service_types.hpp"
#include "core/sensor_types.hpp"
#include "dataset/step_assembler.hpp"
#include "gait/step_segmenter.hpp"
#include "signal/signal_conditioner.hpp"
#include "sync/synchronizer.hpp"

#include <atomic>
#include <exception>
#include <vector>

namespace kam {

class BatchPipeline {
public:
    /**
     * @throws std::invalid_argument on invalid configuration
     */
    explicit BatchPipeline(const PipelineConfig& config = PipelineConfig());

    /**
     * @brief Process every session and merge the assembled steps
     *
     * @throws SchemaMismatchError if successful sessions disagree on channels
     */
    BatchResult run(const std::vector<Session>& sessions) const;

    /**
     * @brief Condition, synchronize and segment one session
     *
     * @throws PipelineError subclasses on per-session failures
     */
    SegmentedSession segment_session(const Session& session) const;

    /**
     * @brief Full chain for one session
     *
     * @throws PipelineError subclasses on per-session failures
     */
    StepDataset process_session(const Session& session) const;

    const PipelineConfig& config() const { return config_; }

private:
    struct WorkerContext {
        const BatchPipeline* pipeline;
        const std::vector<Session>* sessions;
        std::vector<SessionResult>* results;
        std::vector<std::exception_ptr>* fatal;
        std::atomic<size_t>* next_index;
    };

    static void* worker_entry(void* arg);
    static void worker_loop(WorkerContext& ctx);

    SessionResult run_isolated(const Session& session) const;

    PipelineConfig config_;
    SignalConditioner conditioner_;
    Synchronizer synchronizer_;
    StepSegmenter segmenter_;
    StepAssembler assembler_;
};

}  // namespace kam
