// Batch Pipeline Implementation
//
// Worker pool over sessions with per-session failure isolation

#include "batch_pipeline.hpp"
#include "core/errors.hpp"
#include "signal/static_calibration.hpp"
#include "utils/logger.hpp"
#include "utils/timing.hpp"

#include <pthread.h>
#include <algorithm>
#include <map>
#include <stdexcept>

namespace kam {

// === Constructor ===

BatchPipeline::BatchPipeline(const PipelineConfig& config)
    : config_(config),
      conditioner_(config.conditioner),
      synchronizer_(config.sync),
      segmenter_(config.segmenter),
      assembler_(config.assembler) {

    if (config_.num_workers < 1) {
        throw std::invalid_argument("num_workers must be >= 1");
    }

    LOG_INFO("BatchPipeline created (workers: %d, L: %d, cutoff: %.1f Hz, calibration: %s)",
             config_.num_workers, config_.assembler.sequence_length,
             config_.conditioner.lowpass_cutoff_hz,
             config_.static_calibration ? "enabled" : "disabled");
}

// === Per-session chain ===

SegmentedSession BatchPipeline::segment_session(const Session& session) const {
    const std::string label = session.info.label();

    // Step 1: Static alignment per sensor
    std::map<std::string, SensorAlignment> alignments;
    if (config_.static_calibration) {
        for (const auto& static_stream : session.static_streams) {
            const SensorStream si = SignalConditioner::to_si_units(static_stream);
            SensorAlignment alignment = estimate_sensor_alignment(si);
            LOG_DEBUG("%s: %s aligned (roll %.2f deg, pitch %.2f deg)",
                      label.c_str(), alignment.sensor_id.c_str(),
                      alignment.roll_rad / DEG_TO_RAD, alignment.pitch_rad / DEG_TO_RAD);
            alignments[alignment.sensor_id] = alignment;
        }
    }

    // Step 2: Condition every stream
    std::vector<ConditionedStream> conditioned;
    conditioned.reserve(session.streams.size());
    for (const auto& stream : session.streams) {
        auto it = alignments.find(stream.sensor_id);
        const SensorAlignment* alignment = it == alignments.end() ? nullptr : &it->second;
        conditioned.push_back(conditioner_.condition(stream, alignment));
    }

    ConditionedStream ground_truth;
    if (session.ground_truth) {
        ground_truth = conditioner_.condition(*session.ground_truth);
    }

    // Step 3: Common time base
    const SynchronizedSession sync = synchronizer_.synchronize(
        session.info, conditioned, session.ground_truth ? &ground_truth : nullptr);

    // Step 4: Steps
    return segmenter_.segment(sync);
}

StepDataset BatchPipeline::process_session(const Session& session) const {
    return assembler_.assemble(segment_session(session));
}

SessionResult BatchPipeline::run_isolated(const Session& session) const {
    SessionResult result;
    result.label = session.info.label();

    const int64_t start_ns = monotonic_time_ns();
    try {
        result.steps = process_session(session);
        result.num_steps = result.steps.size();
        result.succeeded = true;
    } catch (const PipelineError& e) {
        result.error = e.what();
        LOG_WARN("Session %s skipped: %s", result.label.c_str(), e.what());
    } catch (const std::invalid_argument& e) {
        result.error = e.what();
        LOG_WARN("Session %s skipped (invalid input): %s", result.label.c_str(), e.what());
    }
    result.elapsed_ms = elapsed_ms_since(start_ns);

    return result;
}

// === Worker pool ===

void BatchPipeline::worker_loop(WorkerContext& ctx) {
    const size_t total = ctx.sessions->size();
    while (true) {
        const size_t index = ctx.next_index->fetch_add(1, std::memory_order_relaxed);
        if (index >= total) {
            break;
        }

        // Disjoint slot: no other thread touches index
        try {
            (*ctx.results)[index] = ctx.pipeline->run_isolated((*ctx.sessions)[index]);
        } catch (...) {
            (*ctx.fatal)[index] = std::current_exception();
        }
    }
}

void* BatchPipeline::worker_entry(void* arg) {
    auto* ctx = static_cast<WorkerContext*>(arg);
    worker_loop(*ctx);
    return nullptr;
}

BatchResult BatchPipeline::run(const std::vector<Session>& sessions) const {
    const int64_t start_ns = monotonic_time_ns();

    BatchResult out;
    out.sessions.resize(sessions.size());
    std::vector<std::exception_ptr> fatal(sessions.size());
    std::atomic<size_t> next_index(0);

    WorkerContext ctx{this, &sessions, &out.sessions, &fatal, &next_index};

    // Spawn helpers; the calling thread works too
    const size_t wanted = std::min(static_cast<size_t>(config_.num_workers),
                                   std::max<size_t>(sessions.size(), 1)) - 1;
    std::vector<pthread_t> threads;
    threads.reserve(wanted);
    for (size_t i = 0; i < wanted; i++) {
        pthread_t thread;
        int ret = pthread_create(&thread, nullptr, worker_entry, &ctx);
        if (ret != 0) {
            LOG_WARN("Failed to create worker thread: %d (continuing with %zu)",
                     ret, threads.size() + 1);
            break;
        }
        threads.push_back(thread);
    }

    worker_loop(ctx);

    for (pthread_t thread : threads) {
        pthread_join(thread, nullptr);
    }

    // Unexpected failures surface on the caller, first in input order
    for (const auto& e : fatal) {
        if (e) {
            std::rethrow_exception(e);
        }
    }

    // === Ordered merge ===
    out.metrics.sessions_total = static_cast<int>(sessions.size());
    for (auto& result : out.sessions) {
        if (!result.succeeded) {
            out.metrics.sessions_failed++;
            continue;
        }
        out.dataset.merge(result.steps);
        out.metrics.sessions_succeeded++;
    }

    out.metrics.steps_assembled = static_cast<int>(out.dataset.size());
    out.metrics.steps_labeled = static_cast<int>(out.dataset.num_labeled());
    out.metrics.elapsed_ms = elapsed_ms_since(start_ns);

    LOG_INFO("Batch finished: %d/%d sessions, %d steps (%zu worker thread(s))",
             out.metrics.sessions_succeeded, out.metrics.sessions_total,
             out.metrics.steps_assembled, threads.size() + 1);

    return out;
}

}  // namespace kam
