// Service Data Types for the batch pipeline
//
// Purpose: Configuration and result structures shared by the batch pipeline
//          and its callers.
//
// Key Features:
// - One PipelineConfig aggregating every stage configuration
// - Per-session result slot (success, error message, step count, timing)
// - Batch result: merged dataset + per-session results + metrics
//
// Sample Usage:
//   PipelineConfig config;
//   config.num_workers = 4;
//   config.segmenter.min_steps = 5;
//   BatchResult result = BatchPipeline(config).run(sessions);
//
// Expected Output:
//   - result.sessions[i] describes sessions[i] (input order)
//   - result.dataset holds the steps of every successful session

#pragma once

#include "dataset/step_assembler.hpp"
#include "dataset/step_dataset.hpp"
#include "gait/step_segmenter.hpp"
#include "signal/signal_conditioner.hpp"
#include "sync/synchronizer.hpp"
#include "utils/logger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kam {

/**
 * @brief Batch pipeline configuration
 */
struct PipelineConfig {
    ConditionerConfig conditioner;
    SyncConfig sync;
    SegmenterConfig segmenter;
    AssemblerConfig assembler;

    // Thread configuration
    int num_workers;                ///< Worker threads (>= 1, the calling thread is one of them)

    // Calibration
    bool static_calibration;        ///< Use session static recordings when present

    PipelineConfig()
        : num_workers(4),
          static_calibration(true) {}
};

/**
 * @brief Outcome of one session
 */
struct SessionResult {
    std::string label;              ///< "subject/trial"
    bool succeeded;
    std::string error;              ///< what() of the isolating exception
    size_t num_steps;               ///< Steps assembled (0 on failure)
    double elapsed_ms;              ///< Wall time spent on the session
    StepDataset steps;              ///< Assembled steps (empty on failure)

    SessionResult() : succeeded(false), num_steps(0), elapsed_ms(0.0) {}
};

/**
 * @brief Output of a batch run
 */
struct BatchResult {
    StepDataset dataset;                    ///< Merged steps, sessions in input order
    std::vector<SessionResult> sessions;    ///< One per input session, input order
    PipelineMetrics metrics;

    /// Labels of sessions that were isolated after an error.
    std::vector<std::string> failed_sessions() const {
        std::vector<std::string> out;
        for (const auto& s : sessions) {
            if (!s.succeeded) {
                out.push_back(s.label);
            }
        }
        return out;
    }
};

}  // namespace kam
