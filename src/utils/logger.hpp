/**
 * @file logger.hpp
 * @brief Unified logging infrastructure for the pipeline and tests
 *
 * Purpose: Provides consistent printf-style logging. INFO/DEBUG go to
 * stdout, WARN/ERROR to stderr so batch logs can be split by severity.
 * Set KAM_LOG_QUIET_DEBUG at compile time to drop DEBUG lines.
 *
 * Sample Input:
 *   LOG_INFO("Session %s: %d steps", label.c_str(), num_steps);
 *
 * Expected Output:
 *   "[INFO] Session S01/walk_01: 42 steps"
 */

#ifndef KAM_UTILS_LOGGER_HPP
#define KAM_UTILS_LOGGER_HPP

#include <cstdio>

#define LOG_INFO(...) do { std::printf("[INFO] " __VA_ARGS__); std::printf("\n"); } while(0)
#define LOG_WARN(...) do { std::fprintf(stderr, "[WARN] " __VA_ARGS__); std::fprintf(stderr, "\n"); } while(0)
#define LOG_ERROR(...) do { std::fprintf(stderr, "[ERROR] " __VA_ARGS__); std::fprintf(stderr, "\n"); } while(0)
#ifdef KAM_LOG_QUIET_DEBUG
#define LOG_DEBUG(...) do {} while(0)
#else
#define LOG_DEBUG(...) do { std::printf("[DEBUG] " __VA_ARGS__); std::printf("\n"); } while(0)
#endif

namespace kam {

/**
 * @brief Batch pipeline metrics for logging
 */
struct PipelineMetrics {
    double elapsed_ms;              ///< Wall time of the batch [ms]
    int sessions_total;             ///< Sessions submitted
    int sessions_succeeded;         ///< Sessions merged into the dataset
    int sessions_failed;            ///< Sessions isolated after an error
    int steps_assembled;            ///< StepSamples in the merged dataset
    int steps_labeled;              ///< ... of which carry ground truth

    PipelineMetrics()
        : elapsed_ms(0.0), sessions_total(0), sessions_succeeded(0),
          sessions_failed(0), steps_assembled(0), steps_labeled(0) {}
};

/**
 * @brief Log batch pipeline metrics
 */
inline void log_metrics(const PipelineMetrics& m) {
    LOG_INFO("Metrics: %.1f ms, sessions=%d (ok=%d, failed=%d), steps=%d (labeled=%d)",
             m.elapsed_ms, m.sessions_total, m.sessions_succeeded,
             m.sessions_failed, m.steps_assembled, m.steps_labeled);
}

} // namespace kam

#endif // KAM_UTILS_LOGGER_HPP
