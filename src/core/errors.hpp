/**
 * @file errors.hpp
 * @brief Exception taxonomy for the gait moment pipeline
 *
 * Purpose: Every data-dependent failure raised by a pipeline stage derives
 * from PipelineError so the batch runner can isolate a failing session
 * without catching programming errors. Configuration defects use
 * std::invalid_argument instead.
 *
 * Sample Input:
 *   throw InsufficientStepsError("S01/walk_02: 1 step(s) detected, 3 required");
 *
 * Expected Output:
 *   catch (const PipelineError& e) -> e.what() carries the session identity
 */

#ifndef KAM_CORE_ERRORS_HPP
#define KAM_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace kam {

/**
 * @brief Base class of all data-dependent pipeline failures
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
};

/// Stream covers too few samples to condition.
class InsufficientDataError : public PipelineError {
public:
    explicit InsufficientDataError(const std::string& what) : PipelineError(what) {}
};

/// No usable time overlap across the sensors of a session.
class SynchronizationError : public PipelineError {
public:
    explicit SynchronizationError(const std::string& what) : PipelineError(what) {}
};

/// Segmentation produced fewer gait cycles than required.
class InsufficientStepsError : public PipelineError {
public:
    explicit InsufficientStepsError(const std::string& what) : PipelineError(what) {}
};

/// Channel layout differs between datasets being merged. Fatal for a merge.
class SchemaMismatchError : public PipelineError {
public:
    explicit SchemaMismatchError(const std::string& what) : PipelineError(what) {}
};

/**
 * @brief Training produced a NaN/Inf loss
 *
 * Carries the provenance ("subject/session#step") of every sample in the
 * offending batch.
 */
class NonFiniteLossError : public PipelineError {
public:
    NonFiniteLossError(const std::string& what, std::string batch_provenance)
        : PipelineError(what + " [batch: " + batch_provenance + "]"),
          batch_provenance_(std::move(batch_provenance)) {}

    const std::string& batch_provenance() const { return batch_provenance_; }

private:
    std::string batch_provenance_;
};

} // namespace kam

#endif // KAM_CORE_ERRORS_HPP
