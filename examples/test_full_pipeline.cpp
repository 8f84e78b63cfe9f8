// Complete Knee Moment Pipeline Integration Test
//
// Purpose: End-to-end validation from raw multi-sensor sessions to scored
//          moment predictions
// Tests all stages working together:
// - Signal conditioning (units, gaps, low-pass, static calibration)
// - Synchronization of a 100 Hz foot IMU and a 60 Hz waist IMU
// - Heel-strike segmentation and step assembly
// - Worker pool with per-session failure isolation
// - Training, subject-held-out evaluation and cross validation

#include "core/errors.hpp"
#include "dataset/channel_scaler.hpp"
#include "dataset/subject_split.hpp"
#include "model/evaluation.hpp"
#include "model/moment_trainer.hpp"
#include "service/batch_pipeline.hpp"
#include "validation/synthetic_gait.hpp"

#include <chrono>
#include <cmath>
#include <iostream>

using namespace kam;
using namespace std::chrono;

namespace {

constexpr size_t STEPS_PER_SESSION = 10;    // heel strikes at 1, 2, ..., 11 s

std::vector<Session> make_sessions(const std::vector<std::string>& subjects,
                                   const SyntheticGait::Params& params = SyntheticGait::Params()) {
    std::vector<Session> sessions;
    for (size_t s = 0; s < subjects.size(); s++) {
        SyntheticGait gait(params, static_cast<uint32_t>(100 + s));
        sessions.push_back(gait.generate_session(subjects[s], "walk"));
    }
    return sessions;
}

PipelineConfig pipeline_config(int workers) {
    PipelineConfig config;
    config.num_workers = workers;
    config.assembler.sequence_length = 50;
    return config;
}

bool same_dataset(const StepDataset& a, const StepDataset& b) {
    if (a.size() != b.size() || a.input_schema() != b.input_schema()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); i++) {
        const StepSample& x = a.sample(i);
        const StepSample& y = b.sample(i);
        if (x.provenance() != y.provenance() || x.inputs != y.inputs ||
            x.has_labels() != y.has_labels()) {
            return false;
        }
        if (x.has_labels() && *x.targets != *y.targets) {
            return false;
        }
    }
    return true;
}

double column_mean(const StepDataset& dataset, const std::string& channel) {
    const int col = dataset.input_schema().index_of(channel);
    double sum = 0.0;
    double count = 0.0;
    for (const auto& sample : dataset.samples()) {
        sum += sample.inputs.col(col).sum();
        count += static_cast<double>(sample.inputs.rows());
    }
    return sum / count;
}

}  // namespace

// Test 1: Sessions to dataset, with one broken and one unlabeled session
bool test_batch_isolation() {
    std::cout << "\n=== Test 1: Batch Pipeline with Failure Isolation ===" << std::endl;

    std::vector<Session> sessions = make_sessions({"S01", "S02", "S99"});

    // S99: waist recording stops after 50 samples -> overlap too short
    Session& broken = sessions[2];
    broken.info.trial_id = "broken";
    SensorStream& waist = broken.streams[1];
    waist.timestamps_ns.resize(50);
    waist.samples.conservativeResize(50, Eigen::NoChange);

    SyntheticGait::Params unlabeled_params;
    unlabeled_params.ground_truth = false;
    sessions.push_back(SyntheticGait(unlabeled_params, 7).generate_session("S03", "free"));

    BatchPipeline pipeline(pipeline_config(4));
    const BatchResult result = pipeline.run(sessions);
    log_metrics(result.metrics);

    for (const auto& s : result.sessions) {
        std::cout << "  " << s.label << ": " << (s.succeeded ? "ok" : "failed")
                  << ", " << s.num_steps << " steps, " << s.elapsed_ms << " ms"
                  << (s.error.empty() ? "" : " (" + s.error + ")") << std::endl;
    }

    const std::vector<std::string> failed = result.failed_sessions();
    const ChannelSchema& schema = result.dataset.input_schema();

    bool passed = result.sessions.size() == 4 &&
                  failed.size() == 1 && failed[0] == "S99/broken" &&
                  !result.sessions[2].error.empty() &&
                  result.sessions[0].num_steps == STEPS_PER_SESSION &&
                  result.dataset.size() == 3 * STEPS_PER_SESSION &&
                  result.dataset.num_labeled() == 2 * STEPS_PER_SESSION &&
                  result.metrics.sessions_failed == 1 &&
                  result.metrics.sessions_succeeded == 3 &&
                  result.metrics.steps_labeled == static_cast<int>(2 * STEPS_PER_SESSION) &&
                  schema.size() == 13 &&
                  schema.name(0) == "AccelX_R_FOOT" &&
                  schema.name(6) == "AccelX_WAIST" &&
                  schema.name(12) == GAIT_PHASE_CHANNEL &&
                  result.dataset.sequence_length() == 50 &&
                  result.dataset.sample(0).provenance() == "S01/walk#0" &&
                  result.dataset.samples().back().subject_id == "S03";

    if (passed) {
        std::cout << "✓ Test 1: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 1: FAILED" << std::endl;
    }
    return passed;
}

// Test 2: The dataset does not depend on the worker count
bool test_worker_determinism() {
    std::cout << "\n=== Test 2: Worker Count Determinism ===" << std::endl;

    const std::vector<Session> sessions = make_sessions({"S01", "S02", "S03", "S04", "S05"});

    auto start = high_resolution_clock::now();
    const BatchResult serial = BatchPipeline(pipeline_config(1)).run(sessions);
    auto mid = high_resolution_clock::now();
    const BatchResult parallel = BatchPipeline(pipeline_config(4)).run(sessions);
    auto end = high_resolution_clock::now();

    std::cout << "1 worker: " << duration_cast<milliseconds>(mid - start).count() << " ms, "
              << serial.dataset.size() << " steps" << std::endl;
    std::cout << "4 workers: " << duration_cast<milliseconds>(end - mid).count() << " ms, "
              << parallel.dataset.size() << " steps" << std::endl;

    bool invalid_rejected = false;
    try {
        BatchPipeline rejected(pipeline_config(0));
    } catch (const std::invalid_argument& e) {
        std::cout << "Caught: " << e.what() << std::endl;
        invalid_rejected = true;
    }

    bool passed = serial.dataset.size() == 5 * STEPS_PER_SESSION &&
                  same_dataset(serial.dataset, parallel.dataset) &&
                  invalid_rejected;

    if (passed) {
        std::cout << "✓ Test 2: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 2: FAILED" << std::endl;
    }
    return passed;
}

// Test 3: Vendor units, tilted foot sensor and static calibration
bool test_static_calibration() {
    std::cout << "\n=== Test 3: Vendor Units and Static Calibration ===" << std::endl;

    SyntheticGait::Params params;
    params.vendor_units = true;
    params.static_recording = true;
    params.gyro_bias_rad_s = 0.05;
    params.sensors[0].roll_rad = 10.0 * DEG_TO_RAD;
    params.sensors[0].pitch_rad = -15.0 * DEG_TO_RAD;
    const std::vector<Session> sessions = make_sessions({"S01"}, params);

    const StepDataset calibrated = BatchPipeline(pipeline_config(1)).run(sessions).dataset;

    PipelineConfig raw_config = pipeline_config(1);
    raw_config.static_calibration = false;
    const StepDataset uncalibrated = BatchPipeline(raw_config).run(sessions).dataset;

    const double accel_x = column_mean(calibrated, "AccelX_R_FOOT");
    const double accel_z = column_mean(calibrated, "AccelZ_R_FOOT");
    const double raw_accel_x = column_mean(uncalibrated, "AccelX_R_FOOT");

    std::cout << "Calibrated AccelX mean: " << accel_x << " m/s²" << std::endl;
    std::cout << "Calibrated AccelZ mean: " << accel_z << " m/s²" << std::endl;
    std::cout << "Uncalibrated AccelX mean: " << raw_accel_x << " m/s²" << std::endl;

    bool passed = calibrated.size() == STEPS_PER_SESSION &&
                  uncalibrated.size() == STEPS_PER_SESSION &&
                  std::abs(accel_x) < 0.2 &&
                  std::abs(accel_z - GRAVITY) < 0.2 &&
                  std::abs(raw_accel_x) > 1.0;

    if (passed) {
        std::cout << "✓ Test 3: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 3: FAILED" << std::endl;
    }
    return passed;
}

// Test 4: Train on two subjects, evaluate on a third, then cross validate
bool test_training_and_cross_validation() {
    std::cout << "\n=== Test 4: Training and Cross Validation ===" << std::endl;

    const std::vector<std::string> subjects = {"S01", "S02", "S03"};
    const BatchResult batch = BatchPipeline(pipeline_config(4)).run(make_sessions(subjects));

    const DatasetSplit split = split_by_subject(batch.dataset, {"S01"}, {"S02"}, {"S03"});
    ChannelScaler scaler;
    scaler.fit(split.train);
    const StepDataset train = scaler.transform(split.train);
    const StepDataset validation = scaler.transform(split.validation);
    const StepDataset test = scaler.transform(split.test);

    EstimatorConfig model_config;
    model_config.hidden_channels = 8;
    model_config.kernel_size = 3;

    TrainingConfig train_config;
    train_config.epochs = 20;
    train_config.batch_size = 4;
    train_config.learning_rate = 5e-3;

    MomentTrainer trainer(MomentEstimator(static_cast<int>(train.input_schema().size()), model_config),
                          train_config);
    const double initial_loss = trainer.evaluate_loss(train);
    const std::vector<EpochRecord> history = trainer.fit(train, &validation);

    const auto checkpoint = trainer.checkpoint();
    const std::vector<SubjectScores> scores = evaluate_by_subject(*checkpoint, test);
    log_scores_table(scores);

    train_config.epochs = 5;
    train_config.log_epochs = false;
    const CrossValidationResult cv = cross_validate(batch.dataset, subjects, 1, model_config, train_config);

    std::cout << "Initial/final training loss: " << initial_loss << " / "
              << history.back().train_loss << std::endl;
    std::cout << "Cross validation subjects: " << cv.per_subject.size() << std::endl;

    bool finite_scores = true;
    for (const auto& m : cv.mean.moments) {
        finite_scores &= std::isfinite(m.r2) && std::isfinite(m.r2_all) && std::isfinite(m.rmse) && std::isfinite(m.r_rmse);
    }

    bool passed = train.size() == STEPS_PER_SESSION &&
                  test.size() == STEPS_PER_SESSION &&
                  history.size() == 20 &&
                  history.back().train_loss < initial_loss &&
                  std::isfinite(history.back().validation_loss) &&
                  scores.size() == 1 &&
                  scores[0].subject_id == "S03" &&
                  scores[0].num_steps == STEPS_PER_SESSION &&
                  cv.per_subject.size() == subjects.size() &&
                  cv.mean.num_steps == 3 * STEPS_PER_SESSION &&
                  finite_scores;

    if (passed) {
        std::cout << "✓ Test 4: PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test 4: FAILED" << std::endl;
    }
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Knee Moment Pipeline Integration Test" << std::endl;
    std::cout << "========================================" << std::endl;

    bool all_passed = true;

    all_passed &= test_batch_isolation();
    all_passed &= test_worker_determinism();
    all_passed &= test_static_calibration();
    all_passed &= test_training_and_cross_validation();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL PIPELINE TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}
