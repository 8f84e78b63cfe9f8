// Butterworth Low-Pass Filter (zero-phase)
//
// Purpose: Remove high-frequency sensor noise from conditioned IMU streams
// Reference: "Digital Signal Processing" - Proakis & Manolakis, ch. 10
//            Bilinear transform with frequency prewarping
//
// Key Features:
// - Arbitrary order, realized as cascaded second-order sections (SOS)
//   plus one first-order section for odd orders
// - Transposed Direct Form II sections (numerically robust)
// - Zero-phase forward-backward filtering for offline processing
// - Odd-extension edge padding and steady-state initial conditions to
//   suppress start-up transients at the recording boundaries
//
// Section design (K = tan(π fc / fs), Q_k = 1 / (2 sin((2k+1)π / 2N))):
//   b0 = K² / (1 + K/Q + K²),  b1 = 2 b0,  b2 = b0
//   a1 = 2 (K² - 1) / (1 + K/Q + K²)
//   a2 = (1 - K/Q + K²) / (1 + K/Q + K²)
//
// Sample Usage:
//   ButterworthLowPass lp(4, 15.0, 100.0);   // 4th order, 15 Hz @ 100 Hz
//   VectorXd smooth = lp.filtfilt(raw);
//
// Expected Output:
//   - Unity DC gain, -3 dB at the cutoff per pass (-6 dB after filtfilt)
//   - No phase lag: heel-strike peaks stay at their original sample

#pragma once

#include "core/types.hpp"

#include <vector>

namespace kam {

class ButterworthLowPass {
public:
    /**
     * @brief Design the filter
     *
     * @param order Filter order (>= 1)
     * @param cutoff_hz -3 dB cutoff frequency [Hz]
     * @param sample_rate_hz Sampling rate [Hz]
     * @throws std::invalid_argument unless 0 < cutoff < Nyquist
     */
    ButterworthLowPass(int order, double cutoff_hz, double sample_rate_hz);

    /**
     * @brief Causal single-pass filtering
     *
     * Section states start at steady state for the first sample.
     */
    VectorXd filter(const VectorXd& x) const;

    /**
     * @brief Zero-phase forward-backward filtering
     *
     * The signal is extended at both ends by an odd reflection of
     * 3 × (order + 1) samples (or n - 1 if shorter) before filtering.
     */
    VectorXd filtfilt(const VectorXd& x) const;

    /**
     * @brief Apply filtfilt to each column independently
     */
    MatrixXd filtfilt_columns(const MatrixXd& samples) const;

    int order() const { return order_; }
    double cutoff_hz() const { return cutoff_hz_; }
    size_t num_sections() const { return sections_.size(); }

private:
    struct Section {
        double b0, b1, b2;
        double a1, a2;
    };

    // In-place single pass through the cascade
    void run(VectorXd& x) const;

    int order_;
    double cutoff_hz_;
    double sample_rate_hz_;
    std::vector<Section> sections_;
};

}  // namespace kam
