// Butterworth Low-Pass Filter Implementation
#include "filter/butterworth.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace kam {

ButterworthLowPass::ButterworthLowPass(int order, double cutoff_hz, double sample_rate_hz)
    : order_(order), cutoff_hz_(cutoff_hz), sample_rate_hz_(sample_rate_hz) {

    if (order < 1) {
        throw std::invalid_argument("Butterworth order must be >= 1");
    }
    if (sample_rate_hz <= 0.0 || cutoff_hz <= 0.0 || cutoff_hz >= 0.5 * sample_rate_hz) {
        throw std::invalid_argument("Butterworth cutoff must lie in (0, Nyquist): cutoff=" +
                                    std::to_string(cutoff_hz) + " Hz, rate=" +
                                    std::to_string(sample_rate_hz) + " Hz");
    }

    // Prewarped analog cutoff for the bilinear transform
    const double K = std::tan(M_PI * cutoff_hz / sample_rate_hz);
    const double K2 = K * K;

    // Second-order sections from conjugate pole pairs
    for (int k = 0; k < order / 2; k++) {
        const double Q = 1.0 / (2.0 * std::sin((2.0 * k + 1.0) * M_PI / (2.0 * order)));
        const double norm = 1.0 / (1.0 + K / Q + K2);

        Section s;
        s.b0 = K2 * norm;
        s.b1 = 2.0 * s.b0;
        s.b2 = s.b0;
        s.a1 = 2.0 * (K2 - 1.0) * norm;
        s.a2 = (1.0 - K / Q + K2) * norm;
        sections_.push_back(s);
    }

    // Real pole of an odd-order design
    if (order % 2 == 1) {
        const double norm = 1.0 / (1.0 + K);

        Section s;
        s.b0 = K * norm;
        s.b1 = s.b0;
        s.b2 = 0.0;
        s.a1 = (K - 1.0) * norm;
        s.a2 = 0.0;
        sections_.push_back(s);
    }
}

void ButterworthLowPass::run(VectorXd& x) const {
    if (x.size() == 0) {
        return;
    }

    for (const auto& s : sections_) {
        // Steady state for a constant input x(0) (unity DC gain: y = x)
        const double x0 = x(0);
        double z2 = (s.b2 - s.a2) * x0;
        double z1 = (s.b1 - s.a1) * x0 + z2;

        for (Eigen::Index i = 0; i < x.size(); i++) {
            const double in = x(i);
            const double out = s.b0 * in + z1;
            z1 = s.b1 * in - s.a1 * out + z2;
            z2 = s.b2 * in - s.a2 * out;
            x(i) = out;
        }
    }
}

VectorXd ButterworthLowPass::filter(const VectorXd& x) const {
    VectorXd y = x;
    run(y);
    return y;
}

VectorXd ButterworthLowPass::filtfilt(const VectorXd& x) const {
    const Eigen::Index n = x.size();
    if (n < 2) {
        return x;
    }

    const Eigen::Index padlen = std::min<Eigen::Index>(3 * (order_ + 1), n - 1);

    // Odd extension: 2*x(0) - x(padlen..1), x, 2*x(n-1) - x(n-2..n-1-padlen)
    VectorXd ext(n + 2 * padlen);
    for (Eigen::Index i = 0; i < padlen; i++) {
        ext(i) = 2.0 * x(0) - x(padlen - i);
    }
    ext.segment(padlen, n) = x;
    for (Eigen::Index i = 0; i < padlen; i++) {
        ext(padlen + n + i) = 2.0 * x(n - 1) - x(n - 2 - i);
    }

    // Forward pass
    run(ext);

    // Backward pass
    ext.reverseInPlace();
    run(ext);
    ext.reverseInPlace();

    return ext.segment(padlen, n);
}

MatrixXd ButterworthLowPass::filtfilt_columns(const MatrixXd& samples) const {
    MatrixXd out(samples.rows(), samples.cols());
    for (Eigen::Index c = 0; c < samples.cols(); c++) {
        out.col(c) = filtfilt(samples.col(c));
    }
    return out;
}

}  // namespace kam
