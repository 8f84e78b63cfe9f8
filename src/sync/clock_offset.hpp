// Clock Offset Estimation via Cross-Correlation
//
// Purpose: Recover the constant offset between two independently clocked
//          recordings of the same motion (e.g. shank gyroscope norm seen by
//          two devices), so they can be placed on one time base.
//
// Math:
//   For lag ℓ in [-L, L], with both signals on the same sample rate f:
//     ρ(ℓ) = Σ (r_i - r̄)(o_{i+ℓ} - ō) / sqrt(Σ (r_i - r̄)² Σ (o_{i+ℓ} - ō)²)
//   summed over the overlapping indices only. ℓ* = argmax ρ(ℓ).
//
//   An event at reference time t_r = s_r + i/f appears in the other stream at
//   t_o = s_o + (i + ℓ*)/f, so the offset to add to the other stream's clock is
//     offset = t_r - t_o = (s_r - s_o) - ℓ*/f
//
// Sample Usage:
//   double offset = estimate_clock_offset_s(shank_a, {"GyroX", "GyroY", "GyroZ"},
//                                           shank_b, {"GyroX", "GyroY", "GyroZ"}, 2.0);
//   sync_config.clock_offsets_s["SHANK_B"] = offset;
//
// Expected Output:
//   - Offset accurate to one sample of the reference rate

#pragma once

#include "core/types.hpp"
#include "signal/signal_conditioner.hpp"

#include <string>
#include <vector>

namespace kam {

/**
 * @brief Result of a lag search
 */
struct LagEstimate {
    int lag_samples;        ///< other(i + lag) best matches reference(i)
    double correlation;     ///< Normalized correlation at that lag

    LagEstimate() : lag_samples(0), correlation(0.0) {}
};

/**
 * @brief Lag maximizing the normalized cross-correlation
 *
 * Lags whose overlap is shorter than min_overlap samples are skipped.
 *
 * @throws SynchronizationError if no lag has enough overlap
 */
LagEstimate estimate_lag(const VectorXd& reference,
                         const VectorXd& other,
                         int max_lag,
                         int min_overlap = 10);

/**
 * @brief Clock offset [s] to add to `other`'s timestamps
 *
 * The norm of the named fields of each stream's first segment is used as the
 * matching signal; `other` is resampled onto the reference rate first.
 *
 * @throws SynchronizationError if fields are missing or signals do not overlap
 */
double estimate_clock_offset_s(const ConditionedStream& reference,
                               const std::vector<std::string>& reference_fields,
                               const ConditionedStream& other,
                               const std::vector<std::string>& other_fields,
                               double max_lag_s);

}  // namespace kam
