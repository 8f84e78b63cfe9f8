// Per-channel min-max scaler
//
// Purpose: Map every input channel into [0, 1] using the range observed on
//          the training split; validation/test data reuse the same range
//          (values outside it map outside [0, 1]).
//
//   x' = (x - min_c) / (max_c - min_c)      (scale 1 when max_c == min_c)
//
// Sample Usage:
//   ChannelScaler scaler;
//   scaler.fit(split.train);
//   StepDataset train = scaler.transform(split.train);
//   StepDataset test = scaler.transform(split.test);
//
// Expected Output:
//   - every channel of train spans exactly [0, 1] (non-constant channels)

#pragma once

#include "dataset/step_dataset.hpp"

namespace kam {

class ChannelScaler {
public:
    ChannelScaler() = default;

    /**
     * @brief Fit channel ranges over all rows of all samples
     *
     * @throws std::invalid_argument on an empty dataset
     */
    void fit(const StepDataset& dataset);

    /**
     * @brief Scale an L × C input block
     *
     * @throws std::logic_error if not fitted
     * @throws std::invalid_argument on a channel count mismatch
     */
    MatrixXd transform(const MatrixXd& inputs) const;

    /**
     * @brief Copy of dataset with every sample's inputs scaled; targets untouched
     */
    StepDataset transform(const StepDataset& dataset) const;

    bool fitted() const { return min_.size() > 0; }
    const RowVectorXd& channel_min() const { return min_; }
    const RowVectorXd& channel_max() const { return max_; }

private:
    RowVectorXd min_;
    RowVectorXd max_;
    RowVectorXd inv_range_;
};

}  // namespace kam
