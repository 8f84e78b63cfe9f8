// Per-channel min-max scaler
#include "dataset/channel_scaler.hpp"

#include <limits>
#include <stdexcept>

namespace kam {

void ChannelScaler::fit(const StepDataset& dataset) {
    if (dataset.empty()) {
        throw std::invalid_argument("Cannot fit scaler on an empty dataset");
    }

    const Eigen::Index channels = static_cast<Eigen::Index>(dataset.input_schema().size());
    RowVectorXd lo = RowVectorXd::Constant(channels, std::numeric_limits<double>::infinity());
    RowVectorXd hi = RowVectorXd::Constant(channels, -std::numeric_limits<double>::infinity());

    for (const auto& sample : dataset.samples()) {
        lo = lo.cwiseMin(sample.inputs.colwise().minCoeff());
        hi = hi.cwiseMax(sample.inputs.colwise().maxCoeff());
    }

    inv_range_.resize(channels);
    for (Eigen::Index c = 0; c < channels; c++) {
        const double range = hi(c) - lo(c);
        inv_range_(c) = range > 0.0 ? 1.0 / range : 1.0;
    }
    min_ = lo;
    max_ = hi;
}

MatrixXd ChannelScaler::transform(const MatrixXd& inputs) const {
    if (!fitted()) {
        throw std::logic_error("ChannelScaler used before fit()");
    }
    if (inputs.cols() != min_.size()) {
        throw std::invalid_argument("Scaler fitted on " + std::to_string(min_.size()) +
                                    " channels, got " + std::to_string(inputs.cols()));
    }
    return ((inputs.rowwise() - min_).array().rowwise() * inv_range_.array()).matrix();
}

StepDataset ChannelScaler::transform(const StepDataset& dataset) const {
    StepDataset out(dataset.input_schema(), dataset.label_schema(), dataset.sequence_length());
    for (const auto& sample : dataset.samples()) {
        StepSample scaled = sample;
        scaled.inputs = transform(sample.inputs);
        out.append(std::move(scaled));
    }
    return out;
}

}  // namespace kam
