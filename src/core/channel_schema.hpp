/**
 * @file channel_schema.hpp
 * @brief Single shared definition of channel naming and ordering
 *
 * Purpose: The synchronizer builds one ChannelSchema per session and every
 * later stage (segmenter, assembler, dataset merge, model) references it
 * instead of re-deriving column positions. Two sessions can only be merged
 * when their schemas compare equal.
 *
 * Naming convention: <field>_<sensor>, e.g. "AccelX_R_FOOT", "GyroZ_WAIST".
 *
 * Sample Input:
 *   ChannelSchema schema({"AccelX_R_FOOT", "AccelY_R_FOOT"});
 *   schema.index_of("AccelY_R_FOOT");
 *
 * Expected Output:
 *   1
 */

#ifndef KAM_CORE_CHANNEL_SCHEMA_HPP
#define KAM_CORE_CHANNEL_SCHEMA_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace kam {

// Ground-truth label channels, in model output order
constexpr const char* KNEE_ADDUCTION_MOMENT = "KNEE_ADDUCTION_MOMENT";
constexpr const char* KNEE_FLEXION_MOMENT = "KNEE_FLEXION_MOMENT";

// Supplementary per-sample features appended by the step assembler
constexpr const char* GAIT_PHASE_CHANNEL = "GAIT_PHASE";
constexpr const char* BODY_WEIGHT_CHANNEL = "BODY_WEIGHT";
constexpr const char* BODY_HEIGHT_CHANNEL = "BODY_HEIGHT";

class ChannelSchema {
public:
    ChannelSchema() = default;

    /**
     * @throws std::invalid_argument on duplicate or empty names
     */
    explicit ChannelSchema(const std::vector<std::string>& names);

    /// Label schema shared by every labeled session: [adduction, flexion].
    static ChannelSchema moment_labels();

    /// Compose a channel name from a sensor field and the sensor id.
    static std::string channel_name(const std::string& field, const std::string& sensor_id) {
        return field + "_" + sensor_id;
    }

    /**
     * @brief Append a channel at the end of the schema
     * @throws std::invalid_argument if the name already exists
     */
    void append(const std::string& name);

    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }
    const std::string& name(size_t index) const { return names_.at(index); }
    const std::vector<std::string>& names() const { return names_; }

    /// Column of a channel, or -1 if absent.
    int index_of(const std::string& name) const;

    /**
     * @brief Columns of several channels, in the order requested
     * @throws SchemaMismatchError if any channel is absent
     */
    std::vector<int> indices_of(const std::vector<std::string>& names) const;

    bool operator==(const ChannelSchema& other) const { return names_ == other.names_; }
    bool operator!=(const ChannelSchema& other) const { return !(*this == other); }

    /// Human-readable first difference between two schemas (empty if equal).
    std::string describe_difference(const ChannelSchema& other) const;

private:
    std::vector<std::string> names_;
};

} // namespace kam

#endif // KAM_CORE_CHANNEL_SCHEMA_HPP
