/**
 * @file channel_schema.cpp
 * @brief Implementation of the shared channel schema
 */

#include "channel_schema.hpp"
#include "errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace kam {

ChannelSchema::ChannelSchema(const std::vector<std::string>& names) {
    names_.reserve(names.size());
    for (const auto& name : names) {
        append(name);
    }
}

ChannelSchema ChannelSchema::moment_labels() {
    return ChannelSchema({KNEE_ADDUCTION_MOMENT, KNEE_FLEXION_MOMENT});
}

void ChannelSchema::append(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Channel name must not be empty");
    }
    if (index_of(name) >= 0) {
        throw std::invalid_argument("Duplicate channel name: " + name);
    }
    names_.push_back(name);
}

int ChannelSchema::index_of(const std::string& name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) {
        return -1;
    }
    return static_cast<int>(it - names_.begin());
}

std::vector<int> ChannelSchema::indices_of(const std::vector<std::string>& names) const {
    std::vector<int> indices;
    indices.reserve(names.size());
    for (const auto& name : names) {
        int index = index_of(name);
        if (index < 0) {
            throw SchemaMismatchError("Channel not present in schema: " + name);
        }
        indices.push_back(index);
    }
    return indices;
}

std::string ChannelSchema::describe_difference(const ChannelSchema& other) const {
    if (*this == other) {
        return "";
    }

    std::ostringstream out;
    size_t common = std::min(names_.size(), other.names_.size());
    for (size_t i = 0; i < common; i++) {
        if (names_[i] != other.names_[i]) {
            out << "column " << i << ": '" << names_[i] << "' vs '" << other.names_[i] << "'";
            return out.str();
        }
    }

    out << "channel count " << names_.size() << " vs " << other.names_.size();
    return out.str();
}

} // namespace kam
