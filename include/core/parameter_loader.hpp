#pragma once

#include "core/errors.hpp"
#include <string>
#include <unordered_map>
#include <sstream>
#include <vector>
#include <array>
#include <yaml-cpp/yaml.h>

namespace larcc {

/**
 * @brief YAML parameter loader with dotted-key lookup
 *
 * Keys such as "reward.kp" walk nested maps. Resolved nodes are cached.
 * Missing keys and failed conversions raise ConfigurationInvalid.
 */
class FastParameterLoader {
private:
    YAML::Node root_;
    mutable std::unordered_map<std::string, YAML::Node> cache_;

public:
    explicit FastParameterLoader(const std::string& filename);

    // Generic get method with type conversion
    template<typename T>
    T get(const std::string& key) const;

    // Specialized get methods for common types
    bool get_bool(const std::string& key) const;
    int get_int(const std::string& key) const;
    double get_double(const std::string& key) const;
    std::string get_string(const std::string& key) const;

    // Array getters
    template<size_t N>
    std::array<double, N> get_array(const std::string& key) const;

    std::vector<double> get_vector(const std::string& key) const;
    std::vector<std::string> get_string_vector(const std::string& key) const;

    // Check if key exists
    bool has_key(const std::string& key) const;

private:
    YAML::Node get_node(const std::string& key) const;
};

template<typename T>
T FastParameterLoader::get(const std::string& key) const {
    YAML::Node node = get_node(key);
    if (!node || node.IsNull()) {
        throw ConfigurationInvalid("parameter not found: " + key);
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationInvalid("failed to convert parameter " + key + ": " + e.what());
    }
}

template<size_t N>
std::array<double, N> FastParameterLoader::get_array(const std::string& key) const {
    YAML::Node node = get_node(key);
    if (!node || node.IsNull()) {
        throw ConfigurationInvalid("parameter not found: " + key);
    }
    if (!node.IsSequence()) {
        throw ConfigurationInvalid("parameter is not an array: " + key);
    }

    if (node.size() != N) {
        throw ConfigurationInvalid("array size mismatch for parameter: " + key +
                                   " (expected: " + std::to_string(N) +
                                   ", got: " + std::to_string(node.size()) + ")");
    }

    std::array<double, N> result;
    for (size_t i = 0; i < N; i++) {
        try {
            result[i] = node[i].as<double>();
        } catch (const YAML::Exception& e) {
            throw ConfigurationInvalid("failed to convert array element " + std::to_string(i) +
                                       " of parameter " + key + " to double: " + e.what());
        }
    }
    return result;
}

} // namespace larcc
