#include "core/parameter_loader.hpp"

namespace larcc {

FastParameterLoader::FastParameterLoader(const std::string& filename) {
    try {
        root_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigurationInvalid("failed to load YAML file: " + filename + " - " + e.what());
    }
}

YAML::Node FastParameterLoader::get_node(const std::string& key) const {
    // Check cache first
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    // Navigate through nested keys (e.g., "workspace.table_position")
    YAML::Node node = root_;
    std::istringstream ss(key);
    std::string token;

    while (std::getline(ss, token, '.')) {
        const YAML::Node& current = node;
        if (!current.IsMap() || !current[token].IsDefined()) {
            YAML::Node null_node;
            cache_[key] = null_node;
            return null_node;
        }
        // reset() rebinds without writing through to root_
        node.reset(current[token]);
    }

    cache_[key] = node;
    return node;
}

bool FastParameterLoader::get_bool(const std::string& key) const {
    return get<bool>(key);
}

int FastParameterLoader::get_int(const std::string& key) const {
    return get<int>(key);
}

double FastParameterLoader::get_double(const std::string& key) const {
    return get<double>(key);
}

std::string FastParameterLoader::get_string(const std::string& key) const {
    return get<std::string>(key);
}

std::vector<double> FastParameterLoader::get_vector(const std::string& key) const {
    YAML::Node node = get_node(key);
    if (!node || node.IsNull() || !node.IsSequence()) {
        throw ConfigurationInvalid("parameter is not a sequence: " + key);
    }

    std::vector<double> result;
    result.reserve(node.size());
    try {
        for (const auto& item : node) {
            result.push_back(item.as<double>());
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationInvalid("failed to convert sequence " + key + ": " + e.what());
    }
    return result;
}

std::vector<std::string> FastParameterLoader::get_string_vector(const std::string& key) const {
    YAML::Node node = get_node(key);
    if (!node || node.IsNull() || !node.IsSequence()) {
        throw ConfigurationInvalid("parameter is not a sequence: " + key);
    }

    std::vector<std::string> result;
    result.reserve(node.size());
    try {
        for (const auto& item : node) {
            result.push_back(item.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationInvalid("failed to convert sequence " + key + ": " + e.what());
    }
    return result;
}

bool FastParameterLoader::has_key(const std::string& key) const {
    YAML::Node node = get_node(key);
    return node.IsDefined() && !node.IsNull();
}

} // namespace larcc
