#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Shepherd {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["shepherd"]) {
        LOG(WARNING) << "Configuration has no 'shepherd' section, keeping defaults";
        return;
    }
    auto root = yaml["shepherd"];

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["endpoint"]) config_.store.endpoint.set(store["endpoint"].as<std::string>());
        if (store["rpc_timeout_ms"]) config_.store.rpc_timeout_ms.set(store["rpc_timeout_ms"].as<int>());
        if (store["connect_timeout_ms"]) config_.store.connect_timeout_ms.set(store["connect_timeout_ms"].as<int>());
        if (store["key_root"]) config_.store.key_root.set(store["key_root"].as<std::string>());
    }

    // Leader
    if (root["leader"]) {
        auto leader = root["leader"];
        if (leader["lease_ttl_s"]) config_.leader.lease_ttl_s.set(leader["lease_ttl_s"].as<int64_t>());
        if (leader["barrier_lease_ttl_s"]) config_.leader.barrier_lease_ttl_s.set(leader["barrier_lease_ttl_s"].as<int64_t>());
        if (leader["marker_lease_ttl_s"]) config_.leader.marker_lease_ttl_s.set(leader["marker_lease_ttl_s"].as<int64_t>());
        if (leader["selection_policy"]) config_.leader.selection_policy.set(leader["selection_policy"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.store.endpoint.get().empty()) {
        validation_errors_.push_back("Store endpoint must not be empty");
    }

    if (config_.store.rpc_timeout_ms.get() < 1) {
        validation_errors_.push_back("Store RPC timeout must be at least 1ms");
    }

    if (config_.store.connect_timeout_ms.get() < 1) {
        validation_errors_.push_back("Store connect timeout must be at least 1ms");
    }

    const std::string key_root = config_.store.key_root.get();
    if (key_root.empty() || key_root.back() == '/') {
        validation_errors_.push_back("Key root must be non-empty and must not end with '/'");
    }

    // Lease TTLs
    if (config_.leader.lease_ttl_s.get() < 1) {
        validation_errors_.push_back("Leader lease TTL must be at least 1 second");
    }

    if (config_.leader.barrier_lease_ttl_s.get() < 1) {
        validation_errors_.push_back("Barrier lease TTL must be at least 1 second");
    }

    if (config_.leader.marker_lease_ttl_s.get() < 1) {
        validation_errors_.push_back("Marker lease TTL must be at least 1 second");
    }

    const std::string policy = config_.leader.selection_policy.get();
    if (policy != "random" && policy != "lowest") {
        validation_errors_.push_back("Selection policy must be 'random' or 'lowest', got '" + policy + "'");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Shepherd
