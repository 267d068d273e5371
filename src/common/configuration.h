#ifndef SHEPHERD_CONFIGURATION_H_
#define SHEPHERD_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Shepherd {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ShepherdConfig {
    // Coordination store (etcd v3) connection
    struct Store {
        ConfigValue<std::string> endpoint{"127.0.0.1:2379", "SHEPHERD_STORE_ENDPOINT"};
        ConfigValue<int> rpc_timeout_ms{5000, "SHEPHERD_STORE_RPC_TIMEOUT_MS"};
        ConfigValue<int> connect_timeout_ms{5000, "SHEPHERD_STORE_CONNECT_TIMEOUT_MS"};
        // Every key lives below this root; bump it when the layout changes.
        ConfigValue<std::string> key_root{"v1", "SHEPHERD_KEY_ROOT"};
    } store;

    struct Leader {
        ConfigValue<int64_t> lease_ttl_s{10, "SHEPHERD_LEADER_LEASE_TTL"};
        ConfigValue<int64_t> barrier_lease_ttl_s{10, "SHEPHERD_BARRIER_LEASE_TTL"};
        ConfigValue<int64_t> marker_lease_ttl_s{10, "SHEPHERD_MARKER_LEASE_TTL"};
        // Supported policies: random, lowest
        ConfigValue<std::string> selection_policy{"random", "SHEPHERD_SELECTION_POLICY"};
    } leader;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const ShepherdConfig& config() const { return config_; }
    ShepherdConfig& config() { return config_; }

    // Back to compiled-in defaults (env overrides still apply)
    void reset() { config_ = ShepherdConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Shared by loadFromFile and loadFromString; the caller catches YAML errors
    void applyYAML(const YAML::Node& yaml);

    ShepherdConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Shepherd

#endif // SHEPHERD_CONFIGURATION_H_
