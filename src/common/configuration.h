#ifndef SLUICE_CONFIGURATION_H_
#define SLUICE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Sluice {

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

    // True when get() returns the environment value instead of the set one.
    bool overriddenByEnv() const {
        return !env_var_.empty() && getEnvValue().has_value();
    }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SluiceConfig {
    // Worker group shape and waiting policy
    struct Runtime {
        ConfigValue<int> workers{4, "SLUICE_WORKERS"};
        // Upper bound on one AwaitEvents park; 0 means poll.
        ConfigValue<int> await_timeout_ms{10, "SLUICE_AWAIT_TIMEOUT_MS"};
    } runtime;

    // All-to-all exchange driver
    struct Exchange {
        ConfigValue<int> rounds{1000, "SLUICE_EXCHANGE_ROUNDS"};
        ConfigValue<size_t> channel_id{0, "SLUICE_EXCHANGE_CHANNEL"};
    } exchange;
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
    const SluiceConfig& config() const { return config_; }
    SluiceConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getWorkers() const { return config_.runtime.workers.get(); }
    int getAwaitTimeoutMs() const { return config_.runtime.await_timeout_ms.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restore compiled-in defaults (tests reuse the singleton)
    void reset() { config_ = SluiceConfig(); validation_errors_.clear(); }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SluiceConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString
    void parseRoot(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

} // namespace Sluice

#endif // SLUICE_CONFIGURATION_H_
