#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Sluice {

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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseRoot(const YAML::Node& yaml) {
    if (!yaml["sluice"]) {
        LOG(WARNING) << "Configuration has no 'sluice' section; keeping defaults";
        return;
    }
    auto root = yaml["sluice"];

    // Runtime
    if (root["runtime"]) {
        auto runtime = root["runtime"];
        if (runtime["workers"]) config_.runtime.workers.set(runtime["workers"].as<int>());
        if (runtime["await_timeout_ms"]) config_.runtime.await_timeout_ms.set(runtime["await_timeout_ms"].as<int>());
    }

    // Exchange
    if (root["exchange"]) {
        auto exchange = root["exchange"];
        if (exchange["rounds"]) config_.exchange.rounds.set(exchange["rounds"].as<int>());
        if (exchange["channel_id"]) config_.exchange.channel_id.set(exchange["channel_id"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseRoot(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseRoot(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate worker group
    if (config_.runtime.workers.get() < 1) {
        validation_errors_.push_back("Workers must be at least 1");
    }

    if (config_.runtime.await_timeout_ms.get() < 0) {
        validation_errors_.push_back("Await timeout cannot be negative");
    }

    // Validate exchange settings
    if (config_.exchange.rounds.get() < 1) {
        validation_errors_.push_back("Exchange rounds must be at least 1");
    }

    for (const auto& error : validation_errors_) {
        LOG(WARNING) << "Invalid configuration: " << error;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Sluice
