#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace XtSim {

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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<size_t>(std::stoull(env_val));
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

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::reset() {
    config_ = XtSimConfig();
    validation_errors_.clear();
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["xtsim"]) {
        LOG(WARNING) << "Configuration has no top-level 'xtsim' node, keeping defaults";
        return;
    }
    auto root = yaml["xtsim"];

    // Coordinator
    if (root["coordinator"]) {
        auto coordinator = root["coordinator"];
        if (coordinator["host"]) config_.coordinator.host.set(coordinator["host"].as<std::string>());
        if (coordinator["port"]) config_.coordinator.port.set(coordinator["port"].as<int>());
    }

    // Harness
    if (root["harness"]) {
        auto harness = root["harness"];
        if (harness["clients"]) config_.harness.clients.set(harness["clients"].as<int>());
        if (harness["vote_strategy"]) config_.harness.vote_strategy.set(harness["vote_strategy"].as<std::string>());
        if (harness["strategies"]) {
            config_.harness.strategies.clear();
            for (const auto& s : harness["strategies"]) {
                config_.harness.strategies.push_back(s.as<std::string>());
            }
        }
        if (harness["send_tx"]) config_.harness.send_tx.set(harness["send_tx"].as<bool>());
        if (harness["tx_count"]) config_.harness.tx_count.set(harness["tx_count"].as<int>());
        if (harness["duration_sec"]) config_.harness.duration_sec.set(harness["duration_sec"].as<int>());
        if (harness["stagger_ms"]) config_.harness.stagger_ms.set(harness["stagger_ms"].as<int64_t>());
        if (harness["join_timeout_ms"]) config_.harness.join_timeout_ms.set(harness["join_timeout_ms"].as<int64_t>());
    }

    // Participant
    if (root["participant"]) {
        auto p = root["participant"];
        if (p["recv_timeout_ms"]) config_.participant.recv_timeout_ms.set(p["recv_timeout_ms"].as<int64_t>());
        if (p["connect_timeout_ms"]) config_.participant.connect_timeout_ms.set(p["connect_timeout_ms"].as<int64_t>());
        if (p["max_frame_bytes"]) config_.participant.max_frame_bytes.set(p["max_frame_bytes"].as<size_t>());
        if (p["vote_delay_min_ms"]) config_.participant.vote_delay_min_ms.set(p["vote_delay_min_ms"].as<int64_t>());
        if (p["vote_delay_max_ms"]) config_.participant.vote_delay_max_ms.set(p["vote_delay_max_ms"].as<int64_t>());
        if (p["late_vote_min_ms"]) config_.participant.late_vote_min_ms.set(p["late_vote_min_ms"].as<int64_t>());
        if (p["late_vote_max_ms"]) config_.participant.late_vote_max_ms.set(p["late_vote_max_ms"].as<int64_t>());
        if (p["block_delay_min_ms"]) config_.participant.block_delay_min_ms.set(p["block_delay_min_ms"].as<int64_t>());
        if (p["block_delay_max_ms"]) config_.participant.block_delay_max_ms.set(p["block_delay_max_ms"].as<int64_t>());
        if (p["origin_delay_min_ms"]) config_.participant.origin_delay_min_ms.set(p["origin_delay_min_ms"].as<int64_t>());
        if (p["origin_delay_max_ms"]) config_.participant.origin_delay_max_ms.set(p["origin_delay_max_ms"].as<int64_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        validation_errors_ = {std::string("YAML: ") + e.what()};
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        validation_errors_ = {std::string("YAML: ") + e.what()};
        return false;
    }
}

namespace {

void CheckRange(const char* name, int64_t min_ms, int64_t max_ms, std::vector<std::string>& errors) {
    if (min_ms < 0) {
        errors.push_back(std::string(name) + " minimum must not be negative");
    }
    if (min_ms > max_ms) {
        errors.push_back(std::string(name) + " minimum exceeds maximum");
    }
}

} // namespace

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate port ranges
    int port = config_.coordinator.port.get();
    if (port < 1 || port > 65535) {
        validation_errors_.push_back("Coordinator port must be between 1 and 65535");
    }

    if (config_.coordinator.host.get().empty()) {
        validation_errors_.push_back("Coordinator host must not be empty");
    }

    // Validate ensemble shape
    int clients = config_.harness.clients.get();
    if (clients < 1 || clients > kMaxParticipants) {
        validation_errors_.push_back("Number of clients must be between 1 and " +
            std::to_string(kMaxParticipants));
    }

    if (config_.harness.tx_count.get() < 0) {
        validation_errors_.push_back("Transaction count must not be negative");
    }

    if (config_.harness.duration_sec.get() < 0) {
        validation_errors_.push_back("Run duration must not be negative");
    }

    if (config_.harness.stagger_ms.get() < 0 || config_.harness.join_timeout_ms.get() < 0) {
        validation_errors_.push_back("Stagger and join timeout must not be negative");
    }

    // Validate participant timing
    const auto& p = config_.participant;
    if (p.recv_timeout_ms.get() < 1) {
        validation_errors_.push_back("Receive timeout must be at least 1ms");
    }

    if (p.connect_timeout_ms.get() < 1) {
        validation_errors_.push_back("Connect timeout must be at least 1ms");
    }

    if (p.max_frame_bytes.get() < 16) {
        validation_errors_.push_back("Max frame size must be at least 16 bytes");
    }

    CheckRange("Vote delay", p.vote_delay_min_ms.get(), p.vote_delay_max_ms.get(), validation_errors_);
    CheckRange("Late vote delay", p.late_vote_min_ms.get(), p.late_vote_max_ms.get(), validation_errors_);
    CheckRange("Block delay", p.block_delay_min_ms.get(), p.block_delay_max_ms.get(), validation_errors_);
    CheckRange("Origin delay", p.origin_delay_min_ms.get(), p.origin_delay_max_ms.get(), validation_errors_);

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    return validate();
}

} // namespace XtSim
