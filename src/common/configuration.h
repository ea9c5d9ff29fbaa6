#ifndef XTSIM_CONFIGURATION_H_
#define XTSIM_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace XtSim {

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
struct XtSimConfig {
    // Shared publisher endpoint
    struct Coordinator {
        ConfigValue<std::string> host{kDefaultCoordinatorHost, "XTSIM_COORDINATOR_HOST"};
        ConfigValue<int> port{kDefaultCoordinatorPort, "XTSIM_COORDINATOR_PORT"};
    } coordinator;

    // Ensemble shape and run length
    struct Harness {
        ConfigValue<int> clients{kDefaultNumParticipants, "XTSIM_CLIENTS"};
        ConfigValue<std::string> vote_strategy{"commit", "XTSIM_VOTE_STRATEGY"};
        // Per-participant overrides, index i applies to participant i
        std::vector<std::string> strategies;
        ConfigValue<bool> send_tx{false, "XTSIM_SEND_TX"};
        ConfigValue<int> tx_count{1, "XTSIM_TX_COUNT"};
        ConfigValue<int> duration_sec{kDefaultRunDurationSec, "XTSIM_DURATION_SEC"};
        ConfigValue<int64_t> stagger_ms{kDefaultStaggerMs, "XTSIM_STAGGER_MS"};
        ConfigValue<int64_t> join_timeout_ms{kDefaultJoinTimeoutMs, "XTSIM_JOIN_TIMEOUT_MS"};
    } harness;

    // Timing of a single simulated sequencer
    struct Participant {
        ConfigValue<int64_t> recv_timeout_ms{kDefaultRecvTimeoutMs, "XTSIM_RECV_TIMEOUT_MS"};
        ConfigValue<int64_t> connect_timeout_ms{kDefaultConnectTimeoutMs, "XTSIM_CONNECT_TIMEOUT_MS"};
        ConfigValue<size_t> max_frame_bytes{kDefaultMaxFrameBytes, "XTSIM_MAX_FRAME_BYTES"};

        ConfigValue<int64_t> vote_delay_min_ms{kDefaultVoteDelayMinMs, "XTSIM_VOTE_DELAY_MIN_MS"};
        ConfigValue<int64_t> vote_delay_max_ms{kDefaultVoteDelayMaxMs, "XTSIM_VOTE_DELAY_MAX_MS"};
        ConfigValue<int64_t> late_vote_min_ms{kDefaultLateVoteMinMs, "XTSIM_LATE_VOTE_MIN_MS"};
        ConfigValue<int64_t> late_vote_max_ms{kDefaultLateVoteMaxMs, "XTSIM_LATE_VOTE_MAX_MS"};
        ConfigValue<int64_t> block_delay_min_ms{kDefaultBlockDelayMinMs, "XTSIM_BLOCK_DELAY_MIN_MS"};
        ConfigValue<int64_t> block_delay_max_ms{kDefaultBlockDelayMaxMs, "XTSIM_BLOCK_DELAY_MAX_MS"};
        ConfigValue<int64_t> origin_delay_min_ms{kDefaultOriginDelayMinMs, "XTSIM_ORIGIN_DELAY_MIN_MS"};
        ConfigValue<int64_t> origin_delay_max_ms{kDefaultOriginDelayMaxMs, "XTSIM_ORIGIN_DELAY_MAX_MS"};
    } participant;
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
    const XtSimConfig& config() const { return config_; }
    XtSimConfig& config() { return config_; }

    // Restore compiled defaults (tests reuse the singleton)
    void reset();

    // Helper methods for common access patterns
    std::string getCoordinatorHost() const { return config_.coordinator.host.get(); }
    int getCoordinatorPort() const { return config_.coordinator.port.get(); }
    int getNumClients() const { return config_.harness.clients.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    XtSimConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies the xtsim: node of a parsed document; throws YAML::Exception
    void applyYAML(const YAML::Node& root);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace XtSim

#endif // XTSIM_CONFIGURATION_H_
