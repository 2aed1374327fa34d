#pragma once
#include "task.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>

struct RetryBackoff {
    int base_ms{500};
    double multiplier{2.0};
    int max_ms{30000};

    // Delay before retry number `retry` (1-based): base * multiplier^(retry-1), capped at max.
    std::chrono::milliseconds delay_for(int retry) const;
};

// Which agents a consensus fan-out (or a single-agent retry) draws.
// Reuse starts at the same agent every attempt; Rotate moves on by one
// fan-out width per retry so each retry asks a fresh set when the pool allows.
enum class AgentRotation { Reuse, Rotate };

std::string to_string(AgentRotation r);

struct ConsensusPolicy {
    ConsensusSetting default_setting;
    std::map<std::string, ConsensusSetting> overrides;  // task id -> setting

    // Run override, then the task's own setting, then the default.
    ConsensusSetting setting_for(const Task& t) const;
};

struct RunConfig {
    int concurrency{4};
    ConsensusPolicy consensus;
    int max_retries{2};
    RetryBackoff retry_backoff;
    int consensus_timeout_ms{120000};
    double similarity_threshold{0.9};
    AgentRotation agent_rotation{AgentRotation::Rotate};

    // Throws ConfigError on out-of-range values.
    void validate() const;
};

// Keys: concurrency, default_fault_tolerance, consensus_overrides, max_retries,
// retry_backoff{base_ms,multiplier,max_ms}, consensus_timeout_ms,
// similarity_threshold, agent_rotation. Missing keys keep their defaults.
RunConfig run_config_from_json(const nlohmann::json& j);
nlohmann::json run_config_to_json(const RunConfig& c);
