#include "../include/run_config.hpp"
#include "../include/errors.hpp"
#include <cmath>

using json = nlohmann::json;

std::chrono::milliseconds RetryBackoff::delay_for(int retry) const {
    if (retry < 1) retry = 1;
    double d = (double)base_ms * std::pow(multiplier, retry - 1);
    if (d > (double)max_ms) d = (double)max_ms;
    return std::chrono::milliseconds((long long)d);
}

std::string to_string(AgentRotation r) {
    return r == AgentRotation::Reuse ? "reuse" : "rotate";
}

ConsensusSetting ConsensusPolicy::setting_for(const Task& t) const {
    auto it = overrides.find(t.id);
    if (it != overrides.end()) return it->second;
    if (t.consensus) return *t.consensus;
    return default_setting;
}

void RunConfig::validate() const {
    if (concurrency < 1) throw ConfigError("concurrency must be >= 1");
    if (max_retries < 0) throw ConfigError("max_retries must be >= 0");
    if (retry_backoff.base_ms < 0) throw ConfigError("retry_backoff.base_ms must be >= 0");
    if (retry_backoff.multiplier < 1.0) throw ConfigError("retry_backoff.multiplier must be >= 1");
    if (retry_backoff.max_ms < retry_backoff.base_ms) throw ConfigError("retry_backoff.max_ms must be >= base_ms");
    if (consensus_timeout_ms < 1) throw ConfigError("consensus_timeout_ms must be >= 1");
    if (similarity_threshold < 0.0 || similarity_threshold > 1.0) {
        throw ConfigError("similarity_threshold must be within [0, 1]");
    }
    if (consensus.default_setting.required && consensus.default_setting.f < 0) {
        throw ConfigError("default_fault_tolerance must be >= 0");
    }
    for (const auto& kv : consensus.overrides) {
        if (kv.second.required && kv.second.f < 0) {
            throw ConfigError("consensus override for " + kv.first + " must be >= 0");
        }
    }
}

RunConfig run_config_from_json(const json& j) {
    RunConfig c;
    if (j.is_null()) return c;
    if (!j.is_object()) throw ConfigError("run configuration must be a JSON object");
    try {
        c.concurrency = j.value("concurrency", c.concurrency);
        if (j.contains("default_fault_tolerance")) {
            c.consensus.default_setting = consensus_setting_from_json(j["default_fault_tolerance"]);
        }
        if (j.contains("consensus_overrides")) {
            for (auto it = j["consensus_overrides"].begin(); it != j["consensus_overrides"].end(); ++it) {
                c.consensus.overrides[it.key()] = consensus_setting_from_json(it.value());
            }
        }
        c.max_retries = j.value("max_retries", c.max_retries);
        if (j.contains("retry_backoff")) {
            const auto& b = j["retry_backoff"];
            c.retry_backoff.base_ms = b.value("base_ms", c.retry_backoff.base_ms);
            c.retry_backoff.multiplier = b.value("multiplier", c.retry_backoff.multiplier);
            c.retry_backoff.max_ms = b.value("max_ms", c.retry_backoff.max_ms);
        }
        c.consensus_timeout_ms = j.value("consensus_timeout_ms", c.consensus_timeout_ms);
        c.similarity_threshold = j.value("similarity_threshold", c.similarity_threshold);
        std::string rotation = j.value("agent_rotation", to_string(c.agent_rotation));
        if (rotation == "reuse") c.agent_rotation = AgentRotation::Reuse;
        else if (rotation == "rotate") c.agent_rotation = AgentRotation::Rotate;
        else throw ConfigError("agent_rotation must be \"reuse\" or \"rotate\", got \"" + rotation + "\"");
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid run configuration: ") + e.what());
    }
    c.validate();
    return c;
}

json run_config_to_json(const RunConfig& c) {
    json overrides = json::object();
    for (const auto& kv : c.consensus.overrides) overrides[kv.first] = consensus_setting_to_json(kv.second);
    return json{
        {"concurrency", c.concurrency},
        {"default_fault_tolerance", consensus_setting_to_json(c.consensus.default_setting)},
        {"consensus_overrides", overrides},
        {"max_retries", c.max_retries},
        {"retry_backoff", {
            {"base_ms", c.retry_backoff.base_ms},
            {"multiplier", c.retry_backoff.multiplier},
            {"max_ms", c.retry_backoff.max_ms}
        }},
        {"consensus_timeout_ms", c.consensus_timeout_ms},
        {"similarity_threshold", c.similarity_threshold},
        {"agent_rotation", to_string(c.agent_rotation)}
    };
}
