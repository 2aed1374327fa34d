#include "../include/ollama_client.hpp"
#include "../include/http.hpp"
#include "../../swarm_core/include/errors.hpp"
#include "../../swarm_core/include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaConfig ollama_config_from_env() {
    OllamaConfig c;
    c.url = getenv_or("OLLAMA_URL", c.url);
    c.chat_model = getenv_or("SWARM_MODEL", c.chat_model);
    c.code_model = getenv_or("SWARM_CODE_MODEL", c.code_model);
    c.embed_model = getenv_or("SWARM_EMBED_MODEL", c.embed_model);
    try {
        c.timeout_ms = std::stoi(getenv_or("SWARM_LLM_TIMEOUT_MS", std::to_string(c.timeout_ms)));
    } catch (const std::exception&) {
        throw ConfigError("SWARM_LLM_TIMEOUT_MS must be an integer");
    }
    return c;
}

OllamaClient::OllamaClient(OllamaConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.url.empty() && cfg_.url.back() == '/') cfg_.url.pop_back();
}

namespace {
json post(const std::string& url, const json& body, long timeout_ms) {
    HttpResponse r;
    try {
        r = http_post_json(url, body.dump(), timeout_ms);
    } catch (const HttpTimeout& e) {
        throw AgentTimeout(e.what());
    } catch (const HttpError& e) {
        throw AgentUnavailable(e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw AgentUnavailable(url + " returned status " + std::to_string(r.status));
    }
    try {
        return json::parse(r.body);
    } catch (const json::exception& e) {
        throw AgentUnavailable(url + " returned invalid JSON: " + e.what());
    }
}
}

std::string OllamaClient::chat(const std::string& model, const std::vector<ChatMessage>& messages) {
    json msgs = json::array();
    for (const auto& m : messages) msgs.push_back(json{{"role", m.role}, {"content", m.content}});
    json body = {
        {"model", model.empty() ? cfg_.chat_model : model},
        {"messages", msgs},
        {"stream", false}
    };
    auto data = post(cfg_.url + "/api/chat", body, cfg_.timeout_ms);
    if (data.contains("message") && data["message"].contains("content")) {
        return data["message"]["content"].get<std::string>();
    }
    return {};
}

std::vector<float> OllamaClient::embed(const std::string& model, const std::string& text) {
    json body = {
        {"model", model.empty() ? cfg_.embed_model : model},
        {"prompt", text}
    };
    auto data = post(cfg_.url + "/api/embeddings", body, cfg_.timeout_ms);
    std::vector<float> vec;
    if (!data.contains("embedding")) return vec;
    try {
        for (auto& v : data["embedding"]) vec.push_back(v.get<float>());
    } catch (const json::exception& e) {
        throw AgentUnavailable(std::string("malformed embedding from ") + cfg_.url + ": " + e.what());
    }
    return vec;
}

std::vector<std::string> OllamaClient::list_models() {
    HttpResponse r;
    try {
        r = http_get(cfg_.url + "/api/tags");
    } catch (const HttpError& e) {
        throw AgentUnavailable(e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw AgentUnavailable("/api/tags returned status " + std::to_string(r.status));
    }
    std::vector<std::string> out;
    auto data = json::parse(r.body);
    for (const auto& m : data.value("models", json::array())) out.push_back(m.value("name", std::string()));
    return out;
}

bool OllamaClient::is_healthy() {
    try {
        return http_get(cfg_.url + "/api/tags").status == 200;
    } catch (const HttpError&) {
        return false;
    }
}
