#pragma once
#include "llm_client.hpp"
#include <string>
#include <vector>

struct OllamaConfig {
    std::string url{"http://localhost:11434"};
    std::string chat_model{"llama3:8b"};
    std::string code_model{"deepseek-coder:13b"};
    std::string embed_model{"nomic-embed-text"};
    int timeout_ms{120000};
};

// Reads OLLAMA_URL, SWARM_MODEL, SWARM_CODE_MODEL, SWARM_EMBED_MODEL and
// SWARM_LLM_TIMEOUT_MS over the defaults above.
OllamaConfig ollama_config_from_env();

class OllamaClient : public LlmClient {
public:
    explicit OllamaClient(OllamaConfig cfg);

    std::string chat(const std::string& model, const std::vector<ChatMessage>& messages) override;
    std::vector<float> embed(const std::string& model, const std::string& text) override;

    std::vector<std::string> list_models();
    bool is_healthy();

    const OllamaConfig& config() const { return cfg_; }

private:
    OllamaConfig cfg_;
};
