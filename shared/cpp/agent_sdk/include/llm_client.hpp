#pragma once
#include <string>
#include <vector>

struct ChatMessage {
    std::string role;  // system|user|assistant
    std::string content;
};

// Language-model invocation. Implementations throw AgentUnavailable or
// AgentTimeout and must be safe to call from several threads.
class LlmClient {
public:
    virtual ~LlmClient() = default;
    virtual std::string chat(const std::string& model, const std::vector<ChatMessage>& messages) = 0;
    virtual std::vector<float> embed(const std::string& model, const std::string& text) = 0;
};
