#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>

namespace vigil {

// Local Ollama server, non-streaming /api/chat.
class OllamaProvider : public Provider {
public:
    OllamaProvider(HttpClient& http,
                   const std::string& base_url = "http://localhost:11434",
                   uint32_t timeout_seconds = 60);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "ollama"; }

private:
    HttpClient& http_;
    std::string base_url_;
    uint32_t timeout_;
};

} // namespace vigil
