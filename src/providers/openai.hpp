#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>

namespace vigil {

// OpenAI Chat Completions API
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url = "",
                   uint32_t timeout_seconds = 60);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "openai"; }

protected:
    std::vector<Header> build_headers() const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    uint32_t timeout_;
};

// OpenAI-compatible endpoint (Groq and friends): same protocol, own base URL
class CompatibleProvider : public OpenAIProvider {
public:
    CompatibleProvider(const std::string& api_key, HttpClient& http,
                       const std::string& base_url, uint32_t timeout_seconds);

    std::string provider_name() const override { return "compatible"; }
};

} // namespace vigil
