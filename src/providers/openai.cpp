#include "openai.hpp"
#include "../http.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static vigil::ProviderRegistrar reg_openai("openai",
    [](const std::string& key, vigil::HttpClient& http, const std::string& base_url,
       uint32_t timeout) {
        return std::make_unique<vigil::OpenAIProvider>(key, http, base_url, timeout);
    });

static vigil::ProviderRegistrar reg_compatible("compatible",
    [](const std::string& key, vigil::HttpClient& http, const std::string& base_url,
       uint32_t timeout) {
        return std::make_unique<vigil::CompatibleProvider>(key, http, base_url, timeout);
    });

using json = nlohmann::json;

namespace vigil {

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url, uint32_t timeout_seconds)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url),
      timeout_(timeout_seconds) {}

std::vector<Header> OpenAIProvider::build_headers() const {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }
    return headers;
}

ChatResponse OpenAIProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    auto response = http_.post(base_url_ + "/chat/completions",
                               request.dump(-1, ' ', false, json::error_handler_t::replace),
                               build_headers(), timeout_);

    if (response.status_code == 0) {
        throw std::runtime_error(provider_name() + " unreachable or timed out");
    }
    if (!response.ok()) {
        throw std::runtime_error(provider_name() + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    auto resp = json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        throw std::runtime_error(provider_name() + " API returned malformed JSON");
    }

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message") && choice["message"].is_object()) {
            const auto& message = choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                result.content = message["content"].get<std::string>();
            }
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& u = resp["usage"];
        result.usage.prompt_tokens = u.value("prompt_tokens", 0u);
        result.usage.completion_tokens = u.value("completion_tokens", 0u);
        result.usage.total_tokens = u.value("total_tokens", 0u);
    }

    return result;
}

CompatibleProvider::CompatibleProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url,
                                       uint32_t timeout_seconds)
    : OpenAIProvider(api_key, http, base_url, timeout_seconds) {}

} // namespace vigil
