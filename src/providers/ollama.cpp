#include "ollama.hpp"
#include "../http.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static vigil::ProviderRegistrar reg_ollama("ollama",
    [](const std::string&, vigil::HttpClient& http, const std::string& base_url,
       uint32_t timeout) {
        std::string url = base_url.empty() ? "http://localhost:11434" : base_url;
        return std::make_unique<vigil::OllamaProvider>(http, url, timeout);
    });

using json = nlohmann::json;

namespace vigil {

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url,
                               uint32_t timeout_seconds)
    : http_(http), base_url_(base_url), timeout_(timeout_seconds) {}

ChatResponse OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    json request;
    request["model"] = model;
    request["stream"] = false;
    request["options"] = {{"temperature", temperature}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    // File excerpts may hold invalid UTF-8; replace rather than throw
    auto response = http_.post(base_url_ + "/api/chat",
                               request.dump(-1, ' ', false, json::error_handler_t::replace),
                               headers, timeout_);

    if (response.status_code == 0) {
        throw std::runtime_error("Ollama unreachable or timed out at " + base_url_);
    }
    if (!response.ok()) {
        throw std::runtime_error("Ollama API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    auto resp = json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        throw std::runtime_error("Ollama API returned malformed JSON");
    }

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("message") && resp["message"].is_object() &&
        resp["message"].contains("content") && resp["message"]["content"].is_string()) {
        result.content = resp["message"]["content"].get<std::string>();
    }

    if (resp.contains("prompt_eval_count") && resp["prompt_eval_count"].is_number_unsigned()) {
        result.usage.prompt_tokens = resp["prompt_eval_count"].get<uint32_t>();
    }
    if (resp.contains("eval_count") && resp["eval_count"].is_number_unsigned()) {
        result.usage.completion_tokens = resp["eval_count"].get<uint32_t>();
    }
    result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;

    return result;
}

} // namespace vigil
