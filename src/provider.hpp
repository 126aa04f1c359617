#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace vigil {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    TokenUsage usage;
    std::string model;
};

// Abstract base class for reasoning/classification services.
// Transport or protocol failures throw std::runtime_error; callers in the
// core catch them and degrade.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              double temperature) = 0;

    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature);

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration
struct Config;

// Factory: create provider by registered name. Throws std::invalid_argument
// for an unknown name.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url,
                                          uint32_t timeout_seconds);

// Create the provider selected in config, with its key, URL and timeout.
std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http);

} // namespace vigil
