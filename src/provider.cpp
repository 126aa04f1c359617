#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"

namespace vigil {

std::string Provider::chat_simple(const std::string& system_prompt,
                                  const std::string& message,
                                  const std::string& model,
                                  double temperature) {
    std::vector<ChatMessage> messages;
    if (!system_prompt.empty()) {
        messages.push_back({Role::System, system_prompt});
    }
    messages.push_back({Role::User, message});
    return chat(messages, model, temperature).content.value_or("");
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url,
                                          uint32_t timeout_seconds) {
    return PluginRegistry::instance().create_provider(
        name, api_key, http, base_url, timeout_seconds);
}

std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http) {
    return create_provider(config.provider, config.api_key_for(config.provider), http,
                           config.base_url_for(config.provider), config.request_timeout);
}

} // namespace vigil
