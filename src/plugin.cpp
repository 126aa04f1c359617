#include "plugin.hpp"
#include <stdexcept>

namespace vigil {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[name] = std::move(factory);
}

static std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                          const std::string& api_key,
                                                          HttpClient& http,
                                                          const std::string& base_url,
                                                          uint32_t timeout_seconds) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it != factories_.end()) factory = it->second;
    }
    if (!factory) {
        throw std::invalid_argument("Unknown provider '" + name + "' (available: " +
                                    join_names(provider_names()) + ")");
    }
    return factory(api_key, http, base_url, timeout_seconds);
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& entry : factories_) names.push_back(entry.first);
    return names;
}

} // namespace vigil
