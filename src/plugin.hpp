#pragma once
#include "http.hpp"
#include "provider.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {

// Builds a reasoning client from its credentials, endpoint and per-call
// timeout. The HttpClient must outlive the provider.
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const std::string& api_key, HttpClient& http, const std::string& base_url,
    uint32_t timeout_seconds)>;

// Name -> factory table filled by static registrars in providers/*.cpp
// before main() runs. Lookups may come from any thread.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    // Throws std::invalid_argument naming the registered providers when
    // `name` is not one of them.
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const std::string& api_key,
                                              HttpClient& http,
                                              const std::string& base_url,
                                              uint32_t timeout_seconds) const;

    // Sorted; used for --help and error messages.
    std::vector<std::string> provider_names() const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, ProviderFactory> factories_;
};

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

} // namespace vigil
