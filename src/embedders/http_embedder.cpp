#include "http_embedder.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace vigil {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

Embedding HttpEmbedder::embed(const std::string& text) {
    nlohmann::json body = {
        {"model", config_.model},
        {"input", text}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(
        config_.base_url + config_.endpoint,
        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
        headers, config_.timeout);
    if (response.status_code != 200) {
        if (response.status_code == 0)
            std::cerr << "[embedder] " << config_.name << " unreachable or timed out\n";
        return {};
    }

    auto j = nlohmann::json::parse(response.body, nullptr, false);
    nlohmann::json::json_pointer ptr(config_.response_path);
    if (j.is_discarded() || !j.contains(ptr) || !j.at(ptr).is_array())
        return {};

    const auto& arr = j.at(ptr);
    Embedding result;
    result.reserve(arr.size());
    for (const auto& val : arr) {
        if (!val.is_number()) return {};
        result.push_back(val.get<float>());
    }
    if (!result.empty())
        dimensions_ = static_cast<uint32_t>(result.size());
    return result;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t timeout) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.default_dims = 1536;
    cfg.timeout = timeout;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    uint32_t timeout) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.default_dims = 768;
    cfg.timeout = timeout;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace vigil
