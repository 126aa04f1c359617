#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace vigil {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0, aa = 0.0, bb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        aa += x * x;
        bb += y * y;
    }
    if (aa <= 0.0 || bb <= 0.0) return 0.0;
    double sim = dot / (std::sqrt(aa) * std::sqrt(bb));
    if (!std::isfinite(sim)) return 0.0;
    return std::max(-1.0, std::min(1.0, sim));
}

std::string describe_embedder(const Embedder* embedder) {
    if (!embedder) return "off";
    std::string out = embedder->embedder_name();
    if (uint32_t dims = embedder->dimensions()) out += " (" + std::to_string(dims) + " dims)";
    return out;
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.memory.embeddings;

    std::string openai_key = emb.api_key;
    if (openai_key.empty()) openai_key = config.api_key_for("openai");

    // Explicit config only: the scorer falls back to lexical overlap without one
    const std::string& provider = emb.provider;
    if (provider.empty()) return nullptr;

    if (provider == "openai") {
        if (openai_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(openai_key, http, emb.base_url, emb.model,
                                      emb.timeout);
    }

    if (provider == "ollama") {
        std::string base = emb.base_url.empty() ? config.base_url_for("ollama")
                                                : emb.base_url;
        return create_ollama_embedder(http, base, emb.model, emb.timeout);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace vigil
