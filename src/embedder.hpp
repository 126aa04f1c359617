#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil {

class HttpClient;
struct Config;

// A point in the similarity space records and queries share. The store pins
// the first dimensionality it sees.
using Embedding = std::vector<float>;

// Text-to-vector service. The retriever embeds queries on the foreground
// thread while the scanner embeds alerts on its own, so implementations
// must tolerate concurrent calls.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Empty on any failure; callers then fall back to lexical recall.
    virtual Embedding embed(const std::string& text) = 0;

    // 0 until known
    virtual uint32_t dimensions() const = 0;

    virtual std::string embedder_name() const = 0;
};

// In [-1, 1]; 0 for empty, zero-norm or differently sized vectors.
double cosine_similarity(const Embedding& a, const Embedding& b);

// nullptr when no embedding provider is configured or it cannot be used.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

// "openai (1536 dims)", or "off" without an embedder. Shown in the banner.
std::string describe_embedder(const Embedder* embedder);

} // namespace vigil
