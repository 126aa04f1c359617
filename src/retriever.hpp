#pragma once
#include "memory.hpp"
#include "util.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vigil {

class Embedder;

struct RetrievedMemory {
    std::string content;
    double score = 0.0;       // 0.7*similarity + 0.3*trust
    Tier tier = Tier::Tactical;
    double trust = 0.0;
    uint64_t created_at = 0;
};

// Weights of the retrieval law
constexpr double kSimilarityWeight = 0.7;
constexpr double kTrustWeight = 0.3;

// Ranks stored records against a query. Similarity is cosine over
// embeddings; if the query cannot be embedded (no embedder, service down)
// every record is compared by lexical word overlap instead, so one query
// never mixes the two measures.
class Retriever {
public:
    Retriever(RecordStore& store, Embedder* embedder);

    std::vector<RetrievedMemory> retrieve(const std::string& query,
                                          uint32_t top_k,
                                          uint64_t now = epoch_seconds());

private:
    RecordStore& store_;
    Embedder* embedder_;
};

// Fraction of distinct query words present in content, in [0,1].
double lexical_overlap(const std::string& query, const std::string& content);

// Render retrieved memories as a context block for the reasoning prompt.
// Empty input renders as an empty string.
std::string format_context(const std::vector<RetrievedMemory>& memories);

} // namespace vigil
