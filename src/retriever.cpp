#include "retriever.hpp"
#include "embedder.hpp"
#include "trust.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <unordered_set>

namespace vigil {

Retriever::Retriever(RecordStore& store, Embedder* embedder)
    : store_(store), embedder_(embedder) {}

double lexical_overlap(const std::string& query, const std::string& content) {
    auto q = tokenize_words(query);
    if (q.empty()) return 0.0;
    std::unordered_set<std::string> qset(q.begin(), q.end());
    auto c = tokenize_words(content);
    std::unordered_set<std::string> cset(c.begin(), c.end());

    size_t hits = 0;
    for (const auto& w : qset) {
        if (cset.count(w)) ++hits;
    }
    return static_cast<double>(hits) / static_cast<double>(qset.size());
}

std::vector<RetrievedMemory> Retriever::retrieve(const std::string& query,
                                                 uint32_t top_k,
                                                 uint64_t now) {
    if (top_k == 0) return {};

    // Embed outside any store access; the HTTP call may be slow
    Embedding query_emb;
    if (embedder_ && !trim(query).empty()) {
        query_emb = embedder_->embed(query);
    }
    bool use_vectors = !query_emb.empty();

    auto records = store_.all();
    if (records.empty()) return {};

    std::vector<RetrievedMemory> scored;
    scored.reserve(records.size());
    for (const auto& rec : records) {
        double sim = use_vectors ? cosine_similarity(query_emb, rec.embedding)
                                 : lexical_overlap(query, rec.content);
        RetrievedMemory r;
        r.content = rec.content;
        r.tier = rec.tier;
        r.trust = trust(rec, now);
        r.created_at = rec.created_at;
        r.score = kSimilarityWeight * sim + kTrustWeight * r.trust;
        scored.push_back(std::move(r));
    }

    size_t k = std::min<size_t>(top_k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k),
                      scored.end(),
                      [](const RetrievedMemory& a, const RetrievedMemory& b) {
                          if (a.score != b.score) return a.score > b.score;
                          return a.created_at > b.created_at;
                      });
    scored.resize(k);
    return scored;
}

std::string format_context(const std::vector<RetrievedMemory>& memories) {
    if (memories.empty()) return {};
    std::ostringstream ss;
    for (const auto& m : memories) {
        char trust_buf[16];
        std::snprintf(trust_buf, sizeof(trust_buf), "%.2f", m.trust);
        ss << "[" << (m.tier == Tier::Strategic ? "STRATEGIC" : "TACTICAL")
           << " MEMORY - Trust: " << trust_buf << "] " << m.content << "\n";
    }
    return ss.str();
}

} // namespace vigil
