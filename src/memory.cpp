#include "memory.hpp"
#include "memory/sqlite_store.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "trust.hpp"
#include "util.hpp"
#include <cmath>

namespace vigil {

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success: return "success";
        case Outcome::Neutral: return "neutral";
        case Outcome::Failure: return "failure";
        case Outcome::Unknown: return "unknown";
    }
    return "unknown";
}

Outcome outcome_from_string(const std::string& s) {
    if (s == "success") return Outcome::Success;
    if (s == "neutral") return Outcome::Neutral;
    if (s == "failure") return Outcome::Failure;
    return Outcome::Unknown;
}

std::string tier_to_string(Tier tier) {
    return tier == Tier::Strategic ? "strategic" : "tactical";
}

Tier tier_from_string(const std::string& s) {
    return s == "strategic" ? Tier::Strategic : Tier::Tactical;
}

MemoryRecord make_record(const std::string& content,
                         const std::string& source,
                         Outcome outcome,
                         double confidence,
                         Embedder* embedder) {
    MemoryRecord rec;
    rec.id = generate_id();
    rec.content = content;
    rec.created_at = epoch_seconds();
    rec.source = source;
    rec.outcome = outcome;
    rec.confidence = confidence;
    rec.tier = classify_tier(content, confidence);
    if (embedder && !trim(content).empty()) {
        rec.embedding = embedder->embed(content);
    }
    return rec;
}

bool record_is_valid(const MemoryRecord& record) {
    if (trim(record.content).empty()) return false;
    if (!std::isfinite(record.confidence)) return false;
    return record.confidence >= 0.0 && record.confidence <= 1.0;
}

std::unique_ptr<RecordStore> create_record_store(const Config& config) {
    return std::make_unique<SqliteRecordStore>(config.database_path());
}

} // namespace vigil
