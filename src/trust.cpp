#include "trust.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

const char* const kAuthoritativeMarkers[] = {
    "admin", "executive", "ceo", "security_action"};

const char* const kStrategicKeywords[] = {
    "vision", "strategy", "investor", "plan"};

} // anonymous namespace

double outcome_score(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success: return 1.0;
        case Outcome::Failure: return 0.1;
        case Outcome::Neutral:
        case Outcome::Unknown: return 0.5;
    }
    return 0.5;
}

double half_life_hours(Tier tier) {
    return tier == Tier::Strategic ? kStrategicHalfLifeHours : kTacticalHalfLifeHours;
}

double tier_decay(double age_hours, Tier tier) {
    if (!(age_hours > 0.0)) return 1.0;
    double d = 1.0 - age_hours / half_life_hours(tier);
    return std::clamp(d, kDecayFloor, 1.0);
}

double source_credibility(const std::string& source) {
    for (const char* marker : kAuthoritativeMarkers) {
        if (contains_ci(source, marker)) return 1.0;
    }
    return 0.6;
}

double trust(const MemoryRecord& record, uint64_t now) {
    double age_hours = 0.0;
    if (record.created_at != 0 && now > record.created_at)
        age_hours = static_cast<double>(now - record.created_at) / 3600.0;

    double raw = 0.5 * outcome_score(record.outcome)
               + 0.3 * tier_decay(age_hours, record.tier)
               + 0.2 * source_credibility(record.source);
    return std::round(raw * 100.0) / 100.0;
}

Tier classify_tier(const std::string& content, double confidence) {
    if (confidence >= kStrategicConfidence) return Tier::Strategic;
    for (const char* kw : kStrategicKeywords) {
        if (contains_ci(content, kw)) return Tier::Strategic;
    }
    return Tier::Tactical;
}

} // namespace vigil
