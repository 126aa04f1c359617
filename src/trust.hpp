#pragma once
#include "memory.hpp"
#include <cstdint>
#include <string>

namespace vigil {

// Half-lives in hours: how long a memory stays fully credible before the
// linear decay reaches its floor.
constexpr double kStrategicHalfLifeHours = 720.0;
constexpr double kTacticalHalfLifeHours = 48.0;
constexpr double kDecayFloor = 0.1;

// Confidence at or above which a record is Strategic regardless of content.
constexpr double kStrategicConfidence = 0.9;

double outcome_score(Outcome outcome);

double half_life_hours(Tier tier);

// clamp(1 - age/half_life, 0.1, 1.0). Negative ages (clock skew) decay to 1.0.
double tier_decay(double age_hours, Tier tier);

// 1.0 for authoritative sources (admin, executive, ceo, security_action), else 0.6.
double source_credibility(const std::string& source);

// trust = 0.5*outcome + 0.3*decay + 0.2*credibility, rounded to 2 decimals.
// A missing (0) or future created_at counts as age 0.
double trust(const MemoryRecord& record, uint64_t now);

Tier classify_tier(const std::string& content, double confidence);

} // namespace vigil
