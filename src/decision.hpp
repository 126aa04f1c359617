#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vigil {

struct DecisionFactors {
    double impact = 5.0;
    double certainty = 0.5;
    double reversibility = 0.5;
    double risk = 5.0;
    double capital = 5.0;
    double time_cost = 5.0;
    double historical_penalty = 1.0;
    uint32_t scar_count = 0;
};

struct DecisionOption {
    std::string name;
    DecisionFactors factors;
};

struct RankedOption {
    std::string name;
    double score = 0.0;
    uint32_t scar_count = 0;
    bool recommended = false;
};

// (impact^1.5 * certainty * reversibility) /
// (risk*(1 + 2*scar_count) * capital * time_cost * historical_penalty)
// Zero or non-finite denominators and non-finite results score exactly 0.
double conqueror_score(const DecisionFactors& f);

// Descending by score, ties keep input order. The first entry is recommended.
std::vector<RankedOption> rank_options(const std::vector<DecisionOption>& options);

// Pull the option list out of a model reply: the JSON array between the first
// '[' and the last ']'. Items with missing, mistyped or unknown fields are
// dropped. scar_count is left at 0 for the caller to fill in.
std::vector<DecisionOption> parse_decision_options(const std::string& reply);

std::string format_ranking(const std::vector<RankedOption>& ranked);

} // namespace vigil
