#include "decision.hpp"
#include "reply_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace vigil {

double conqueror_score(const DecisionFactors& f) {
    double adjusted_risk = f.risk * (1.0 + 2.0 * static_cast<double>(f.scar_count));
    double denominator = adjusted_risk * f.capital * f.time_cost * f.historical_penalty;
    if (denominator == 0.0 || !std::isfinite(denominator)) return 0.0;

    double numerator = std::pow(f.impact, 1.5) * f.certainty * f.reversibility;
    double score = numerator / denominator;
    if (!std::isfinite(score)) return 0.0;
    return score;
}

std::vector<RankedOption> rank_options(const std::vector<DecisionOption>& options) {
    std::vector<RankedOption> ranked;
    ranked.reserve(options.size());
    for (const auto& opt : options) {
        RankedOption r;
        r.name = opt.name;
        r.score = conqueror_score(opt.factors);
        r.scar_count = opt.factors.scar_count;
        ranked.push_back(std::move(r));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedOption& a, const RankedOption& b) {
                         return a.score > b.score;
                     });
    if (!ranked.empty()) ranked.front().recommended = true;
    return ranked;
}

static bool read_number(const nlohmann::json& item, const char* key, double& out) {
    if (!item.contains(key) || !item[key].is_number()) return false;
    out = item[key].get<double>();
    return std::isfinite(out);
}

std::vector<DecisionOption> parse_decision_options(const std::string& reply) {
    auto arr = extract_json_array(reply);
    if (!arr) return {};

    static const std::unordered_set<std::string> kAllowed = {
        "name", "impact", "certainty", "reversibility", "risk",
        "capital", "time", "penalty"};

    std::vector<DecisionOption> options;
    for (const auto& item : *arr) {
        if (!item.is_object()) continue;

        bool unknown_key = false;
        for (auto& [key, _] : item.items()) {
            if (!kAllowed.count(key)) { unknown_key = true; break; }
        }
        if (unknown_key) {
            std::cerr << "[decision] Dropping option with unexpected fields\n";
            continue;
        }

        if (!item.contains("name") || !item["name"].is_string()) continue;
        DecisionOption opt;
        opt.name = item["name"].get<std::string>();
        if (opt.name.empty()) continue;

        auto& f = opt.factors;
        if (!read_number(item, "impact", f.impact) ||
            !read_number(item, "certainty", f.certainty) ||
            !read_number(item, "reversibility", f.reversibility) ||
            !read_number(item, "risk", f.risk) ||
            !read_number(item, "capital", f.capital) ||
            !read_number(item, "time", f.time_cost)) {
            std::cerr << "[decision] Dropping option '" << opt.name
                      << "' with missing or non-numeric factors\n";
            continue;
        }
        if (item.contains("penalty") && !read_number(item, "penalty", f.historical_penalty))
            continue;

        options.push_back(std::move(opt));
    }
    return options;
}

std::string format_ranking(const std::vector<RankedOption>& ranked) {
    if (ranked.empty()) return "No options to rank.";
    std::ostringstream ss;
    ss << "Decision ranking:\n";
    size_t pos = 1;
    for (const auto& r : ranked) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.4f", r.score);
        ss << pos++ << ". " << r.name << " (score " << buf;
        if (r.scar_count > 0) ss << ", " << r.scar_count << " scar(s)";
        ss << ")";
        if (r.recommended) ss << "  <- RECOMMENDED";
        ss << "\n";
    }
    return ss.str();
}

} // namespace vigil
