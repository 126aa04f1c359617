#include "guardrail.hpp"
#include "util.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace vigil {

Guardrail::Guardrail(GuardrailConfig config)
    : config_(std::move(config))
    , budget_(config_.risk_ceiling)
{}

static std::string format_amount(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0f", v);
    return buf;
}

static bool is_path_separator(char c) {
    return c == '/' || c == '\\' || c == '"' || c == '\'' || c == '(' || c == ')' ||
           c == ',' || c == ';' || c == ':' || c == '=' ||
           std::isspace(static_cast<unsigned char>(c));
}

// True if `entry` appears in `text` as whole path components: the match must
// start at a separator and end at one (or at end of text). "/proc" matches
// "/proc/1/maps" but not "/home/me/procurement".
bool references_location(const std::string& text, const std::string& entry) {
    if (entry.empty()) return false;
    std::string hay = to_lower(text);
    std::string needle = to_lower(entry);
    while (!needle.empty() && (needle.back() == '/' || needle.back() == '\\'))
        needle.pop_back();
    if (needle.empty()) return false;

    for (size_t pos = hay.find(needle); pos != std::string::npos;
         pos = hay.find(needle, pos + 1)) {
        bool starts = pos == 0 || is_path_separator(hay[pos - 1]);
        size_t end = pos + needle.size();
        bool ends = end == hay.size() || is_path_separator(hay[end]) ||
                    (std::ispunct(static_cast<unsigned char>(hay[end])) && hay[end] != '.' &&
                     hay[end] != '_' && hay[end] != '-') ||
                    (hay[end] == '.' &&
                     (end + 1 == hay.size() ||
                      std::isspace(static_cast<unsigned char>(hay[end + 1]))));
        if (starts && ends) return true;
    }
    return false;
}

GuardVerdict Guardrail::consult(const std::string& action_description, double cost) {
    GuardVerdict v;

    for (const auto& dir : config_.forbidden_directories) {
        if (references_location(action_description, dir)) {
            v.allowed = false;
            v.kind = VerdictKind::PathViolation;
            v.reason = "Path violation: action touches protected location '" + dir + "'";
            std::lock_guard<std::mutex> lock(mutex_);
            ++vetoes_;
            std::cerr << "[guardrail] " << v.reason << "\n";
            return v;
        }
    }

    if (!std::isfinite(cost) || cost < 0.0) {
        v.allowed = false;
        v.kind = VerdictKind::BudgetExceeded;
        v.reason = "Invalid risk cost";
        return v;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!budget_.can_afford(cost)) {
        ++vetoes_;
        v.allowed = false;
        v.kind = VerdictKind::BudgetExceeded;
        v.reason = "Risk budget exceeded: " + format_amount(budget_.spent()) + " + " +
                   format_amount(cost) + " > " + format_amount(budget_.ceiling());
        std::cerr << "[guardrail] " << v.reason << "\n";
        return v;
    }
    budget_.charge(cost);
    return v;
}

GuardVerdict Guardrail::self_preservation(const std::string& request) {
    GuardVerdict v;
    for (const auto& term : config_.self_preservation_terms) {
        if (contains_ci(request, term)) {
            v.allowed = false;
            v.kind = VerdictKind::SelfPreservation;
            v.reason = "Self-preservation rule: refusing request containing '" + term + "'";
            std::lock_guard<std::mutex> lock(mutex_);
            ++vetoes_;
            return v;
        }
    }
    return v;
}

double Guardrail::estimate_risk_cost(const std::string& request) const {
    for (const auto& term : config_.elevated_terms) {
        if (contains_ci(request, term)) return config_.elevated_cost;
    }
    return config_.default_cost;
}

double Guardrail::spent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.spent();
}

double Guardrail::ceiling() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.ceiling();
}

double Guardrail::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.ceiling() - budget_.spent();
}

uint32_t Guardrail::veto_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vetoes_;
}

RegretIndex Guardrail::record_regret() {
    std::lock_guard<std::mutex> lock(mutex_);
    regret_.risk_avoided += config_.regret_risk;
    regret_.loss_saved += config_.regret_risk * config_.regret_impact * 100.0;
    ++regret_.saved_situations;
    return regret_;
}

RegretIndex Guardrail::regret() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return regret_;
}

} // namespace vigil
