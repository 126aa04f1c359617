#pragma once
#include "config.hpp"
#include <cstdint>
#include <mutex>
#include <string>

namespace vigil {

enum class VerdictKind { Clear, PathViolation, BudgetExceeded, SelfPreservation };

struct GuardVerdict {
    bool allowed = true;
    std::string reason;
    VerdictKind kind = VerdictKind::Clear;
};

// Whole-component match of a protected location inside free text, case
// insensitive. Entries may be absolute prefixes ("/etc") or bare directory
// names (".vigil_vault").
bool references_location(const std::string& text, const std::string& entry);

// Cumulative risk taken this session. Monotonic: approved costs are never
// refunded. Owned and mutated by a Guardrail; readable through its accessors.
class RiskBudget {
public:
    explicit RiskBudget(double ceiling) : ceiling_(ceiling) {}

    double ceiling() const { return ceiling_; }
    double spent() const { return spent_; }

    bool can_afford(double cost) const { return spent_ + cost <= ceiling_; }
    void charge(double cost) { spent_ += cost; }

private:
    double ceiling_;
    double spent_ = 0.0;
};

// What constitutional refusals are estimated to have saved this session.
struct RegretIndex {
    double risk_avoided = 0.0;
    double loss_saved = 0.0;
    uint32_t saved_situations = 0;
};

// Policy gate consulted before every state-changing action, by the
// foreground agent and the scanner alike.
class Guardrail {
public:
    explicit Guardrail(GuardrailConfig config);

    // Path guard, then budget guard. Only an approval charges the budget.
    GuardVerdict consult(const std::string& action_description, double cost);

    // Refuse requests that would have the agent damage its own host.
    GuardVerdict self_preservation(const std::string& request);

    // Elevated cost for requests that read, move, delete or decide.
    double estimate_risk_cost(const std::string& request) const;

    double spent() const;
    double ceiling() const;
    double remaining() const;
    uint32_t veto_count() const;

    // Credit one refusal on principle (protected path, self-preservation)
    // to the regret index and return the updated totals.
    RegretIndex record_regret();
    RegretIndex regret() const;

private:
    GuardrailConfig config_;
    mutable std::mutex mutex_;
    RiskBudget budget_;
    uint32_t vetoes_ = 0;
    RegretIndex regret_;
};

} // namespace vigil
