#pragma once
#include "config.hpp"
#include "memory.hpp"
#include "provider.hpp"
#include "retriever.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace vigil {

class ActionSurface;
class Embedder;
class Guardrail;
class ScarLedger;
struct ActionIntent;

enum class ReplyKind {
    Answer,     // reasoning service answered
    Action,     // an OS action was attempted
    Ranking,    // decision ranking
    Forgotten,  // memories deleted on request
    Vetoed,     // blocked by a severe scar
    Refused,    // blocked by the guardrail
    Rejected,   // malformed request
    Fallback    // reasoning unavailable, local keyword handling used
};

struct AgentReply {
    std::string text;
    ReplyKind kind = ReplyKind::Answer;
};

enum class TriageMode { Existential, Strategic, Tactical };

const char* triage_mode_name(TriageMode mode);
TriageMode classify_triage(const std::string& request);

struct HealthReport {
    uint32_t memories = 0;
    double average_confidence = 0.0;
    uint32_t processed_files = 0;
    uint32_t scars = 0;
    double budget_spent = 0.0;
    double budget_ceiling = 0.0;
    uint32_t guardrail_vetoes = 0;
    double risk_avoided = 0.0;
    double loss_saved = 0.0;
};

std::string format_health_report(const HealthReport& report);

// Foreground request path: guardrail, scar check, memory commands, decision
// ranking, retrieval-grounded reasoning, action dispatch, and feedback.
class Agent {
public:
    // provider may be null: requests are then answered by the keyword fallback.
    // actions may be null: action intents are reported but not executed.
    Agent(std::unique_ptr<Provider> provider,
          RecordStore& store,
          ScarLedger& scars,
          Guardrail& guardrail,
          Embedder* embedder,
          ActionSurface* actions,
          const Config& config);

    AgentReply process(const std::string& request);

    // Record how a reply turned out. A failure with a lesson also registers a
    // scar against the request. Returns the new memory id, empty on failure.
    std::string record_feedback(const std::string& request, const std::string& reply,
                                Outcome outcome, const std::string& lesson = "");

    HealthReport health_report();

    const std::string& model() const { return model_; }
    void set_model(const std::string& model) { model_ = model; }
    std::string provider_name() const;

private:
    AgentReply handle_forget(const std::string& keyword);
    AgentReply handle_decision(const std::string& request);
    AgentReply dispatch(const ActionIntent& intent, ReplyKind kind);
    std::string build_system_prompt(TriageMode mode, const std::string& context,
                                    const std::string& caution) const;

    std::unique_ptr<Provider> provider_;
    RecordStore& store_;
    ScarLedger& scars_;
    Guardrail& guardrail_;
    Embedder* embedder_;
    ActionSurface* actions_;
    Retriever retriever_;
    std::string model_;
    double temperature_;
    uint32_t recall_limit_;
};

} // namespace vigil
