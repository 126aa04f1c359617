#include "agent.hpp"
#include "action_surface.hpp"
#include "decision.hpp"
#include "guardrail.hpp"
#include "intent.hpp"
#include "scar_ledger.hpp"
#include "util.hpp"
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <sstream>

namespace vigil {

namespace {

const char* const kForgetPrefixes[] = {"forget about", "delete memory"};

const char* const kDecisionParserPrompt =
    "Act as a strategic analyst. Extract decision parameters for each option in the "
    "user's text. Return ONLY a raw JSON list of objects, no backticks, no prose:\n"
    "[{\"name\": \"Option Name\", \"impact\": 1-10, \"certainty\": 0.1-1.0, "
    "\"reversibility\": 0.1-1.0, \"risk\": 1-10, \"capital\": 1-10, \"time\": 1-10, "
    "\"penalty\": 1.0}]";

bool contains_any(const std::string& lowered, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (lowered.find(w) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

const char* triage_mode_name(TriageMode mode) {
    switch (mode) {
        case TriageMode::Existential: return "EXISTENTIAL";
        case TriageMode::Strategic:   return "STRATEGIC";
        case TriageMode::Tactical:    return "TACTICAL";
    }
    return "TACTICAL";
}

TriageMode classify_triage(const std::string& request) {
    std::string t = to_lower(request);
    if (contains_any(t, {"danger", "problem", "fail", "security", "error"}))
        return TriageMode::Existential;
    if (contains_any(t, {"plan", "strategy", "future", "ceo", "goal"}))
        return TriageMode::Strategic;
    return TriageMode::Tactical;
}

std::string format_health_report(const HealthReport& r) {
    char buf[64];
    std::ostringstream ss;
    ss << "--- vigil health report ---\n";
    ss << "Memories:            " << r.memories << "\n";
    std::snprintf(buf, sizeof(buf), "%.2f", r.average_confidence);
    ss << "Average confidence:  " << buf << "\n";
    ss << "Files processed:     " << r.processed_files << "\n";
    ss << "Scars:               " << r.scars << "\n";
    std::snprintf(buf, sizeof(buf), "%.0f / %.0f", r.budget_spent, r.budget_ceiling);
    ss << "Risk budget:         " << buf << "\n";
    ss << "Guardrail vetoes:    " << r.guardrail_vetoes << "\n";
    std::snprintf(buf, sizeof(buf), "%.0f risk avoided, $%.0f saved",
                  r.risk_avoided, r.loss_saved);
    ss << "Regret index:        " << buf << "\n";
    return ss.str();
}

// Refusals on principle feed the regret index; budget refusals do not.
static AgentReply refuse(Guardrail& guardrail, const GuardVerdict& verdict) {
    if (verdict.kind != VerdictKind::PathViolation &&
        verdict.kind != VerdictKind::SelfPreservation) {
        return {verdict.reason, ReplyKind::Refused};
    }
    RegretIndex idx = guardrail.record_regret();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "\n[Regret index: $%.0f saved]", idx.loss_saved);
    return {verdict.reason + buf, ReplyKind::Refused};
}

Agent::Agent(std::unique_ptr<Provider> provider,
             RecordStore& store,
             ScarLedger& scars,
             Guardrail& guardrail,
             Embedder* embedder,
             ActionSurface* actions,
             const Config& config)
    : provider_(std::move(provider))
    , store_(store)
    , scars_(scars)
    , guardrail_(guardrail)
    , embedder_(embedder)
    , actions_(actions)
    , retriever_(store, embedder)
    , model_(config.model)
    , temperature_(config.temperature)
    , recall_limit_(config.memory.recall_limit)
{}

std::string Agent::provider_name() const {
    return provider_ ? provider_->provider_name() : "none";
}

AgentReply Agent::process(const std::string& request) {
    std::string req = trim(request);
    if (req.empty()) return {"Empty request.", ReplyKind::Rejected};
    std::string lowered = to_lower(req);

    auto gate = guardrail_.consult(req, guardrail_.estimate_risk_cost(req));
    if (!gate.allowed) return refuse(guardrail_, gate);

    std::string caution;
    if (auto trauma = scars_.check_trauma(req)) {
        if (trauma->vetoes()) {
            return {"STRATEGIC VETO: this request matches a previous critical failure. "
                    "Reason: " + trauma->lesson +
                    ". Refusing to proceed without a manual override.",
                    ReplyKind::Vetoed};
        }
        caution = trauma->lesson;
    }

    for (const char* prefix : kForgetPrefixes) {
        auto pos = lowered.find(prefix);
        if (pos != std::string::npos) {
            return handle_forget(trim(req.substr(pos + std::string(prefix).size())));
        }
    }

    if (lowered.find("decide") != std::string::npos ||
        lowered.find("compare") != std::string::npos) {
        return handle_decision(req);
    }

    auto self = guardrail_.self_preservation(req);
    if (!self.allowed) return refuse(guardrail_, self);

    if (!provider_) return dispatch(keyword_fallback(req), ReplyKind::Fallback);

    TriageMode mode = classify_triage(req);
    std::string context = format_context(retriever_.retrieve(req, recall_limit_));

    std::string answer;
    try {
        answer = trim(provider_->chat_simple(build_system_prompt(mode, context, caution),
                                             req, model_, temperature_));
    } catch (const std::exception& e) {
        std::cerr << "[agent] " << provider_->provider_name()
                  << " unavailable, using keyword fallback: " << e.what() << "\n";
        return dispatch(keyword_fallback(req), ReplyKind::Fallback);
    }

    if (auto intent = parse_action_reply(answer)) {
        return dispatch(*intent, intent->action == "reply" ? ReplyKind::Answer
                                                           : ReplyKind::Action);
    }
    if (answer.empty()) return dispatch(keyword_fallback(req), ReplyKind::Fallback);
    return {answer, ReplyKind::Answer};
}

AgentReply Agent::handle_forget(const std::string& keyword) {
    if (keyword.empty()) {
        return {"Tell me what to forget, e.g. \"forget about project x\".",
                ReplyKind::Rejected};
    }
    uint32_t removed = store_.delete_matching(keyword);
    if (removed == 0) {
        return {"No memories matched '" + keyword + "'.", ReplyKind::Forgotten};
    }
    return {"Wiped " + std::to_string(removed) + " memor" +
            (removed == 1 ? "y" : "ies") + " related to '" + keyword + "'.",
            ReplyKind::Forgotten};
}

AgentReply Agent::handle_decision(const std::string& request) {
    if (!provider_) {
        return {"Decision analysis needs the reasoning service, which is not configured.",
                ReplyKind::Fallback};
    }

    std::string reply;
    try {
        reply = provider_->chat_simple(kDecisionParserPrompt, request, model_, 0.0);
    } catch (const std::exception& e) {
        std::cerr << "[agent] Decision parser unavailable: " << e.what() << "\n";
        return {"Decision analysis unavailable: reasoning service did not respond.",
                ReplyKind::Fallback};
    }

    auto options = parse_decision_options(reply);
    if (options.empty()) {
        return {"Could not extract any well-formed options to compare.", ReplyKind::Fallback};
    }
    for (auto& opt : options) {
        opt.factors.scar_count = scars_.count_matching(opt.name);
    }
    return {format_ranking(rank_options(options)), ReplyKind::Ranking};
}

AgentReply Agent::dispatch(const ActionIntent& intent, ReplyKind kind) {
    if (intent.action == "reply") {
        std::string text = intent.reply.empty() ? "(no reply)" : intent.reply;
        return {text, kind};
    }
    if (!validate_intent(intent)) {
        return {"Rejected action with invalid arguments: " + describe_intent(intent),
                ReplyKind::Rejected};
    }

    std::string desc = describe_intent(intent);
    if (is_destructive(intent.action)) {
        auto gate = guardrail_.consult(desc, guardrail_.estimate_risk_cost(desc));
        if (!gate.allowed) return refuse(guardrail_, gate);
    }

    if (!actions_) {
        return {"Action '" + desc + "' requested, but no action surface is configured.", kind};
    }
    bool ok = actions_->perform(intent);
    std::string text = intent.reply.empty() ? "" : intent.reply + "\n";
    text += ok ? "Done: " + desc : "Action failed: " + desc;
    return {text, kind == ReplyKind::Fallback ? ReplyKind::Fallback : ReplyKind::Action};
}

std::string Agent::build_system_prompt(TriageMode mode, const std::string& context,
                                       const std::string& caution) const {
    std::ostringstream ss;
    ss << "You are vigil, a personal executive assistant with institutional memory.\n";
    ss << "OPERATING_MODE: " << triage_mode_name(mode) << "\n\n";
    ss << "INSTITUTIONAL MEMORY (most relevant and trusted first):\n";
    ss << (context.empty() ? "(none)\n" : context) << "\n";
    if (!caution.empty()) {
        ss << "CAUTION: a past failure is related to this request. Lesson: "
           << caution << "\n\n";
    }
    ss << "INSTRUCTIONS:\n";
    ss << "- If MODE is EXISTENTIAL, warn the user about past failures first.\n";
    ss << "- If MODE is STRATEGIC, lean on high-trust historical successes.\n";
    ss << "- If MODE is TACTICAL, focus on immediate execution steps.\n\n";
    ss << action_system_prompt();
    return ss.str();
}

std::string Agent::record_feedback(const std::string& request, const std::string& reply,
                                   Outcome outcome, const std::string& lesson) {
    double confidence = 0.5;
    if (outcome == Outcome::Success) {
        confidence = 0.9;
    } else if (outcome == Outcome::Failure) {
        confidence = 0.2;
        if (!trim(lesson).empty() && !scars_.register_scar(request, 0.9, lesson)) {
            std::cerr << "[agent] Scar not registered (duplicate or invalid)\n";
        }
    }

    std::string content = "User: " + trim(request) + " | AI: " + trim(reply);
    auto rec = make_record(content, source::kExecutive, outcome, confidence, embedder_);
    return store_.append(rec);
}

HealthReport Agent::health_report() {
    HealthReport r;
    r.memories = store_.count();
    r.average_confidence = store_.average_confidence();
    r.processed_files = store_.processed_count();
    r.scars = scars_.count();
    r.budget_spent = guardrail_.spent();
    r.budget_ceiling = guardrail_.ceiling();
    r.guardrail_vetoes = guardrail_.veto_count();
    auto regret = guardrail_.regret();
    r.risk_avoided = regret.risk_avoided;
    r.loss_saved = regret.loss_saved;
    return r;
}

} // namespace vigil
