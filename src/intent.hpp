#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace vigil {

// A structured request for the OS action surface, produced either by the
// reasoning service or by the local keyword fallback.
struct ActionIntent {
    std::string action;                         // "reply" = conversational only
    nlohmann::json args = nlohmann::json::object();
    std::string reply;
};

bool is_known_action(const std::string& action);

// Actions that change machine state in a way the operator may not want
// repeated. These pass the guardrail before they run.
bool is_destructive(const std::string& action);

// Parse {"action": str, "args": object, "reply": str} out of a model reply.
// Unknown actions, wrong types or extra keys reject the whole reply.
std::optional<ActionIntent> parse_action_reply(const std::string& reply);

// Per-action argument checks (URL present, brightness 0..100, ...).
bool validate_intent(const ActionIntent& intent);

// Offline mapping from phrasing to an intent, used when the reasoning
// service is unreachable. Always returns something; "reply" when nothing
// matched.
ActionIntent keyword_fallback(const std::string& text);

// One-line description used for guardrail consultation and logs.
std::string describe_intent(const ActionIntent& intent);

// The action list and JSON contract given to the reasoning service.
const char* action_system_prompt();

} // namespace vigil
