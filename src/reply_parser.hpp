#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace vigil {

// Model replies are untrusted text. These helpers pull the first usable
// payload out of surrounding prose and never throw.

// Parse the substring between the first '{' and the last '}' as an object.
std::optional<nlohmann::json> extract_json_object(const std::string& reply);

// Parse the substring between the first '[' and the last ']' as an array.
std::optional<nlohmann::json> extract_json_array(const std::string& reply);

enum class VerdictStatus {
    Ok,           // score parsed from the reply
    Unparseable,  // reply held no usable score
    Unavailable   // the service could not be reached or failed
};

struct ClassifierVerdict {
    VerdictStatus status = VerdictStatus::Unavailable;
    int score = 0;          // 0..100, meaningful only when status == Ok
    std::string reason;

    // Score used for the quarantine decision: failures count as 0 (fail open).
    int effective_score() const { return status == VerdictStatus::Ok ? score : 0; }
};

// A JSON object with an integer "sensitivity_score" wins; otherwise the first
// run of digits in the reply. Values outside 0..100 are Unparseable.
ClassifierVerdict parse_sensitivity_score(const std::string& reply);

} // namespace vigil
