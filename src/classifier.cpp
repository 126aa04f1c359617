#include "classifier.hpp"
#include "provider.hpp"
#include <iostream>
#include <stdexcept>

namespace vigil {

static const char* const kClassifierSystemPrompt =
    "You are a data-loss-prevention auditor. Rate how confidential a document is "
    "on a scale from 0 (public) to 100 (secrets, credentials, financial or "
    "personal records). Reply with JSON {\"sensitivity_score\": N} and nothing else.";

LlmClassifier::LlmClassifier(Provider& provider, std::string model)
    : provider_(provider), model_(std::move(model)) {}

std::string LlmClassifier::build_prompt(const std::string& file_name,
                                        const std::string& excerpt) {
    return "File: " + file_name + "\n"
           "Content excerpt:\n---\n" + excerpt + "\n---\n"
           "Return ONLY the sensitivity score.";
}

ClassifierVerdict LlmClassifier::classify(const std::string& file_name,
                                          const std::string& excerpt) {
    std::string reply;
    try {
        reply = provider_.chat_simple(kClassifierSystemPrompt,
                                      build_prompt(file_name, excerpt), model_, 0.0);
    } catch (const std::exception& e) {
        ClassifierVerdict v;
        v.status = VerdictStatus::Unavailable;
        v.reason = e.what();
        std::cerr << "[classifier] " << provider_.provider_name()
                  << " unavailable: " << e.what() << "\n";
        return v;
    }

    auto verdict = parse_sensitivity_score(reply);
    if (verdict.status != VerdictStatus::Ok) {
        std::cerr << "[classifier] Unparseable reply for " << file_name
                  << " (" << verdict.reason << "), treating as 0\n";
    }
    return verdict;
}

} // namespace vigil
