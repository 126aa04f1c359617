#pragma once
#include "reply_parser.hpp"
#include <string>

namespace vigil {

class Provider;

// Rates how confidential a text excerpt is on a 0..100 scale.
class Classifier {
public:
    virtual ~Classifier() = default;

    // Never throws: collaborator failures come back as an Unavailable verdict.
    virtual ClassifierVerdict classify(const std::string& file_name,
                                       const std::string& excerpt) = 0;
};

// Asks the reasoning service for a score and parses the reply.
class LlmClassifier : public Classifier {
public:
    LlmClassifier(Provider& provider, std::string model);

    ClassifierVerdict classify(const std::string& file_name,
                               const std::string& excerpt) override;

    static std::string build_prompt(const std::string& file_name,
                                    const std::string& excerpt);

private:
    Provider& provider_;
    std::string model_;
};

} // namespace vigil
