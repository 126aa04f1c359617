#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "decision.hpp"
#include <cmath>
#include <limits>

using namespace vigil;
using Catch::Matchers::WithinAbs;

// ── conqueror_score ──────────────────────────────────────────

TEST_CASE("conqueror_score: reference value", "[decision]") {
    DecisionFactors f;
    f.impact = 4.0;         // 4^1.5 = 8
    f.certainty = 0.5;
    f.reversibility = 0.5;
    f.risk = 2.0;
    f.capital = 1.0;
    f.time_cost = 1.0;
    f.historical_penalty = 1.0;
    REQUIRE_THAT(conqueror_score(f), WithinAbs(1.0, 1e-12));
}

TEST_CASE("conqueror_score: any zero denominator factor scores exactly 0", "[decision]") {
    DecisionFactors base;
    for (int i = 0; i < 4; ++i) {
        DecisionFactors f = base;
        if (i == 0) f.risk = 0.0;
        if (i == 1) f.capital = 0.0;
        if (i == 2) f.time_cost = 0.0;
        if (i == 3) f.historical_penalty = 0.0;
        REQUIRE(conqueror_score(f) == 0.0);
    }
}

TEST_CASE("conqueror_score: non-finite inputs score 0", "[decision]") {
    DecisionFactors f;
    f.capital = std::numeric_limits<double>::infinity();
    REQUIRE(conqueror_score(f) == 0.0);

    DecisionFactors g;
    g.impact = -4.0;   // pow of a negative base is NaN
    REQUIRE(conqueror_score(g) == 0.0);
}

TEST_CASE("conqueror_score: strictly decreasing in scar_count", "[decision]") {
    DecisionFactors f;
    double previous = conqueror_score(f);
    for (uint32_t scars = 1; scars <= 10; ++scars) {
        f.scar_count = scars;
        double s = conqueror_score(f);
        REQUIRE(s < previous);
        previous = s;
    }
}

TEST_CASE("conqueror_score: one scar triples the effective risk", "[decision]") {
    DecisionFactors clean;
    DecisionFactors scarred;
    scarred.scar_count = 1;
    REQUIRE_THAT(conqueror_score(scarred) * 3.0, WithinAbs(conqueror_score(clean), 1e-12));
}

// ── rank_options ─────────────────────────────────────────────

TEST_CASE("rank_options: descending and recommends the top", "[decision]") {
    std::vector<DecisionOption> opts(3);
    opts[0].name = "Hire";
    opts[0].factors.impact = 4.0;
    opts[1].name = "Outsource";
    opts[1].factors.impact = 9.0;
    opts[2].name = "Wait";
    opts[2].factors.impact = 1.0;

    auto ranked = rank_options(opts);
    REQUIRE(ranked.size() == 3);
    REQUIRE(ranked[0].name == "Outsource");
    REQUIRE(ranked[0].recommended);
    REQUIRE(ranked[1].name == "Hire");
    REQUIRE_FALSE(ranked[1].recommended);
    REQUIRE(ranked[2].name == "Wait");
}

TEST_CASE("rank_options: ties keep input order", "[decision]") {
    std::vector<DecisionOption> opts(3);
    opts[0].name = "A";
    opts[1].name = "B";
    opts[2].name = "C";
    auto ranked = rank_options(opts);
    REQUIRE(ranked[0].name == "A");
    REQUIRE(ranked[1].name == "B");
    REQUIRE(ranked[2].name == "C");
}

TEST_CASE("rank_options: scars push an option down", "[decision]") {
    std::vector<DecisionOption> opts(2);
    opts[0].name = "Acme";
    opts[0].factors.scar_count = 2;
    opts[1].name = "Globex";
    auto ranked = rank_options(opts);
    REQUIRE(ranked[0].name == "Globex");
    REQUIRE(ranked[1].scar_count == 2);
}

TEST_CASE("rank_options: empty input", "[decision]") {
    REQUIRE(rank_options({}).empty());
}

// ── parse_decision_options ───────────────────────────────────

TEST_CASE("parse_decision_options: array embedded in prose", "[decision]") {
    std::string reply =
        "Sure! Here you go:\n"
        "[{\"name\": \"Hire\", \"impact\": 8, \"certainty\": 0.7, \"reversibility\": 0.4,"
        " \"risk\": 5, \"capital\": 6, \"time\": 4, \"penalty\": 1.0},"
        " {\"name\": \"Outsource\", \"impact\": 6, \"certainty\": 0.8, \"reversibility\": 0.9,"
        " \"risk\": 3, \"capital\": 4, \"time\": 2}]\n"
        "Let me know if you need more.";
    auto opts = parse_decision_options(reply);
    REQUIRE(opts.size() == 2);
    REQUIRE(opts[0].name == "Hire");
    REQUIRE(opts[0].factors.time_cost == 4.0);
    REQUIRE(opts[1].factors.historical_penalty == 1.0);
    REQUIRE(opts[1].factors.scar_count == 0);
}

TEST_CASE("parse_decision_options: drops malformed items", "[decision]") {
    std::string reply =
        "[{\"name\": \"NoNumbers\"},"
        " {\"name\": \"Extra\", \"impact\": 1, \"certainty\": 1, \"reversibility\": 1,"
        "  \"risk\": 1, \"capital\": 1, \"time\": 1, \"bonus\": 5},"
        " {\"name\": \"Text\", \"impact\": \"high\", \"certainty\": 1, \"reversibility\": 1,"
        "  \"risk\": 1, \"capital\": 1, \"time\": 1},"
        " 42,"
        " {\"name\": \"Good\", \"impact\": 1, \"certainty\": 1, \"reversibility\": 1,"
        "  \"risk\": 1, \"capital\": 1, \"time\": 1}]";
    auto opts = parse_decision_options(reply);
    REQUIRE(opts.size() == 1);
    REQUIRE(opts[0].name == "Good");
}

TEST_CASE("parse_decision_options: no array yields nothing", "[decision]") {
    REQUIRE(parse_decision_options("I cannot help with that.").empty());
    REQUIRE(parse_decision_options("[not json]").empty());
    REQUIRE(parse_decision_options("").empty());
}

// ── format_ranking ───────────────────────────────────────────

TEST_CASE("format_ranking: marks the recommendation", "[decision]") {
    std::vector<DecisionOption> opts(2);
    opts[0].name = "Hire";
    opts[1].name = "Outsource";
    opts[1].factors.scar_count = 1;
    auto text = format_ranking(rank_options(opts));
    REQUIRE(text.find("1. Hire") != std::string::npos);
    REQUIRE(text.find("<- RECOMMENDED") != std::string::npos);
    REQUIRE(text.find("1 scar(s)") != std::string::npos);
    REQUIRE(text.find("RECOMMENDED") < text.find("2. Outsource"));
}

TEST_CASE("format_ranking: empty ranking", "[decision]") {
    REQUIRE(format_ranking({}) == "No options to rank.");
}
