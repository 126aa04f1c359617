#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "action_surface.hpp"
#include "agent.hpp"
#include "guardrail.hpp"
#include "memory/sqlite_store.hpp"
#include "scar_ledger.hpp"
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

using namespace vigil;
using Catch::Matchers::WithinAbs;

namespace {

// ── Mock provider ────────────────────────────────────────────────

class MockProvider : public Provider {
public:
    // Queue of replies: returned in order, then repeats the last
    std::vector<std::string> replies;
    bool should_throw = false;
    int chat_call_count = 0;
    std::vector<ChatMessage> last_messages;

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& /*model*/,
                      double /*temperature*/) override {
        chat_call_count++;
        last_messages = messages;
        if (should_throw) throw std::runtime_error("provider error");
        ChatResponse r;
        if (!replies.empty()) {
            auto idx = static_cast<size_t>(chat_call_count - 1);
            r.content = idx < replies.size() ? replies[idx] : replies.back();
        }
        return r;
    }

    std::string provider_name() const override { return "mock"; }
};

class MockActionSurface : public ActionSurface {
public:
    std::vector<ActionIntent> performed;
    bool result = true;

    bool perform(const ActionIntent& intent) override {
        performed.push_back(intent);
        return result;
    }
};

struct AgentFixture {
    std::string path = "/tmp/vigil_test_agent_" + std::to_string(getpid()) + ".db";
    Config config = make_config();
    SqliteRecordStore store{path};
    ScarLedger scars{path};
    Guardrail guardrail{config.guardrail};
    MockActionSurface actions;
    MockProvider* provider = nullptr;   // owned by the agent

    ~AgentFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }

    Config make_config() const {
        Config c;
        c.memory.path = path;
        return c;
    }

    Agent make_agent() {
        auto p = std::make_unique<MockProvider>();
        provider = p.get();
        return Agent(std::move(p), store, scars, guardrail, nullptr, &actions, config);
    }

    Agent make_offline_agent() {
        provider = nullptr;
        return Agent(nullptr, store, scars, guardrail, nullptr, &actions, config);
    }
};

} // anonymous namespace

// ── Request validation and gating ────────────────────────────────

TEST_CASE("Agent: empty request is rejected", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    auto r = agent.process("   ");
    REQUIRE(r.kind == ReplyKind::Rejected);
    REQUIRE(f.provider->chat_call_count == 0);
}

TEST_CASE("Agent: severe scar vetoes a matching request", "[agent]") {
    AgentFixture f;
    f.scars.register_scar("delete all logs", 0.9, "deleted logs without backup");
    auto agent = f.make_agent();

    auto r = agent.process("please delete all logs now");
    REQUIRE(r.kind == ReplyKind::Vetoed);
    REQUIRE(r.text.find("STRATEGIC VETO") != std::string::npos);
    REQUIRE(r.text.find("deleted logs without backup") != std::string::npos);
    REQUIRE(f.provider->chat_call_count == 0);
}

TEST_CASE("Agent: mild scar becomes a caution in the prompt", "[agent]") {
    AgentFixture f;
    f.scars.register_scar("buy cheap monitors", 0.4, "cheap monitors broke");
    auto agent = f.make_agent();
    f.provider->replies = {"Consider the mid-range model."};

    auto r = agent.process("should I buy cheap monitors");
    REQUIRE(r.kind == ReplyKind::Answer);
    REQUIRE(r.text == "Consider the mid-range model.");
    REQUIRE(f.provider->last_messages[0].content.find("cheap monitors broke") != std::string::npos);
}

TEST_CASE("Agent: protected paths are refused", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    auto r = agent.process("read /etc/shadow for me");
    REQUIRE(r.kind == ReplyKind::Refused);
    REQUIRE(f.provider->chat_call_count == 0);
}

TEST_CASE("Agent: self-preservation refuses destructive requests", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    auto r = agent.process("format the hard drive");
    REQUIRE(r.kind == ReplyKind::Refused);
    REQUIRE(f.guardrail.veto_count() == 1);
}

TEST_CASE("Agent: refusals on principle update the regret index", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();

    auto r = agent.process("format the hard drive");
    REQUIRE(r.kind == ReplyKind::Refused);
    REQUIRE(r.text.find("[Regret index: $7200 saved]") != std::string::npos);

    auto p = agent.process("read /etc/shadow for me");
    REQUIRE(p.kind == ReplyKind::Refused);
    REQUIRE(p.text.find("$14400 saved") != std::string::npos);

    auto h = agent.health_report();
    REQUIRE(h.risk_avoided == 16.0);
    REQUIRE(h.loss_saved == 14400.0);
    REQUIRE(format_health_report(h).find("16 risk avoided, $14400 saved") != std::string::npos);
}

TEST_CASE("Agent: exhausted risk budget refuses further requests", "[agent]") {
    AgentFixture f;
    f.config.guardrail.risk_ceiling = 15.0;
    Guardrail tight(f.config.guardrail);
    auto p = std::make_unique<MockProvider>();
    p->replies = {"ok"};
    Agent agent(std::move(p), f.store, f.scars, tight, nullptr, &f.actions, f.config);

    REQUIRE(agent.process("hello there").kind == ReplyKind::Answer);
    auto r = agent.process("hello again");
    REQUIRE(r.kind == ReplyKind::Refused);
    REQUIRE(r.text.find("Risk budget exceeded") != std::string::npos);
    REQUIRE(tight.spent() == 10.0);
    REQUIRE(r.text.find("Regret index") == std::string::npos);
    REQUIRE(tight.regret().saved_situations == 0);
}

// ── Memory commands ──────────────────────────────────────────────

TEST_CASE("Agent: forget about deletes matching memories", "[agent]") {
    AgentFixture f;
    f.store.append(make_record("Project Falcon launch", source::kExecutive, Outcome::Neutral, 0.5, nullptr));
    f.store.append(make_record("falcon budget", source::kExecutive, Outcome::Neutral, 0.5, nullptr));
    f.store.append(make_record("other", source::kExecutive, Outcome::Neutral, 0.5, nullptr));
    auto agent = f.make_agent();

    auto r = agent.process("Forget about Falcon");
    REQUIRE(r.kind == ReplyKind::Forgotten);
    REQUIRE(r.text.find("2 memories") != std::string::npos);
    REQUIRE(f.store.count() == 1);
}

TEST_CASE("Agent: delete memory is not blocked by self-preservation", "[agent]") {
    AgentFixture f;
    f.store.append(make_record("old wifi password", source::kExecutive, Outcome::Neutral, 0.5, nullptr));
    auto agent = f.make_agent();

    auto r = agent.process("delete memory wifi password");
    REQUIRE(r.kind == ReplyKind::Forgotten);
    REQUIRE(f.store.count() == 0);
}

TEST_CASE("Agent: forget without a keyword is rejected", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    REQUIRE(agent.process("forget about").kind == ReplyKind::Rejected);
}

// ── Decision ranking ─────────────────────────────────────────────

TEST_CASE("Agent: decide ranks options and counts scars", "[agent]") {
    AgentFixture f;
    f.scars.register_scar("acme order", 0.5, "Acme shipped late");
    auto agent = f.make_agent();
    f.provider->replies = {
        "[{\"name\": \"Acme\", \"impact\": 5, \"certainty\": 0.5, \"reversibility\": 0.5,"
        "  \"risk\": 5, \"capital\": 5, \"time\": 5},"
        " {\"name\": \"Globex\", \"impact\": 5, \"certainty\": 0.5, \"reversibility\": 0.5,"
        "  \"risk\": 5, \"capital\": 5, \"time\": 5}]"};

    auto r = agent.process("help me decide between Acme and Globex");
    REQUIRE(r.kind == ReplyKind::Ranking);
    REQUIRE(r.text.find("1. Globex") != std::string::npos);
    REQUIRE(r.text.find("2. Acme") != std::string::npos);
    REQUIRE(r.text.find("1 scar(s)") != std::string::npos);
}

TEST_CASE("Agent: decide with an unusable reply", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    f.provider->replies = {"I'd go with whichever feels right."};
    REQUIRE(agent.process("compare vim and emacs").kind == ReplyKind::Fallback);
}

TEST_CASE("Agent: decide without a provider", "[agent]") {
    AgentFixture f;
    auto agent = f.make_offline_agent();
    REQUIRE(agent.process("decide on a vendor").kind == ReplyKind::Fallback);
}

// ── Reasoning and actions ────────────────────────────────────────

TEST_CASE("Agent: answer is grounded in retrieved memories", "[agent]") {
    AgentFixture f;
    f.store.append(make_record("The board approved the hiring plan", source::kExecutive,
                               Outcome::Success, 0.9, nullptr));
    auto agent = f.make_agent();
    f.provider->replies = {"Proceed with hiring."};

    auto r = agent.process("what did the board say about hiring");
    REQUIRE(r.kind == ReplyKind::Answer);
    REQUIRE(r.text == "Proceed with hiring.");
    const auto& system = f.provider->last_messages[0].content;
    REQUIRE(system.find("STRATEGIC MEMORY") != std::string::npos);
    REQUIRE(system.find("board approved the hiring plan") != std::string::npos);
    REQUIRE(system.find("OPERATING_MODE: TACTICAL") != std::string::npos);
}

TEST_CASE("Agent: triage mode reaches the prompt", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    f.provider->replies = {"Check the logs."};
    agent.process("there is a security problem");
    REQUIRE(f.provider->last_messages[0].content.find("OPERATING_MODE: EXISTENTIAL") !=
            std::string::npos);
}

TEST_CASE("Agent: JSON action reply is dispatched", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    f.provider->replies = {
        "{\"action\": \"open_url\", \"args\": {\"url\": \"https://example.com\"}, \"reply\": \"Opening it.\"}"};

    auto r = agent.process("show me example dot com");
    REQUIRE(r.kind == ReplyKind::Action);
    REQUIRE(f.actions.performed.size() == 1);
    REQUIRE(f.actions.performed[0].action == "open_url");
    REQUIRE(r.text.find("Done: open_url https://example.com") != std::string::npos);
}

TEST_CASE("Agent: invalid action arguments are rejected", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    f.provider->replies = {"{\"action\": \"set_brightness\", \"args\": {\"value\": 400}}"};

    auto r = agent.process("blind me");
    REQUIRE(r.kind == ReplyKind::Rejected);
    REQUIRE(f.actions.performed.empty());
}

TEST_CASE("Agent: failed action is reported", "[agent]") {
    AgentFixture f;
    f.actions.result = false;
    auto agent = f.make_agent();
    f.provider->replies = {"{\"action\": \"enable_wifi\", \"args\": {}, \"reply\": \"\"}"};

    auto r = agent.process("get me online");
    REQUIRE(r.kind == ReplyKind::Action);
    REQUIRE(r.text.find("Action failed") != std::string::npos);
}

TEST_CASE("Agent: provider failure falls back to keywords", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    f.provider->should_throw = true;

    auto r = agent.process("turn on wifi");
    REQUIRE(r.kind == ReplyKind::Fallback);
    REQUIRE(f.actions.performed.size() == 1);
    REQUIRE(f.actions.performed[0].action == "enable_wifi");
}

TEST_CASE("Agent: offline agent uses keywords", "[agent]") {
    AgentFixture f;
    auto agent = f.make_offline_agent();
    REQUIRE(agent.provider_name() == "none");

    auto r = agent.process("what is the weather");
    REQUIRE(r.kind == ReplyKind::Fallback);
    REQUIRE(f.actions.performed.empty());
}

TEST_CASE("Agent: no action surface reports the intent only", "[agent]") {
    AgentFixture f;
    Agent agent(nullptr, f.store, f.scars, f.guardrail, nullptr, nullptr, f.config);
    auto r = agent.process("take a screenshot");
    REQUIRE(r.text.find("no action surface") != std::string::npos);
}

// ── Feedback ─────────────────────────────────────────────────────

TEST_CASE("Agent: failure feedback with a lesson registers a scar", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();

    auto id = agent.record_feedback("wipe the staging server", "Done.", Outcome::Failure,
                                    "staging wipe lost customer data");
    REQUIRE_FALSE(id.empty());
    REQUIRE(f.scars.count() == 1);

    auto trauma = f.scars.check_trauma("wipe staging again");
    REQUIRE(trauma.has_value());
    REQUIRE(trauma->vetoes());

    auto records = f.store.all();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].content == "User: wipe the staging server | AI: Done.");
    REQUIRE(records[0].outcome == Outcome::Failure);
    REQUIRE_THAT(records[0].confidence, WithinAbs(0.2, 1e-9));
    REQUIRE(records[0].source == source::kExecutive);

    // The next similar request is vetoed
    REQUIRE(agent.process("wipe the staging server").kind == ReplyKind::Vetoed);
}

TEST_CASE("Agent: success feedback is stored as strategic", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    agent.record_feedback("book the offsite", "Booked.", Outcome::Success);

    auto records = f.store.all();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].tier == Tier::Strategic);
    REQUIRE(f.scars.count() == 0);
}

TEST_CASE("Agent: failure without a lesson leaves no scar", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    agent.record_feedback("x", "y", Outcome::Failure);
    REQUIRE(f.scars.count() == 0);
    REQUIRE(f.store.count() == 1);
}

// ── Health report ────────────────────────────────────────────────

TEST_CASE("Agent: health report reflects state", "[agent]") {
    AgentFixture f;
    auto agent = f.make_agent();
    f.provider->replies = {"fine"};
    agent.record_feedback("a", "b", Outcome::Success);
    f.scars.register_scar("c", 0.5, "lesson c");
    f.store.upsert_processed("/x.txt", "h");
    agent.process("hello");

    auto h = agent.health_report();
    REQUIRE(h.memories == 1);
    REQUIRE(h.scars == 1);
    REQUIRE(h.processed_files == 1);
    REQUIRE(h.budget_spent == 10.0);
    REQUIRE(h.budget_ceiling == 5000.0);
    REQUIRE_THAT(h.average_confidence, WithinAbs(0.9, 1e-9));

    auto text = format_health_report(h);
    REQUIRE(text.find("Memories:") != std::string::npos);
    REQUIRE(text.find("10 / 5000") != std::string::npos);
}

// ── Triage ───────────────────────────────────────────────────────

TEST_CASE("classify_triage: keyword classes", "[agent]") {
    REQUIRE(classify_triage("the build will FAIL") == TriageMode::Existential);
    REQUIRE(classify_triage("our plan for next year") == TriageMode::Strategic);
    REQUIRE(classify_triage("turn on wifi") == TriageMode::Tactical);
}
