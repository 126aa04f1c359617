#include <catch2/catch_test_macros.hpp>
#include "intent.hpp"

using namespace vigil;

// ── parse_action_reply ───────────────────────────────────────

TEST_CASE("parse_action_reply: well-formed action", "[intent]") {
    auto i = parse_action_reply(
        "{\"action\": \"open_url\", \"args\": {\"url\": \"https://example.com\"}, \"reply\": \"Opening\"}");
    REQUIRE(i.has_value());
    REQUIRE(i->action == "open_url");
    REQUIRE(i->args["url"] == "https://example.com");
    REQUIRE(i->reply == "Opening");
}

TEST_CASE("parse_action_reply: args and reply are optional", "[intent]") {
    auto i = parse_action_reply("Sure. {\"action\": \"wifi_status\"}");
    REQUIRE(i.has_value());
    REQUIRE(i->args.is_object());
    REQUIRE(i->args.empty());
}

TEST_CASE("parse_action_reply: rejects extra keys", "[intent]") {
    REQUIRE_FALSE(parse_action_reply(
        "{\"action\": \"shutdown\", \"args\": {}, \"reply\": \"\", \"force\": true}").has_value());
}

TEST_CASE("parse_action_reply: rejects unknown actions and wrong types", "[intent]") {
    REQUIRE_FALSE(parse_action_reply("{\"action\": \"format_disk\"}").has_value());
    REQUIRE_FALSE(parse_action_reply("{\"action\": 7}").has_value());
    REQUIRE_FALSE(parse_action_reply("{\"action\": \"reply\", \"reply\": 5}").has_value());
    REQUIRE_FALSE(parse_action_reply("{\"action\": \"open_url\", \"args\": \"x\"}").has_value());
    REQUIRE_FALSE(parse_action_reply("{\"args\": {}}").has_value());
}

TEST_CASE("parse_action_reply: plain prose is not an action", "[intent]") {
    REQUIRE_FALSE(parse_action_reply("The capital of France is Paris.").has_value());
}

// ── validate_intent ──────────────────────────────────────────

static ActionIntent intent(const std::string& action, nlohmann::json args = nlohmann::json::object(),
                           const std::string& reply = "") {
    ActionIntent i;
    i.action = action;
    i.args = std::move(args);
    i.reply = reply;
    return i;
}

TEST_CASE("validate_intent: brightness range", "[intent]") {
    REQUIRE(validate_intent(intent("set_brightness", {{"value", 0}})));
    REQUIRE(validate_intent(intent("set_brightness", {{"value", 100}})));
    REQUIRE_FALSE(validate_intent(intent("set_brightness", {{"value", 101}})));
    REQUIRE_FALSE(validate_intent(intent("set_brightness", {{"value", "50"}})));
    REQUIRE_FALSE(validate_intent(intent("set_brightness")));
    REQUIRE(validate_intent(intent("increase_brightness")));
    REQUIRE_FALSE(validate_intent(intent("decrease_brightness", {{"value", -1}})));
}

TEST_CASE("validate_intent: required string arguments", "[intent]") {
    REQUIRE(validate_intent(intent("open_url", {{"url", "https://x.y"}})));
    REQUIRE_FALSE(validate_intent(intent("open_url")));
    REQUIRE_FALSE(validate_intent(intent("open_app", {{"app_name", "  "}})));
    REQUIRE(validate_intent(intent("close_app", {{"app_name", "firefox"}})));
    REQUIRE(validate_intent(intent("open_path", {{"query", "downloads"}})));
    REQUIRE_FALSE(validate_intent(intent("open_path")));
}

TEST_CASE("validate_intent: reply needs text", "[intent]") {
    REQUIRE(validate_intent(intent("reply", nlohmann::json::object(), "hello")));
    REQUIRE_FALSE(validate_intent(intent("reply")));
    REQUIRE_FALSE(validate_intent(intent("launch_rockets")));
}

// ── classification helpers ───────────────────────────────────

TEST_CASE("is_destructive: power and connectivity changes", "[intent]") {
    REQUIRE(is_destructive("shutdown"));
    REQUIRE(is_destructive("disable_wifi"));
    REQUIRE(is_destructive("close_app"));
    REQUIRE_FALSE(is_destructive("enable_wifi"));
    REQUIRE_FALSE(is_destructive("reply"));
}

TEST_CASE("describe_intent: action plus arguments", "[intent]") {
    REQUIRE(describe_intent(intent("open_url", {{"url", "https://x.y"}})) == "open_url https://x.y");
    REQUIRE(describe_intent(intent("set_brightness", {{"value", 40}})) == "set_brightness 40");
    REQUIRE(describe_intent(intent("shutdown")) == "shutdown");
}

// ── keyword_fallback ─────────────────────────────────────────

TEST_CASE("keyword_fallback: power and radios", "[intent]") {
    REQUIRE(keyword_fallback("please shutdown the pc").action == "shutdown");
    REQUIRE(keyword_fallback("Turn off WiFi").action == "disable_wifi");
    REQUIRE(keyword_fallback("enable bluetooth").action == "enable_bluetooth");
    REQUIRE(keyword_fallback("take a screenshot").action == "take_screenshot");
    REQUIRE(keyword_fallback("copy a screenshot").action == "copy_screenshot");
}

TEST_CASE("keyword_fallback: brightness", "[intent]") {
    auto set = keyword_fallback("set brightness to 40");
    REQUIRE(set.action == "set_brightness");
    REQUIRE(set.args["value"] == 40);
    REQUIRE(keyword_fallback("increase brightness").action == "increase_brightness");
    auto ask = keyword_fallback("brightness");
    REQUIRE(ask.action == "reply");
    REQUIRE_FALSE(ask.reply.empty());
}

TEST_CASE("keyword_fallback: open targets", "[intent]") {
    auto url = keyword_fallback("open example.com");
    REQUIRE(url.action == "open_url");
    REQUIRE(url.args["url"] == "https://example.com");

    auto path = keyword_fallback("open ~/Documents");
    REQUIRE(path.action == "open_path");
    REQUIRE(path.args["path"] == "~/documents");

    auto app = keyword_fallback("open firefox");
    REQUIRE(app.action == "open_app");
    REQUIRE(app.args["app_name"] == "firefox");

    REQUIRE(keyword_fallback("go to youtube").args["url"] == "https://www.youtube.com");
}

TEST_CASE("keyword_fallback: unmatched text asks again", "[intent]") {
    auto i = keyword_fallback("what is the meaning of life");
    REQUIRE(i.action == "reply");
    REQUIRE(validate_intent(i));
}
