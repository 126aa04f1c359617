#include "intent.hpp"
#include "reply_parser.hpp"
#include "util.hpp"
#include <cctype>
#include <unordered_set>

namespace vigil {

namespace {

const std::unordered_set<std::string>& known_actions() {
    static const std::unordered_set<std::string> kActions = {
        "shutdown", "restart", "sleep",
        "enable_wifi", "disable_wifi", "wifi_status",
        "take_screenshot", "copy_screenshot",
        "open_url", "open_path", "open_app", "close_app",
        "set_brightness", "increase_brightness", "decrease_brightness",
        "max_brightness", "min_brightness",
        "enable_bluetooth", "disable_bluetooth", "bluetooth_status",
        "reply"};
    return kActions;
}

ActionIntent make(const std::string& action,
                  nlohmann::json args = nlohmann::json::object(),
                  const std::string& reply = "") {
    ActionIntent i;
    i.action = action;
    i.args = std::move(args);
    i.reply = reply;
    return i;
}

bool has(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

bool has_string_arg(const nlohmann::json& args, const char* key) {
    return args.contains(key) && args[key].is_string() &&
           !trim(args[key].get<std::string>()).empty();
}

} // anonymous namespace

bool is_known_action(const std::string& action) {
    return known_actions().count(action) > 0;
}

bool is_destructive(const std::string& action) {
    return action == "shutdown" || action == "restart" || action == "sleep" ||
           action == "disable_wifi" || action == "disable_bluetooth" ||
           action == "close_app";
}

std::optional<ActionIntent> parse_action_reply(const std::string& reply) {
    auto obj = extract_json_object(reply);
    if (!obj) return std::nullopt;

    for (auto& [key, _] : obj->items()) {
        if (key != "action" && key != "args" && key != "reply") return std::nullopt;
    }
    if (!obj->contains("action") || !(*obj)["action"].is_string()) return std::nullopt;

    ActionIntent intent;
    intent.action = (*obj)["action"].get<std::string>();
    if (!is_known_action(intent.action)) return std::nullopt;

    if (obj->contains("args")) {
        if (!(*obj)["args"].is_object()) return std::nullopt;
        intent.args = (*obj)["args"];
    }
    if (obj->contains("reply")) {
        if (!(*obj)["reply"].is_string()) return std::nullopt;
        intent.reply = (*obj)["reply"].get<std::string>();
    }
    return intent;
}

bool validate_intent(const ActionIntent& intent) {
    if (!is_known_action(intent.action)) return false;
    const auto& a = intent.args;

    if (intent.action == "set_brightness") {
        if (!a.contains("value") || !a["value"].is_number_integer()) return false;
        auto v = a["value"].get<long long>();
        return v >= 0 && v <= 100;
    }
    if (intent.action == "increase_brightness" || intent.action == "decrease_brightness") {
        if (!a.contains("value")) return true;
        if (!a["value"].is_number_integer()) return false;
        auto v = a["value"].get<long long>();
        return v >= 0 && v <= 100;
    }
    if (intent.action == "open_url") return has_string_arg(a, "url");
    if (intent.action == "open_app" || intent.action == "close_app")
        return has_string_arg(a, "app_name");
    if (intent.action == "open_path")
        return has_string_arg(a, "path") || has_string_arg(a, "query");
    if (intent.action == "reply") return !trim(intent.reply).empty();
    return true;
}

ActionIntent keyword_fallback(const std::string& text) {
    std::string t = to_lower(text);

    if (has(t, "shutdown") || has(t, "power off")) return make("shutdown");
    if (has(t, "restart")) return make("restart");
    if (has(t, "sleep") || has(t, "hibernate")) return make("sleep");

    if (has(t, "turn on wifi") || has(t, "enable wifi")) return make("enable_wifi");
    if (has(t, "turn off wifi") || has(t, "disable wifi")) return make("disable_wifi");
    if (has(t, "wifi status") || has(t, "is wifi")) return make("wifi_status");

    if (has(t, "screenshot") || has(t, "screen shot")) {
        return make(has(t, "copy") ? "copy_screenshot" : "take_screenshot");
    }

    if (has(t, "brightness")) {
        if (has(t, "increase") || has(t, "brighter")) return make("increase_brightness");
        if (has(t, "decrease") || has(t, "darker")) return make("decrease_brightness");
        for (size_t i = 0; i < t.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(t[i]))) continue;
            size_t j = i;
            while (j < t.size() && j - i < 4 && std::isdigit(static_cast<unsigned char>(t[j]))) ++j;
            int v = std::stoi(t.substr(i, j - i));
            if (v > 100) break;
            return make("set_brightness", {{"value", v}});
        }
        return make("reply", nlohmann::json::object(),
                    "Do you want me to increase or decrease the brightness?");
    }

    if (has(t, "turn on bluetooth") || has(t, "enable bluetooth")) return make("enable_bluetooth");
    if (has(t, "turn off bluetooth") || has(t, "disable bluetooth")) return make("disable_bluetooth");
    if (has(t, "bluetooth status") || has(t, "is bluetooth")) return make("bluetooth_status");

    if (has(t, "youtube")) return make("open_url", {{"url", "https://www.youtube.com"}});
    if (has(t, "google")) return make("open_url", {{"url", "https://www.google.com"}});

    auto pos = t.find("open ");
    if (pos != std::string::npos) {
        std::string target = trim(t.substr(pos + 5));
        if (!target.empty()) {
            bool looks_like_url = target.rfind("http", 0) == 0 ||
                (target.find('.') != std::string::npos &&
                 target.find(' ') == std::string::npos &&
                 target.find('/') == std::string::npos);
            if (looks_like_url) {
                std::string url = target.rfind("http", 0) == 0 ? target : "https://" + target;
                return make("open_url", {{"url", url}});
            }
            if (target[0] == '/' || target[0] == '~')
                return make("open_path", {{"path", target}});
            return make("open_app", {{"app_name", target}});
        }
    }

    return make("reply", nlohmann::json::object(),
                "Sorry, I couldn't interpret that. Could you repeat?");
}

std::string describe_intent(const ActionIntent& intent) {
    std::string desc = intent.action;
    for (const char* key : {"url", "path", "query", "app_name"}) {
        if (intent.args.contains(key) && intent.args[key].is_string())
            desc += " " + intent.args[key].get<std::string>();
    }
    if (intent.args.contains("value") && intent.args["value"].is_number_integer())
        desc += " " + std::to_string(intent.args["value"].get<long long>());
    return desc;
}

const char* action_system_prompt() {
    return
        "You are a local assistant. Answer the user's request. If it asks for a "
        "machine action, return a single JSON object and nothing else:\n"
        "{\"action\": string, \"args\": object, \"reply\": string}\n"
        "Allowed actions: shutdown, restart, sleep, enable_wifi, disable_wifi, "
        "wifi_status, take_screenshot, copy_screenshot, open_url (args.url), "
        "open_path (args.path or args.query), open_app / close_app (args.app_name), "
        "set_brightness (args.value 0-100), increase_brightness, decrease_brightness, "
        "max_brightness, min_brightness, enable_bluetooth, disable_bluetooth, "
        "bluetooth_status, reply.\n"
        "For ordinary questions answer in plain text.";
}

} // namespace vigil
