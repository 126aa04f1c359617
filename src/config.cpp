#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace vigil {

nlohmann::json Config::defaults_json() {
    GuardrailConfig g;
    ScannerConfig s;
    return {
        {"provider", "ollama"},
        {"model", "llama3"},
        {"temperature", 0.3},
        {"request_timeout", 60},
        {"providers", {
            {"openai", {{"api_key", ""}, {"base_url", "https://api.openai.com/v1"}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}},
            {"compatible", {{"api_key", ""}, {"base_url", "https://api.groq.com/openai/v1"}}}
        }},
        {"memory", {
            {"path", ""},
            {"recall_limit", 5},
            {"embeddings", {
                {"provider", ""},
                {"base_url", ""},
                {"model", ""},
                {"api_key", ""},
                {"timeout", 10}
            }}
        }},
        {"guardrail", {
            {"risk_ceiling", g.risk_ceiling},
            {"forbidden_directories", g.forbidden_directories},
            {"self_preservation_terms", g.self_preservation_terms},
            {"elevated_terms", g.elevated_terms},
            {"elevated_cost", g.elevated_cost},
            {"default_cost", g.default_cost},
            {"regret_risk", g.regret_risk},
            {"regret_impact", g.regret_impact}
        }},
        {"scanner", {
            {"enabled", s.enabled},
            {"roots", s.roots},
            {"interval_seconds", s.interval_seconds},
            {"threshold", s.threshold},
            {"excerpt_chars", s.excerpt_chars},
            {"max_file_mb", s.max_file_mb},
            {"extensions", s.extensions},
            {"excluded_dirs", s.excluded_dirs},
            {"vault_dir", s.vault_dir},
            {"quarantine_cost", s.quarantine_cost},
            {"classify_timeout", s.classify_timeout}
        }},
        {"actions", {
            {"shutdown", "systemctl poweroff"},
            {"restart", "systemctl reboot"},
            {"sleep", "systemctl suspend"},
            {"enable_wifi", "nmcli radio wifi on"},
            {"disable_wifi", "nmcli radio wifi off"},
            {"wifi_status", "nmcli radio wifi"},
            {"enable_bluetooth", "rfkill unblock bluetooth"},
            {"disable_bluetooth", "rfkill block bluetooth"},
            {"bluetooth_status", "rfkill list bluetooth"},
            {"set_brightness", "brightnessctl set {value}%"},
            {"increase_brightness", "brightnessctl set +{value}%"},
            {"decrease_brightness", "brightnessctl set {value}%-"},
            {"open_url", "xdg-open {url}"},
            {"open_app", "{app}"},
            {"open_path", "xdg-open {path}"},
            {"take_screenshot", "gnome-screenshot"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string_list(const nlohmann::json& obj, const char* key,
                             std::vector<std::string>& out) {
    if (!obj.contains(key) || !obj[key].is_array()) return;
    out.clear();
    for (const auto& item : obj[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("request_timeout") && j["request_timeout"].is_number_unsigned())
        cfg.request_timeout = j["request_timeout"].get<uint32_t>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("path") && m["path"].is_string())
            cfg.memory.path = m["path"].get<std::string>();
        if (m.contains("recall_limit") && m["recall_limit"].is_number_unsigned())
            cfg.memory.recall_limit = m["recall_limit"].get<uint32_t>();
        if (m.contains("embeddings") && m["embeddings"].is_object()) {
            auto& e = m["embeddings"];
            auto& ec = cfg.memory.embeddings;
            if (e.contains("provider") && e["provider"].is_string())
                ec.provider = e["provider"].get<std::string>();
            if (e.contains("base_url") && e["base_url"].is_string())
                ec.base_url = e["base_url"].get<std::string>();
            if (e.contains("model") && e["model"].is_string())
                ec.model = e["model"].get<std::string>();
            if (e.contains("api_key") && e["api_key"].is_string())
                ec.api_key = e["api_key"].get<std::string>();
            if (e.contains("timeout") && e["timeout"].is_number_unsigned())
                ec.timeout = e["timeout"].get<uint32_t>();
        }
    }

    if (j.contains("guardrail") && j["guardrail"].is_object()) {
        auto& g = j["guardrail"];
        if (g.contains("risk_ceiling") && g["risk_ceiling"].is_number())
            cfg.guardrail.risk_ceiling = g["risk_ceiling"].get<double>();
        read_string_list(g, "forbidden_directories", cfg.guardrail.forbidden_directories);
        read_string_list(g, "self_preservation_terms", cfg.guardrail.self_preservation_terms);
        read_string_list(g, "elevated_terms", cfg.guardrail.elevated_terms);
        if (g.contains("elevated_cost") && g["elevated_cost"].is_number())
            cfg.guardrail.elevated_cost = g["elevated_cost"].get<double>();
        if (g.contains("default_cost") && g["default_cost"].is_number())
            cfg.guardrail.default_cost = g["default_cost"].get<double>();
        if (g.contains("regret_risk") && g["regret_risk"].is_number())
            cfg.guardrail.regret_risk = g["regret_risk"].get<double>();
        if (g.contains("regret_impact") && g["regret_impact"].is_number())
            cfg.guardrail.regret_impact = g["regret_impact"].get<double>();
    }

    if (j.contains("scanner") && j["scanner"].is_object()) {
        auto& s = j["scanner"];
        auto& sc = cfg.scanner;
        if (s.contains("enabled") && s["enabled"].is_boolean())
            sc.enabled = s["enabled"].get<bool>();
        read_string_list(s, "roots", sc.roots);
        if (s.contains("interval_seconds") && s["interval_seconds"].is_number_unsigned())
            sc.interval_seconds = s["interval_seconds"].get<uint32_t>();
        if (s.contains("threshold") && s["threshold"].is_number_unsigned())
            sc.threshold = s["threshold"].get<uint32_t>();
        if (s.contains("excerpt_chars") && s["excerpt_chars"].is_number_unsigned())
            sc.excerpt_chars = s["excerpt_chars"].get<uint32_t>();
        if (s.contains("max_file_mb") && s["max_file_mb"].is_number_unsigned())
            sc.max_file_mb = s["max_file_mb"].get<uint32_t>();
        read_string_list(s, "extensions", sc.extensions);
        read_string_list(s, "excluded_dirs", sc.excluded_dirs);
        if (s.contains("vault_dir") && s["vault_dir"].is_string())
            sc.vault_dir = s["vault_dir"].get<std::string>();
        if (s.contains("quarantine_cost") && s["quarantine_cost"].is_number())
            sc.quarantine_cost = s["quarantine_cost"].get<double>();
        if (s.contains("classify_timeout") && s["classify_timeout"].is_number_unsigned())
            sc.classify_timeout = s["classify_timeout"].get<uint32_t>();
    }

    if (j.contains("actions") && j["actions"].is_object()) {
        for (auto& [name, cmd] : j["actions"].items()) {
            if (cmd.is_string())
                cfg.actions[name] = cmd.get<std::string>();
        }
    }

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.vigil/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " ("
                      << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("GROQ_API_KEY"))
        cfg.providers["compatible"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;
    if (const char* v = std::getenv("VIGIL_PROVIDER"))
        cfg.provider = v;
    if (const char* v = std::getenv("VIGIL_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("VIGIL_DB_PATH"))
        cfg.memory.path = v;

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::database_path() const {
    if (!memory.path.empty()) return expand_home(memory.path);
    return expand_home("~/.vigil/vigil.db");
}

} // namespace vigil
