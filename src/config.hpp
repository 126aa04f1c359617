#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace vigil {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct EmbeddingConfig {
    std::string provider;   // "", "openai" or "ollama"; empty disables embeddings
    std::string base_url;
    std::string model;
    std::string api_key;
    uint32_t timeout = 10;  // seconds
};

struct MemoryConfig {
    std::string path;       // empty = ~/.vigil/vigil.db
    uint32_t recall_limit = 5;
    EmbeddingConfig embeddings;
};

struct GuardrailConfig {
    double risk_ceiling = 5000.0;
    std::vector<std::string> forbidden_directories = {
        "System32", "Windows", "AppData", ".vigil_vault",
        "/etc", "/boot", "/proc", "/sys", "/usr/bin", "/usr/sbin"};
    std::vector<std::string> self_preservation_terms = {
        "delete", "format", "remove system"};
    std::vector<std::string> elevated_terms = {"decide", "read", "delete", "move"};
    double elevated_cost = 100.0;
    double default_cost = 10.0;
    // Weights for the regret index: each constitutional refusal counts as
    // avoiding regret_risk units of risk at regret_impact, worth 100 per unit.
    double regret_risk = 8.0;
    double regret_impact = 9.0;
};

struct ScannerConfig {
    bool enabled = true;
    std::vector<std::string> roots = {"~"};
    uint32_t interval_seconds = 3600;
    uint32_t threshold = 80;
    uint32_t excerpt_chars = 1000;
    uint32_t max_file_mb = 50;
    std::vector<std::string> extensions = {".txt", ".md", ".log", ".csv"};
    std::vector<std::string> excluded_dirs = {
        "Windows", "Program Files", "AppData", ".git", "node_modules",
        ".cache", "proc", "sys", "dev"};
    std::string vault_dir = "~/.vigil_vault";
    double quarantine_cost = 10.0;
    uint32_t classify_timeout = 30; // seconds
};

struct Config {
    std::string provider = "ollama";
    std::string model = "llama3";
    double temperature = 0.3;
    uint32_t request_timeout = 60; // seconds

    std::unordered_map<std::string, ProviderEntry> providers;

    MemoryConfig memory;
    GuardrailConfig guardrail;
    ScannerConfig scanner;

    // Action name -> shell command template ({value}, {url}, {app}, {path})
    std::unordered_map<std::string, std::string> actions;

    // Load from ~/.vigil/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if absent) + env vars
    static Config load_from(const std::string& config_path);

    // Build from an already-parsed document, no file or env access
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // Resolved database path
    std::string database_path() const;
};

} // namespace vigil
