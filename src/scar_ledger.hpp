#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

// Severity at or above which a matching scar vetoes the request.
constexpr double kVetoSeverity = 0.8;

struct ScarRecord {
    std::string pattern_key;   // sha256 of the lower-cased triggering content
    double severity = 0.0;
    std::string lesson;
    uint64_t created_at = 0;
};

struct Trauma {
    double severity = 0.0;
    std::string lesson;

    bool vetoes() const { return severity >= kVetoSeverity; }
};

// Permanent record of failed decisions. Scars are never updated or deleted.
// Shares the database file with the record store but owns its own table;
// like the store, every call opens its own connection.
class ScarLedger {
public:
    // Throws std::runtime_error if the database cannot be opened.
    explicit ScarLedger(const std::string& path);

    // False when severity is outside [0,1], the lesson is empty, or an
    // identical scar (same pattern and lesson) already exists.
    bool register_scar(const std::string& content, double severity,
                       const std::string& lesson);

    // First scar, in insertion order, whose lesson shares a word with input.
    std::optional<Trauma> check_trauma(const std::string& input);

    // Scars whose lesson mentions name (case-insensitive). Feeds the decision
    // engine's scar_count.
    uint32_t count_matching(const std::string& name);

    std::vector<ScarRecord> all();
    uint32_t count();

private:
    std::string path_;
};

// Fingerprint used for duplicate suppression.
std::string scar_pattern_key(const std::string& content);

} // namespace vigil
