#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>

namespace vigil {

class Embedder; // forward declaration

using Embedding = std::vector<float>;

enum class Outcome { Success, Neutral, Failure, Unknown };

enum class Tier { Tactical, Strategic };

// Well-known provenance tags
namespace source {
inline constexpr const char* kExecutive = "executive_interaction";
inline constexpr const char* kFileScan = "file_scan";
inline constexpr const char* kSystemLog = "system_log";
inline constexpr const char* kSecurityAction = "automated_security_action";
} // namespace source

// One episodic observation. Trust is never stored: it is derived per query
// from outcome, age, tier and source.
struct MemoryRecord {
    std::string id;
    std::string content;
    uint64_t created_at = 0;   // epoch seconds, 0 = missing
    std::string source;
    Outcome outcome = Outcome::Unknown;
    double confidence = 0.5;
    Tier tier = Tier::Tactical;
    Embedding embedding;       // empty when no embedder was available
};

// Append-only store of MemoryRecords plus the scanner's processed-file cursor.
// Implementations must be safe to call from several threads at once.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::string backend_name() const = 0;

    // Persist a record atomically. Returns its id, or an empty string when the
    // record was rejected (empty content, confidence outside [0,1]) or the
    // write failed.
    virtual std::string append(const MemoryRecord& record) = 0;

    // All records, oldest first.
    virtual std::vector<MemoryRecord> all() = 0;

    // Delete every record whose content contains keyword (case-insensitive).
    // An empty keyword deletes nothing. Returns the number removed.
    virtual uint32_t delete_matching(const std::string& keyword) = 0;

    // Back-fill the outcome of a record whose outcome is still Unknown.
    virtual bool set_outcome(const std::string& id, Outcome outcome) = 0;

    virtual uint32_t count() = 0;

    // Mean confidence over all records, 0 when empty.
    virtual double average_confidence() = 0;

    // Delta-sync cursor for the sensitivity scanner
    virtual std::optional<std::string> processed_hash(const std::string& path) = 0;
    virtual bool upsert_processed(const std::string& path,
                                  const std::string& content_hash) = 0;
    virtual uint32_t processed_count() = 0;
};

std::string outcome_to_string(Outcome outcome);
Outcome outcome_from_string(const std::string& s);

std::string tier_to_string(Tier tier);
Tier tier_from_string(const std::string& s);

// Build a fresh record: new id, created_at = now, tier from the classifier,
// embedding from the embedder when one is given. Call outside any store lock.
MemoryRecord make_record(const std::string& content,
                         const std::string& source,
                         Outcome outcome,
                         double confidence,
                         Embedder* embedder);

// Validation shared by every backend.
bool record_is_valid(const MemoryRecord& record);

struct Config;
// Create the record store configured for this installation.
std::unique_ptr<RecordStore> create_record_store(const Config& config);

} // namespace vigil
