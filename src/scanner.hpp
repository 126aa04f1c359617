#pragma once
#include "config.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

class RecordStore;
class Embedder;
class Classifier;
class Guardrail;
class QuarantineVault;

// Terminal state of one file in one sweep.
enum class ScanOutcome {
    Unchanged,    // digest matches the cursor: nothing done
    Cleared,      // classified below threshold, cursor updated
    Quarantined,  // moved to the vault, memory recorded, cursor updated
    Denied,       // guardrail refused the move; retried next sweep
    Failed,       // move failed; retried next sweep
    Unreadable    // could not be hashed or read
};

const char* scan_outcome_name(ScanOutcome outcome);

struct ScanReport {
    uint32_t discovered = 0;
    uint32_t unchanged = 0;
    uint32_t cleared = 0;
    uint32_t quarantined = 0;
    uint32_t denied = 0;
    uint32_t failed = 0;
    uint32_t unreadable = 0;

    void add(ScanOutcome outcome);
};

// Background sensitivity sweep: discover -> hash -> skip unchanged ->
// classify -> quarantine or clear. Every quarantine goes through the
// guardrail first.
// True for zip/PDF signatures or embedded NUL bytes.
bool looks_like_binary_container(const std::string& prefix);

class SensitivityScanner {
public:
    SensitivityScanner(RecordStore& store, Embedder* embedder,
                       Classifier& classifier, Guardrail& guardrail,
                       QuarantineVault& vault, ScannerConfig config);
    ~SensitivityScanner();

    SensitivityScanner(const SensitivityScanner&) = delete;
    SensitivityScanner& operator=(const SensitivityScanner&) = delete;

    // Candidate files under the configured roots, excluding the vault,
    // hidden entries, excluded directories, oversized files and other
    // extensions.
    std::vector<std::filesystem::path> discover() const;

    // Unreadable covers both I/O failure and binary containers with no
    // text extractor; neither touches the cursor.
    ScanOutcome scan_file(const std::filesystem::path& path);

    // One full pass over discover(). Per-file errors are logged and counted.
    ScanReport sweep();

    // Sweep now and then every interval_seconds until stop().
    void start();
    void stop();
    bool running() const { return running_.load(); }

private:
    bool has_candidate_extension(const std::filesystem::path& p) const;
    bool is_excluded_dir(const std::filesystem::path& p) const;
    void run_loop();

    RecordStore& store_;
    Embedder* embedder_;
    Classifier& classifier_;
    Guardrail& guardrail_;
    QuarantineVault& vault_;
    ScannerConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> abort_{false};   // cuts a sweep short on stop()
    std::mutex mutex_;
    std::mutex sweep_mutex_;           // one sweep at a time
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace vigil
