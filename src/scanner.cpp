#include "scanner.hpp"
#include "classifier.hpp"
#include "guardrail.hpp"
#include "memory.hpp"
#include "util.hpp"
#include "vault.hpp"
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace vigil {

// Below this many non-space characters there is nothing to classify
static constexpr size_t kMinClassifiableChars = 5;

const char* scan_outcome_name(ScanOutcome outcome) {
    switch (outcome) {
        case ScanOutcome::Unchanged:   return "unchanged";
        case ScanOutcome::Cleared:     return "cleared";
        case ScanOutcome::Quarantined: return "quarantined";
        case ScanOutcome::Denied:      return "denied";
        case ScanOutcome::Failed:      return "failed";
        case ScanOutcome::Unreadable:  return "unreadable";
    }
    return "unknown";
}

void ScanReport::add(ScanOutcome outcome) {
    switch (outcome) {
        case ScanOutcome::Unchanged:   ++unchanged; break;
        case ScanOutcome::Cleared:     ++cleared; break;
        case ScanOutcome::Quarantined: ++quarantined; break;
        case ScanOutcome::Denied:      ++denied; break;
        case ScanOutcome::Failed:      ++failed; break;
        case ScanOutcome::Unreadable:  ++unreadable; break;
    }
}

SensitivityScanner::SensitivityScanner(RecordStore& store, Embedder* embedder,
                                       Classifier& classifier, Guardrail& guardrail,
                                       QuarantineVault& vault, ScannerConfig config)
    : store_(store), embedder_(embedder), classifier_(classifier),
      guardrail_(guardrail), vault_(vault), config_(std::move(config)) {}

SensitivityScanner::~SensitivityScanner() {
    stop();
}

static bool is_hidden(const fs::path& p) {
    std::string name = p.filename().string();
    return !name.empty() && (name[0] == '.' || name[0] == '~');
}

bool SensitivityScanner::has_candidate_extension(const fs::path& p) const {
    std::string ext = to_lower(p.extension().string());
    for (const auto& allowed : config_.extensions) {
        if (ext == to_lower(allowed)) return true;
    }
    return false;
}

bool SensitivityScanner::is_excluded_dir(const fs::path& p) const {
    std::string name = p.filename().string();
    for (const auto& excluded : config_.excluded_dirs) {
        if (name == excluded) return true;
    }
    return is_hidden(p) || vault_.contains(p);
}

std::vector<fs::path> SensitivityScanner::discover() const {
    std::vector<fs::path> found;
    const uintmax_t max_bytes = static_cast<uintmax_t>(config_.max_file_mb) * 1024 * 1024;

    for (const auto& root_str : config_.roots) {
        fs::path root = expand_home(root_str);
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            std::cerr << "[scanner] Skipping missing root " << root << "\n";
            continue;
        }

        fs::recursive_directory_iterator it(
            root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[scanner] Cannot walk " << root << ": " << ec.message() << "\n";
            continue;
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                ec.clear();
                continue;
            }
            const auto& entry = *it;
            std::error_code st_ec;

            if (entry.is_directory(st_ec)) {
                if (is_excluded_dir(entry.path())) it.disable_recursion_pending();
                continue;
            }
            if (!entry.is_regular_file(st_ec) || st_ec) continue;
            if (is_hidden(entry.path())) continue;
            if (!has_candidate_extension(entry.path())) continue;

            auto size = entry.file_size(st_ec);
            if (st_ec || size > max_bytes) continue;

            found.push_back(entry.path());
        }
    }
    return found;
}

static std::string read_prefix(const fs::path& path, size_t max_bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    std::string buf(max_bytes, '\0');
    in.read(&buf[0], static_cast<std::streamsize>(max_bytes));
    buf.resize(static_cast<size_t>(in.gcount()));
    return buf;
}

// Zip (docx/xlsx/odt), PDF, or anything with NUL bytes. The prefix of such a
// file is compressed or structural data; classifying it would clear the file.
bool looks_like_binary_container(const std::string& prefix) {
    if (prefix.compare(0, 4, "PK\x03\x04") == 0) return true;
    if (prefix.compare(0, 5, "%PDF-") == 0) return true;
    return prefix.find('\0') != std::string::npos;
}

ScanOutcome SensitivityScanner::scan_file(const fs::path& path) {
    const std::string path_str = path.string();

    auto digest = sha256_file_hex(path_str);
    if (!digest) {
        std::cerr << "[scanner] Cannot read " << path_str << "\n";
        return ScanOutcome::Unreadable;
    }

    auto prior = store_.processed_hash(path_str);
    if (prior && *prior == *digest) return ScanOutcome::Unchanged;

    std::string prefix = read_prefix(path, config_.excerpt_chars);
    if (looks_like_binary_container(prefix)) {
        std::cerr << "[scanner] No text extractor for " << path_str << ", skipping\n";
        return ScanOutcome::Unreadable;
    }
    std::string excerpt = sanitize_excerpt(prefix, config_.excerpt_chars);
    size_t meaningful = 0;
    for (char c : excerpt) {
        if (!std::isspace(static_cast<unsigned char>(c))) ++meaningful;
    }
    if (meaningful < kMinClassifiableChars) {
        store_.upsert_processed(path_str, *digest);
        return ScanOutcome::Cleared;
    }

    std::string name = path.filename().string();
    auto verdict = classifier_.classify(name, excerpt);
    int score = verdict.effective_score();

    if (score < static_cast<int>(config_.threshold)) {
        if (!store_.upsert_processed(path_str, *digest))
            std::cerr << "[scanner] Could not record cursor for " << path_str << "\n";
        return ScanOutcome::Cleared;
    }

    auto gate = guardrail_.consult("quarantine " + path_str, config_.quarantine_cost);
    if (!gate.allowed) {
        std::cerr << "[scanner] Quarantine of " << path_str << " refused: "
                  << gate.reason << "\n";
        return ScanOutcome::Denied;
    }

    std::string reason = "sensitivity score " + std::to_string(score);
    auto moved = vault_.quarantine(path, reason);
    if (!moved) return ScanOutcome::Failed;

    std::string content = "SECURITY ALERT: Moved " + name + " to vault (Score: " +
                          std::to_string(score) + ")";
    auto rec = make_record(content, source::kSecurityAction, Outcome::Success, 1.0,
                           embedder_);
    if (store_.append(rec).empty())
        std::cerr << "[scanner] Failed to record quarantine of " << path_str << "\n";

    store_.upsert_processed(path_str, *digest);
    std::cerr << "[scanner] Quarantined " << path_str << " -> " << moved->string()
              << " (score " << score << ")\n";
    return ScanOutcome::Quarantined;
}

ScanReport SensitivityScanner::sweep() {
    // The REPL's /scan and the background loop must not race on one file.
    std::lock_guard<std::mutex> sweep_lock(sweep_mutex_);
    ScanReport report;
    auto candidates = discover();
    report.discovered = static_cast<uint32_t>(candidates.size());

    for (const auto& path : candidates) {
        if (abort_.load()) break;
        try {
            report.add(scan_file(path));
        } catch (const std::exception& e) {
            std::cerr << "[scanner] Error on " << path.string() << ": " << e.what() << "\n";
            report.add(ScanOutcome::Failed);
        }
    }
    return report;
}

void SensitivityScanner::start() {
    if (running_.exchange(true)) return;
    abort_.store(false);
    thread_ = std::thread([this]() { run_loop(); });
}

void SensitivityScanner::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) return;
        abort_.store(true);
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void SensitivityScanner::run_loop() {
    while (running_.load()) {
        auto report = sweep();
        std::cerr << "[scanner] Sweep done: " << report.discovered << " candidates, "
                  << report.quarantined << " quarantined, " << report.cleared
                  << " cleared, " << report.unchanged << " unchanged\n";

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(config_.interval_seconds),
                     [this]() { return !running_.load(); });
    }
}

} // namespace vigil
