#pragma once
#include "../memory.hpp"
#include <string>

namespace vigil {

// SQLite-backed RecordStore. Holds only the database path: every operation
// opens its own connection, so the foreground agent and the scanner thread
// never share a handle.
class SqliteRecordStore : public RecordStore {
public:
    // Creates the schema. Throws std::runtime_error if the file cannot be opened.
    explicit SqliteRecordStore(const std::string& path);

    std::string backend_name() const override { return "sqlite"; }

    std::string append(const MemoryRecord& record) override;
    std::vector<MemoryRecord> all() override;
    uint32_t delete_matching(const std::string& keyword) override;
    bool set_outcome(const std::string& id, Outcome outcome) override;
    uint32_t count() override;
    double average_confidence() override;

    std::optional<std::string> processed_hash(const std::string& path) override;
    bool upsert_processed(const std::string& path,
                          const std::string& content_hash) override;
    uint32_t processed_count() override;

    // Embedding length fixed by the first embedded record, 0 if none yet.
    uint32_t embedding_dims();

    const std::string& path() const { return path_; }

private:
    void init_schema();

    std::string path_;
};

} // namespace vigil
