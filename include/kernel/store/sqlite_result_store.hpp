// Nodeweave kernel: durable result store backed by SQLite
#pragma once

#include <filesystem>
#include <memory>

#include "kernel/store/result_store.hpp"

namespace nw {

// Table `results` (id PK, name, hash, input_hash, age, result YAML, blob_id)
// with secondary indexes on hash, age and (id, input_hash). Pass ":memory:"
// for a private in-memory database.
class NODEWEAVE_API SqliteResultStore final : public ResultStore {
public:
    explicit SqliteResultStore(const std::filesystem::path& db_path);
    ~SqliteResultStore() override;

    SqliteResultStore(const SqliteResultStore&) = delete;
    SqliteResultStore& operator=(const SqliteResultStore&) = delete;

    void put(const CacheEntry& entry) override;
    std::optional<CacheEntry> get(const NodeId& id) const override;
    std::optional<CacheEntry> find(const NodeId& id, const std::string& input_hash) const override;
    std::optional<CacheEntry> find_by_hash(const std::string& hash) const override;
    bool update_age(const NodeId& id, int64_t age) override;
    int remove(const NodeId& id) override;
    int remove_older_than(int64_t cutoff) override;
    std::vector<CacheEntry> list() const override;
    size_t size() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    struct Impl;
    std::filesystem::path path_;
    std::unique_ptr<Impl> impl_;
};

} // namespace nw
