// Nodeweave kernel: keyed table behind the result cache
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nw_types.hpp"

namespace nw {

struct CacheEntry {
    NodeId id;                  // primary key, one entry per node
    std::string name;
    std::string hash;           // content hash of result
    std::string input_hash;     // memoization key
    int64_t age = 0;            // ms since epoch of last write or touch
    NodeResult result;
    std::optional<std::string> blob_id;
};

// Durable key/value table. Writes are atomic per key; no cross-key
// transactions. Implementations throw GraphError{Storage} on backend failure.
class ResultStore {
public:
    virtual ~ResultStore() = default;

    // Upsert by entry.id (last write wins).
    virtual void put(const CacheEntry& entry) = 0;
    virtual std::optional<CacheEntry> get(const NodeId& id) const = 0;
    virtual std::optional<CacheEntry> find(const NodeId& id, const std::string& input_hash) const = 0;
    virtual std::optional<CacheEntry> find_by_hash(const std::string& hash) const = 0;

    // Returns false when no entry with that id exists.
    virtual bool update_age(const NodeId& id, int64_t age) = 0;

    virtual int remove(const NodeId& id) = 0;
    // Removes every entry with age <= cutoff.
    virtual int remove_older_than(int64_t cutoff) = 0;

    virtual std::vector<CacheEntry> list() const = 0;
    virtual size_t size() const = 0;
};

} // namespace nw
