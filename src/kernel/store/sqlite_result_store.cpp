// Nodeweave kernel: durable result store backed by SQLite
#include "kernel/store/sqlite_result_store.hpp"

#include <sqlite3.h>

#include <mutex>
#include <sstream>

namespace nw {

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS results ("
    "  id TEXT PRIMARY KEY,"
    "  name TEXT,"
    "  hash TEXT NOT NULL,"
    "  input_hash TEXT NOT NULL,"
    "  age INTEGER NOT NULL,"
    "  result TEXT NOT NULL,"
    "  blob_id TEXT"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_results_hash ON results(hash);"
    "CREATE INDEX IF NOT EXISTS idx_results_age ON results(age);"
    "CREATE INDEX IF NOT EXISTS idx_results_input ON results(id, input_hash);";

constexpr const char* kSelectColumns =
    "SELECT id, name, hash, input_hash, age, result, blob_id FROM results ";

// Owns one prepared statement.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw GraphError(GraphErrc::Storage,
                             std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

    // true on SQLITE_ROW, false on SQLITE_DONE
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw GraphError(GraphErrc::Storage,
                         std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
    }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : std::string();
    }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

std::string serialize_result(const NodeResult& result) {
    YAML::Emitter out;
    out << result.to_yaml();
    return out.c_str();
}

CacheEntry read_row(const Statement& st) {
    CacheEntry e;
    e.id = st.text(0);
    e.name = st.text(1);
    e.hash = st.text(2);
    e.input_hash = st.text(3);
    e.age = st.int64(4);
    try {
        e.result = NodeResult::from_yaml(YAML::Load(st.text(5)));
    } catch (const std::exception& ex) {
        throw GraphError(GraphErrc::Storage,
                         "Corrupt cached result for node " + e.id + ": " + ex.what());
    }
    if (!st.is_null(6)) e.blob_id = st.text(6);
    return e;
}

} // namespace

struct SqliteResultStore::Impl {
    sqlite3* db = nullptr;
    mutable std::mutex mx;

    void exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            throw GraphError(GraphErrc::Storage, "SQLite exec failed: " + msg);
        }
    }
};

SqliteResultStore::SqliteResultStore(const std::filesystem::path& db_path)
    : path_(db_path), impl_(std::make_unique<Impl>()) {
    const std::string path_str = db_path.string();
    if (path_str != ":memory:" && db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            throw GraphError(GraphErrc::Storage,
                             "Cannot create cache directory " + db_path.parent_path().string() +
                                 ": " + ec.message());
        }
    }
    if (sqlite3_open(path_str.c_str(), &impl_->db) != SQLITE_OK) {
        std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        throw GraphError(GraphErrc::Storage, "Cannot open result store " + path_str + ": " + msg);
    }
    try {
        impl_->exec("PRAGMA journal_mode=WAL;");
        impl_->exec(kSchema);
    } catch (...) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        throw;
    }
}

SqliteResultStore::~SqliteResultStore() {
    if (impl_ && impl_->db) {
        sqlite3_close(impl_->db);
    }
}

void SqliteResultStore::put(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db,
                 "INSERT OR REPLACE INTO results (id, name, hash, input_hash, age, result, blob_id) "
                 "VALUES (?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, entry.id);
    st.bind(2, entry.name);
    st.bind(3, entry.hash);
    st.bind(4, entry.input_hash);
    st.bind(5, entry.age);
    st.bind(6, serialize_result(entry.result));
    if (entry.blob_id) {
        st.bind(7, *entry.blob_id);
    } else {
        st.bind_null(7);
    }
    st.step();
}

std::optional<CacheEntry> SqliteResultStore::get(const NodeId& id) const {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, (std::string(kSelectColumns) + "WHERE id=?").c_str());
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

std::optional<CacheEntry> SqliteResultStore::find(const NodeId& id, const std::string& input_hash) const {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, (std::string(kSelectColumns) + "WHERE id=? AND input_hash=?").c_str());
    st.bind(1, id);
    st.bind(2, input_hash);
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

std::optional<CacheEntry> SqliteResultStore::find_by_hash(const std::string& hash) const {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, (std::string(kSelectColumns) + "WHERE hash=? ORDER BY id LIMIT 1").c_str());
    st.bind(1, hash);
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

bool SqliteResultStore::update_age(const NodeId& id, int64_t age) {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, "UPDATE results SET age=? WHERE id=?");
    st.bind(1, age);
    st.bind(2, id);
    st.step();
    return sqlite3_changes(impl_->db) > 0;
}

int SqliteResultStore::remove(const NodeId& id) {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, "DELETE FROM results WHERE id=?");
    st.bind(1, id);
    st.step();
    return sqlite3_changes(impl_->db);
}

int SqliteResultStore::remove_older_than(int64_t cutoff) {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, "DELETE FROM results WHERE age<=?");
    st.bind(1, cutoff);
    st.step();
    return sqlite3_changes(impl_->db);
}

std::vector<CacheEntry> SqliteResultStore::list() const {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, (std::string(kSelectColumns) + "ORDER BY id").c_str());
    std::vector<CacheEntry> out;
    while (st.step()) {
        out.push_back(read_row(st));
    }
    return out;
}

size_t SqliteResultStore::size() const {
    std::lock_guard<std::mutex> lk(impl_->mx);
    Statement st(impl_->db, "SELECT COUNT(*) FROM results");
    if (!st.step()) return 0;
    return static_cast<size_t>(st.int64(0));
}

} // namespace nw
