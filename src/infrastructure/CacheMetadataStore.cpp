#include "infrastructure/CacheMetadataStore.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace crawlscope::infrastructure {

namespace {

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

std::runtime_error SqliteError(sqlite3* db, const std::string& what) {
    return std::runtime_error(what + ": " + sqlite3_errmsg(db));
}

void Exec(sqlite3* db, const char* sql) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string text = message ? message : "unknown error";
        sqlite3_free(message);
        throw std::runtime_error(std::string("sqlite exec failed: ") + text);
    }
}

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw SqliteError(db, "sqlite prepare failed");
    }
    return Statement(raw);
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void StepDone(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw SqliteError(db, "sqlite step failed");
    }
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

CacheEntryMeta ReadRow(sqlite3_stmt* stmt) {
    CacheEntryMeta entry;
    entry.keyHash = ColumnText(stmt, 0);
    entry.filename = ColumnText(stmt, 1);
    entry.sizeBytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    entry.createdAt = sqlite3_column_double(stmt, 3);
    entry.lastAccessed = sqlite3_column_double(stmt, 4);
    entry.accessCount = sqlite3_column_int64(stmt, 5);
    entry.ttlSeconds = sqlite3_column_int(stmt, 6);
    return entry;
}

constexpr const char* kSelectColumns =
    "SELECT key, filename, size_bytes, created_at, last_accessed, access_count, ttl_seconds "
    "FROM cache_metadata ";

} // namespace

void CacheMetadataStore::ConnectionCloser::operator()(sqlite3* db) const {
    sqlite3_close(db);
}

CacheMetadataStore::CacheMetadataStore(std::filesystem::path dbPath) : m_dbPath(std::move(dbPath)) {
    Connection db = open();
    Exec(db.get(), "PRAGMA journal_mode=WAL");
    Exec(db.get(),
         "CREATE TABLE IF NOT EXISTS cache_metadata ("
         " key TEXT PRIMARY KEY,"
         " filename TEXT NOT NULL,"
         " size_bytes INTEGER NOT NULL,"
         " created_at REAL NOT NULL,"
         " last_accessed REAL NOT NULL,"
         " access_count INTEGER DEFAULT 0,"
         " ttl_seconds INTEGER NOT NULL)");
    Exec(db.get(), "CREATE INDEX IF NOT EXISTS idx_last_accessed ON cache_metadata(last_accessed)");
}

CacheMetadataStore::Connection CacheMetadataStore::open() const {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(m_dbPath.string().c_str(), &raw);
    Connection db(raw);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : "out of memory";
        throw std::runtime_error("Cannot open cache metadata at " + m_dbPath.string() + ": " + message);
    }
    sqlite3_busy_timeout(db.get(), 5000);
    return db;
}

std::optional<CacheEntryMeta> CacheMetadataStore::find(const std::string& keyHash) const {
    Connection db = open();
    Statement stmt = Prepare(db.get(), (std::string(kSelectColumns) + "WHERE key = ?").c_str());
    BindText(stmt.get(), 1, keyHash);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return ReadRow(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw SqliteError(db.get(), "cache metadata lookup failed");
    }
    return std::nullopt;
}

void CacheMetadataStore::upsert(const CacheEntryMeta& entry) const {
    Connection db = open();
    Statement stmt = Prepare(db.get(),
        "INSERT OR REPLACE INTO cache_metadata "
        "(key, filename, size_bytes, created_at, last_accessed, access_count, ttl_seconds) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    BindText(stmt.get(), 1, entry.keyHash);
    BindText(stmt.get(), 2, entry.filename);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(entry.sizeBytes));
    sqlite3_bind_double(stmt.get(), 4, entry.createdAt);
    sqlite3_bind_double(stmt.get(), 5, entry.lastAccessed);
    sqlite3_bind_int64(stmt.get(), 6, entry.accessCount);
    sqlite3_bind_int(stmt.get(), 7, entry.ttlSeconds);
    StepDone(db.get(), stmt.get());
}

void CacheMetadataStore::touch(const std::string& keyHash, double now) const {
    Connection db = open();
    Statement stmt = Prepare(db.get(),
        "UPDATE cache_metadata SET last_accessed = ?, access_count = access_count + 1 WHERE key = ?");
    sqlite3_bind_double(stmt.get(), 1, now);
    BindText(stmt.get(), 2, keyHash);
    StepDone(db.get(), stmt.get());
}

void CacheMetadataStore::remove(const std::string& keyHash) const {
    Connection db = open();
    Statement stmt = Prepare(db.get(), "DELETE FROM cache_metadata WHERE key = ?");
    BindText(stmt.get(), 1, keyHash);
    StepDone(db.get(), stmt.get());
}

void CacheMetadataStore::removeAll() const {
    Connection db = open();
    Exec(db.get(), "DELETE FROM cache_metadata");
}

uint64_t CacheMetadataStore::totalSize() const {
    Connection db = open();
    Statement stmt = Prepare(db.get(), "SELECT COALESCE(SUM(size_bytes), 0) FROM cache_metadata");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw SqliteError(db.get(), "cache size query failed");
    }
    return static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

uint64_t CacheMetadataStore::entryCount() const {
    Connection db = open();
    Statement stmt = Prepare(db.get(), "SELECT COUNT(*) FROM cache_metadata");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw SqliteError(db.get(), "cache count query failed");
    }
    return static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<CacheEntryMeta> CacheMetadataStore::leastRecentlyAccessed(uint64_t limit) const {
    Connection db = open();
    Statement stmt = Prepare(db.get(),
        (std::string(kSelectColumns) + "ORDER BY last_accessed ASC LIMIT ?").c_str());
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

    std::vector<CacheEntryMeta> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(ReadRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw SqliteError(db.get(), "cache eviction query failed");
    }
    return rows;
}

} // namespace crawlscope::infrastructure
