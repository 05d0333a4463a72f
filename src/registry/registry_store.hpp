#ifndef TOKENVAULT_REGISTRY_REGISTRY_STORE_HPP
#define TOKENVAULT_REGISTRY_REGISTRY_STORE_HPP

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "registry/token_registry.hpp"
#include "util/logger.hpp"

namespace tokenvault {
namespace registry {

/*
  RegistryStore
  --------------------------------
  Persists a TokenRegistry in a SQLite database so that token numbering
  survives a restart.

  Tables:
    tokens   (token PRIMARY KEY, value UNIQUE, type, sequence, created_at)
    counters (type PRIMARY KEY, next_sequence)

  - load() rehydrates a registry (entries and counters) through
    TokenRegistry::restore(), which rejects inconsistent data.
  - flush() writes the registry inside one SQL transaction. Rows already in
    the database are kept; counters only move forward. A row binding one of
    our tokens to a different value aborts the flush and rolls back.
  - Both return false on database errors and log the reason. Values are
    never logged.
*/
class RegistryStore {
  public:
    explicit RegistryStore(const std::string& dbFilePath) : m_dbFilePath(dbFilePath) {}

    const std::string& GetPath() const { return m_dbFilePath; }

    // -------------------------------------------------------------------------
    // Reads every entry and counter into @p registry, replacing its content.
    // An empty or missing database yields an empty registry.
    // Throws core::RegistryError if the stored data is inconsistent.
    // -------------------------------------------------------------------------
    bool Load(TokenRegistry& registry) {
        using namespace tokenvault::util::logger;

        sqlite3* db = nullptr;
        if (!openDatabase(db)) {
            error("[RegistryStore] Could not open database: " + m_dbFilePath);
            return false;
        }
        if (!initDatabaseSchema(db)) {
            sqlite3_close(db);
            return false;
        }

        RegistrySnapshot snap;
        if (!readEntries(db, snap) || !readCounters(db, snap)) {
            error("[RegistryStore] Failed to read registry tables: " + std::string(sqlite3_errmsg(db)));
            sqlite3_close(db);
            return false;
        }
        sqlite3_close(db);

        registry.restore(snap);
        info("[RegistryStore] Loaded " + std::to_string(snap.entries.size()) + " entries from " +
             m_dbFilePath);
        return true;
    }

    // -------------------------------------------------------------------------
    // Writes the registry in a single transaction. Returns true on success.
    // -------------------------------------------------------------------------
    bool Flush(const TokenRegistry& registry) {
        using namespace tokenvault::util::logger;

        RegistrySnapshot snap = registry.snapshot();

        sqlite3* db = nullptr;
        if (!openDatabase(db)) {
            error("[RegistryStore] Could not open database: " + m_dbFilePath);
            return false;
        }
        if (!initDatabaseSchema(db)) {
            sqlite3_close(db);
            return false;
        }
        if (!execSql(db, "BEGIN IMMEDIATE TRANSACTION;")) {
            error("[RegistryStore] Could not start transaction.");
            sqlite3_close(db);
            return false;
        }

        size_t written = 0;
        for (const auto& entry : snap.entries) {
            if (!upsertEntry(db, entry, written)) {
                execSql(db, "ROLLBACK;");
                sqlite3_close(db);
                return false;
            }
        }
        for (const auto& counter : snap.nextSequence) {
            if (!upsertCounter(db, counter.first, counter.second)) {
                error("[RegistryStore] Counter update failed for " + counter.first + ": " +
                      std::string(sqlite3_errmsg(db)));
                execSql(db, "ROLLBACK;");
                sqlite3_close(db);
                return false;
            }
        }

        if (!execSql(db, "COMMIT;")) {
            error("[RegistryStore] Failed to commit registry flush.");
            execSql(db, "ROLLBACK;");
            sqlite3_close(db);
            return false;
        }
        sqlite3_close(db);

        info("[RegistryStore] Flushed registry: " + std::to_string(written) + " new rows, " +
             std::to_string(snap.entries.size()) + " entries total.");
        return true;
    }

  private:
    bool openDatabase(sqlite3*& db) {
        int rc = sqlite3_open(m_dbFilePath.c_str(), &db);
        if (rc != SQLITE_OK) {
            // sqlite3_open allocates a handle even on failure
            sqlite3_close(db);
            db = nullptr;
            return false;
        }
        return db != nullptr;
    }

    bool initDatabaseSchema(sqlite3* db) {
        const char* ddl = "CREATE TABLE IF NOT EXISTS tokens ("
                          " token TEXT PRIMARY KEY,"
                          " value TEXT NOT NULL UNIQUE,"
                          " type TEXT NOT NULL,"
                          " sequence INTEGER NOT NULL,"
                          " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                          ");"
                          "CREATE TABLE IF NOT EXISTS counters ("
                          " type TEXT PRIMARY KEY,"
                          " next_sequence INTEGER NOT NULL"
                          ");";

        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            util::logger::error("[RegistryStore] initDatabaseSchema error: " +
                                std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool execSql(sqlite3* db, const char* sql) {
        return sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    static std::string columnText(sqlite3_stmt* stmt, int col) {
        const unsigned char* raw = sqlite3_column_text(stmt, col);
        int len = sqlite3_column_bytes(stmt, col);
        return raw ? std::string(reinterpret_cast<const char*>(raw), static_cast<size_t>(len))
                   : std::string();
    }

    bool readEntries(sqlite3* db, RegistrySnapshot& snap) {
        const char* sql = "SELECT token, value, type, sequence FROM tokens;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            return false;
        }
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            RegistryEntry e;
            e.token = columnText(stmt, 0);
            e.value = columnText(stmt, 1);
            e.type = columnText(stmt, 2);
            e.sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
            snap.entries.push_back(std::move(e));
        }
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

    bool readCounters(sqlite3* db, RegistrySnapshot& snap) {
        const char* sql = "SELECT type, next_sequence FROM counters;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            return false;
        }
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            snap.nextSequence[columnText(stmt, 0)] =
                static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        }
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

    // -------------------------------------------------------------------------
    // Inserts the entry unless the token is already stored with the same value.
    // -------------------------------------------------------------------------
    bool upsertEntry(sqlite3* db, const RegistryEntry& entry, size_t& written) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT value FROM tokens WHERE token = ?;", -1, &stmt,
                               nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, entry.token.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            bool same = columnText(stmt, 0) == entry.value;
            sqlite3_finalize(stmt);
            if (!same) {
                util::logger::error("[RegistryStore] " + entry.token +
                                    " is stored with a different value; flush aborted.");
            }
            return same;
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }

        const char* sql = "INSERT INTO tokens (token, value, type, sequence) VALUES (?, ?, ?, ?);";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, entry.token.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, entry.value.data(), static_cast<int>(entry.value.size()),
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, entry.type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(entry.sequence));
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            // UNIQUE(value): the value is stored under another token
            util::logger::error("[RegistryStore] Insert of " + entry.token + " failed: " +
                                std::string(sqlite3_errmsg(db)));
            return false;
        }
        ++written;
        return true;
    }

    bool upsertCounter(sqlite3* db, const std::string& type, uint64_t next) {
        const char* sql = "INSERT INTO counters (type, next_sequence) VALUES (?, ?)"
                          " ON CONFLICT(type) DO UPDATE SET"
                          " next_sequence = MAX(next_sequence, excluded.next_sequence);";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(next));
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

  private:
    std::string m_dbFilePath;
};

} // namespace registry
} // namespace tokenvault

#endif // TOKENVAULT_REGISTRY_REGISTRY_STORE_HPP
