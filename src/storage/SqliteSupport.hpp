#pragma once

#include "meshcache/Error.hpp"

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace meshcache::storage::detail {

// Owns one prepared statement; finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            const std::string reason = sqlite3_errmsg(db_);
            stmt_ = nullptr;
            throw_error(ErrorCode::Storage, "failed to prepare statement: " + reason);
        }
    }

    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& text) {
        sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }

    void bind(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind_blob(int index, std::span<const std::uint8_t> bytes) {
        sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
    }

    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    // True while a row is available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw_error(ErrorCode::Storage, std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {
        }
    }

    std::string column_text(int index) const {
        const auto* text = sqlite3_column_text(stmt_, index);
        if (text == nullptr) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
    }

    std::int64_t column_int(int index) const {
        return sqlite3_column_int64(stmt_, index);
    }

    std::vector<std::uint8_t> column_blob(int index) const {
        const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, index));
        const auto size = sqlite3_column_bytes(stmt_, index);
        if (blob == nullptr || size <= 0) {
            return {};
        }
        return std::vector<std::uint8_t>(blob, blob + size);
    }

    bool column_is_null(int index) const {
        return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
    }

private:
    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_{nullptr};
};

inline sqlite3* open_database(const std::string& path) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string reason = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
        if (db != nullptr) {
            sqlite3_close(db);
        }
        throw_error(ErrorCode::Storage,
                    "unable to open index database " + path + ": " + reason,
                    "Check that the storage directory is writable");
    }
    return db;
}

inline void exec(sqlite3* db, const char* sql) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message != nullptr ? message : "unknown error";
        sqlite3_free(message);
        throw_error(ErrorCode::Storage, "sqlite exec failed: " + reason);
    }
}

inline std::int64_t to_unix_micros(std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::microseconds>(point.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point from_unix_micros(std::int64_t micros) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros)));
}

}  // namespace meshcache::storage::detail
