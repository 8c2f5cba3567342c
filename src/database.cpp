/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/database.hpp"
#include "jitstream/logger.hpp"
#include <sqlite3.h>

namespace jitstream {

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

bool Statement::bind(int index, const std::string& value) noexcept {
    return sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                             SQLITE_TRANSIENT) == SQLITE_OK;
}

bool Statement::bind(int index, std::int64_t value) noexcept {
    return sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) == SQLITE_OK;
}

bool Statement::bind(int index, const std::optional<std::string>& value) noexcept {
    if (!value) {
        return sqlite3_bind_null(stmt_, index) == SQLITE_OK;
    }
    return bind(index, *value);
}

int Statement::step() noexcept {
    return sqlite3_step(stmt_);
}

std::int64_t Statement::columnInt(int index) const noexcept {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

std::string Statement::columnText(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (!text) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::optional<std::string> Statement::columnOptionalText(int index) const {
    if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(index);
}

Database::~Database() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

std::unique_ptr<Database> Database::open(const std::filesystem::path& path,
                                         std::chrono::milliseconds busyTimeout,
                                         std::string& error) noexcept {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        error = "Failed to open database " + path.string() + ": " +
                (handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc));
        if (handle) {
            sqlite3_close_v2(handle);
        }
        return nullptr;
    }

    if (sqlite3_busy_timeout(handle, static_cast<int>(busyTimeout.count())) != SQLITE_OK) {
        LOG_WARN("Failed to set sqlite busy timeout on " + path.string());
    }

    try {
        return std::unique_ptr<Database>(new Database(handle));
    } catch (const std::exception& e) {
        sqlite3_close_v2(handle);
        error = std::string("Failed to wrap database handle: ") + e.what();
        return nullptr;
    }
}

int Database::exec(const std::string& sql) noexcept {
    char* message = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK && !isBusy(rc)) {
        LOG_DEBUG(std::string("sqlite exec failed: ") + (message ? message : sqlite3_errstr(rc)));
    }
    sqlite3_free(message);
    return rc;
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql, int& rc) noexcept {
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_DEBUG("sqlite prepare failed: " + errorMessage());
        return nullptr;
    }
    try {
        return std::make_unique<Statement>(stmt);
    } catch (const std::exception&) {
        sqlite3_finalize(stmt);
        rc = SQLITE_NOMEM;
        return nullptr;
    }
}

std::int64_t Database::lastInsertRowid() const noexcept {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

int Database::changes() const noexcept {
    return sqlite3_changes(db_);
}

std::string Database::errorMessage() const {
    return sqlite3_errmsg(db_);
}

bool Database::isBusy(int rc) noexcept {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

Transaction::~Transaction() {
    if (open_) {
        if (db_.exec("ROLLBACK") != SQLITE_OK) {
            LOG_WARN("Transaction rollback failed: " + db_.errorMessage());
        }
    }
}

int Transaction::begin() noexcept {
    int rc = db_.exec("BEGIN IMMEDIATE");
    open_ = (rc == SQLITE_OK);
    return rc;
}

int Transaction::commit() noexcept {
    int rc = db_.exec("COMMIT");
    if (rc == SQLITE_OK) {
        open_ = false;
    }
    return rc;
}

}
