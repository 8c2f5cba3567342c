/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace jitstream {

// Thin RAII layer over the sqlite3 C API. Every call reports through return
// codes; nothing here throws.
class Statement final {
public:
    explicit Statement(sqlite3_stmt* stmt) noexcept : stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&&) = delete;
    Statement& operator=(Statement&&) = delete;

    bool bind(int index, const std::string& value) noexcept;
    bool bind(int index, std::int64_t value) noexcept;
    bool bind(int index, const std::optional<std::string>& value) noexcept;

    // Raw sqlite result code (SQLITE_ROW, SQLITE_DONE, SQLITE_BUSY, ...).
    [[nodiscard]] int step() noexcept;

    [[nodiscard]] std::int64_t columnInt(int index) const noexcept;
    [[nodiscard]] std::string columnText(int index) const;
    [[nodiscard]] std::optional<std::string> columnOptionalText(int index) const;

private:
    sqlite3_stmt* stmt_;
};

class Database final {
public:
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    [[nodiscard]] static std::unique_ptr<Database> open(const std::filesystem::path& path,
                                                        std::chrono::milliseconds busyTimeout,
                                                        std::string& error) noexcept;

    // Returns the sqlite result code; SQLITE_OK on success.
    [[nodiscard]] int exec(const std::string& sql) noexcept;
    [[nodiscard]] std::unique_ptr<Statement> prepare(const std::string& sql, int& rc) noexcept;
    [[nodiscard]] std::int64_t lastInsertRowid() const noexcept;
    [[nodiscard]] int changes() const noexcept;
    [[nodiscard]] std::string errorMessage() const;

    [[nodiscard]] static bool isBusy(int rc) noexcept;

private:
    explicit Database(sqlite3* db) noexcept : db_(db) {}
    sqlite3* db_;
};

// BEGIN IMMEDIATE ... COMMIT, rolled back unless committed.
class Transaction final {
public:
    explicit Transaction(Database& db) noexcept : db_(db) {}
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] int begin() noexcept;
    [[nodiscard]] int commit() noexcept;

private:
    Database& db_;
    bool open_ = false;
};

}
