/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/queue_store.hpp"
#include "jitstream/database.hpp"
#include "jitstream/logger.hpp"
#include <sqlite3.h>
#include <functional>
#include <thread>

namespace jitstream {

namespace {
const char* tableFor(QueueKind kind) noexcept {
    return kind == QueueKind::Mount ? "mount_queue" : "launch_queue";
}

std::string insertSql(QueueKind kind) {
    if (kind == QueueKind::Mount) {
        return "INSERT INTO mount_queue (udid, ip, status) VALUES (?1, ?2, 0)";
    }
    return "INSERT INTO launch_queue (udid, ip, bundle_id, status) VALUES (?1, ?2, ?3, 0)";
}

std::string claimSql(QueueKind kind) {
    std::string bundle = kind == QueueKind::Launch ? "bundle_id" : "NULL";
    return "SELECT ordinal, udid, ip, " + bundle + " FROM " + tableFor(kind) +
           " WHERE status = 0 ORDER BY ordinal LIMIT 1";
}

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS devices ("
    " udid VARCHAR(64) PRIMARY KEY,"
    " ip VARCHAR(64) NOT NULL,"
    " last_used DATETIME DEFAULT CURRENT_TIMESTAMP);"
    "CREATE TABLE IF NOT EXISTS mount_queue ("
    " udid VARCHAR(64) NOT NULL,"
    " ip VARCHAR(64),"
    " status INT NOT NULL DEFAULT 0,"
    " error VARCHAR(255),"
    " ordinal INTEGER PRIMARY KEY AUTOINCREMENT);"
    "CREATE TABLE IF NOT EXISTS launch_queue ("
    " udid VARCHAR(64) NOT NULL,"
    " ip VARCHAR(64),"
    " bundle_id VARCHAR(255),"
    " status INT NOT NULL DEFAULT 0,"
    " error VARCHAR(255),"
    " ordinal INTEGER PRIMARY KEY AUTOINCREMENT);";
}

const char* queueKindName(QueueKind kind) noexcept {
    return kind == QueueKind::Mount ? "mount" : "launch";
}

QueueStore::QueueStore(QueueStoreOptions options) : options_(std::move(options)) {
    if (options_.attempts < 1) {
        options_.attempts = 1;
    }
    if (!options_.sleep) {
        options_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::unique_ptr<Database> QueueStore::connect(std::string& error) const noexcept {
    return Database::open(options_.database, options_.busyTimeout, error);
}

bool QueueStore::ensureSchema(std::string& error) noexcept {
    auto db = connect(error);
    if (!db) {
        return false;
    }
    if (db->exec(kSchema) != SQLITE_OK) {
        error = "Failed to create schema: " + db->errorMessage();
        return false;
    }
    return true;
}

QueueStore::Attempt QueueStore::retryWhileBusy(const std::string& operation,
                                               const std::function<Attempt()>& step) const {
    for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
        Attempt outcome = step();
        if (outcome != Attempt::Busy) {
            return outcome;
        }
        LOG_WARN("Storage busy during " + operation + " (attempt " + std::to_string(attempt) + "/" +
                 std::to_string(options_.attempts) + ")");
        if (attempt < options_.attempts) {
            options_.sleep(options_.backoff);
        }
    }
    return Attempt::Busy;
}

std::string QueueStore::busyMessage() const {
    return "storage busy after " + std::to_string(options_.attempts) + " attempts";
}

EnqueueResult QueueStore::enqueue(QueueKind kind, const DeviceId& device,
                                  const EntryMetadata& metadata) noexcept {
    EnqueueResult result;
    try {
        std::string error;
        auto db = connect(error);
        if (!db) {
            result.failure = Failure::backend(Stage::QueueCheck, error);
            return result;
        }

        Attempt outcome = retryWhileBusy(std::string(queueKindName(kind)) + " enqueue for " + device, [&] {
            return tryEnqueue(*db, kind, device, metadata, result);
        });
        if (outcome == Attempt::Busy) {
            result.failure = Failure::backend(Stage::QueueCheck, busyMessage());
            return result;
        }
        if (outcome == Attempt::Failed) {
            return result;
        }

        result.ok = true;
        LOG_DEBUG(std::string("Enqueued ") + queueKindName(kind) + " entry " +
                  std::to_string(result.ordinal) + " for " + device +
                  (result.duplicate ? " (existing)" : ""));
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.failure = Failure::backend(Stage::QueueCheck, e.what());
        return result;
    }
}

QueueStore::Attempt QueueStore::tryEnqueue(Database& db, QueueKind kind, const DeviceId& device,
                                           const EntryMetadata& metadata,
                                           EnqueueResult& result) noexcept {
    auto failed = [&](const std::string& what) {
        result.failure = Failure::backend(Stage::QueueCheck, what + ": " + db.errorMessage());
        return Attempt::Failed;
    };

    Transaction tx(db);
    int rc = tx.begin();
    if (Database::isBusy(rc)) return Attempt::Busy;
    if (rc != SQLITE_OK) return failed("begin");

    // One live entry per device and kind
    auto existing = db.prepare(std::string("SELECT ordinal FROM ") + tableFor(kind) +
                               " WHERE udid = ?1 AND status IN (0, 1) ORDER BY ordinal LIMIT 1", rc);
    if (!existing) {
        return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
    }
    existing->bind(1, device);
    rc = existing->step();
    if (rc == SQLITE_ROW) {
        result.ordinal = existing->columnInt(0);
        result.duplicate = true;
        return Attempt::Done;
    }
    if (Database::isBusy(rc)) return Attempt::Busy;
    if (rc != SQLITE_DONE) return failed("lookup");

    auto purge = db.prepare(std::string("DELETE FROM ") + tableFor(kind) +
                            " WHERE udid = ?1 AND status = 2", rc);
    if (!purge) {
        return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
    }
    purge->bind(1, device);
    rc = purge->step();
    if (Database::isBusy(rc)) return Attempt::Busy;
    if (rc != SQLITE_DONE) return failed("purge");

    auto insert = db.prepare(insertSql(kind), rc);
    if (!insert) {
        return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
    }
    insert->bind(1, device);
    insert->bind(2, metadata.address);
    if (kind == QueueKind::Launch) {
        insert->bind(3, metadata.bundleId);
    }
    rc = insert->step();
    if (Database::isBusy(rc)) return Attempt::Busy;
    if (rc != SQLITE_DONE) return failed("insert");
    result.ordinal = db.lastInsertRowid();
    result.duplicate = false;

    rc = tx.commit();
    if (Database::isBusy(rc)) return Attempt::Busy;
    if (rc != SQLITE_OK) return failed("commit");
    return Attempt::Done;
}

QueueStatus QueueStore::queryStatus(QueueKind kind, const DeviceId& device) noexcept {
    try {
        std::string error;
        auto db = connect(error);
        if (!db) {
            return QueueStatus::backendError(error);
        }

        QueueStatus status;
        Attempt outcome = retryWhileBusy(std::string(queueKindName(kind)) + " status for " + device, [&] {
            return tryQueryStatus(*db, kind, device, status);
        });
        if (outcome == Attempt::Busy) {
            return QueueStatus::backendError(busyMessage());
        }
        return status;
    } catch (const std::exception& e) {
        return QueueStatus::backendError(e.what());
    }
}

QueueStore::Attempt QueueStore::tryQueryStatus(Database& db, QueueKind kind, const DeviceId& device,
                                               QueueStatus& status) noexcept {
    try {
        auto failed = [&](const std::string& what) {
            status = QueueStatus::backendError(what + ": " + db.errorMessage());
            return Attempt::Failed;
        };

        int rc = SQLITE_OK;
        auto lookup = db.prepare(std::string("SELECT ordinal, status FROM ") + tableFor(kind) +
                                 " WHERE udid = ?1 ORDER BY ordinal LIMIT 1", rc);
        if (!lookup) {
            return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
        }
        lookup->bind(1, device);
        rc = lookup->step();
        if (rc == SQLITE_DONE) {
            status = QueueStatus::notQueued();
            return Attempt::Done;
        }
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_ROW) return failed("lookup");

        Ordinal ordinal = lookup->columnInt(0);
        auto state = static_cast<EntryStatus>(lookup->columnInt(1));
        lookup.reset();

        switch (state) {
            case EntryStatus::InProgress:
                status = QueueStatus::inProgress();
                return Attempt::Done;
            case EntryStatus::Error:
                return consumeError(db, kind, ordinal, status);
            case EntryStatus::Pending:
                break;
            default:
                status = QueueStatus::backendError("unknown status " + std::to_string(static_cast<int>(state)));
                return Attempt::Failed;
        }

        auto ahead = db.prepare(std::string("SELECT COUNT(*) FROM ") + tableFor(kind) +
                                " WHERE status = 0 AND ordinal < ?1", rc);
        if (!ahead) {
            return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
        }
        ahead->bind(1, ordinal);
        rc = ahead->step();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_ROW) return failed("count");
        status = QueueStatus::queuedAt(static_cast<std::size_t>(ahead->columnInt(0)));
        return Attempt::Done;
    } catch (const std::exception& e) {
        status = QueueStatus::backendError(e.what());
        return Attempt::Failed;
    }
}

QueueStore::Attempt QueueStore::consumeError(Database& db, QueueKind kind, Ordinal ordinal,
                                             QueueStatus& status) noexcept {
    try {
        auto failed = [&](const std::string& what) {
            status = QueueStatus::backendError(what + ": " + db.errorMessage());
            return Attempt::Failed;
        };

        Transaction tx(db);
        int rc = tx.begin();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_OK) return failed("begin");

        auto read = db.prepare(std::string("SELECT error FROM ") + tableFor(kind) +
                               " WHERE ordinal = ?1 AND status = 2", rc);
        if (!read) {
            return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
        }
        read->bind(1, ordinal);
        rc = read->step();
        if (rc == SQLITE_DONE) {
            // Another reader consumed it first
            status = QueueStatus::notQueued();
            return Attempt::Done;
        }
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_ROW) return failed("read error");
        std::string message = read->columnText(0);
        read.reset();

        auto drop = db.prepare(std::string("DELETE FROM ") + tableFor(kind) + " WHERE ordinal = ?1", rc);
        if (!drop) {
            return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
        }
        drop->bind(1, ordinal);
        rc = drop->step();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_DONE) return failed("delete");
        drop.reset();

        rc = tx.commit();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_OK) return failed("commit");
        status = QueueStatus::failed(message.empty() ? "unknown error" : message);
        return Attempt::Done;
    } catch (const std::exception& e) {
        status = QueueStatus::backendError(e.what());
        return Attempt::Failed;
    }
}

bool QueueStore::clear(QueueKind kind, std::string& error) noexcept {
    try {
        auto db = connect(error);
        if (!db) {
            return false;
        }
        Attempt outcome = retryWhileBusy(std::string("clearing ") + tableFor(kind), [&] {
            int rc = db->exec(std::string("DELETE FROM ") + tableFor(kind));
            if (Database::isBusy(rc)) return Attempt::Busy;
            if (rc != SQLITE_OK) {
                error = std::string("Failed to clear ") + tableFor(kind) + ": " + db->errorMessage();
                return Attempt::Failed;
            }
            return Attempt::Done;
        });
        if (outcome == Attempt::Busy) {
            error = std::string("Failed to clear ") + tableFor(kind) + ": " + busyMessage();
        }
        return outcome == Attempt::Done;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

ClaimResult QueueStore::claimNext(QueueKind kind) noexcept {
    ClaimResult result;
    try {
        auto db = connect(result.error);
        if (!db) {
            return result;
        }

        Attempt outcome = retryWhileBusy(std::string(queueKindName(kind)) + " claim", [&] {
            return tryClaim(*db, kind, result);
        });
        if (outcome == Attempt::Busy) {
            result.error = busyMessage();
        }
        result.ok = outcome == Attempt::Done;
        if (!result.ok) {
            result.entry.reset();
        }
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.entry.reset();
        result.error = e.what();
        return result;
    }
}

QueueStore::Attempt QueueStore::tryClaim(Database& db, QueueKind kind, ClaimResult& result) noexcept {
    try {
        auto failed = [&](const std::string& what) {
            result.error = what + ": " + db.errorMessage();
            return Attempt::Failed;
        };
        result.entry.reset();

        Transaction tx(db);
        int rc = tx.begin();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_OK) return failed("begin");

        auto next = db.prepare(claimSql(kind), rc);
        if (!next) {
            return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
        }
        rc = next->step();
        if (rc == SQLITE_DONE) {
            return Attempt::Done;
        }
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_ROW) return failed("select");

        QueueEntry entry;
        entry.kind = kind;
        entry.ordinal = next->columnInt(0);
        entry.deviceId = next->columnText(1);
        entry.address = next->columnOptionalText(2);
        entry.bundleId = next->columnOptionalText(3);
        entry.status = EntryStatus::InProgress;
        next.reset();

        auto mark = db.prepare(std::string("UPDATE ") + tableFor(kind) + " SET status = 1 WHERE ordinal = ?1", rc);
        if (!mark) {
            return Database::isBusy(rc) ? Attempt::Busy : failed("prepare");
        }
        mark->bind(1, entry.ordinal);
        rc = mark->step();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_DONE) return failed("update");
        mark.reset();

        rc = tx.commit();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_OK) return failed("commit");
        result.entry = std::move(entry);
        return Attempt::Done;
    } catch (const std::exception& e) {
        result.error = e.what();
        return Attempt::Failed;
    }
}

QueueStore::Attempt QueueStore::trySettle(Database& db, const std::string& sql, Ordinal ordinal,
                                          const std::string* message, std::string& error) noexcept {
    try {
        int rc = SQLITE_OK;
        auto statement = db.prepare(sql, rc);
        if (!statement) {
            if (Database::isBusy(rc)) return Attempt::Busy;
            error = db.errorMessage();
            return Attempt::Failed;
        }
        if (message != nullptr) {
            statement->bind(1, *message);
            statement->bind(2, ordinal);
        } else {
            statement->bind(1, ordinal);
        }
        rc = statement->step();
        if (Database::isBusy(rc)) return Attempt::Busy;
        if (rc != SQLITE_DONE) {
            error = db.errorMessage();
            return Attempt::Failed;
        }
        return Attempt::Done;
    } catch (const std::exception& e) {
        error = e.what();
        return Attempt::Failed;
    }
}

bool QueueStore::complete(QueueKind kind, Ordinal ordinal) noexcept {
    try {
        std::string error;
        auto db = connect(error);
        if (!db) {
            LOG_ERROR("complete: " + error);
            return false;
        }
        std::string sql = std::string("DELETE FROM ") + tableFor(kind) + " WHERE ordinal = ?1";
        Attempt outcome = retryWhileBusy(std::string("completing ") + queueKindName(kind) + " entry " +
                                             std::to_string(ordinal),
                                         [&] { return trySettle(*db, sql, ordinal, nullptr, error); });
        if (outcome != Attempt::Done) {
            LOG_ERROR("complete: " + (outcome == Attempt::Busy ? busyMessage() : error));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("complete: ") + e.what());
        return false;
    }
}

bool QueueStore::fail(QueueKind kind, Ordinal ordinal, const std::string& message) noexcept {
    try {
        std::string error;
        auto db = connect(error);
        if (!db) {
            LOG_ERROR("fail: " + error);
            return false;
        }
        std::string sql = std::string("UPDATE ") + tableFor(kind) + " SET status = 2, error = ?1 WHERE ordinal = ?2";
        Attempt outcome = retryWhileBusy(std::string("failing ") + queueKindName(kind) + " entry " +
                                             std::to_string(ordinal),
                                         [&] { return trySettle(*db, sql, ordinal, &message, error); });
        if (outcome != Attempt::Done) {
            LOG_ERROR("fail: " + (outcome == Attempt::Busy ? busyMessage() : error));
            return false;
        }
        return db->changes() > 0;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("fail: ") + e.what());
        return false;
    }
}

std::string describeStatus(const QueueStatus& status) {
    switch (status.state) {
        case QueueState::NotQueued:    return "not queued";
        case QueueState::Queued:       return "queued, position " + std::to_string(status.position);
        case QueueState::InProgress:   return "in progress";
        case QueueState::Failed:       return "failed: " + status.message;
        case QueueState::BackendError: return "storage error: " + status.message;
    }
    return "unknown";
}

}
