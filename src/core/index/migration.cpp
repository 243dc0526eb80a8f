#include "core/index/migration.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <sqlite3.h>

namespace sv {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT MAX(version) FROM schema_version";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW
            && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            version = sqlite3_column_int(stmt, 0);
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(svIndex, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (!exec(kSchemaVersionTable)) {
        return false;
    }

    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(svIndex, "Manifest schema version %d is newer than supported version %d",
                  current, targetVersion);
        return false;
    }

    // Runs one step atomically and records it.
    auto step = [&](int version, const char* sql) -> bool {
        LOG_INFO(svIndex, "Applying manifest migration %d -> %d", version - 1, version);
        if (!exec("BEGIN IMMEDIATE")) {
            return false;
        }
        if (!exec(sql)) {
            exec("ROLLBACK");
            return false;
        }

        sqlite3_stmt* stmt = nullptr;
        bool recorded = false;
        if (sqlite3_prepare_v2(db,
                "INSERT INTO schema_version (version, applied_at) VALUES (?1, ?2)",
                -1, &stmt, nullptr) == SQLITE_OK) {
            const QByteArray appliedAt =
                QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toUtf8();
            sqlite3_bind_int(stmt, 1, version);
            sqlite3_bind_text(stmt, 2, appliedAt.constData(), static_cast<int>(appliedAt.size()),
                              SQLITE_TRANSIENT);
            recorded = sqlite3_step(stmt) == SQLITE_DONE;
        }
        sqlite3_finalize(stmt);

        if (!recorded) {
            LOG_ERROR(svIndex, "Failed to record schema version %d: %s",
                      version, sqlite3_errmsg(db));
            exec("ROLLBACK");
            return false;
        }
        return exec("COMMIT");
    };

    if (current < 1 && targetVersion >= 1) {
        if (!step(1, kSchemaV1)) {
            return false;
        }
        current = 1;
    }

    if (current < 2 && targetVersion >= 2) {
        if (!step(2, kSchemaV2)) {
            return false;
        }
        current = 2;
    }

    return current == targetVersion;
}

} // namespace sv
