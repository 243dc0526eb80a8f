#pragma once

struct sqlite3;

namespace sv {

// Bring the manifest schema up to targetVersion. Each step runs in its own
// transaction and is recorded in schema_version, so a step is applied exactly
// once. Downgrades are refused.
bool applyMigrations(sqlite3* db, int targetVersion);

// Highest version recorded in schema_version.
// Returns 0 if the table does not exist yet (fresh database).
int currentSchemaVersion(sqlite3* db);

} // namespace sv
