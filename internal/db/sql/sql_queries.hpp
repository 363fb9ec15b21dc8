#pragma once

#include <array>

namespace permit::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  may_read/may_write/may_manage are nullable booleans on disk:
    NULL = unspecified (merge), 1 = grant, 0 = revoke
*/

static constexpr std::array<const char*, 2> SCHEMA_MIGRATIONS = {
    "CREATE TABLE IF NOT EXISTS permission_change ("
    " id TEXT PRIMARY KEY,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " status_code INTEGER,"
    " status_message TEXT,"
    " user_id TEXT NOT NULL,"
    " metadata_key TEXT,"
    " metadata_value TEXT,"
    " realm_url TEXT NOT NULL,"
    " may_read INTEGER,"
    " may_write INTEGER,"
    " may_manage INTEGER);",
    "CREATE INDEX IF NOT EXISTS permission_change_status ON permission_change(status_code);",
};

#define PERMIT_PERMISSION_CHANGE_COLUMNS                                                                    \
  "id,created_at_ms,updated_at_ms,status_code,status_message,user_id,metadata_key,metadata_value,realm_url," \
  "may_read,may_write,may_manage"

static constexpr const char* INSERT_PERMISSION_CHANGE =
    "INSERT INTO permission_change(" PERMIT_PERMISSION_CHANGE_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PERMISSION_CHANGE =
    "SELECT " PERMIT_PERMISSION_CHANGE_COLUMNS " FROM permission_change WHERE id=?;";

static constexpr const char* LIST_PERMISSION_CHANGES =
    "SELECT " PERMIT_PERMISSION_CHANGE_COLUMNS " FROM permission_change"
    " WHERE (?1 = 0 OR (?1 = 1 AND status_code IS NULL) OR (?1 = 2 AND status_code IS NOT NULL))"
    " AND (?2 IS NULL OR realm_url = ?2)"
    " ORDER BY created_at_ms, id;";

// Terminal write happens at most once; a zero change count means missing or already set.
static constexpr const char* SET_STATUS =
    "UPDATE permission_change SET status_code=?, status_message=?, updated_at_ms=COALESCE(?, updated_at_ms)"
    " WHERE id=? AND status_code IS NULL;";

static constexpr const char* EXISTS_PERMISSION_CHANGE =
    "SELECT 1 FROM permission_change WHERE id=?;";

static constexpr const char* DELETE_PERMISSION_CHANGE =
    "DELETE FROM permission_change WHERE id=?;";

} // namespace permit::db::sql
