#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace recall_core {

enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  Full,
  NotADatabase,  // wrong key or not a SQLCipher file
  Corrupt,
  Interrupted,
  Schema,
  Generic
};

// Only the primary code (low byte) matters; extended codes refine it.
inline DbErrorKind classify_sqlite_code(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    case SQLITE_CORRUPT:
      return DbErrorKind::Corrupt;
    case SQLITE_INTERRUPT:
      return DbErrorKind::Interrupted;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline const char *kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::NotADatabase: return "notadb";
    case DbErrorKind::Corrupt: return "corrupt";
    case DbErrorKind::Interrupted: return "interrupted";
    case DbErrorKind::Schema: return "schema";
    default: return "generic";
  }
}

// Failures caused by the state of the storage layer rather than by the
// request; the same request may succeed later.
inline bool is_transient(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
    case DbErrorKind::Readonly:
    case DbErrorKind::Io:
    case DbErrorKind::CantOpen:
    case DbErrorKind::Full:
    case DbErrorKind::Interrupted:
      return true;
    default:
      return false;
  }
}

// "<operation> failed: (<kind>) <sqlite message> [code=N, xcode=M] sql: <statement>"
inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  std::string msg = operation + " failed: (" + kind_to_string(classify_sqlite_code(e.get_code())) +
                    ") " + e.what();
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  const std::string sql = e.get_sql();
  if (!sql.empty()) {
    msg += " sql: " + sql;
  }
  return msg;
}

}  // namespace recall_core
