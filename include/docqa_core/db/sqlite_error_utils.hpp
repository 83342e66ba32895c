#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docqa_core {

// Coarse classes of SQLite failure reported by the cache database
enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Corrupt, Schema, Generic };

struct DbErrorInfo {
  DbErrorKind kind;
  const char* label;
  // Worth retrying later: another connection holds the lock
  bool transient;
};

inline DbErrorInfo describe_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return {DbErrorKind::BusyOrLocked, "busy_or_locked", true};
    case SQLITE_CONSTRAINT:
      return {DbErrorKind::Constraint, "constraint", false};
    case SQLITE_READONLY:
      return {DbErrorKind::Readonly, "readonly", false};
    case SQLITE_IOERR:
      return {DbErrorKind::Io, "io", false};
    case SQLITE_CANTOPEN:
      return {DbErrorKind::CantOpen, "cantopen", false};
    case SQLITE_FULL:
      return {DbErrorKind::Full, "disk_full", false};
    // A wrong SQLCipher key surfaces as SQLITE_NOTADB
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return {DbErrorKind::Corrupt, "corrupt_or_wrong_key", false};
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return {DbErrorKind::Schema, "schema", false};
    default:
      return {DbErrorKind::Generic, "generic", false};
  }
}

inline DbErrorKind classify_sqlite_code(int primary_code) {
  return describe_sqlite_code(primary_code).kind;
}

/**
 * @brief One-line description of a failed cache statement.
 *
 * "<operation> failed: (<label>[, transient]) <sqlite message> [code=N, xcode=M]"
 */
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const DbErrorInfo info = describe_sqlite_code(e.get_code());
  std::string msg = operation + " failed: (" + info.label;
  if (info.transient) {
    msg += ", transient";
  }
  msg += ") " + std::string(e.errstr());
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

}  // namespace docqa_core
