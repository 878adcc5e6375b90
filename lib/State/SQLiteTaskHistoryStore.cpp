//===-- SQLiteTaskHistoryStore.cpp ----------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2017 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "taskstate/State/TaskHistoryStore.h"

#include "taskstate/Basic/PlatformUtility.h"
#include "taskstate/State/TaskExecution.h"

#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <cstring>
#include <mutex>

#include <sqlite3.h>

using namespace taskstate;
using namespace taskstate::state;

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

namespace {

class SQLiteTaskHistoryStore : public TaskHistoryStore {
  /// Version History:
  /// * 1: Initial schema.
  static const int currentSchemaVersion = 1;

  std::string path;
  uint32_t clientSchemaVersion;
  /// If this is `true`, the database will be re-created if the client/schema
  /// version mismatches. If `false`, it will not be re-created but returns an
  /// error instead.
  bool recreateOnUnmatchedVersion;

  sqlite3 *db = nullptr;

  /// Whether a build transaction is open.
  bool inBuild = false;

  /// The mutex to protect all access to the database and statements.
  std::mutex dbMutex;

  std::string getCurrentErrorMessage() {
    int err_code = sqlite3_errcode(db);
    const char* err_message = sqlite3_errmsg(db);
    const char* filename = sqlite3_db_filename(db, "main");

    std::string out;
    llvm::raw_string_ostream outStream(out);
    outStream << "error: accessing task history database \""
              << (filename ? filename : path.c_str()) << "\": " << err_message;

    if (err_code == SQLITE_BUSY || err_code == SQLITE_LOCKED) {
      outStream << " Possibly there are two concurrent builds running in the same filesystem location.";
    }

    outStream.flush();
    return out;
  }

  bool createSchema(std::string *error_out) {
    char *cError = nullptr;

    // Create the schema in a single transaction.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr,
                              &cError);

    // Create the info table.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE info ("
             "id INTEGER PRIMARY KEY, "
             "version INTEGER, "
             "client_version INTEGER);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      char* query = sqlite3_mprintf(
        "INSERT INTO info VALUES (0, %d, %d);",
        currentSchemaVersion, clientSchemaVersion);
      result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
      sqlite3_free(query);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE task_executions ("
             "task_path STRING PRIMARY KEY, "
             "record BLOB, "
             "cache_key STRING);"),
        nullptr, nullptr, &cError);
    }

    // Sync changes to disk.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
    }

    if (result != SQLITE_OK) {
      *error_out = (std::string("unable to initialize database (") +
                    (cError ? cError : sqlite3_errstr(result)) + ")");
      sqlite3_free(cError);
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    return true;
  }

  bool open(std::string *error_out) {
    // The db is opened lazily whenever an operation on it occurs. Thus if it is
    // already open, we don't need to do any further work.
    if (db) return true;

    // Configure SQLite3 on first use.
    //
    // We attempt to set multi-threading mode, but can settle for serialized if
    // the library can't be reinitialized (there are only two modes).
    static int sqliteConfigureResult = []() -> int {
      // We access a single connection from multiple threads.
      return sqlite3_config(SQLITE_CONFIG_MULTITHREAD);
    }();
    if (sqliteConfigureResult != SQLITE_OK) {
      if (!sqlite3_threadsafe()) {
        *error_out = "unable to configure database: not thread-safe";
        return false;
      }
    }

    int result = sqlite3_open(path.c_str(), &db);
    if (result != SQLITE_OK) {
      *error_out = "unable to open database: " + std::string(
          sqlite3_errstr(result));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    sqlite3_busy_timeout(db, 5000);

    // Check the stored schema, if any.
    int version;
    uint32_t clientVersion = 0;
    sqlite3_stmt* stmt;
    result = sqlite3_prepare_v2(
      db, "SELECT version,client_version FROM info LIMIT 1",
      -1, &stmt, nullptr);
    if (result == SQLITE_ERROR) {
      version = -1;
    } else {
      if (result != SQLITE_OK) {
        *error_out = getCurrentErrorMessage();
        close();
        return false;
      }
      result = sqlite3_step(stmt);
      if (result == SQLITE_DONE) {
        version = -1;
      } else if (result == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
        clientVersion = sqlite3_column_int(stmt, 1);
      } else {
        *error_out = getCurrentErrorMessage();
        sqlite3_finalize(stmt);
        close();
        return false;
      }
      sqlite3_finalize(stmt);
    }

    if (version != currentSchemaVersion ||
        clientVersion != clientSchemaVersion) {
      // Close the database before we try to recreate it.
      sqlite3_close(db);
      db = nullptr;

      if (!recreateOnUnmatchedVersion) {
        *error_out = ("version mismatch (database-schema: " +
                      std::to_string(version) + ", requested schema: " +
                      std::to_string(currentSchemaVersion) +
                      ", database-client: " + std::to_string(clientVersion) +
                      ", requested client: " +
                      std::to_string(clientSchemaVersion) + ")");
        return false;
      }

      // Always recreate the database from scratch when the schema changes.
      if (basic::sys::unlink(path.c_str()) == -1 && errno != ENOENT) {
        *error_out = std::string("unable to unlink existing database: ") +
          basic::sys::strerror(errno);
        return false;
      }

      result = sqlite3_open(path.c_str(), &db);
      if (result != SQLITE_OK) {
        *error_out = "unable to open database: " + std::string(
            sqlite3_errstr(result));
        sqlite3_close(db);
        db = nullptr;
        return false;
      }
      sqlite3_busy_timeout(db, 5000);

      if (!createSchema(error_out))
        return false;
    }

    // Initialize prepared statements.
    result = sqlite3_prepare_v2(
      db, findExecutionStmtSQL,
      -1, &findExecutionStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertExecutionStmtSQL,
      -1, &insertExecutionStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, deleteExecutionStmtSQL,
      -1, &deleteExecutionStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, getTaskPathsStmtSQL,
      -1, &getTaskPathsStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    return true;
  }

  void close() {
    if (!db) return;

    // Destroy prepared statements.
    sqlite3_finalize(findExecutionStmt);
    findExecutionStmt = nullptr;
    sqlite3_finalize(insertExecutionStmt);
    insertExecutionStmt = nullptr;
    sqlite3_finalize(deleteExecutionStmt);
    deleteExecutionStmt = nullptr;
    sqlite3_finalize(getTaskPathsStmt);
    getTaskPathsStmt = nullptr;

    sqlite3_close(db);
    db = nullptr;
  }

  static constexpr const char *findExecutionStmtSQL = (
      "SELECT record FROM task_executions WHERE task_path == ? LIMIT 1;");
  sqlite3_stmt* findExecutionStmt = nullptr;

  static constexpr const char *insertExecutionStmtSQL = (
      "INSERT OR REPLACE INTO task_executions VALUES (?, ?, ?);");
  sqlite3_stmt* insertExecutionStmt = nullptr;

  static constexpr const char *deleteExecutionStmtSQL = (
      "DELETE FROM task_executions WHERE task_path == ?;");
  sqlite3_stmt* deleteExecutionStmt = nullptr;

  static constexpr const char *getTaskPathsStmtSQL = (
      "SELECT task_path FROM task_executions ORDER BY task_path;");
  sqlite3_stmt* getTaskPathsStmt = nullptr;

public:
  SQLiteTaskHistoryStore(StringRef path, uint32_t clientSchemaVersion,
                         bool recreateOnUnmatchedVersion)
    : path(path.str()), clientSchemaVersion(clientSchemaVersion),
      recreateOnUnmatchedVersion(recreateOnUnmatchedVersion) { }

  virtual ~SQLiteTaskHistoryStore() {
    std::lock_guard<std::mutex> guard(dbMutex);
    if (db) {
      if (inBuild)
        sqlite3_exec(db, "END;", nullptr, nullptr, nullptr);
      close();
    }
  }

  /// @name TaskHistoryStore API
  /// @{

  virtual bool lookupExecution(StringRef taskPath,
                               TaskExecution* execution_out,
                               std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    int result = sqlite3_reset(findExecutionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(findExecutionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(findExecutionStmt, /*index=*/1,
                               taskPath.data(), taskPath.size(),
                               SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    // If the task wasn't found, we are done.
    result = sqlite3_step(findExecutionStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    // Otherwise, decode the record from the row.
    int numRecordBytes = sqlite3_column_bytes(findExecutionStmt, 0);
    const void* recordBytes = sqlite3_column_blob(findExecutionStmt, 0);
    std::string decodeError;
    if (!TaskExecution::fromData(
            StringRef(static_cast<const char*>(recordBytes), numRecordBytes),
            execution_out, &decodeError)) {
      *error_out = "unexpected contents for task '" + taskPath.str() + "': " +
        decodeError;
      return false;
    }

    return true;
  }

  virtual bool setExecution(StringRef taskPath,
                            const TaskExecution& execution,
                            std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    auto record = execution.toData();
    auto cacheKey = execution.cacheKey.str();

    int result = sqlite3_reset(insertExecutionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(insertExecutionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertExecutionStmt, /*index=*/1,
                               taskPath.data(), taskPath.size(),
                               SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_blob(insertExecutionStmt, /*index=*/2,
                               record.data(), record.size(),
                               SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertExecutionStmt, /*index=*/3,
                               cacheKey.data(), cacheKey.size(),
                               SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(insertExecutionStmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return true;
  }

  virtual bool removeExecution(StringRef taskPath,
                               std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    int result = sqlite3_reset(deleteExecutionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(deleteExecutionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(deleteExecutionStmt, /*index=*/1,
                               taskPath.data(), taskPath.size(),
                               SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(deleteExecutionStmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return true;
  }

  virtual bool getTaskPaths(std::vector<std::string>& paths_out,
                            std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    int result = sqlite3_reset(getTaskPathsStmt);
    checkSQLiteResultOKReturnFalse(result);

    while ((result = sqlite3_step(getTaskPathsStmt)) == SQLITE_ROW) {
      auto size = sqlite3_column_bytes(getTaskPathsStmt, 0);
      auto text = (const char*) sqlite3_column_text(getTaskPathsStmt, 0);

      paths_out.push_back(std::string(text, size));
    }
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return true;
  }

  virtual bool buildStarted(std::string *error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    // Execute the entire build inside a single transaction.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr,
                              nullptr);
    checkSQLiteResultOKReturnFalse(result);

    inBuild = true;
    return true;
  }

  virtual bool buildComplete(std::string *error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!db)
      return true;

    // Sync changes to disk.
    bool success = true;
    if (inBuild) {
      inBuild = false;
      int result = sqlite3_exec(db, "END;", nullptr, nullptr, nullptr);
      if (result != SQLITE_OK) {
        *error_out = getCurrentErrorMessage();
        success = false;
      }
    }

    // We close the connection whenever a build completes so that we release
    // any locks that we may have on the file.
    close();
    return success;
  }

  virtual void dump(raw_ostream& os) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    std::string error;
    if (!open(&error)) {
      os << "error: " << error << "\n";
      return;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
        db, "SELECT task_path, cache_key, record FROM task_executions "
        "ORDER BY task_path;", -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
      os << getCurrentErrorMessage() << "\n";
      return;
    }

    os << "executions:\n";
    while (sqlite3_step(stmt) == SQLITE_ROW) {
      auto pathSize = sqlite3_column_bytes(stmt, 0);
      auto pathText = (const char*) sqlite3_column_text(stmt, 0);
      auto keySize = sqlite3_column_bytes(stmt, 1);
      auto keyText = (const char*) sqlite3_column_text(stmt, 1);
      auto recordSize = sqlite3_column_bytes(stmt, 2);
      auto recordBytes = (const char*) sqlite3_column_blob(stmt, 2);

      os << StringRef(pathText, pathSize) << " -- "
         << StringRef(keyText, keySize) << ", " << recordSize << " bytes\n";

      TaskExecution execution;
      std::string decodeError;
      if (TaskExecution::fromData(StringRef(recordBytes, recordSize),
                                  &execution, &decodeError)) {
        execution.dump(os);
      } else {
        os << "  error: " << decodeError << "\n";
      }
    }

    sqlite3_finalize(stmt);
  }

  /// @}
};

}

std::unique_ptr<TaskHistoryStore>
state::createSQLiteTaskHistoryStore(StringRef path,
                                    uint32_t clientSchemaVersion,
                                    bool recreateOnUnmatchedVersion,
                                    std::string* error_out) {
  return std::make_unique<SQLiteTaskHistoryStore>(path, clientSchemaVersion,
                                                  recreateOnUnmatchedVersion);
}

#undef checkSQLiteResultOKReturnFalse
