#include "ragsync/knowledge/sqlite_source.hpp"

#include "ragsync/common/fs.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <memory>
#include <sstream>

namespace ragsync::knowledge {

namespace {

constexpr const char *kStartedAtKey = "started_at_ms";
constexpr const char *kLastDeactivationKey = "last_deactivation_ms";

struct DbCloser {
  void operator()(sqlite3 *db) const {
    if (db != nullptr) {
      sqlite3_close(db);
    }
  }
};

struct StmtFinalizer {
  void operator()(sqlite3_stmt *stmt) const {
    if (stmt != nullptr) {
      sqlite3_finalize(stmt);
    }
  }
};

using DbPtr = std::unique_ptr<sqlite3, DbCloser>;
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

common::Status unavailable(const std::string &message) {
  return common::Status::error(common::ErrorCode::SourceUnavailable, message);
}

common::Status db_error(sqlite3 *db, const std::string &context) {
  return unavailable(context + ": " + (db == nullptr ? "sqlite error" : sqlite3_errmsg(db)));
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return unavailable(msg);
  }
  return common::Status::success();
}

common::Result<DbPtr> open_db(const std::filesystem::path &path, const std::uint64_t busy_timeout_ms,
                              const bool create) {
  sqlite3 *raw = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | (create ? SQLITE_OPEN_CREATE : 0) |
                    SQLITE_OPEN_NOMUTEX;
  const int rc = sqlite3_open_v2(path.string().c_str(), &raw, flags, nullptr);
  DbPtr db(raw);
  if (rc != SQLITE_OK) {
    return common::Result<DbPtr>::failure(db_error(db.get(), "cannot open " + path.string()));
  }
  sqlite3_busy_timeout(db.get(), static_cast<int>(busy_timeout_ms));
  return common::Result<DbPtr>::success(std::move(db));
}

common::Result<StmtPtr> prepare(sqlite3 *db, const char *sql) {
  sqlite3_stmt *raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return common::Result<StmtPtr>::failure(db_error(db, "prepare failed"));
  }
  return common::Result<StmtPtr>::success(StmtPtr(raw));
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

KnowledgeEntry row_to_entry(sqlite3_stmt *stmt) {
  return KnowledgeEntry{.id = sqlite3_column_int64(stmt, 0),
                        .tag = column_text(stmt, 1),
                        .question = column_text(stmt, 2),
                        .answer = column_text(stmt, 3),
                        .active = sqlite3_column_int(stmt, 4) != 0,
                        .last_modified = common::from_unix_ms(sqlite3_column_int64(stmt, 5))};
}

common::Result<std::vector<KnowledgeEntry>> collect_rows(sqlite3 *db, sqlite3_stmt *stmt) {
  std::vector<KnowledgeEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    entries.push_back(row_to_entry(stmt));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<KnowledgeEntry>>::failure(db_error(db, "query failed"));
  }
  return common::Result<std::vector<KnowledgeEntry>>::success(std::move(entries));
}

common::Result<std::optional<std::int64_t>> read_meta(sqlite3 *db, const char *key) {
  auto stmt = prepare(db, "SELECT value FROM source_meta WHERE key = ?1");
  if (!stmt.ok()) {
    return stmt.forward_failure<std::optional<std::int64_t>>();
  }
  sqlite3_bind_text(stmt.value().get(), 1, key, -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt.value().get());
  if (rc == SQLITE_ROW) {
    return common::Result<std::optional<std::int64_t>>::success(
        sqlite3_column_int64(stmt.value().get(), 0));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::optional<std::int64_t>>::failure(db_error(db, "meta read failed"));
  }
  return common::Result<std::optional<std::int64_t>>::success(std::nullopt);
}

common::Status write_meta(sqlite3 *db, const char *key, const std::int64_t value) {
  auto stmt = prepare(
      db, "INSERT INTO source_meta(key, value) VALUES(?1, ?2) "
          "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
  if (!stmt.ok()) {
    return stmt.status();
  }
  sqlite3_bind_text(stmt.value().get(), 1, key, -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.value().get(), 2, value);
  if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
    return db_error(db, "meta write failed");
  }
  return common::Status::success();
}

/// A write timestamp strictly greater than every stored one, so that the modification trigger
/// sees each change even when two land inside the same millisecond.
common::Result<std::int64_t> next_modification_ms(sqlite3 *db, const std::int64_t now_ms) {
  auto stmt = prepare(db, "SELECT COALESCE(MAX(last_modified_ms), 0) FROM knowledge_entries");
  if (!stmt.ok()) {
    return stmt.forward_failure<std::int64_t>();
  }
  if (sqlite3_step(stmt.value().get()) != SQLITE_ROW) {
    return common::Result<std::int64_t>::failure(db_error(db, "max timestamp read failed"));
  }
  const std::int64_t prev = sqlite3_column_int64(stmt.value().get(), 0);
  auto deactivated = read_meta(db, kLastDeactivationKey);
  if (!deactivated.ok()) {
    return deactivated.forward_failure<std::int64_t>();
  }
  const std::int64_t floor = std::max(prev, deactivated.value().value_or(0));
  return common::Result<std::int64_t>::success(std::max(now_ms, floor + 1));
}

/// Runs `body` inside BEGIN IMMEDIATE / COMMIT, rolling back when it fails.
template <typename Body> common::Status in_transaction(sqlite3 *db, Body &&body) {
  if (auto begin = exec_sql(db, "BEGIN IMMEDIATE;"); !begin.ok()) {
    return begin;
  }
  auto status = body();
  if (!status.ok()) {
    if (const auto rollback = exec_sql(db, "ROLLBACK;"); !rollback.ok()) {
      return common::Status::error(status.code(), status.error() + " (rollback failed: " +
                                                      rollback.error() + ")");
    }
    return status;
  }
  return exec_sql(db, "COMMIT;");
}

common::Status validate_question(const std::string &question) {
  if (common::trim(question).size() < SqliteKnowledgeSource::kMinQuestionLength) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "question must be at least " +
                                     std::to_string(SqliteKnowledgeSource::kMinQuestionLength) +
                                     " characters");
  }
  return common::Status::success();
}

common::Status validate_answer(const std::string &answer) {
  if (common::trim(answer).empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "answer must not be empty");
  }
  return common::Status::success();
}

} // namespace

SqliteKnowledgeSource::SqliteKnowledgeSource(std::filesystem::path db_path,
                                             const std::uint64_t busy_timeout_ms, Clock clock)
    : db_path_(std::move(db_path)), busy_timeout_ms_(busy_timeout_ms), clock_(std::move(clock)) {}

common::Status SqliteKnowledgeSource::initialize() {
  if (db_path_.has_parent_path()) {
    if (const auto dir = common::ensure_dir(db_path_.parent_path()); !dir.ok()) {
      return unavailable(dir.error());
    }
  }
  auto db = open_db(db_path_, busy_timeout_ms_, true);
  if (!db.ok()) {
    return db.status();
  }
  sqlite3 *handle = db.value().get();

  auto status = exec_sql(handle, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(handle, R"(
CREATE TABLE IF NOT EXISTS knowledge_entries (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  tag TEXT NOT NULL DEFAULT '',
  question TEXT NOT NULL,
  answer TEXT NOT NULL,
  active INTEGER NOT NULL DEFAULT 1,
  created_at_ms INTEGER NOT NULL,
  last_modified_ms INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(handle, R"(
CREATE INDEX IF NOT EXISTS idx_knowledge_active_modified
  ON knowledge_entries(active, last_modified_ms);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(handle, R"(
CREATE TABLE IF NOT EXISTS source_meta (
  key TEXT PRIMARY KEY,
  value INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  auto started = read_meta(handle, kStartedAtKey);
  if (!started.ok()) {
    return started.status();
  }
  if (!started.value().has_value()) {
    return write_meta(handle, kStartedAtKey, common::to_unix_ms(clock_()));
  }
  return common::Status::success();
}

common::Result<std::vector<KnowledgeEntry>> SqliteKnowledgeSource::list_active_entries() {
  return list_entries(false);
}

common::Result<std::vector<KnowledgeEntry>>
SqliteKnowledgeSource::list_entries(const bool include_inactive) {
  using ResultT = common::Result<std::vector<KnowledgeEntry>>;
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.forward_failure<std::vector<KnowledgeEntry>>();
  }
  const char *sql = include_inactive
                        ? "SELECT id, tag, question, answer, active, last_modified_ms "
                          "FROM knowledge_entries ORDER BY id ASC"
                        : "SELECT id, tag, question, answer, active, last_modified_ms "
                          "FROM knowledge_entries WHERE active = 1 ORDER BY id ASC";
  auto stmt = prepare(db.value().get(), sql);
  if (!stmt.ok()) {
    return stmt.forward_failure<std::vector<KnowledgeEntry>>();
  }
  auto rows = collect_rows(db.value().get(), stmt.value().get());
  if (!rows.ok()) {
    return ResultT::failure(rows.status());
  }
  return rows;
}

common::Result<std::optional<common::TimePoint>>
SqliteKnowledgeSource::max_modification_timestamp_of_active_entries() {
  using ResultT = common::Result<std::optional<common::TimePoint>>;
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.forward_failure<std::optional<common::TimePoint>>();
  }
  sqlite3 *handle = db.value().get();

  auto stmt = prepare(handle, "SELECT MAX(last_modified_ms) FROM knowledge_entries WHERE active = 1");
  if (!stmt.ok()) {
    return stmt.forward_failure<std::optional<common::TimePoint>>();
  }
  if (sqlite3_step(stmt.value().get()) != SQLITE_ROW) {
    return ResultT::failure(db_error(handle, "max timestamp read failed"));
  }
  std::optional<std::int64_t> max_ms;
  if (sqlite3_column_type(stmt.value().get(), 0) != SQLITE_NULL) {
    max_ms = sqlite3_column_int64(stmt.value().get(), 0);
  }

  // Removing a row from the active set is a change too, including the last active row.
  auto deactivated = read_meta(handle, kLastDeactivationKey);
  if (!deactivated.ok()) {
    return deactivated.forward_failure<std::optional<common::TimePoint>>();
  }
  if (deactivated.value().has_value()) {
    max_ms = std::max(max_ms.value_or(*deactivated.value()), *deactivated.value());
  }

  if (!max_ms.has_value()) {
    return ResultT::success(std::nullopt);
  }
  return ResultT::success(common::from_unix_ms(*max_ms));
}

common::Result<std::int64_t> SqliteKnowledgeSource::source_uptime_seconds() {
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.forward_failure<std::int64_t>();
  }
  auto started = read_meta(db.value().get(), kStartedAtKey);
  if (!started.ok()) {
    return started.forward_failure<std::int64_t>();
  }
  if (!started.value().has_value()) {
    return common::Result<std::int64_t>::failure(common::ErrorCode::SourceUnavailable,
                                                 "source start time is not recorded");
  }
  const std::int64_t elapsed_ms = common::to_unix_ms(clock_()) - *started.value();
  return common::Result<std::int64_t>::success(std::max<std::int64_t>(0, elapsed_ms / 1000));
}

common::Result<std::vector<KnowledgeEntry>>
SqliteKnowledgeSource::fetch_entries_by_ids(const std::vector<std::int64_t> &ids) {
  using ResultT = common::Result<std::vector<KnowledgeEntry>>;
  if (ids.empty()) {
    return ResultT::success({});
  }
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.forward_failure<std::vector<KnowledgeEntry>>();
  }

  std::ostringstream sql;
  sql << "SELECT id, tag, question, answer, active, last_modified_ms FROM knowledge_entries "
         "WHERE active = 1 AND id IN (";
  for (std::size_t i = 0; i < ids.size(); ++i) {
    sql << (i == 0 ? "?" : ",?");
  }
  sql << ")";
  const std::string text = sql.str();

  auto stmt = prepare(db.value().get(), text.c_str());
  if (!stmt.ok()) {
    return stmt.forward_failure<std::vector<KnowledgeEntry>>();
  }
  for (std::size_t i = 0; i < ids.size(); ++i) {
    sqlite3_bind_int64(stmt.value().get(), static_cast<int>(i + 1), ids[i]);
  }
  return collect_rows(db.value().get(), stmt.value().get());
}

common::Result<std::optional<KnowledgeEntry>> SqliteKnowledgeSource::get_entry(const std::int64_t id) {
  using ResultT = common::Result<std::optional<KnowledgeEntry>>;
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.forward_failure<std::optional<KnowledgeEntry>>();
  }
  auto stmt = prepare(db.value().get(),
                      "SELECT id, tag, question, answer, active, last_modified_ms "
                      "FROM knowledge_entries WHERE id = ?1");
  if (!stmt.ok()) {
    return stmt.forward_failure<std::optional<KnowledgeEntry>>();
  }
  sqlite3_bind_int64(stmt.value().get(), 1, id);
  auto rows = collect_rows(db.value().get(), stmt.value().get());
  if (!rows.ok()) {
    return rows.forward_failure<std::optional<KnowledgeEntry>>();
  }
  if (rows.value().empty()) {
    return ResultT::success(std::nullopt);
  }
  return ResultT::success(std::move(rows.value().front()));
}

common::Result<std::int64_t> SqliteKnowledgeSource::add_entry(const std::string &tag,
                                                              const std::string &question,
                                                              const std::string &answer) {
  if (const auto status = validate_question(question); !status.ok()) {
    return common::Result<std::int64_t>::failure(status);
  }
  if (const auto status = validate_answer(answer); !status.ok()) {
    return common::Result<std::int64_t>::failure(status);
  }

  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.forward_failure<std::int64_t>();
  }
  sqlite3 *handle = db.value().get();

  std::int64_t inserted_id = 0;
  const auto status = in_transaction(handle, [&]() -> common::Status {
    const std::int64_t now_ms = common::to_unix_ms(clock_());
    auto modified = next_modification_ms(handle, now_ms);
    if (!modified.ok()) {
      return modified.status();
    }
    auto stmt = prepare(handle,
                        "INSERT INTO knowledge_entries(tag, question, answer, active, "
                        "created_at_ms, last_modified_ms) VALUES(?1, ?2, ?3, 1, ?4, ?5)");
    if (!stmt.ok()) {
      return stmt.status();
    }
    sqlite3_bind_text(stmt.value().get(), 1, tag.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.value().get(), 2, question.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.value().get(), 3, answer.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.value().get(), 4, now_ms);
    sqlite3_bind_int64(stmt.value().get(), 5, modified.value());
    if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
      return db_error(handle, "insert failed");
    }
    inserted_id = sqlite3_last_insert_rowid(handle);
    return common::Status::success();
  });
  if (!status.ok()) {
    return common::Result<std::int64_t>::failure(status);
  }
  return common::Result<std::int64_t>::success(inserted_id);
}

common::Status SqliteKnowledgeSource::update_entry(const std::int64_t id, const EntryUpdate &update) {
  if (!update.tag.has_value() && !update.question.has_value() && !update.answer.has_value()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "nothing to update");
  }
  if (update.question.has_value()) {
    if (auto status = validate_question(*update.question); !status.ok()) {
      return status;
    }
  }
  if (update.answer.has_value()) {
    if (auto status = validate_answer(*update.answer); !status.ok()) {
      return status;
    }
  }

  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.status();
  }
  sqlite3 *handle = db.value().get();

  return in_transaction(handle, [&]() -> common::Status {
    auto modified = next_modification_ms(handle, common::to_unix_ms(clock_()));
    if (!modified.ok()) {
      return modified.status();
    }
    auto stmt = prepare(handle, "UPDATE knowledge_entries SET "
                                "tag = COALESCE(?1, tag), question = COALESCE(?2, question), "
                                "answer = COALESCE(?3, answer), last_modified_ms = ?4 "
                                "WHERE id = ?5");
    if (!stmt.ok()) {
      return stmt.status();
    }
    sqlite3_stmt *raw = stmt.value().get();
    const auto bind_optional = [raw](const int index, const std::optional<std::string> &value) {
      if (value.has_value()) {
        sqlite3_bind_text(raw, index, value->c_str(), -1, SQLITE_TRANSIENT);
      } else {
        sqlite3_bind_null(raw, index);
      }
    };
    bind_optional(1, update.tag);
    bind_optional(2, update.question);
    bind_optional(3, update.answer);
    sqlite3_bind_int64(raw, 4, modified.value());
    sqlite3_bind_int64(raw, 5, id);
    if (sqlite3_step(raw) != SQLITE_DONE) {
      return db_error(handle, "update failed");
    }
    if (sqlite3_changes(handle) == 0) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "no entry with id " + std::to_string(id));
    }
    return common::Status::success();
  });
}

common::Status SqliteKnowledgeSource::set_active(const std::int64_t id, const bool active) {
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.status();
  }
  sqlite3 *handle = db.value().get();

  return in_transaction(handle, [&]() -> common::Status {
    auto modified = next_modification_ms(handle, common::to_unix_ms(clock_()));
    if (!modified.ok()) {
      return modified.status();
    }
    auto stmt = prepare(handle, "UPDATE knowledge_entries SET active = ?1, last_modified_ms = ?2 "
                                "WHERE id = ?3 AND active != ?1");
    if (!stmt.ok()) {
      return stmt.status();
    }
    sqlite3_bind_int(stmt.value().get(), 1, active ? 1 : 0);
    sqlite3_bind_int64(stmt.value().get(), 2, modified.value());
    sqlite3_bind_int64(stmt.value().get(), 3, id);
    if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
      return db_error(handle, "update failed");
    }
    if (sqlite3_changes(handle) == 0) {
      auto existing = prepare(handle, "SELECT 1 FROM knowledge_entries WHERE id = ?1");
      if (!existing.ok()) {
        return existing.status();
      }
      sqlite3_bind_int64(existing.value().get(), 1, id);
      if (sqlite3_step(existing.value().get()) != SQLITE_ROW) {
        return common::Status::error(common::ErrorCode::InvalidArgument,
                                     "no entry with id " + std::to_string(id));
      }
      return common::Status::success();
    }
    if (!active) {
      return write_meta(handle, kLastDeactivationKey, modified.value());
    }
    return common::Status::success();
  });
}

common::Status SqliteKnowledgeSource::mark_restarted() {
  auto db = open_db(db_path_, busy_timeout_ms_, false);
  if (!db.ok()) {
    return db.status();
  }
  return write_meta(db.value().get(), kStartedAtKey, common::to_unix_ms(clock_()));
}

} // namespace ragsync::knowledge
