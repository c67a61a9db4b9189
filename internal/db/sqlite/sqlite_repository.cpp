#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace kbsync::db::sqlite {

using kbsync::db::ErrorCode;
using kbsync::db::Result;
using kbsync::model::DocumentStatus;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement PrepareOn(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void Bind(sqlite3_stmt* st, const sql::Params& params) {
  int idx = 1;
  for (const auto& p : params) {
    if (std::holds_alternative<std::nullptr_t>(p)) {
      sqlite3_bind_null(st, idx);
    } else if (const auto* i = std::get_if<int64_t>(&p)) {
      sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*i));
    } else if (const auto* d = std::get_if<double>(&p)) {
      sqlite3_bind_double(st, idx, *d);
    } else {
      const auto& s = std::get<std::string>(p);
      sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    ++idx;
  }
}

sql::Param OptText(const std::optional<std::string>& v) {
  if (!v) return nullptr;
  return *v;
}

sql::Param OptTime(const std::optional<util::TimePoint>& v) {
  if (!v) return nullptr;
  return util::FormatTimestamp(*v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return util::ParseTimestamp(ColText(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

sql::Params DocumentParams(const model::DocumentRecord& r) {
  return {
      r.filename,
      r.filepath,
      std::string(kbsync::model::ToString(r.status)),
      util::FormatTimestamp(r.created_at),
      r.last_modified_time,
      OptTime(r.process_at),
      OptTime(r.finish_at),
      OptText(r.failed_msg),
      r.file_size,
      OptText(r.file_hash),
      OptText(r.file_store_path),
      OptText(r.knowledge_id),
  };
}

model::DocumentRecord ReadDocument(sqlite3_stmt* st) {
  model::DocumentRecord r;
  r.id                 = ColI64(st, 0);
  r.filename           = ColText(st, 1);
  r.filepath           = ColText(st, 2);
  r.status             = kbsync::model::ParseDocumentStatus(ColText(st, 3)).value_or(DocumentStatus::kUnknown);
  r.created_at         = util::ParseTimestamp(ColText(st, 4)).value_or(util::TimePoint{});
  r.last_modified_time = sqlite3_column_double(st, 5);
  r.process_at         = ColOptTime(st, 6);
  r.finish_at          = ColOptTime(st, 7);
  r.failed_msg         = ColOptText(st, 8);
  r.file_size          = ColI64(st, 9);
  r.file_hash          = ColOptText(st, 10);
  r.file_store_path    = ColOptText(st, 11);
  r.knowledge_id       = ColOptText(st, 12);
  return r;
}

model::ScriptRunRecord ReadRun(sqlite3_stmt* st) {
  model::ScriptRunRecord r;
  r.id                = ColI64(st, 0);
  r.script_name       = ColText(st, 1);
  r.process_duration  = sqlite3_column_double(st, 2);
  r.process_count     = ColI64(st, 3);
  r.insert_count      = ColI64(st, 4);
  r.update_count      = ColI64(st, 5);
  r.delete_count      = ColI64(st, 6);
  r.process_timestamp = util::ParseTimestamp(ColText(st, 7)).value_or(util::TimePoint{});
  r.status            = ColText(st, 8);
  r.failed_reason     = ColText(st, 9);
  return r;
}

// WHERE clause + params for a filter.
std::string FilterClause(const DocumentFilter& filter, sql::Params& params) {
  std::string where;
  auto        add = [&where](const char* cond) {
    where += where.empty() ? " WHERE " : " AND ";
    where += cond;
  };
  if (filter.status) {
    add("file_status=?");
    params.emplace_back(std::string(kbsync::model::ToString(*filter.status)));
  }
  if (filter.exclude_deleted) {
    add("file_status<>?");
    params.emplace_back(std::string(kbsync::model::ToString(DocumentStatus::kDeleted)));
  }
  return where;
}

const char* OrderClause(DocumentOrder order) {
  switch (order) {
    case DocumentOrder::kInsertion:
      return " ORDER BY id ASC";
    case DocumentOrder::kNewestFirst:
      return " ORDER BY created_at DESC, id DESC";
    case DocumentOrder::kRecentlyFinished:
      return " ORDER BY finish_at DESC, id DESC";
  }
  return " ORDER BY id ASC";
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kDeferred);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_DOCUMENT, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);
  Bind(st.get(), DocumentParams(r));

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocument(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOn(db, sql::SELECT_DOCUMENT_BY_ID);
  Bind(st.get(), {id});

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ReadDocument(st.get());
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
  return std::nullopt;
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocumentByPath(Transaction& t, const std::string& filepath) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOn(db, sql::SELECT_DOCUMENT_BY_PATH);
  Bind(st.get(), {filepath});

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ReadDocument(st.get());
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
  return std::nullopt;
}

Result SqliteRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_DOCUMENT, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  auto params = DocumentParams(r);
  params.emplace_back(r.id);
  Bind(st.get(), params);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "document " + std::to_string(r.id));
  return Result::Ok();
}

std::vector<model::DocumentRecord> SqliteRepository::ListDocuments(Transaction& t, const DocumentFilter& filter, const Pagination& page) {
  auto* db = TX(t).Handle();

  sql::Params params;
  std::string query = sql::SELECT_DOCUMENTS;
  query += FilterClause(filter, params);
  query += OrderClause(filter.order);
  if (page.limit > 0 || page.offset > 0) {
    // LIMIT -1 is unbounded in sqlite
    query += " LIMIT ? OFFSET ?";
    params.emplace_back(page.limit > 0 ? static_cast<int64_t>(page.limit) : int64_t{-1});
    params.emplace_back(static_cast<int64_t>(page.offset));
  }
  query += ";";

  auto st = PrepareOn(db, query);
  Bind(st.get(), params);

  std::vector<model::DocumentRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadDocument(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
  return out;
}

int64_t SqliteRepository::CountDocuments(Transaction& t, const DocumentFilter& filter) {
  auto* db = TX(t).Handle();

  sql::Params params;
  std::string query = sql::COUNT_DOCUMENTS;
  query += FilterClause(filter, params);
  query += ";";

  auto st = PrepareOn(db, query);
  Bind(st.get(), params);

  if (sqlite3_step(st.get()) != SQLITE_ROW) throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
  return ColI64(st.get(), 0);
}

std::vector<StatusCount> SqliteRepository::CountByStatus(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOn(db, sql::COUNT_BY_STATUS);

  std::vector<StatusCount> out;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(StatusCount{.status = ColText(st.get(), 0), .count = ColI64(st.get(), 1)});
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
  return out;
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertScriptRun(Transaction& t, model::ScriptRunRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_RUN, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);
  Bind(st.get(), {
                     r.script_name,
                     r.process_duration,
                     r.process_count,
                     r.insert_count,
                     r.update_count,
                     r.delete_count,
                     util::FormatTimestamp(r.process_timestamp),
                     r.status,
                     r.failed_reason.empty() ? sql::Param{nullptr} : sql::Param{r.failed_reason},
                 });

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::ScriptRunRecord> SqliteRepository::ListScriptRuns(Transaction& t, const std::string& script_name, std::size_t limit) {
  auto* db = TX(t).Handle();

  sql::Params params;
  std::string query = sql::SELECT_RUNS;
  if (!script_name.empty()) {
    query += " WHERE script_name=?";
    params.emplace_back(script_name);
  }
  query += " ORDER BY id DESC";
  if (limit > 0) {
    query += " LIMIT ?";
    params.emplace_back(static_cast<int64_t>(limit));
  }
  query += ";";

  auto st = PrepareOn(db, query);
  Bind(st.get(), params);

  std::vector<model::ScriptRunRecord> out;
  int                                 rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRun(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
  return out;
}

} // namespace kbsync::db::sqlite
