#include "finagent/metadata_store.hpp"

#include "finagent/error.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <memory>
#include <system_error>
#include <utility>

namespace finagent {
namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kCreateUploads = R"SQL(
  CREATE TABLE IF NOT EXISTS uploads (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_id TEXT UNIQUE NOT NULL,
    filename TEXT NOT NULL,
    provider TEXT,
    content_type TEXT NOT NULL,
    bytes INTEGER NOT NULL,
    uploaded_at TEXT NOT NULL
  );
)SQL";

constexpr const char* kCreateRuns = R"SQL(
  CREATE TABLE IF NOT EXISTS runs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    run_id TEXT UNIQUE NOT NULL,
    thread_id TEXT NOT NULL,
    assistant_id TEXT,
    status TEXT NOT NULL,
    schema_profile TEXT,
    metadata_json TEXT,
    started_at TEXT NOT NULL
  );
)SQL";

constexpr const char* kUpsertUpload = R"SQL(
  INSERT OR REPLACE INTO uploads
    (file_id, filename, provider, content_type, bytes, uploaded_at)
  VALUES (?,?,?,?,?,?)
)SQL";

constexpr const char* kUpsertRun = R"SQL(
  INSERT OR REPLACE INTO runs
    (run_id, thread_id, assistant_id, status, schema_profile, metadata_json, started_at)
  VALUES (?,?,?,?,?,?,?)
)SQL";

constexpr const char* kUpdateRunStatus = "UPDATE runs SET status = ? WHERE run_id = ?";

struct ConnectionCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

Connection open_connection(const std::filesystem::path& path) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.string().c_str(),
                           &raw,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  Connection db(raw);
  if (rc != SQLITE_OK) {
    std::string reason = db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc);
    throw PersistenceError("Failed to open " + path.string() + ": " + reason);
  }
  sqlite3_busy_timeout(db.get(), kBusyTimeoutMs);
  return db;
}

void exec_all(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw PersistenceError("SQLite exec failed: " + msg);
  }
}

Statement prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(raw);
    throw PersistenceError("SQLite prepare failed: " + err);
  }
  return Statement(raw);
}

void bind_text(sqlite3* db, sqlite3_stmt* st, int index, const std::string& value) {
  if (sqlite3_bind_text(st, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw PersistenceError(std::string("SQLite bind failed: ") + sqlite3_errmsg(db));
  }
}

void bind_optional_text(sqlite3* db, sqlite3_stmt* st, int index, const std::optional<std::string>& value) {
  if (!value) {
    if (sqlite3_bind_null(st, index) != SQLITE_OK) {
      throw PersistenceError(std::string("SQLite bind failed: ") + sqlite3_errmsg(db));
    }
    return;
  }
  bind_text(db, st, index, *value);
}

void bind_int64(sqlite3* db, sqlite3_stmt* st, int index, std::int64_t value) {
  if (sqlite3_bind_int64(st, index, value) != SQLITE_OK) {
    throw PersistenceError(std::string("SQLite bind failed: ") + sqlite3_errmsg(db));
  }
}

void step_done(sqlite3* db, sqlite3_stmt* st, const std::string& operation) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw PersistenceError(operation + " failed: " + sqlite3_errmsg(db));
  }
}

std::string compact_json(const std::map<std::string, std::string>& metadata) {
  nlohmann::json value = nlohmann::json::object();
  for (const auto& [key, entry] : metadata) {
    value[key] = entry;
  }
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

const char* to_string(RunStatus status) {
  switch (status) {
    case RunStatus::Queued:
      return "queued";
    case RunStatus::Running:
      return "running";
    case RunStatus::Completed:
      return "completed";
    case RunStatus::Failed:
      return "failed";
    case RunStatus::Cancelled:
      return "cancelled";
  }
  return "queued";
}

std::optional<RunStatus> parse_run_status(std::string_view value) {
  if (value == "queued") return RunStatus::Queued;
  if (value == "running") return RunStatus::Running;
  if (value == "completed") return RunStatus::Completed;
  if (value == "failed") return RunStatus::Failed;
  if (value == "cancelled") return RunStatus::Cancelled;
  return std::nullopt;
}

MetadataStore::MetadataStore(std::filesystem::path database_path, Logger logger)
    : database_path_(std::move(database_path)), logger_(std::move(logger)) {
  auto parent = database_path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw PersistenceError("Unable to create " + parent.string() + ": " + ec.message());
    }
  }
  initialise();
}

void MetadataStore::initialise() const {
  auto db = open_connection(database_path_);
  exec_all(db.get(), kCreateUploads);
  exec_all(db.get(), kCreateRuns);
  logger_.debug("metadata store ready", {{"database_path", database_path_.string()}});
}

void MetadataStore::log_upload(const UploadRecord& record) const {
  logger_.debug("Persisting upload metadata", {{"file_id", record.file_id}});
  auto db = open_connection(database_path_);
  auto st = prepare(db.get(), kUpsertUpload);
  int i = 1;
  bind_text(db.get(), st.get(), i++, record.file_id);
  bind_text(db.get(), st.get(), i++, record.filename);
  bind_optional_text(db.get(), st.get(), i++, record.provider);
  bind_text(db.get(), st.get(), i++, record.content_type);
  bind_int64(db.get(), st.get(), i++, record.bytes);
  bind_text(db.get(), st.get(), i++, utils::format_iso8601_utc(record.uploaded_at));
  step_done(db.get(), st.get(), "log_upload");
}

void MetadataStore::log_run(const RunRecord& record) const {
  logger_.debug("Persisting run metadata", {{"run_id", record.run_id}});
  auto db = open_connection(database_path_);
  auto st = prepare(db.get(), kUpsertRun);
  int i = 1;
  bind_text(db.get(), st.get(), i++, record.run_id);
  bind_text(db.get(), st.get(), i++, record.thread_id);
  bind_optional_text(db.get(), st.get(), i++, record.assistant_id);
  bind_text(db.get(), st.get(), i++, record.status);
  bind_optional_text(db.get(), st.get(), i++, record.schema_profile);
  bind_text(db.get(), st.get(), i++, compact_json(record.metadata));
  bind_text(db.get(), st.get(), i++, utils::format_iso8601_utc(record.started_at));
  step_done(db.get(), st.get(), "log_run");
}

void MetadataStore::update_run_status(const std::string& run_id, const std::string& status) const {
  logger_.debug("Updating run status", {{"run_id", run_id}, {"status", status}});
  auto db = open_connection(database_path_);
  auto st = prepare(db.get(), kUpdateRunStatus);
  bind_text(db.get(), st.get(), 1, status);
  bind_text(db.get(), st.get(), 2, run_id);
  step_done(db.get(), st.get(), "update_run_status");
}

void MetadataStore::update_run_status(const std::string& run_id, RunStatus status) const {
  update_run_status(run_id, std::string(to_string(status)));
}

}  // namespace finagent
