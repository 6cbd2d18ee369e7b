#include "attic/archive/sqlite_manifest.hpp"

#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "attic/util/time.hpp"

namespace attic::archive {

// SQL schemas and queries
namespace sql {

constexpr const char* kCreateManifestTable = R"(
CREATE TABLE IF NOT EXISTS archive_manifest (
  content_hash TEXT PRIMARY KEY,
  message_id TEXT NOT NULL,
  channel_id TEXT NOT NULL,
  attachment_ids TEXT NOT NULL DEFAULT '',  -- comma-joined
  filename TEXT NOT NULL,
  size INTEGER NOT NULL,
  sha256 TEXT NOT NULL,
  tenant TEXT,
  workspace TEXT,
  media_type TEXT NOT NULL,
  visibility TEXT NOT NULL,
  tags TEXT NOT NULL DEFAULT '',            -- comma-joined
  compression TEXT NOT NULL DEFAULT '{}',   -- JSON
  created_at TEXT NOT NULL                  -- RFC3339
);
CREATE INDEX IF NOT EXISTS idx_manifest_created ON archive_manifest(created_at);
)";

constexpr const char* kSelectColumns =
    "SELECT content_hash, message_id, channel_id, attachment_ids, filename, size, sha256, "
    "tenant, workspace, media_type, visibility, tags, compression, created_at "
    "FROM archive_manifest";

constexpr const char* kInsertIfAbsent = R"(
INSERT INTO archive_manifest (
  content_hash, message_id, channel_id, attachment_ids, filename, size, sha256,
  tenant, workspace, media_type, visibility, tags, compression, created_at
) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
ON CONFLICT(content_hash) DO NOTHING
)";

constexpr const char* kUpdateTags =
    "UPDATE archive_manifest SET tags = ? WHERE content_hash = ?";

constexpr const char* kSearchTag = R"(
SELECT content_hash, filename, media_type, visibility, tags, size, created_at
FROM archive_manifest
WHERE tags LIKE ? ESCAPE '\'
ORDER BY created_at DESC, content_hash
LIMIT ? OFFSET ?
)";

constexpr const char* kTotals =
    "SELECT COUNT(*), COALESCE(SUM(size), 0) FROM archive_manifest";

constexpr const char* kByMediaType =
    "SELECT media_type, COUNT(*) FROM archive_manifest GROUP BY media_type";

}  // namespace sql

namespace {

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StmtFinalizer {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using DbHandle = std::unique_ptr<sqlite3, DbCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

Error makeSqliteError(sqlite3* db, const std::string& operation) {
  std::string message = operation;
  if (db) {
    message += ": " + std::string(sqlite3_errmsg(db));
  }
  return makeError(ErrorCode::kDatabaseError, message);
}

Result<void> checkSqliteResult(sqlite3* db, int result, const std::string& operation) {
  if (result == SQLITE_OK || result == SQLITE_DONE || result == SQLITE_ROW) {
    return {};
  }
  return std::unexpected(makeSqliteError(db, operation));
}

Result<DbHandle> openDatabase(const std::filesystem::path& path) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                           nullptr);
  DbHandle db(raw);
  if (rc != SQLITE_OK) {
    return std::unexpected(makeSqliteError(db.get(), "Failed to open manifest " + path.string()));
  }

  sqlite3_busy_timeout(db.get(), SqliteManifest::kBusyTimeoutMs);
  auto pragma = checkSqliteResult(
      db.get(), sqlite3_exec(db.get(), "PRAGMA synchronous = NORMAL", nullptr, nullptr, nullptr),
      "Set synchronous mode");
  if (!pragma) {
    return std::unexpected(pragma.error());
  }
  return db;
}

Result<StmtHandle> prepare(sqlite3* db, const char* query, const std::string& operation) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, query, -1, &raw, nullptr) != SQLITE_OK) {
    return std::unexpected(makeSqliteError(db, "Failed to prepare " + operation));
  }
  return StmtHandle(raw);
}

// Rolls back unless committed
class Transaction {
 public:
  explicit Transaction(sqlite3* db) : db_(db) {}
  ~Transaction() {
    if (active_) {
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  Result<void> begin() {
    auto result = checkSqliteResult(
        db_, sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), "Begin transaction");
    active_ = result.has_value();
    return result;
  }

  Result<void> commit() {
    auto result = checkSqliteResult(
        db_, sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr), "Commit transaction");
    if (result) {
      active_ = false;
    }
    return result;
  }

 private:
  sqlite3* db_;
  bool active_ = false;
};

std::string joinList(const std::vector<std::string>& items) {
  std::string joined;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) joined += ",";
    joined += items[i];
  }
  return joined;
}

std::vector<std::string> splitList(const std::string& joined) {
  std::vector<std::string> items;
  std::istringstream stream(joined);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::string columnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return columnText(stmt, column);
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    bindText(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

Result<std::chrono::system_clock::time_point> columnTime(sqlite3_stmt* stmt, int column) {
  auto parsed = util::Time::fromRfc3339(columnText(stmt, column));
  if (!parsed) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "Corrupt created_at in manifest: " + parsed.error().message()));
  }
  return *parsed;
}

Result<ArchiveRecord> readRecord(sqlite3_stmt* stmt) {
  ArchiveRecord record;
  record.content_hash = columnText(stmt, 0);
  record.message_id = columnText(stmt, 1);
  record.channel_id = columnText(stmt, 2);
  record.attachment_ids = splitList(columnText(stmt, 3));
  record.filename = columnText(stmt, 4);
  record.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
  record.sha256 = columnText(stmt, 6);
  record.tenant = columnOptionalText(stmt, 7);
  record.workspace = columnOptionalText(stmt, 8);
  record.media_type = columnText(stmt, 9);
  record.visibility = columnText(stmt, 10);
  record.tags = splitList(columnText(stmt, 11));

  auto compression = nlohmann::json::parse(columnText(stmt, 12), nullptr, false);
  if (compression.is_discarded()) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "Corrupt compression stats for " + record.content_hash));
  }
  record.compression = compressionFromJson(compression);

  auto created = columnTime(stmt, 13);
  if (!created) {
    return std::unexpected(created.error());
  }
  record.created_at = *created;
  return record;
}

Result<std::optional<ArchiveRecord>> selectByHash(sqlite3* db, const std::string& content_hash) {
  std::string query = std::string(sql::kSelectColumns) + " WHERE content_hash = ?";
  auto stmt = prepare(db, query.c_str(), "manifest lookup");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  bindText(stmt->get(), 1, content_hash);

  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return std::optional<ArchiveRecord>{};
  }
  if (rc != SQLITE_ROW) {
    return std::unexpected(makeSqliteError(db, "Manifest lookup failed"));
  }

  auto record = readRecord(stmt->get());
  if (!record) {
    return std::unexpected(record.error());
  }
  return std::optional<ArchiveRecord>(std::move(*record));
}

// Escape LIKE wildcards so the substring is matched literally
std::string likePattern(const std::string& substring) {
  std::string pattern = "%";
  for (char c : substring) {
    if (c == '%' || c == '_' || c == '\\') {
      pattern += '\\';
    }
    pattern += c;
  }
  pattern += "%";
  return pattern;
}

}  // namespace

SqliteManifest::SqliteManifest(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

Result<void> SqliteManifest::initialize() {
  auto parent = db_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Failed to create manifest directory: " + ec.message()));
    }
  }

  auto db = openDatabase(db_path_);
  if (!db) {
    return std::unexpected(db.error());
  }

  // journal_mode is persistent; set once here
  auto result = checkSqliteResult(
      db->get(), sqlite3_exec(db->get(), "PRAGMA journal_mode = WAL", nullptr, nullptr, nullptr),
      "Enable WAL");
  if (!result) {
    return result;
  }

  result = checkSqliteResult(
      db->get(), sqlite3_exec(db->get(), sql::kCreateManifestTable, nullptr, nullptr, nullptr),
      "Create manifest schema");
  if (!result) {
    return result;
  }

  spdlog::debug("Manifest ready at {}", db_path_.string());
  return {};
}

Result<std::optional<ArchiveRecord>> SqliteManifest::lookup(const std::string& content_hash) {
  auto db = openDatabase(db_path_);
  if (!db) {
    return std::unexpected(db.error());
  }
  return selectByHash(db->get(), content_hash);
}

Result<RecordResult> SqliteManifest::record(const ArchiveRecord& record) {
  if (record.content_hash.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Cannot record an entry without a content hash"));
  }

  auto db = openDatabase(db_path_);
  if (!db) {
    return std::unexpected(db.error());
  }

  Transaction txn(db->get());
  auto begun = txn.begin();
  if (!begun) {
    return std::unexpected(begun.error());
  }

  auto stmt = prepare(db->get(), sql::kInsertIfAbsent, "manifest insert");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }

  sqlite3_stmt* s = stmt->get();
  bindText(s, 1, record.content_hash);
  bindText(s, 2, record.message_id);
  bindText(s, 3, record.channel_id);
  bindText(s, 4, joinList(record.attachment_ids));
  bindText(s, 5, record.filename);
  sqlite3_bind_int64(s, 6, static_cast<sqlite3_int64>(record.size));
  bindText(s, 7, record.sha256.empty() ? record.content_hash : record.sha256);
  bindOptionalText(s, 8, record.tenant);
  bindOptionalText(s, 9, record.workspace);
  bindText(s, 10, record.media_type);
  bindText(s, 11, record.visibility);
  bindText(s, 12, joinList(normalizeTags(record.tags)));
  bindText(s, 13, compressionToJson(record.compression).dump());
  bindText(s, 14, util::Time::toRfc3339(record.created_at));

  if (sqlite3_step(s) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError(db->get(), "Failed to insert manifest row"));
  }
  bool inserted = sqlite3_changes(db->get()) > 0;

  auto stored = selectByHash(db->get(), record.content_hash);
  if (!stored) {
    return std::unexpected(stored.error());
  }
  if (!stored->has_value()) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "Manifest row vanished after insert: " + record.content_hash));
  }

  auto committed = txn.commit();
  if (!committed) {
    return std::unexpected(committed.error());
  }

  if (!inserted) {
    spdlog::info("Manifest already holds {}; kept existing row", record.content_hash);
  }
  return RecordResult{std::move(**stored), inserted};
}

Result<ArchiveRecord> SqliteManifest::updateTags(const std::string& content_hash,
                                                 const std::vector<std::string>& tags) {
  auto db = openDatabase(db_path_);
  if (!db) {
    return std::unexpected(db.error());
  }

  Transaction txn(db->get());
  auto begun = txn.begin();
  if (!begun) {
    return std::unexpected(begun.error());
  }

  auto stmt = prepare(db->get(), sql::kUpdateTags, "tag update");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  bindText(stmt->get(), 1, joinList(normalizeTags(tags)));
  bindText(stmt->get(), 2, content_hash);

  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError(db->get(), "Failed to update tags"));
  }
  if (sqlite3_changes(db->get()) == 0) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "No archive record for " + content_hash));
  }

  auto stored = selectByHash(db->get(), content_hash);
  if (!stored) {
    return std::unexpected(stored.error());
  }
  if (!stored->has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "No archive record for " + content_hash));
  }

  auto committed = txn.commit();
  if (!committed) {
    return std::unexpected(committed.error());
  }
  return std::move(**stored);
}

Result<std::vector<ManifestSummary>> SqliteManifest::searchTag(const std::string& substring,
                                                               std::size_t limit,
                                                               std::size_t offset) {
  auto db = openDatabase(db_path_);
  if (!db) {
    return std::unexpected(db.error());
  }

  auto stmt = prepare(db->get(), sql::kSearchTag, "tag search");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }

  auto needle = normalizeTags({substring});
  bindText(stmt->get(), 1, likePattern(needle.empty() ? "" : needle.front()));
  sqlite3_bind_int64(stmt->get(), 2, static_cast<sqlite3_int64>(limit));
  sqlite3_bind_int64(stmt->get(), 3, static_cast<sqlite3_int64>(offset));

  std::vector<ManifestSummary> results;
  int rc;
  while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
    ManifestSummary summary;
    summary.content_hash = columnText(stmt->get(), 0);
    summary.filename = columnText(stmt->get(), 1);
    summary.media_type = columnText(stmt->get(), 2);
    summary.visibility = columnText(stmt->get(), 3);
    summary.tags = splitList(columnText(stmt->get(), 4));
    summary.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt->get(), 5));

    auto created = columnTime(stmt->get(), 6);
    if (!created) {
      return std::unexpected(created.error());
    }
    summary.created_at = *created;
    results.push_back(std::move(summary));
  }

  if (rc != SQLITE_DONE) {
    return std::unexpected(makeSqliteError(db->get(), "Tag search failed"));
  }
  return results;
}

Result<ManifestStats> SqliteManifest::stats() {
  auto db = openDatabase(db_path_);
  if (!db) {
    return std::unexpected(db.error());
  }

  ManifestStats stats;

  auto totals = prepare(db->get(), sql::kTotals, "stats query");
  if (!totals) {
    return std::unexpected(totals.error());
  }
  if (sqlite3_step(totals->get()) != SQLITE_ROW) {
    return std::unexpected(makeSqliteError(db->get(), "Stats query failed"));
  }
  stats.records = static_cast<std::uint64_t>(sqlite3_column_int64(totals->get(), 0));
  stats.total_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(totals->get(), 1));

  auto by_type = prepare(db->get(), sql::kByMediaType, "media type breakdown");
  if (!by_type) {
    return std::unexpected(by_type.error());
  }
  int rc;
  while ((rc = sqlite3_step(by_type->get())) == SQLITE_ROW) {
    stats.by_media_type[columnText(by_type->get(), 0)] =
        static_cast<std::uint64_t>(sqlite3_column_int64(by_type->get(), 1));
  }
  if (rc != SQLITE_DONE) {
    return std::unexpected(makeSqliteError(db->get(), "Media type breakdown failed"));
  }

  return stats;
}

}  // namespace attic::archive
