#include "document_index.hpp"

#include "../core/byte_codec.hpp"
#include "../core/file_io.hpp"
#include "chunk_set_codec.hpp"
#include "docmem/errors.hpp"
#include "docmem/log.hpp"
#include "fault_injection.hpp"
#include "ranking.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace docmem::index {
namespace {

constexpr char kDatabaseFile[] = "chunks.sqlite3";

class SqliteError final : public std::runtime_error {
 public:
  SqliteError(const std::string& message, int code) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] bool corruption() const {
    const int primary = code_ & 0xFF;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
  }

 private:
  int code_ = SQLITE_ERROR;
};

SqliteError LastError(sqlite3* db, const std::string& what) {
  return SqliteError("sqlite " + what + " failed: " + sqlite3_errmsg(db), sqlite3_extended_errcode(db));
}

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw LastError(db_, "prepare");
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw SqliteError(message, rc);
}

void RollbackQuietly(sqlite3* db) {
  try {
    Exec(db, "ROLLBACK;");
  } catch (const SqliteError& ex) {
    log::Logger()->error("document index: rollback failed: {}", ex.what());
  }
}

std::vector<std::byte> EncodeVector(const std::vector<float>& vector) {
  core::ByteWriter writer{};
  for (const float x : vector) {
    writer.AppendF32(x);
  }
  return writer.Take();
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  if (text == nullptr) {
    return {};
  }
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

// Runs fn inside BEGIN IMMEDIATE / COMMIT, rolling back if anything throws.
template <typename Fn>
void InTransaction(sqlite3* db, Fn&& fn) {
  Exec(db, "BEGIN IMMEDIATE TRANSACTION;");
  try {
    fn();
    Exec(db, "COMMIT;");
  } catch (const std::exception&) {
    RollbackQuietly(db);
    throw;
  }
}

}  // namespace

struct DocumentIndex::SQLiteState {
  sqlite3* db = nullptr;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

DocumentIndex::DocumentIndex(int dimensions, std::filesystem::path directory)
    : dimensions_(dimensions), directory_(std::move(directory)) {
  if (dimensions_ <= 0) {
    throw IndexOperationError("document index dimensions must be positive");
  }
  Open();
}

DocumentIndex::~DocumentIndex() = default;

void DocumentIndex::Open() {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw IndexOperationError("cannot create " + directory_.string() + ": " + ec.message());
  }
  const auto db_path = (directory_ / kDatabaseFile).string();

  auto state = std::make_unique<SQLiteState>();
  if (sqlite3_open_v2(db_path.c_str(),
                      &state->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                      nullptr) != SQLITE_OK) {
    const std::string message = state->db != nullptr ? sqlite3_errmsg(state->db) : "out of memory";
    throw IndexOperationError("cannot open " + db_path + ": " + message);
  }

  try {
    Exec(state->db, "PRAGMA journal_mode=WAL;");
    Exec(state->db, "PRAGMA synchronous=NORMAL;");
    {
      Statement check(state->db, "PRAGMA quick_check;");
      if (sqlite3_step(check.get()) != SQLITE_ROW || ColumnText(check.get(), 0) != "ok") {
        throw SqliteError("quick_check reported damage in " + db_path, SQLITE_CORRUPT);
      }
    }
    Exec(state->db,
         "CREATE TABLE IF NOT EXISTS meta("
         "key TEXT PRIMARY KEY,"
         "value TEXT NOT NULL"
         ");");
    Exec(state->db,
         "CREATE TABLE IF NOT EXISTS chunks("
         "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
         "chunk_id TEXT NOT NULL UNIQUE,"
         "source_doc_id TEXT NOT NULL,"
         "offset_start INTEGER NOT NULL,"
         "offset_end INTEGER NOT NULL,"
         "body TEXT NOT NULL,"
         "embedding BLOB NOT NULL"
         ");");
    Exec(state->db, "CREATE INDEX IF NOT EXISTS chunks_by_doc ON chunks(source_doc_id);");

    Statement select_dims(state->db, "SELECT value FROM meta WHERE key = 'dimensions';");
    const int rc = sqlite3_step(select_dims.get());
    if (rc == SQLITE_ROW) {
      const auto stored = ColumnText(select_dims.get(), 0);
      if (stored != std::to_string(dimensions_)) {
        throw IndexOperationError("document index at " + db_path + " has " + stored +
                                  " dimensions, embedder has " + std::to_string(dimensions_));
      }
    } else if (rc == SQLITE_DONE) {
      Statement insert_dims(state->db, "INSERT INTO meta(key, value) VALUES('dimensions', ?1);");
      const auto dims_text = std::to_string(dimensions_);
      if (sqlite3_bind_text(insert_dims.get(), 1, dims_text.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
          sqlite3_step(insert_dims.get()) != SQLITE_DONE) {
        throw LastError(state->db, "insert meta");
      }
    } else {
      throw LastError(state->db, "read meta");
    }
    sqlite_ = std::move(state);
    LoadMirror();
  } catch (const SqliteError& ex) {
    if (ex.corruption()) {
      throw IndexCorrupted(std::string("document index: ") + ex.what());
    }
    throw IndexOperationError(std::string("document index: ") + ex.what());
  }
  log::Logger()->info("document index: opened {} with {} chunks", db_path, by_seq_.size());
}

void DocumentIndex::LoadMirror() {
  Statement select(sqlite_->db,
                   "SELECT seq, chunk_id, source_doc_id, offset_start, offset_end, body, embedding "
                   "FROM chunks ORDER BY seq;");
  std::map<std::int64_t, Chunk> by_seq{};
  std::unordered_map<std::string, std::int64_t> seq_by_id{};
  const auto expected_blob = static_cast<std::size_t>(dimensions_) * sizeof(float);
  for (;;) {
    const int rc = sqlite3_step(select.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      throw LastError(sqlite_->db, "load chunks");
    }
    Chunk chunk{};
    const auto seq = sqlite3_column_int64(select.get(), 0);
    chunk.id = ColumnText(select.get(), 1);
    chunk.source_doc_id = ColumnText(select.get(), 2);
    chunk.offset_start = static_cast<std::uint64_t>(sqlite3_column_int64(select.get(), 3));
    chunk.offset_end = static_cast<std::uint64_t>(sqlite3_column_int64(select.get(), 4));
    chunk.text = ColumnText(select.get(), 5);
    const auto* blob = static_cast<const std::byte*>(sqlite3_column_blob(select.get(), 6));
    const auto blob_size = static_cast<std::size_t>(sqlite3_column_bytes(select.get(), 6));
    if (blob_size != expected_blob || blob == nullptr) {
      throw SqliteError("chunk " + chunk.id + " has a malformed embedding", SQLITE_CORRUPT);
    }
    core::ByteReader reader(std::span<const std::byte>(blob, blob_size), "document_index");
    chunk.vector.resize(static_cast<std::size_t>(dimensions_));
    for (auto& x : chunk.vector) {
      x = reader.ReadF32();
    }
    seq_by_id.emplace(chunk.id, seq);
    by_seq.emplace(seq, std::move(chunk));
  }
  by_seq_ = std::move(by_seq);
  seq_by_id_ = std::move(seq_by_id);
}

std::vector<std::int64_t> DocumentIndex::InsertRows(const std::vector<Chunk>& chunks) {
  Statement insert(sqlite_->db,
                   "INSERT INTO chunks(chunk_id, source_doc_id, offset_start, offset_end, body, embedding) "
                   "VALUES(?1, ?2, ?3, ?4, ?5, ?6);");
  std::vector<std::int64_t> seqs{};
  seqs.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    insert.Reset();
    const auto blob = EncodeVector(chunk.vector);
    if (sqlite3_bind_text(insert.get(), 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
        sqlite3_bind_text(insert.get(), 2, chunk.source_doc_id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
        sqlite3_bind_int64(insert.get(), 3, static_cast<sqlite3_int64>(chunk.offset_start)) != SQLITE_OK ||
        sqlite3_bind_int64(insert.get(), 4, static_cast<sqlite3_int64>(chunk.offset_end)) != SQLITE_OK ||
        sqlite3_bind_text(insert.get(), 5, chunk.text.data(), static_cast<int>(chunk.text.size()), SQLITE_TRANSIENT) !=
            SQLITE_OK ||
        sqlite3_bind_blob(insert.get(), 6, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
      throw LastError(sqlite_->db, "bind");
    }
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      throw LastError(sqlite_->db, "insert");
    }
    seqs.push_back(sqlite3_last_insert_rowid(sqlite_->db));
  }
  return seqs;
}

void DocumentIndex::Add(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    return;
  }
  std::unordered_set<std::string> batch_ids{};
  for (const auto& chunk : chunks) {
    if (chunk.id.empty()) {
      throw IndexOperationError("chunk id must not be empty");
    }
    if (chunk.vector.size() != static_cast<std::size_t>(dimensions_)) {
      throw IndexOperationError("chunk " + chunk.id + " dimension mismatch");
    }
    if (seq_by_id_.contains(chunk.id) || !batch_ids.insert(chunk.id).second) {
      throw IndexOperationError("chunk id already indexed: " + chunk.id);
    }
  }
  detail::MaybeInjectAddFailure("DocumentIndex::Add");

  std::vector<std::int64_t> seqs{};
  try {
    InTransaction(sqlite_->db, [&] { seqs = InsertRows(chunks); });
  } catch (const SqliteError& ex) {
    throw IndexOperationError(std::string("document index add failed: ") + ex.what());
  }
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    seq_by_id_[chunks[i].id] = seqs[i];
    by_seq_[seqs[i]] = chunks[i];
  }
}

std::vector<ScoredChunk> DocumentIndex::Search(const std::vector<float>& query, int top_k) const {
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw IndexOperationError("document index search dimension mismatch");
  }
  std::vector<const Chunk*> ordered{};
  ordered.reserve(by_seq_.size());
  for (const auto& [seq, chunk] : by_seq_) {
    ordered.push_back(&chunk);
  }
  return RankByCosine(ordered, query, top_k);
}

DeleteResult DocumentIndex::Delete(const std::vector<std::string>& chunk_ids) {
  DeleteResult result{};
  std::vector<std::string> removed{};
  try {
    InTransaction(sqlite_->db, [&] {
      Statement remove(sqlite_->db, "DELETE FROM chunks WHERE chunk_id = ?1;");
      for (const auto& id : chunk_ids) {
        if (!seq_by_id_.contains(id)) {
          result.deleted.push_back(id);
          continue;
        }
        if (detail::ConsumeDeleteFailure()) {
          result.failed.push_back(DeleteFailure{.chunk_id = id, .reason = "injected delete failure"});
          continue;
        }
        remove.Reset();
        if (sqlite3_bind_text(remove.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_step(remove.get()) != SQLITE_DONE) {
          // A failed statement is rolled back on its own; the transaction stays open.
          result.failed.push_back(DeleteFailure{.chunk_id = id, .reason = sqlite3_errmsg(sqlite_->db)});
          continue;
        }
        removed.push_back(id);
      }
    });
  } catch (const SqliteError& ex) {
    for (const auto& id : removed) {
      result.failed.push_back(DeleteFailure{.chunk_id = id, .reason = ex.what()});
    }
    log::Logger()->warn("document index: delete transaction failed, {} chunks kept: {}", removed.size(), ex.what());
    return result;
  }
  for (const auto& id : removed) {
    const auto it = seq_by_id_.find(id);
    if (it != seq_by_id_.end()) {
      by_seq_.erase(it->second);
      seq_by_id_.erase(it);
    }
    result.deleted.push_back(id);
  }
  return result;
}

std::vector<Chunk> DocumentIndex::Fetch(const std::vector<std::string>& chunk_ids) const {
  std::vector<std::int64_t> seqs{};
  for (const auto& id : chunk_ids) {
    const auto it = seq_by_id_.find(id);
    if (it != seq_by_id_.end()) {
      seqs.push_back(it->second);
    }
  }
  std::sort(seqs.begin(), seqs.end());
  seqs.erase(std::unique(seqs.begin(), seqs.end()), seqs.end());
  std::vector<Chunk> out{};
  out.reserve(seqs.size());
  for (const auto seq : seqs) {
    out.push_back(by_seq_.at(seq));
  }
  return out;
}

std::vector<std::string> DocumentIndex::ChunkIds() const {
  std::vector<std::string> out{};
  out.reserve(by_seq_.size());
  for (const auto& [seq, chunk] : by_seq_) {
    out.push_back(chunk.id);
  }
  return out;
}

void DocumentIndex::Clear() {
  try {
    InTransaction(sqlite_->db, [&] { Exec(sqlite_->db, "DELETE FROM chunks;"); });
  } catch (const SqliteError& ex) {
    throw IndexOperationError(std::string("document index clear failed: ") + ex.what());
  }
  by_seq_.clear();
  seq_by_id_.clear();
}

std::vector<std::byte> DocumentIndex::Snapshot() const {
  ChunkSet set{.backend = BackendKind::kDocument, .dimensions = dimensions_, .chunks = {}};
  set.chunks.reserve(by_seq_.size());
  for (const auto& [seq, chunk] : by_seq_) {
    set.chunks.push_back(chunk);
  }
  return EncodeChunkSet(set);
}

void DocumentIndex::Restore(std::span<const std::byte> blob) {
  auto set = DecodeChunkSet(blob);
  if (set.backend != BackendKind::kDocument) {
    throw IndexOperationError("snapshot was taken from the " + std::string(ToString(set.backend)) + " backend");
  }
  if (set.dimensions != dimensions_) {
    throw IndexOperationError("snapshot has " + std::to_string(set.dimensions) + " dimensions, index has " +
                              std::to_string(dimensions_));
  }
  std::vector<std::int64_t> seqs{};
  try {
    InTransaction(sqlite_->db, [&] {
      Exec(sqlite_->db, "DELETE FROM chunks;");
      seqs = InsertRows(set.chunks);
    });
  } catch (const SqliteError& ex) {
    throw IndexOperationError(std::string("document index restore failed: ") + ex.what());
  }
  by_seq_.clear();
  seq_by_id_.clear();
  for (std::size_t i = 0; i < set.chunks.size(); ++i) {
    seq_by_id_[set.chunks[i].id] = seqs[i];
    by_seq_[seqs[i]] = std::move(set.chunks[i]);
  }
}

std::uint64_t DocumentIndex::StorageBytes() const {
  return core::DirectorySize(directory_);
}

}  // namespace docmem::index
