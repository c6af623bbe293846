#include "docmem/backup_store.hpp"
#include "docmem/document_registry.hpp"
#include "docmem/errors.hpp"
#include "docmem/index_backend.hpp"
#include "docmem/memory_manager.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"
#include "manager_fixtures.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace {

using docmem::tests::kAlphaText;
using docmem::tests::kRiverText;
using docmem::tests::kSolarText;
using docmem::tests::OpenManager;
using docmem::tests::Require;
using docmem::tests::RequireThrows;
using docmem::tests::SmallConfig;
using docmem::tests::TextUpload;

docmem::FileUpload PdfUpload(const std::string& filename) {
  return docmem::FileUpload{.filename = filename, .bytes = docmem::tests::Bytes("%PDF-1.4 binary"), .file_type = std::nullopt};
}

void ScenarioIngestAndQuery() {
  docmem::tests::Log("scenario: ingest and query");
  docmem::tests::ScratchDir dir("manager-ingest");
  auto manager = OpenManager(SmallConfig(dir.path()));

  const auto outcome = manager->Ingest(TextUpload("a.txt", kAlphaText));
  Require(outcome.status == docmem::IngestStatus::kCommitted, "first ingest commits");
  Require(outcome.chunk_count == 3, "a.txt splits into three chunks");
  Require(outcome.doc_id.rfind("doc-000001-", 0) == 0, "first document id");
  (void)manager->Ingest(TextUpload("b.txt", kSolarText));

  const auto stats = manager->Stats();
  Require(stats.doc_count == 2 && stats.chunk_count == 4, "stats count documents and chunks");
  Require(stats.backend_type == docmem::BackendKind::kFlat, "stats report the backend");
  Require(stats.storage_bytes > 0, "stats report storage");

  const auto hits = manager->Query("Beta notes explain the middle part", 2);
  Require(hits.size() == 2, "top_k hits returned");
  const auto& best = hits.front();
  docmem::tests::LogKV("best_score", static_cast<double>(best.score));
  Require(best.filename == "a.txt" && best.doc_id == outcome.doc_id, "best hit comes from a.txt");
  Require(best.chunk_ordinal == 1 && best.total_chunks == 3, "best hit is the middle chunk");
  Require(best.chunk_text.find("Beta notes") != std::string::npos, "hit carries chunk text");
  Require(std::string(kAlphaText).substr(best.offset_start, best.offset_end - best.offset_start) == best.chunk_text,
          "offsets address the source text");
  Require(best.approx_tokens > 0, "token estimate is set");
  Require(hits[0].score >= hits[1].score, "hits are ordered by score");

  Require(manager->Query("solar sunlight power").front().filename == "b.txt", "default top_k query finds b.txt");
  Require(manager->Query("anything", 50).size() == 4, "top_k is clamped to the chunk count");
  Require(manager->Verify().ok(), "index and registry agree");
}

void ScenarioDuplicateRejected() {
  docmem::tests::Log("scenario: duplicate detection");
  docmem::tests::ScratchDir dir("manager-duplicate");
  auto embedder = std::make_shared<docmem::tests::ScriptedEmbedder>();
  auto manager = OpenManager(SmallConfig(dir.path()), embedder);
  const auto first = manager->Ingest(TextUpload("a.txt", kAlphaText));
  const auto calls = embedder->calls();

  const auto again = manager->Ingest(TextUpload(
      "copy.txt", "ALPHA notes cover the opening topic here.\r\n\r\nBeta   notes explain the middle part.\n\nGamma notes close it.  "));
  Require(again.status == docmem::IngestStatus::kDuplicateRejected, "reformatted copy is a duplicate");
  Require(again.duplicate_of == first.doc_id, "duplicate names the original");
  Require(embedder->calls() == calls, "duplicates are not embedded");
  Require(manager->Stats().doc_count == 1 && manager->Stats().chunk_count == 3, "nothing added for duplicates");
}

void ScenarioIngestValidation() {
  docmem::tests::Log("scenario: ingest validation");
  docmem::tests::ScratchDir dir("manager-validation");
  auto manager = OpenManager(SmallConfig(dir.path()));

  RequireThrows<docmem::ValidationError>([&] { (void)manager->Ingest(TextUpload("empty.txt", "")); },
                                         "empty files are rejected");
  RequireThrows<docmem::ValidationError>([&] { (void)manager->Ingest(TextUpload("notes.md", "text")); },
                                         "unsupported types are rejected");
  RequireThrows<docmem::ValidationError>([&] { (void)manager->Ingest(TextUpload("", "text")); },
                                         "empty filenames are rejected");
  RequireThrows<docmem::ChunkingError>([&] { (void)manager->Ingest(TextUpload("blank.txt", " \n\t \n")); },
                                       "whitespace-only text is rejected");
  try {
    (void)manager->Ingest(PdfUpload("b.pdf"));
    throw std::runtime_error("pdf without an extractor must fail");
  } catch (const docmem::ExtractionError& ex) {
    Require(ex.kind() == docmem::ErrorKind::kExtraction, "extraction failures carry their kind");
  }
  Require(manager->Stats().doc_count == 0 && manager->Stats().chunk_count == 0, "rejected ingests leave nothing");
  Require(manager->ListBackups().empty(), "rejected ingests take no snapshot");
}

void ScenarioQueryValidation() {
  docmem::tests::Log("scenario: query validation");
  docmem::tests::ScratchDir dir("manager-query-validation");
  auto manager = OpenManager(SmallConfig(dir.path()));
  Require(manager->Query("anything").empty(), "empty store returns no hits");
  RequireThrows<docmem::ValidationError>([&] { (void)manager->Query("   "); }, "blank query rejected");
  RequireThrows<docmem::ValidationError>([&] { (void)manager->Query("x", 0); }, "top_k zero rejected");
}

void ScenarioRemoveDocuments() {
  docmem::tests::Log("scenario: remove documents");
  docmem::tests::ScratchDir dir("manager-remove");
  auto manager = OpenManager(SmallConfig(dir.path()));
  const auto a = manager->Ingest(TextUpload("a.txt", kAlphaText)).doc_id;
  const auto b = manager->Ingest(TextUpload("b.txt", kSolarText)).doc_id;

  const auto unknown_only = manager->RemoveDocuments({"doc-999999-deadbeef"});
  Require(!unknown_only.snapshot_id.has_value(), "nothing known means no snapshot");
  Require(unknown_only.failed.size() == 1 && unknown_only.failed[0].kind == docmem::ErrorKind::kNotFound,
          "unknown ids are reported not found");
  RequireThrows<docmem::ValidationError>([&] { (void)manager->RemoveDocuments({}); }, "empty id list rejected");

  const auto report = manager->RemoveDocuments({a, a, "doc-missing"});
  Require(report.snapshot_id.has_value(), "removal takes a snapshot first");
  Require(report.removed == std::vector<std::string>({a}), "known id removed once");
  Require(report.failed.size() == 1 && report.failed[0].doc_id == "doc-missing", "unknown id reported");
  Require(manager->Stats().doc_count == 1 && manager->Stats().chunk_count == 1, "only b.txt remains");
  for (const auto& hit : manager->Query("Alpha notes cover the opening topic", 5)) {
    Require(hit.doc_id == b, "removed chunks are never returned");
  }
  const auto backups = manager->ListBackups();
  Require(!backups.empty() && backups.front().label.rfind("pre-remove-", 0) == 0, "snapshot carries the pre-remove label");
  Require(manager->Verify().ok(), "store stays consistent");

  // The same content may come back once its document is gone.
  Require(manager->Ingest(TextUpload("a.txt", kAlphaText)).status == docmem::IngestStatus::kCommitted,
          "removed content can be ingested again");
}

void ScenarioRemoveWithIndexFailures() {
  docmem::tests::Log("scenario: remove with index failures");
  for (const auto backend : {docmem::BackendKind::kFlat, docmem::BackendKind::kDocument}) {
    docmem::tests::ScratchDir dir("manager-remove-fault");
    auto manager = OpenManager(SmallConfig(dir.path(), backend));
    const auto a = manager->Ingest(TextUpload("a.txt", kAlphaText)).doc_id;

    docmem::index::testing::SetDeleteFailCountdown(1);
    const auto report = manager->RemoveDocuments({a});
    docmem::index::testing::ClearFailCountdowns();
    Require(report.removed.empty(), "document with undeletable chunks is not removed");
    Require(report.failed.size() == 1 && report.failed[0].kind == docmem::ErrorKind::kIndexOperation,
            "failure is reported as an index operation error");
    Require(manager->ListDocuments().size() == 1, "document stays registered");
    Require(manager->Stats().chunk_count == 3, "deleted chunks are put back");
    Require(manager->Verify().ok(), "index and registry still agree");
    Require(manager->Query("Gamma notes close it").front().doc_id == a, "document stays searchable");
  }
}

void ScenarioRemoveRollbackAfterTrimmedEntry() {
  docmem::tests::Log("scenario: remove rollback after a trimmed entry");
  docmem::tests::ScratchDir dir("manager-remove-trim");
  const auto config = SmallConfig(dir.path(), docmem::BackendKind::kDocument);
  {
    auto manager = OpenManager(config);
    const auto a = manager->Ingest(TextUpload("a.txt", kAlphaText)).doc_id;

    // One chunk survives the delete, putting the other two back fails, then
    // the registry cannot be saved.
    docmem::index::testing::SetDeleteFailCountdown(1);
    docmem::index::testing::SetAddFailCountdown(1);
    docmem::registry::testing::SetPersistFailCountdown(1);
    RequireThrows<docmem::RegistryError>([&] { (void)manager->RemoveDocuments({a}); },
                                         "registry persist failure is propagated");
    docmem::index::testing::ClearFailCountdowns();
    docmem::registry::testing::ClearPersistFailCountdown();

    Require(manager->ListDocuments().size() == 1, "document stays registered");
    Require(manager->Stats().chunk_count == 3, "every chunk of the restored entry is back");
    Require(manager->Verify().ok(), "index and registry still agree");
  }
  auto reopened = OpenManager(config);
  Require(!reopened->LastRecovery().corruption_detected, "reopen finds no missing chunks");
  Require(reopened->Stats().doc_count == 1 && reopened->Stats().chunk_count == 3, "document survives reopen");
}

void ScenarioBackupClearRestore() {
  docmem::tests::Log("scenario: backup, clear and restore");
  docmem::tests::ScratchDir dir("manager-backup");
  auto config = SmallConfig(dir.path());
  auto manager = OpenManager(config);
  (void)manager->Ingest(TextUpload("a.txt", kAlphaText));
  (void)manager->Ingest(TextUpload("b.txt", kSolarText));

  const auto backup_id = manager->CreateBackup("v1");
  const auto clear_id = manager->ClearAll();
  Require(clear_id != backup_id, "clear takes its own snapshot");
  Require(manager->Stats().doc_count == 0 && manager->Stats().chunk_count == 0, "clear empties the store");
  Require(manager->Query("solar power").empty(), "cleared store returns no hits");

  const auto probes = manager->HealthCheck({"Alpha notes cover the opening topic here.", "solar"});
  Require(probes.size() == 2, "one result per probe");
  Require(!probes[0].passed && !probes[1].passed, "health check fails on an empty store");

  const auto restored = manager->RestoreBackup("v1");
  Require(restored.id == backup_id, "label resolves to the backup");
  Require(manager->Stats().doc_count == 2 && manager->Stats().chunk_count == 4, "restore brings documents back");
  Require(manager->Query("solar sunlight").front().filename == "b.txt", "restored store answers queries");

  const auto next = manager->Ingest(TextUpload("c.txt", kRiverText));
  Require(next.doc_id.rfind("doc-000003-", 0) == 0, "ids are not reissued after a restore");

  RequireThrows<docmem::SnapshotError>([&] { (void)manager->RestoreBackup("no-such-backup"); },
                                       "unknown backups are rejected");

  (void)manager->RestoreBackup(clear_id);
  Require(manager->Stats().doc_count == 2, "restoring the clear-all snapshot undoes the clear");
  Require(manager->CreateBackup("").size() > 0, "an empty label still creates a backup");
  const auto backups = manager->ListBackups();
  Require(backups.front().label.rfind("backup-", 0) == 0, "empty label becomes a backup- label");
}

void ScenarioRestoreKeepsStateWhenPersistFails() {
  docmem::tests::Log("scenario: restore persist failure");
  docmem::tests::ScratchDir dir("manager-restore-fault");
  auto manager = OpenManager(SmallConfig(dir.path()));
  (void)manager->Ingest(TextUpload("a.txt", kAlphaText));
  const auto backup_id = manager->CreateBackup("v1");
  (void)manager->Ingest(TextUpload("b.txt", kSolarText));

  docmem::registry::testing::SetPersistFailCountdown(1);
  RequireThrows<docmem::SnapshotError>([&] { (void)manager->RestoreBackup(backup_id); },
                                       "restore must fail when the registry cannot be saved");
  docmem::registry::testing::ClearPersistFailCountdown();
  Require(manager->Stats().doc_count == 2 && manager->Stats().chunk_count == 4, "live state is kept");
  Require(manager->Verify().ok(), "live state stays consistent");
}

void ScenarioHealthCheck() {
  docmem::tests::Log("scenario: health check");
  docmem::tests::ScratchDir dir("manager-health");
  auto manager = OpenManager(SmallConfig(dir.path()));
  Require(manager->HealthCheck({}).empty(), "no probes, no results");
  (void)manager->Ingest(TextUpload("a.txt", kAlphaText));

  const auto results = manager->HealthCheck({"Alpha notes cover the opening topic here.", "zebra quantum xylophone"});
  Require(results[0].passed, "a probe matching stored text passes");
  Require(results[0].matched_filename == "a.txt", "matched filename is reported");
  Require(results[0].best_score >= 0.75F, "best score meets the threshold");
  Require(!results[1].passed, "an unrelated probe fails");
  RequireThrows<docmem::ValidationError>([&] { (void)manager->HealthCheck({"ok", " "}); }, "blank probes rejected");
}

void ScenarioReplaceAll() {
  docmem::tests::Log("scenario: replace all");
  docmem::tests::ScratchDir dir("manager-replace");
  auto manager = OpenManager(SmallConfig(dir.path()));
  (void)manager->Ingest(TextUpload("old.txt", kRiverText));

  const auto report = manager->ReplaceAll({
      TextUpload("a.txt", kAlphaText),
      PdfUpload("b.pdf"),
      TextUpload("a-copy.txt", kAlphaText),
      TextUpload("c.txt", kSolarText),
  });
  Require(!report.snapshot_id.empty(), "replace takes a snapshot first");
  Require(report.ingested.size() == 2, "two files ingested");
  Require(report.ingested[0].filename == "a.txt" && report.ingested[1].filename == "c.txt", "ingest order kept");
  Require(report.failed.size() == 1 && report.failed[0].filename == "b.pdf", "pdf failure reported");
  Require(report.failed[0].kind == docmem::ErrorKind::kExtraction, "pdf fails extraction");
  Require(report.duplicates == std::vector<std::string>({"a-copy.txt"}), "in-batch duplicate reported");
  Require(!report.cancelled && report.skipped.empty(), "not cancelled");

  const auto docs = manager->ListDocuments();
  Require(docs.size() == 2, "only the replacement set remains");
  Require(std::none_of(docs.begin(), docs.end(), [](const auto& doc) { return doc.original_filename == "old.txt"; }),
          "previous documents are gone");

  (void)manager->RestoreBackup(report.snapshot_id);
  Require(manager->ListDocuments().size() == 1, "the replace snapshot holds the previous store");
}

void ScenarioReplaceAllCancelled() {
  docmem::tests::Log("scenario: replace all cancelled");
  docmem::tests::ScratchDir dir("manager-replace-cancel");
  auto manager = OpenManager(SmallConfig(dir.path()));
  (void)manager->Ingest(TextUpload("old.txt", kRiverText));

  std::stop_source stop{};
  stop.request_stop();
  const auto report = manager->ReplaceAll({TextUpload("a.txt", kAlphaText), TextUpload("c.txt", kSolarText)},
                                          stop.get_token());
  Require(report.cancelled, "stop request is honoured");
  Require(report.skipped.size() == 2 && report.ingested.empty(), "remaining files are skipped");
  Require(manager->Stats().doc_count == 0, "the wipe stays applied");
  (void)manager->RestoreBackup(report.snapshot_id);
  Require(manager->Stats().doc_count == 1, "the snapshot recovers the previous store");
}

void ScenarioIngestFaults() {
  docmem::tests::Log("scenario: ingest faults");
  docmem::tests::ScratchDir dir("manager-ingest-fault");
  auto manager = OpenManager(SmallConfig(dir.path()));

  docmem::index::testing::SetAddFailCountdown(1);
  RequireThrows<docmem::IndexOperationError>([&] { (void)manager->Ingest(TextUpload("a.txt", kAlphaText)); },
                                             "index add failure surfaces");
  docmem::index::testing::ClearFailCountdowns();
  Require(manager->Stats().chunk_count == 0 && manager->Stats().doc_count == 0, "failed add leaves nothing");

  docmem::registry::testing::SetPersistFailCountdown(1);
  RequireThrows<docmem::RegistryError>([&] { (void)manager->Ingest(TextUpload("a.txt", kAlphaText)); },
                                       "registry failure surfaces");
  docmem::registry::testing::ClearPersistFailCountdown();
  Require(manager->Stats().chunk_count == 0 && manager->Stats().doc_count == 0, "chunks are compensated away");
  Require(manager->Verify().ok(), "no orphans after compensation");

  const auto retry = manager->Ingest(TextUpload("a.txt", kAlphaText));
  Require(retry.status == docmem::IngestStatus::kCommitted, "the same file ingests after the faults clear");
  Require(retry.doc_id.rfind("doc-000001-", 0) == 0, "failed ingests do not consume ids");

  docmem::backup::testing::SetWriteFailCountdown(1);
  RequireThrows<docmem::SnapshotError>([&] { (void)manager->RemoveDocuments({retry.doc_id}); },
                                       "removal aborts when its snapshot fails");
  docmem::backup::testing::ClearWriteFailCountdown();
  Require(manager->Stats().doc_count == 1, "nothing removed without a snapshot");

  docmem::backup::testing::SetWriteFailCountdown(1);
  RequireThrows<docmem::SnapshotError>([&] { (void)manager->ClearAll(); }, "clear aborts when its snapshot fails");
  docmem::backup::testing::ClearWriteFailCountdown();
  Require(manager->Stats().doc_count == 1, "nothing cleared without a snapshot");

  docmem::registry::testing::SetPersistFailCountdown(1);
  RequireThrows<docmem::RegistryError>([&] { (void)manager->ClearAll(); }, "clear fails when the registry cannot be saved");
  docmem::registry::testing::ClearPersistFailCountdown();
  Require(manager->Stats().doc_count == 1 && manager->Stats().chunk_count == 3, "index is restored after a failed wipe");
  Require(manager->Verify().ok(), "store consistent after failed wipe");
}

void ScenarioEmbeddingFailures() {
  docmem::tests::Log("scenario: embedding failures");
  docmem::tests::ScratchDir dir("manager-embedding");
  auto embedder = std::make_shared<docmem::tests::ScriptedEmbedder>();
  auto manager = OpenManager(SmallConfig(dir.path()), embedder);

  embedder->FailNext(1);
  Require(manager->Ingest(TextUpload("a.txt", kAlphaText)).status == docmem::IngestStatus::kCommitted,
          "one failure is retried");

  embedder->FailNext(2);
  RequireThrows<docmem::EmbeddingError>([&] { (void)manager->Ingest(TextUpload("b.txt", kSolarText)); },
                                        "two failures abort the ingest");
  Require(manager->Stats().doc_count == 1, "aborted ingest leaves nothing");

  embedder->FailNext(2);
  RequireThrows<docmem::RetrievalUnavailable>([&] { (void)manager->Query("alpha notes"); },
                                              "query reports retrieval unavailable");
  embedder->FailNext(0);
  Require(!manager->Query("alpha notes").empty(), "queries recover once the provider does");
}

void ScenarioPersistsAcrossReopen() {
  docmem::tests::Log("scenario: reopen");
  docmem::tests::ScratchDir dir("manager-reopen");
  for (const auto backend : {docmem::BackendKind::kFlat, docmem::BackendKind::kDocument}) {
    const auto data_dir = dir.path() / std::string(docmem::ToString(backend));
    std::string doc_id{};
    {
      auto manager = OpenManager(SmallConfig(data_dir, backend));
      doc_id = manager->Ingest(TextUpload("a.txt", kAlphaText)).doc_id;
      (void)manager->CreateBackup("keep");
    }
    auto reopened = OpenManager(SmallConfig(data_dir, backend));
    Require(!reopened->LastRecovery().corruption_detected, "clean reopen reports no corruption");
    Require(reopened->Stats().doc_count == 1 && reopened->Stats().chunk_count == 3, "documents survive reopen");
    Require(reopened->Query("Gamma notes close it").front().doc_id == doc_id, "queries work after reopen");
    Require(reopened->ListBackups().size() == 1, "backups survive reopen");
    const auto second = reopened->Ingest(TextUpload("b.txt", kSolarText));
    Require(second.doc_id.rfind("doc-000002-", 0) == 0, "id sequence survives reopen");
  }
}

void ScenarioConstructorValidation() {
  docmem::tests::Log("scenario: constructor validation");
  docmem::tests::ScratchDir dir("manager-ctor");
  auto config = SmallConfig(dir.path());
  config.chunking.chunk_overlap = 50;
  RequireThrows<docmem::ValidationError>([&] { (void)OpenManager(config); }, "bad config rejected");
  RequireThrows<docmem::ValidationError>(
      [&] { docmem::MemoryManager manager(SmallConfig(dir.path()), nullptr); }, "missing embedder rejected");
}

}  // namespace

int main() {
  try {
    docmem::tests::Log("memory_manager_test: start");
    ScenarioIngestAndQuery();
    ScenarioDuplicateRejected();
    ScenarioIngestValidation();
    ScenarioQueryValidation();
    ScenarioRemoveDocuments();
    ScenarioRemoveWithIndexFailures();
    ScenarioRemoveRollbackAfterTrimmedEntry();
    ScenarioBackupClearRestore();
    ScenarioRestoreKeepsStateWhenPersistFails();
    ScenarioHealthCheck();
    ScenarioReplaceAll();
    ScenarioReplaceAllCancelled();
    ScenarioIngestFaults();
    ScenarioEmbeddingFailures();
    ScenarioPersistsAcrossReopen();
    ScenarioConstructorValidation();
    docmem::tests::Log("memory_manager_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    docmem::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
