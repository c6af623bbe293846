#include "docmem/errors.hpp"
#include "docmem/index_backend.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"
#include "index_contract.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>

namespace {

using docmem::tests::Require;
using docmem::tests::RequireThrows;
using docmem::tests::index_contract::kDims;
using docmem::tests::index_contract::ThreeChunks;

void ScenarioInjectedRebuildFailureKeepsEverything() {
  docmem::tests::Log("scenario: injected rebuild failure");
  docmem::tests::ScratchDir dir("flat-rebuild");
  auto index = docmem::OpenIndexBackend(docmem::BackendKind::kFlat, kDims, dir.path());
  index->Add(ThreeChunks());

  docmem::index::testing::SetDeleteFailCountdown(1);
  const auto result = index->Delete({"d1#0", "d1#1", "absent"});
  docmem::index::testing::ClearFailCountdowns();
  Require(result.failed.size() == 2, "a failed rebuild reports every present id");
  Require(result.deleted.size() == 1 && result.deleted[0] == "absent", "absent ids still count as deleted");
  Require(index->ChunkCount() == 3, "nothing is removed when the rebuild fails");
  Require(index->Search(docmem::tests::AxisVector(kDims, 1), 1)[0].chunk.id == "d1#1",
          "kept chunks stay searchable");
}

void ScenarioDamagedFileIsCorruption() {
  docmem::tests::Log("scenario: damaged file");
  docmem::tests::ScratchDir dir("flat-damaged");
  {
    auto index = docmem::OpenIndexBackend(docmem::BackendKind::kFlat, kDims, dir.path());
    index->Add(ThreeChunks());
  }
  const auto path = docmem::IndexStoragePath(docmem::BackendKind::kFlat, dir.path());
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "not an index";
  }
  RequireThrows<docmem::IndexCorrupted>(
      [&] { (void)docmem::OpenIndexBackend(docmem::BackendKind::kFlat, kDims, dir.path()); },
      "a damaged index file must be reported as corruption");
}

void ScenarioBackendMismatchOnRestore() {
  docmem::tests::Log("scenario: backend mismatch on restore");
  docmem::tests::ScratchDir flat_dir("flat-mismatch");
  docmem::tests::ScratchDir doc_dir("doc-mismatch");
  auto document = docmem::OpenIndexBackend(docmem::BackendKind::kDocument, kDims, doc_dir.path());
  document->Add(ThreeChunks());
  auto flat = docmem::OpenIndexBackend(docmem::BackendKind::kFlat, kDims, flat_dir.path());
  RequireThrows<docmem::IndexOperationError>([&] { flat->Restore(document->Snapshot()); },
                                             "a document snapshot must not restore into a flat index");
  Require(flat->ChunkCount() == 0, "rejected restore leaves the flat index empty");
}

}  // namespace

int main() {
  try {
    docmem::tests::Log("flat_index_test: start");
    docmem::tests::index_contract::RunAll(docmem::BackendKind::kFlat);
    ScenarioInjectedRebuildFailureKeepsEverything();
    ScenarioDamagedFileIsCorruption();
    ScenarioBackendMismatchOnRestore();
    docmem::tests::Log("flat_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    docmem::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
