#include "docmem/errors.hpp"
#include "docmem/memory_manager.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"
#include "manager_fixtures.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using docmem::tests::OpenManager;
using docmem::tests::Require;
using docmem::tests::SmallConfig;
using docmem::tests::TextUpload;

std::string TopicText(int i) {
  return "Topic " + std::to_string(i) + " covers warehouse item " + std::to_string(i * 7) + " in depth.";
}

// Collects the first failure seen by any worker thread.
class FailureSink {
 public:
  void Record(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (first_.empty()) {
      first_ = message;
    }
  }
  void Check() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(first_.empty(), first_);
  }

 private:
  mutable std::mutex mutex_;
  std::string first_;
};

void ScenarioParallelIngestOfDistinctFiles() {
  docmem::tests::Log("scenario: parallel ingest");
  docmem::tests::ScratchDir dir("concurrency-ingest");
  auto manager = OpenManager(SmallConfig(dir.path()));
  FailureSink failures{};
  std::mutex ids_mutex{};
  std::set<std::string> ids{};

  std::vector<std::thread> threads{};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      try {
        for (int i = 0; i < 5; ++i) {
          const int n = t * 5 + i;
          const auto outcome = manager->Ingest(TextUpload("topic-" + std::to_string(n) + ".txt", TopicText(n)));
          std::lock_guard<std::mutex> lock(ids_mutex);
          ids.insert(outcome.doc_id);
        }
      } catch (const std::exception& ex) {
        failures.Record(ex.what());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  failures.Check();
  Require(ids.size() == 20, "every document gets a unique id");
  Require(manager->Stats().doc_count == 20, "all documents committed");
  Require(manager->Verify().ok(), "index and registry agree");
}

void ScenarioSameContentRacesToOneCommit() {
  docmem::tests::Log("scenario: duplicate race");
  docmem::tests::ScratchDir dir("concurrency-duplicate");
  auto manager = OpenManager(SmallConfig(dir.path()));
  std::atomic<int> committed{0};
  std::atomic<int> duplicates{0};
  FailureSink failures{};

  std::vector<std::thread> threads{};
  for (int t = 0; t < 6; ++t) {
    threads.emplace_back([&, t]() {
      try {
        const auto outcome = manager->Ingest(TextUpload("copy-" + std::to_string(t) + ".txt", docmem::tests::kAlphaText));
        if (outcome.status == docmem::IngestStatus::kCommitted) {
          committed.fetch_add(1);
        } else {
          duplicates.fetch_add(1);
        }
      } catch (const std::exception& ex) {
        failures.Record(ex.what());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  failures.Check();
  Require(committed.load() == 1, "exactly one copy commits");
  Require(duplicates.load() == 5, "every other copy is a duplicate");
  Require(manager->Stats().chunk_count == 3, "only one set of chunks is stored");
}

void ScenarioQueriesDuringWrites() {
  docmem::tests::Log("scenario: queries during writes");
  docmem::tests::ScratchDir dir("concurrency-mixed");
  auto manager = OpenManager(SmallConfig(dir.path()));
  (void)manager->Ingest(TextUpload("base.txt", docmem::tests::kAlphaText));

  std::atomic<bool> writing{true};
  FailureSink failures{};
  std::vector<std::thread> readers{};
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&]() {
      try {
        while (writing.load()) {
          for (const auto& hit : manager->Query("warehouse item topic", 5)) {
            // Every hit must belong to a fully registered document.
            if (hit.total_chunks == 0 || hit.chunk_ordinal >= hit.total_chunks || hit.filename.empty()) {
              failures.Record("query observed a half-applied mutation: " + hit.chunk_id);
            }
          }
          (void)manager->Stats();
          (void)manager->ListDocuments();
        }
      } catch (const std::exception& ex) {
        failures.Record(ex.what());
      }
    });
  }

  try {
    std::vector<std::string> added{};
    for (int i = 0; i < 12; ++i) {
      added.push_back(manager->Ingest(TextUpload("t" + std::to_string(i) + ".txt", TopicText(i))).doc_id);
      if (i % 4 == 3) {
        const auto report = manager->RemoveDocuments({added[static_cast<std::size_t>(i - 1)]});
        Require(report.removed.size() == 1, "removal during queries succeeds");
      }
    }
    (void)manager->CreateBackup("mid-run");
    (void)manager->ClearAll();
    (void)manager->RestoreBackup("mid-run");
  } catch (const std::exception& ex) {
    failures.Record(ex.what());
  }
  writing.store(false);
  for (auto& reader : readers) {
    reader.join();
  }
  failures.Check();
  Require(manager->Stats().doc_count == 10, "base plus twelve added minus three removed");
  Require(manager->Verify().ok(), "store is consistent after the mixed run");
}

}  // namespace

int main() {
  try {
    docmem::tests::Log("memory_manager_concurrency_test: start");
    ScenarioParallelIngestOfDistinctFiles();
    ScenarioSameContentRacesToOneCommit();
    ScenarioQueriesDuringWrites();
    docmem::tests::Log("memory_manager_concurrency_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    docmem::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
