#include "docmem/config.hpp"
#include "docmem/embeddings.hpp"
#include "docmem/memory_manager.hpp"
#include "docmem/types.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

int main() {
  try {
    docmem::tests::Log("smoke_test: start");
    docmem::ManagerConfig config{};
    docmem::ValidateConfig(config);
    if (config.chunking.chunk_overlap >= config.chunking.chunk_size) {
      std::cerr << "default chunk overlap must be smaller than chunk size\n";
      return EXIT_FAILURE;
    }
    if (config.default_top_k <= 0) {
      std::cerr << "default top_k must be positive\n";
      return EXIT_FAILURE;
    }

    docmem::tests::ScratchDir dir("smoke");
    config.data_dir = dir.path();
    config.log_level = "warn";
    docmem::MemoryManager manager(config, std::make_shared<docmem::HashingEmbedder>());
    const auto outcome = manager.Ingest(docmem::tests::TextUpload("hello.txt", "Hello from the document store."));
    if (outcome.status != docmem::IngestStatus::kCommitted) {
      std::cerr << "ingest did not commit\n";
      return EXIT_FAILURE;
    }
    const auto hits = manager.Query("hello document store");
    if (hits.empty() || hits.front().filename != "hello.txt") {
      std::cerr << "query did not find the ingested file\n";
      return EXIT_FAILURE;
    }

    docmem::tests::Log("smoke_test: finished");
    std::cout << "docmem smoke test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "smoke test failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
