#include "docmem/index_backend.hpp"

#include "docmem/errors.hpp"
#include "document_index.hpp"
#include "fault_injection.hpp"
#include "flat_index.hpp"

#include <atomic>
#include <string>

namespace docmem {
namespace {

std::atomic<std::uint32_t> g_test_add_fail_countdown{0};
std::atomic<std::uint32_t> g_test_delete_fail_countdown{0};

bool ConsumeCountdown(std::atomic<std::uint32_t>& countdown) {
  auto remaining = countdown.load(std::memory_order_relaxed);
  while (remaining > 0) {
    if (countdown.compare_exchange_weak(remaining,
                                        remaining - 1,
                                        std::memory_order_relaxed,
                                        std::memory_order_relaxed)) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::filesystem::path IndexStoragePath(BackendKind kind, const std::filesystem::path& data_dir) {
  switch (kind) {
    case BackendKind::kFlat:
      return data_dir / "flat_index.bin";
    case BackendKind::kDocument:
      return data_dir / "document_index";
  }
  throw ValidationError("unknown backend kind");
}

std::unique_ptr<IndexBackend> OpenIndexBackend(BackendKind kind,
                                               int dimensions,
                                               const std::filesystem::path& data_dir) {
  switch (kind) {
    case BackendKind::kFlat:
      return std::make_unique<index::FlatIndex>(dimensions, IndexStoragePath(kind, data_dir));
    case BackendKind::kDocument:
      return std::make_unique<index::DocumentIndex>(dimensions, IndexStoragePath(kind, data_dir));
  }
  throw ValidationError("unknown backend kind");
}

namespace index::detail {

void MaybeInjectAddFailure(std::string_view where) {
  if (ConsumeCountdown(g_test_add_fail_countdown)) {
    throw IndexOperationError(std::string(where) + " injected failure");
  }
}

bool ConsumeDeleteFailure() {
  return ConsumeCountdown(g_test_delete_fail_countdown);
}

}  // namespace index::detail

namespace index::testing {

void SetAddFailCountdown(std::uint32_t countdown) {
  g_test_add_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void SetDeleteFailCountdown(std::uint32_t countdown) {
  g_test_delete_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void ClearFailCountdowns() {
  g_test_add_fail_countdown.store(0, std::memory_order_relaxed);
  g_test_delete_fail_countdown.store(0, std::memory_order_relaxed);
}

}  // namespace index::testing

}  // namespace docmem
