#pragma once

#include <string_view>

namespace docmem::index::detail {

// Throws IndexOperationError while the add countdown is armed.
void MaybeInjectAddFailure(std::string_view where);

// Returns true (and decrements) while the delete countdown is armed.
[[nodiscard]] bool ConsumeDeleteFailure();

}  // namespace docmem::index::detail
