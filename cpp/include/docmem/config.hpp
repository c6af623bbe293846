#pragma once

#include "docmem/types.hpp"

namespace docmem {

// Overlays DOCMEM_* environment variables onto base:
//   DOCMEM_DATA_DIR, DOCMEM_BACKEND (flat|document, or faiss|chroma),
//   DOCMEM_CHUNK_SIZE, DOCMEM_CHUNK_OVERLAP, DOCMEM_TOP_K,
//   DOCMEM_HEALTH_THRESHOLD, DOCMEM_BACKUP_RETENTION, DOCMEM_LOG_LEVEL.
// Unset or empty variables leave the base value. Malformed values throw
// ValidationError naming the variable. The result is not validated.
[[nodiscard]] ManagerConfig LoadConfigFromEnv(ManagerConfig base = {});

// Throws ValidationError describing the first invalid field.
void ValidateConfig(const ManagerConfig& config);

}  // namespace docmem
