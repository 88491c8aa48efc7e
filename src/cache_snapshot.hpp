#pragma once

#include "flag_model.hpp"
#include <cstdint>
#include <memory>

namespace flageval {

// Immutable published state of the flag_cache.
// Shared by evaluator callers via shared_ptr<const cache_snapshot>.
struct cache_snapshot {
    // Incremented on every replace() / clear()
    uint64_t version = 0;

    definitions_snapshot definitions;
};

} // namespace flageval
