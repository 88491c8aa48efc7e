#pragma once

#include "flag_model.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace flageval {

// Prefix of attribute keys that refer to the value of another flag
inline constexpr std::string_view flag_dependency_prefix = "$feature/";

// Evaluate a flag definition for a subject.
//
// Inactive flags are always false. Rule groups with a variant override are
// tried first (declaration order otherwise kept). The first matching group
// decides the value; when no group matches and at least one group could not
// be decided, the result is inconclusive rather than false.
outcome<flag_value> match_flag(const feature_flag& flag,
                               std::string_view subject_id,
                               const attribute_map& attributes);

// As above, additionally resolving "$feature/<key>" conditions against the
// other flags of `definitions`. Cohort conditions are always inconclusive.
outcome<flag_value> match_flag(const feature_flag& flag,
                               std::string_view subject_id,
                               const attribute_map& attributes,
                               const definitions_snapshot& definitions);

// Variant the subject falls into, by cumulative percentage ranges in declared
// order. nullopt if the flag is not multivariate or the bucket lies past the
// last range.
std::optional<std::string> matching_variant(const feature_flag& flag,
                                            std::string_view subject_id);

} // namespace flageval
