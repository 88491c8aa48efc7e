#pragma once

#include <string_view>

namespace flageval {

// Salt for rollout gating. Empty to stay compatible with the server-side evaluator.
inline constexpr std::string_view rollout_salt = "";

// Salt for multivariate assignment. Keeps variant buckets independent of rollout buckets.
inline constexpr std::string_view variant_salt = "variant";

// Map (flag key, subject id, salt) to a stable value in [0, 1).
//
// The value is the first 15 hex digits of SHA-1("<flag_key>.<subject_id><salt>")
// divided by 0xFFFFFFFFFFFFFFF. Every SDK computes the same number for the
// same inputs, so rollout and variant decisions agree with the server.
double bucket(std::string_view flag_key, std::string_view subject_id,
              std::string_view salt = rollout_salt);

} // namespace flageval
