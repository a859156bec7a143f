#pragma once

#include <cstdint>
#include <string>

namespace panel_promote::seed {

// Identifier of the digest used by stable_hash; written into every summary so
// recorded seeds can be recomputed later.
constexpr const char* kSeedDigestVersion = "fnv1a64-v1";

constexpr uint64_t kPanelHashModulus = 1000000ULL;
constexpr int64_t kSeedModulus = 2147483647LL;

// FNV-1a 64-bit over the UTF-8 bytes of text. Identical in every process and
// on every platform.
uint64_t stable_hash(const std::string& text);

// stable_hash(panel_id) mod 1'000'000
uint64_t panel_hash(const std::string& panel_id);

// (global_seed + panel_hash(panel_id)) mod 2'147'483'647, always non-negative.
int64_t derive_seed(int64_t global_seed, const std::string& panel_id);

} // namespace panel_promote::seed
