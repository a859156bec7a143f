#include "panel_promote/seed/seed_deriver.hpp"

namespace panel_promote::seed {

namespace {

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

} // namespace

uint64_t stable_hash(const std::string& text) {
    uint64_t h = kFnvOffsetBasis;
    for (unsigned char c : text) {
        h ^= static_cast<uint64_t>(c);
        h *= kFnvPrime;
    }
    return h;
}

uint64_t panel_hash(const std::string& panel_id) {
    return stable_hash(panel_id) % kPanelHashModulus;
}

int64_t derive_seed(int64_t global_seed, const std::string& panel_id) {
    // Reduce first so the sum cannot overflow and negative seeds wrap upward.
    int64_t base = global_seed % kSeedModulus;
    if (base < 0) base += kSeedModulus;
    const int64_t h = static_cast<int64_t>(panel_hash(panel_id));
    return (base + h) % kSeedModulus;
}

} // namespace panel_promote::seed
