#include <bpath/core/Key.h>

#include <bit>

namespace bpath::core {

namespace {

constexpr std::uint64_t kGolden    = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kFoldTag   = 0x243f6a8885a308d3ULL;
constexpr std::uint64_t kSplitTag  = 0x13198a2e03707344ULL;

// SplitMix64 finalizer; a bijection on 64-bit words.
constexpr std::uint64_t mix64(std::uint64_t z) noexcept {
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

// Injective in data for a fixed (key, tag): every step is a bijection.
constexpr std::uint64_t derive(std::uint64_t key, std::uint64_t tag, std::uint64_t data) noexcept {
  return mix64(mix64(key ^ tag) + kGolden * (data + 1));
}

} // namespace

std::int32_t bitcast_to_int32(double t) noexcept {
  float f = static_cast<float>(t);
  if (f == 0.0f) f = 0.0f;
  return std::bit_cast<std::int32_t>(f);
}

Key fold_in(Key key, std::uint32_t data) noexcept {
  return Key(derive(key.bits(), kFoldTag, data));
}

std::vector<Key> split(Key key, std::size_t n) {
  std::vector<Key> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.emplace_back(derive(key.bits(), kSplitTag, static_cast<std::uint64_t>(i)));
  }
  return out;
}

Key derive_interval_key(Key key, double t0, double t1) noexcept {
  const Key k = fold_in(key, static_cast<std::uint32_t>(bitcast_to_int32(t0)));
  return fold_in(k, static_cast<std::uint32_t>(bitcast_to_int32(t1)));
}

} // namespace bpath::core
