#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <bpath/core/Tree.h>

namespace bpath::core {

// Key
// ---
// Immutable PRNG token. Keys are never advanced in place: every derivation
// (fold_in, split) returns fresh keys and leaves its input untouched, so a key
// can be shared freely between threads and queries.
class Key {
public:
  constexpr Key() noexcept = default;
  explicit constexpr Key(std::uint64_t seed) noexcept : bits_(seed) {}

  constexpr std::uint64_t bits() const noexcept { return bits_; }

  bool operator==(const Key&) const = default;

private:
  std::uint64_t bits_{0};
};

// Rounds t to single precision and reinterprets its bit pattern as int32.
// -0.0 is mapped to +0.0 first so equal times always give equal integers.
std::int32_t bitcast_to_int32(double t) noexcept;

// Mixes one 32-bit word into key. For a fixed key, distinct data give
// distinct keys.
Key fold_in(Key key, std::uint32_t data) noexcept;

// n independent children of key. split(key, n)[i] does not depend on n.
std::vector<Key> split(Key key, std::size_t n);

// Key for the interval [t0, t1]: fold_in(fold_in(key, bits(t0)), bits(t1)).
Key derive_interval_key(Key key, double t0, double t1) noexcept;

// One child key per leaf of tree, laid out in the same structure.
template <typename T>
Tree<Key> split_by_tree(Key key, const Tree<T>& tree) {
  return tree.unflatten(split(key, tree.num_leaves()));
}

} // namespace bpath::core
