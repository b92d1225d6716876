#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace bpath::core {

enum class TreeKind { Leaf, Sequence, Mapping };

/// Tree
/// ----
/// Immutable nested structure of values: a leaf, an ordered sequence of
/// subtrees, or a string-keyed mapping of subtrees. Mapping keys are kept
/// sorted, so every traversal visits leaves in one fixed depth-first order
/// (sequence order, then ascending key order) that depends only on the
/// structure, never on the leaf contents.
///
/// Leaf paths are printed as ['key'][0]; the path of a root leaf is empty.
template <typename T>
class Tree {
public:
  static Tree leaf(T value) {
    Tree t(TreeKind::Leaf);
    t.value_.emplace(std::move(value));
    return t;
  }

  static Tree sequence(std::vector<Tree> children) {
    Tree t(TreeKind::Sequence);
    t.children_ = std::move(children);
    return t;
  }

  // Throws std::invalid_argument on duplicate keys.
  static Tree mapping(std::vector<std::pair<std::string, Tree>> entries) {
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    Tree t(TreeKind::Mapping);
    t.keys_.reserve(entries.size());
    t.children_.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
      if (i > 0 && entries[i].first == entries[i - 1].first) {
        throw std::invalid_argument("duplicate mapping key '" + entries[i].first + "'");
      }
      t.keys_.push_back(std::move(entries[i].first));
      t.children_.push_back(std::move(entries[i].second));
    }
    return t;
  }

  TreeKind kind() const noexcept { return kind_; }
  bool is_leaf() const noexcept { return kind_ == TreeKind::Leaf; }

  const T& value() const {
    if (kind_ != TreeKind::Leaf) throw std::invalid_argument("tree node is not a leaf");
    return *value_;
  }

  // Number of direct children (0 for a leaf).
  std::size_t size() const noexcept { return children_.size(); }

  const Tree& operator[](std::size_t i) const {
    if (kind_ == TreeKind::Leaf) throw std::invalid_argument("tree leaf has no children");
    if (i >= children_.size()) throw std::out_of_range("tree child index out of range");
    return children_[i];
  }

  const Tree& at(std::string_view key) const {
    if (kind_ != TreeKind::Mapping) throw std::invalid_argument("tree node is not a mapping");
    const auto it = std::lower_bound(keys_.begin(), keys_.end(), key,
                                     [](const std::string& a, std::string_view b) { return a < b; });
    if (it == keys_.end() || *it != key) {
      throw std::out_of_range("tree has no key '" + std::string(key) + "'");
    }
    return children_[static_cast<std::size_t>(it - keys_.begin())];
  }

  // Sorted keys of a mapping; empty for other kinds.
  const std::vector<std::string>& keys() const noexcept { return keys_; }

  std::size_t num_leaves() const noexcept {
    if (kind_ == TreeKind::Leaf) return 1;
    std::size_t n = 0;
    for (const Tree& c : children_) n += c.num_leaves();
    return n;
  }

  template <typename F>
  void for_each_leaf(F&& f) const {
    if (kind_ == TreeKind::Leaf) {
      f(*value_);
      return;
    }
    for (const Tree& c : children_) c.for_each_leaf(f);
  }

  // f(path, value) for every leaf, in traversal order.
  template <typename F>
  void for_each_leaf_with_path(F&& f) const {
    visit_with_path(std::string(), f);
  }

  std::vector<T> leaves() const {
    std::vector<T> out;
    out.reserve(num_leaves());
    for_each_leaf([&](const T& v) { out.push_back(v); });
    return out;
  }

  template <typename U>
  bool same_structure(const Tree<U>& other) const noexcept {
    if (kind_ != other.kind_) return false;
    if (kind_ == TreeKind::Leaf) return true;
    if (children_.size() != other.children_.size() || keys_ != other.keys_) return false;
    for (std::size_t i = 0; i < children_.size(); ++i) {
      if (!children_[i].same_structure(other.children_[i])) return false;
    }
    return true;
  }

  // Applies f to every leaf, keeping the structure.
  template <typename F>
  auto map(F&& f) const -> Tree<std::decay_t<std::invoke_result_t<F&, const T&>>> {
    using U = std::decay_t<std::invoke_result_t<F&, const T&>>;
    if (kind_ == TreeKind::Leaf) return Tree<U>::leaf(f(*value_));

    Tree<U> out(kind_);
    out.keys_ = keys_;
    out.children_.reserve(children_.size());
    for (const Tree& c : children_) out.children_.push_back(c.map(f));
    return out;
  }

  // Applies f(mine, theirs) leaf by leaf. Both trees must have the same
  // structure, otherwise std::invalid_argument is thrown.
  template <typename U, typename F>
  auto zip_map(const Tree<U>& other, F&& f) const
      -> Tree<std::decay_t<std::invoke_result_t<F&, const T&, const U&>>> {
    if (!same_structure(other)) throw std::invalid_argument("tree structures do not match");
    return zip_map_unchecked(other, f);
  }

  // Rebuilds this structure with the given leaves, in traversal order.
  template <typename U>
  Tree<U> unflatten(std::vector<U> leaves) const {
    if (leaves.size() != num_leaves()) {
      throw std::invalid_argument("leaf count does not match tree structure");
    }
    std::size_t pos = 0;
    return rebuild(leaves, pos);
  }

private:
  template <typename>
  friend class Tree;

  explicit Tree(TreeKind kind) : kind_(kind) {}

  template <typename F>
  void visit_with_path(const std::string& prefix, F& f) const {
    if (kind_ == TreeKind::Leaf) {
      f(prefix, *value_);
      return;
    }
    for (std::size_t i = 0; i < children_.size(); ++i) {
      const std::string step = kind_ == TreeKind::Mapping
                                   ? "['" + keys_[i] + "']"
                                   : "[" + std::to_string(i) + "]";
      children_[i].visit_with_path(prefix + step, f);
    }
  }

  template <typename U, typename F>
  auto zip_map_unchecked(const Tree<U>& other, F& f) const
      -> Tree<std::decay_t<std::invoke_result_t<F&, const T&, const U&>>> {
    using R = std::decay_t<std::invoke_result_t<F&, const T&, const U&>>;
    if (kind_ == TreeKind::Leaf) return Tree<R>::leaf(f(*value_, *other.value_));

    Tree<R> out(kind_);
    out.keys_ = keys_;
    out.children_.reserve(children_.size());
    for (std::size_t i = 0; i < children_.size(); ++i) {
      out.children_.push_back(children_[i].zip_map_unchecked(other.children_[i], f));
    }
    return out;
  }

  template <typename U>
  Tree<U> rebuild(std::vector<U>& leaves, std::size_t& pos) const {
    if (kind_ == TreeKind::Leaf) return Tree<U>::leaf(std::move(leaves[pos++]));

    Tree<U> out(kind_);
    out.keys_ = keys_;
    out.children_.reserve(children_.size());
    for (const Tree& c : children_) out.children_.push_back(c.rebuild(leaves, pos));
    return out;
  }

  TreeKind kind_;
  std::optional<T> value_;
  std::vector<Tree> children_;
  std::vector<std::string> keys_;
};

} // namespace bpath::core
