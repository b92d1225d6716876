#include <catch2/catch.hpp>

#include <bpath/core/Tree.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace bpath::core;

namespace {

// {"b": [1, 2], "a": 3, "c": {"z": 4}}
Tree<int> sample_tree() {
    return Tree<int>::mapping({
        {"b", Tree<int>::sequence({Tree<int>::leaf(1), Tree<int>::leaf(2)})},
        {"a", Tree<int>::leaf(3)},
        {"c", Tree<int>::mapping({{"z", Tree<int>::leaf(4)}})},
    });
}

} // namespace

TEST_CASE("mapping keys are sorted and traversal follows them", "[tree]") {
    const Tree<int> t = sample_tree();

    REQUIRE(t.kind() == TreeKind::Mapping);
    REQUIRE(t.keys() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(t.num_leaves() == 4);
    REQUIRE(t.leaves() == std::vector<int>{3, 1, 2, 4});

    REQUIRE(t.at("a").value() == 3);
    REQUIRE(t.at("b")[1].value() == 2);
    REQUIRE(t.at("c").at("z").value() == 4);
}

TEST_CASE("leaf paths name every step from the root", "[tree]") {
    std::vector<std::string> paths;
    sample_tree().for_each_leaf_with_path([&](const std::string& path, int) { paths.push_back(path); });

    REQUIRE(paths == std::vector<std::string>{"['a']", "['b'][0]", "['b'][1]", "['c']['z']"});

    paths.clear();
    Tree<int>::leaf(0).for_each_leaf_with_path([&](const std::string& path, int) { paths.push_back(path); });
    REQUIRE(paths == std::vector<std::string>{""});
}

TEST_CASE("malformed access is rejected", "[tree]") {
    const Tree<int> t = sample_tree();

    REQUIRE_THROWS_AS(t.value(), std::invalid_argument);
    REQUIRE_THROWS_AS(t.at("missing"), std::out_of_range);
    REQUIRE_THROWS_AS(t.at("b")[2], std::out_of_range);
    REQUIRE_THROWS_AS(t.at("b").at("x"), std::invalid_argument);
    REQUIRE_THROWS_AS(t.at("a")[0], std::invalid_argument);

    REQUIRE_THROWS_AS(Tree<int>::mapping({{"k", Tree<int>::leaf(1)}, {"k", Tree<int>::leaf(2)}}),
                      std::invalid_argument);
}

TEST_CASE("map keeps the structure and changes the leaf type", "[tree]") {
    const Tree<int> t = sample_tree();
    const Tree<std::string> s = t.map([](int v) { return std::to_string(v * 10); });

    REQUIRE(s.same_structure(t));
    REQUIRE(s.leaves() == std::vector<std::string>{"30", "10", "20", "40"});
    REQUIRE(s.at("c").at("z").value() == "40");
}

TEST_CASE("zip_map pairs leaves of identically shaped trees", "[tree]") {
    const Tree<int> t = sample_tree();
    const Tree<double> halves = t.map([](int v) { return v * 0.5; });

    const Tree<double> sums = t.zip_map(halves, [](int a, double b) { return a + b; });
    REQUIRE(sums.leaves() == std::vector<double>{4.5, 1.5, 3.0, 6.0});

    const Tree<int> other = Tree<int>::sequence({Tree<int>::leaf(1)});
    REQUIRE_THROWS_AS(t.zip_map(other, [](int a, int b) { return a + b; }), std::invalid_argument);

    // Same leaf count, different keys
    const Tree<int> renamed = Tree<int>::mapping({
        {"b", Tree<int>::sequence({Tree<int>::leaf(1), Tree<int>::leaf(2)})},
        {"a", Tree<int>::leaf(3)},
        {"d", Tree<int>::mapping({{"z", Tree<int>::leaf(4)}})},
    });
    REQUIRE_FALSE(t.same_structure(renamed));
}

TEST_CASE("unflatten rebuilds the structure from traversal-ordered leaves", "[tree]") {
    const Tree<int> t = sample_tree();

    const Tree<char> c = t.unflatten(std::vector<char>{'a', 'b', 'c', 'd'});
    REQUIRE(c.same_structure(t));
    REQUIRE(c.at("a").value() == 'a');
    REQUIRE(c.at("b")[0].value() == 'b');
    REQUIRE(c.at("c").at("z").value() == 'd');

    REQUIRE_THROWS_AS(t.unflatten(std::vector<char>{'a'}), std::invalid_argument);
}

TEST_CASE("empty containers have no leaves", "[tree]") {
    const Tree<int> empty_seq = Tree<int>::sequence({});
    const Tree<int> empty_map = Tree<int>::mapping({});

    REQUIRE(empty_seq.num_leaves() == 0);
    REQUIRE(empty_map.num_leaves() == 0);
    REQUIRE_FALSE(empty_seq.same_structure(empty_map));
    REQUIRE(empty_map.unflatten(std::vector<int>{}).same_structure(empty_map));
}
