#include <libutl/utilities.hpp>
#include <libutl/index_vector.hpp>
#include <catch2/catch_test_macros.hpp>

#define TEST(name) TEST_CASE("libutl " name, "[libutl]") // NOLINT

using namespace du;

namespace {

    using Index  = utl::Vector_index<struct Test_index_tag>;
    using Vector = utl::Index_vector<Index, std::string>;

    template <class T>
    using Subscript = decltype(std::declval<T>()[Index(0)]);

    static_assert(utl::vector_index<Index>);
    static_assert(std::three_way_comparable<Index>);
    static_assert(std::is_same_v<Subscript<Vector&&>, std::string&&>);
    static_assert(std::is_same_v<Subscript<Vector const&&>, std::string const&&>);
    static_assert(std::is_same_v<Subscript<Vector&>, std::string&>);
    static_assert(std::is_same_v<Subscript<Vector const&>, std::string const&>);

} // namespace

TEST("Index_vector::push")
{
    Vector vector;
    REQUIRE(vector.empty());

    Index const a = vector.push("a");
    Index const b = vector.push(3UZ, 'b');
    REQUIRE(a.get() == 0);
    REQUIRE(b.get() == 1);
    REQUIRE(vector.size() == 2);
    REQUIRE(vector[a] == "a");
    REQUIRE(vector[b] == "bbb");
}

TEST("Index_vector::contains")
{
    Vector vector;
    REQUIRE_FALSE(vector.contains(Index(0)));
    (void)vector.push("x");
    REQUIRE(vector.contains(Index(0)));
    REQUIRE_FALSE(vector.contains(Index(1)));
    REQUIRE_THROWS_AS(vector[Index(1)], std::out_of_range);
}

TEST("Index_vector::indices")
{
    Vector vector;
    (void)vector.push("x");
    (void)vector.push("y");
    (void)vector.push("z");

    std::string joined;
    for (Index const index : vector.indices()) {
        joined += vector[index];
    }
    REQUIRE(joined == "xyz");
}
