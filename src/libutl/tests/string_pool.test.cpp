#include <libutl/utilities.hpp>
#include <libutl/string_pool.hpp>
#include <catch2/catch_test_macros.hpp>

#define TEST(name) TEST_CASE("libutl " name, "[libutl]") // NOLINT

using namespace du;

TEST("String_pool interning")
{
    utl::String_pool pool;
    auto const hello = pool.make("hello");
    auto const world = pool.make("world");
    REQUIRE(hello != world);
    REQUIRE(pool.make("hello") == hello);
    REQUIRE(pool.get(hello) == "hello");
    REQUIRE(pool.get(world) == "world");
    REQUIRE(pool.size() == 2);
}

TEST("String_pool::find")
{
    utl::String_pool pool;
    REQUIRE_FALSE(pool.find("x").has_value());
    auto const x = pool.make("x");
    REQUIRE(pool.find("x") == x);
    REQUIRE(pool.size() == 1);
}

TEST("String_pool views stay valid")
{
    utl::String_pool pool;
    std::string_view const first = pool.get(pool.make("first"));
    for (int i = 0; i != 1000; ++i) {
        (void)pool.make(std::format("string {}", i));
    }
    REQUIRE(first == "first");
}

TEST("String_pool concurrent interning")
{
    utl::String_pool pool;
    std::vector<std::vector<utl::String_id>> results(4);
    {
        std::vector<std::jthread> threads;
        for (auto& result : results) {
            threads.emplace_back([&pool, &result] {
                for (int i = 0; i != 100; ++i) {
                    result.push_back(pool.make(std::format("s{}", i % 10)));
                }
            });
        }
    }
    REQUIRE(pool.size() == 10);
    for (auto const& result : results) {
        REQUIRE(result == results.front());
    }
}
