#include <libutl/utilities.hpp>
#include <libutl/concurrent_map.hpp>
#include <catch2/catch_test_macros.hpp>

#define TEST(name) TEST_CASE("libutl " name, "[libutl]") // NOLINT

using namespace du;

TEST("Concurrent_map::insert keeps the first value")
{
    utl::Concurrent_map<int, std::string> map;
    REQUIRE_FALSE(map.find(1).has_value());
    REQUIRE(map.insert(1, "one") == "one");
    REQUIRE(map.insert(1, "uno") == "one");
    REQUIRE(map.find(1) == "one");
    REQUIRE(map.size() == 1);
    map.clear();
    REQUIRE(map.size() == 0);
}

TEST("Concurrent_map::find_or_insert")
{
    utl::Concurrent_map<int, int> map;
    int calls = 0;
    auto const make = [&] { return ++calls; };
    REQUIRE(map.find_or_insert(7, make) == 1);
    REQUIRE(map.find_or_insert(7, make) == 1);
    REQUIRE(calls == 1);
}

TEST("Concurrent_map concurrent insertion")
{
    utl::Concurrent_map<int, int> map;
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t != 4; ++t) {
            threads.emplace_back([&map, t] {
                for (int i = 0; i != 100; ++i) {
                    (void)map.insert(i, t);
                }
            });
        }
    }
    REQUIRE(map.size() == 100);
    for (int i = 0; i != 100; ++i) {
        auto const value = map.find(i);
        REQUIRE(value.has_value());
        REQUIRE(map.insert(i, 99) == value.value());
    }
}
