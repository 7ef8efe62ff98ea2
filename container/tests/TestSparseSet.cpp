/**
 * @file TestSparseSet.cpp
 * @brief Unit tests for container::SparseSet.
 */

#include <catch2/catch_test_macros.hpp>

#include "ember/container/SparseSet.hpp"

#include <string>

namespace ember::container {

TEST_CASE("SparseSet grows to fit large slots", "[container][sparseset]")
{
    SparseSet<int> set;
    REQUIRE(set.empty());

    REQUIRE(set.insert(5000, 7) != nullptr);
    REQUIRE(set.contains(5000));
    REQUIRE_FALSE(set.contains(4999));
    REQUIRE(*set.find(5000) == 7);
}

TEST_CASE("SparseSet rejects a second insert on the same slot", "[container][sparseset]")
{
    SparseSet<std::string> set;
    REQUIRE(set.insert(1, "first") != nullptr);
    REQUIRE(set.insert(1, "second") == nullptr);
    REQUIRE(*set.find(1) == "first");
}

TEST_CASE("SparseSet swap-and-pop keeps the moved element reachable", "[container][sparseset]")
{
    SparseSet<int> set;
    set.insert(10, 100);
    set.insert(20, 200);
    set.insert(30, 300);

    REQUIRE(set.remove(10));
    REQUIRE_FALSE(set.contains(10));
    REQUIRE(set.size() == 2);
    REQUIRE(*set.find(30) == 300);
    REQUIRE(*set.find(20) == 200);

    REQUIRE(set.slots().size() == set.values().size());
    for (core::u32 i = 0; i < set.size(); ++i)
        REQUIRE(*set.find(set.slots()[i]) == set.values()[i]);

    REQUIRE_FALSE(set.remove(10));
    REQUIRE_FALSE(set.remove(99999));
}

} // namespace ember::container
