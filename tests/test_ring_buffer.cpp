#include <catch2/catch_test_macros.hpp>
#include "memory/ring_buffer.hpp"
#include <stdexcept>
#include <string>

using namespace hybridmem;

static std::vector<int> contents(const RingBuffer<int>& rb) {
    std::vector<int> out;
    for (size_t i = 0; i < rb.size(); i++) out.push_back(rb[i]);
    return out;
}

TEST_CASE("RingBuffer: zero capacity rejected", "[ring_buffer]") {
    REQUIRE_THROWS_AS(RingBuffer<int>(0), std::invalid_argument);
}

TEST_CASE("RingBuffer: fills in order without eviction", "[ring_buffer]") {
    RingBuffer<int> rb(3);
    REQUIRE(rb.empty());
    REQUIRE_FALSE(rb.push_back(1));
    REQUIRE_FALSE(rb.push_back(2));
    REQUIRE_FALSE(rb.push_back(3));
    REQUIRE(rb.full());
    REQUIRE(contents(rb) == std::vector<int>{1, 2, 3});
    REQUIRE(rb.back() == 3);
}

TEST_CASE("RingBuffer: push into full buffer evicts oldest", "[ring_buffer]") {
    RingBuffer<int> rb(3);
    for (int i = 1; i <= 3; i++) rb.push_back(i);
    REQUIRE(rb.push_back(4));
    REQUIRE(rb.push_back(5));
    REQUIRE(rb.size() == 3);
    REQUIRE(contents(rb) == std::vector<int>{3, 4, 5});
    REQUIRE(rb.back() == 5);
}

TEST_CASE("RingBuffer: remove_if keeps survivor order across wraparound", "[ring_buffer]") {
    RingBuffer<int> rb(4);
    for (int i = 1; i <= 6; i++) rb.push_back(i);  // holds 3 4 5 6
    REQUIRE(rb.remove_if([](int v) { return v % 2 == 0; }) == 2);
    REQUIRE(contents(rb) == std::vector<int>{3, 5});

    rb.push_back(7);
    rb.push_back(8);
    REQUIRE(contents(rb) == std::vector<int>{3, 5, 7, 8});
}

TEST_CASE("RingBuffer: remove_if with no match leaves contents intact", "[ring_buffer]") {
    RingBuffer<std::string> rb(2);
    rb.push_back("a");
    rb.push_back("b");
    rb.push_back("c");
    REQUIRE(rb.remove_if([](const std::string&) { return false; }) == 0);
    REQUIRE(rb.size() == 2);
    REQUIRE(rb[0] == "b");
    REQUIRE(rb[1] == "c");
}

TEST_CASE("RingBuffer: clear empties the buffer", "[ring_buffer]") {
    RingBuffer<int> rb(2);
    rb.push_back(1);
    rb.push_back(2);
    rb.clear();
    REQUIRE(rb.empty());
    REQUIRE_FALSE(rb.push_back(9));
    REQUIRE(contents(rb) == std::vector<int>{9});
}
