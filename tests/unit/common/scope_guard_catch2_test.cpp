#include <catch2/catch_test_macros.hpp>

#include <xfer/common/scope_guard.h>

#include <stdexcept>
#include <vector>

TEST_CASE("scope_exit runs on normal exit", "[unit][common][scope_guard]") {
    int runs = 0;
    {
        auto done = xfer::scope_exit([&] { ++runs; });
        CHECK(runs == 0);
    }
    CHECK(runs == 1);
}

TEST_CASE("scope_exit runs while an exception unwinds", "[unit][common][scope_guard]") {
    int runs = 0;
    auto body = [&] {
        auto done = xfer::scope_exit([&] { ++runs; });
        throw std::runtime_error("action failed");
    };
    CHECK_THROWS_AS(body(), std::runtime_error);
    CHECK(runs == 1);
}

TEST_CASE("scope_exit guards unwind in reverse order", "[unit][common][scope_guard]") {
    std::vector<int> order;
    {
        auto outer = xfer::scope_exit([&] { order.push_back(1); });
        auto inner = xfer::scope_exit([&] { order.push_back(2); });
    }
    CHECK(order == std::vector<int>{2, 1});
}
