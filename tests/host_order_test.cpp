#include "hostfan/host_order.hpp"

#include "test_utils.h"

#include <algorithm>
#include <cstdio>
#include <set>
#include <thread>
#include <vector>

namespace {

constexpr std::string_view k_failure_prefix = "host_order_test: ";

bool is_permutation_of_range(std::vector<std::size_t> order, std::size_t count)
{
    if (order.size() != count) {
        return false;
    }
    std::sort(order.begin(), order.end());
    for (std::size_t i = 0; i < count; ++i) {
        if (order[i] != i) {
            return false;
        }
    }
    return true;
}

void test_permutation_covers_every_host()
{
    hostfan::HostOrder order;
    for (std::size_t count : {0u, 1u, 2u, 7u, 64u}) {
        hostfan::test::require_true(is_permutation_of_range(order.permutation(count), count),
                                    k_failure_prefix,
                                    "permutation must contain every index exactly once");
    }
}

void test_empty_pool_yields_empty_order()
{
    hostfan::HostOrder order(42);
    hostfan::test::require_true(order.permutation(0).empty(),
                                k_failure_prefix,
                                "no hosts means no order");
}

void test_fixed_seed_is_reproducible()
{
    hostfan::HostOrder a(1234);
    hostfan::HostOrder b(1234);
    for (int i = 0; i < 5; ++i) {
        hostfan::test::require_true(a.permutation(10) == b.permutation(10),
                                    k_failure_prefix,
                                    "same seed should give the same sequence of orders");
    }
}

void test_orders_vary_between_commands()
{
    hostfan::HostOrder order(7);
    std::set<std::vector<std::size_t>> seen;
    for (int i = 0; i < 50; ++i) {
        seen.insert(order.permutation(6));
    }
    hostfan::test::require_true(seen.size() > 1,
                                k_failure_prefix,
                                "successive commands should not all get the same order");
}

void test_every_position_is_reachable()
{
    // Each host should show up first at least once over many draws
    hostfan::HostOrder order(99);
    std::set<std::size_t> firsts;
    for (int i = 0; i < 400; ++i) {
        firsts.insert(order.permutation(4).front());
    }
    hostfan::test::require_true(firsts.size() == 4,
                                k_failure_prefix,
                                "every host should be tried first for some command");
}

void test_concurrent_callers()
{
    hostfan::HostOrder order;
    std::vector<std::thread> threads;
    std::atomic<int> bad{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&order, &bad]() {
            for (int i = 0; i < 200; ++i) {
                if (!is_permutation_of_range(order.permutation(9), 9)) {
                    ++bad;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    hostfan::test::require_true(bad.load() == 0,
                                k_failure_prefix,
                                "concurrent callers must each get a valid permutation");
}

} // namespace

int main()
{
    try {
        test_permutation_covers_every_host();
        test_empty_pool_yields_empty_order();
        test_fixed_seed_is_reproducible();
        test_orders_vary_between_commands();
        test_every_position_is_reachable();
        test_concurrent_callers();
    }
    catch (const std::exception& ex) {
        std::fprintf(stderr, "host_order_test failed: %s\n", ex.what());
        return 1;
    }

    std::fprintf(stderr, "host_order_test passed\n");
    return 0;
}
