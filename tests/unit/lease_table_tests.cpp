#include <doctest/doctest.h>
#include <cork/lease_table.hpp>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace cork;

namespace {

// Spin until `table` reports `count` holders and waiters for `name`
void wait_for_queue(const LeaseTable& table, const std::string& name, size_t count) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (table.waiting(name) < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

TEST_CASE("lease: RAII release") {
    LeaseTable table;
    {
        Lease lease = table.acquire("game");
        CHECK(lease.isHeld());
        CHECK(lease.name() == "game");
        CHECK(table.waiting("game") == 1);
    }
    CHECK(table.waiting("game") == 0);

    Lease again = table.acquire("game");
    again.release();
    CHECK_FALSE(again.isHeld());
    CHECK(table.waiting("game") == 0);
}

TEST_CASE("lease: moves transfer ownership") {
    LeaseTable table;
    Lease a = table.acquire("x");
    Lease b = std::move(a);
    CHECK_FALSE(a.isHeld());
    CHECK(b.isHeld());
    CHECK(table.waiting("x") == 1);

    Lease c;
    c = std::move(b);
    CHECK(c.isHeld());
    c.release();
    CHECK(table.waiting("x") == 0);
}

TEST_CASE("lease: same name is served in arrival order") {
    LeaseTable table;
    std::mutex order_mutex;
    std::vector<int> order;

    Lease first = table.acquire("bottle");

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            Lease lease = table.acquire("bottle");
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
        // Each thread queues before the next one starts
        wait_for_queue(table, "bottle", static_cast<size_t>(i) + 2);
    }

    CHECK(table.waiting("bottle") == 5);
    first.release();
    for (auto& t : threads) t.join();

    CHECK(order == std::vector<int>{0, 1, 2, 3});
    CHECK(table.waiting("bottle") == 0);
}

TEST_CASE("lease: different names do not block each other") {
    LeaseTable table;
    Lease held = table.acquire("one");

    bool acquired = false;
    std::thread other([&] {
        Lease lease = table.acquire("two");
        acquired = lease.isHeld();
    });
    other.join();

    CHECK(acquired);
    CHECK(held.isHeld());
}

TEST_CASE("cancellation token is shared between copies") {
    CancellationToken token;
    CancellationToken copy = token;
    CHECK_FALSE(copy.cancelled());
    token.cancel();
    CHECK(copy.cancelled());
}
