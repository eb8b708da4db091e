/**
 * @file test_fetch_gate.cpp
 * @brief Unit tests for fetch admission control
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/retrieval/fetch_gate.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace deepdive;
using std::chrono::milliseconds;

TEST_CASE("FetchGate: permits are released on destruction", "[fetch_gate]") {
    FetchGate gate(2, milliseconds(0));

    {
        FetchGate::Permit a = gate.acquire("a.example");
        REQUIRE(a);
        REQUIRE(gate.in_flight() == 1);

        FetchGate::Permit b = std::move(a);
        REQUIRE(b);
        REQUIRE_FALSE(a);
        REQUIRE(gate.in_flight() == 1);
    }
    REQUIRE(gate.in_flight() == 0);

    FetchGate::Permit c = gate.acquire("c.example");
    c.release();
    REQUIRE(gate.in_flight() == 0);
    c.release();
    REQUIRE(gate.in_flight() == 0);
}

TEST_CASE("FetchGate: global concurrency cap", "[fetch_gate]") {
    FetchGate gate(3, milliseconds(0));
    std::atomic<int> active(0);
    std::atomic<int> max_seen(0);

    std::vector<std::future<void>> workers;
    for (int i = 0; i < 12; ++i) {
        workers.push_back(std::async(std::launch::async, [&gate, &active, &max_seen, i]() {
            FetchGate::Permit permit = gate.acquire("host" + std::to_string(i) + ".example");
            int now = ++active;
            int previous = max_seen.load();
            while (now > previous && !max_seen.compare_exchange_weak(previous, now)) {}
            std::this_thread::sleep_for(milliseconds(10));
            --active;
        }));
    }
    for (auto& worker : workers) {
        worker.get();
    }

    REQUIRE(max_seen.load() <= 3);
    REQUIRE(gate.peak_in_flight() <= 3);
    REQUIRE(gate.peak_in_flight() >= 1);
    REQUIRE(gate.in_flight() == 0);
}

TEST_CASE("FetchGate: politeness delay spaces requests to one host", "[fetch_gate]") {
    FetchGate gate(8, milliseconds(40));
    auto start = FetchGate::Clock::now();

    { FetchGate::Permit p = gate.acquire("same.example"); }
    { FetchGate::Permit p = gate.acquire("same.example"); }
    { FetchGate::Permit p = gate.acquire("same.example"); }

    auto elapsed = std::chrono::duration_cast<milliseconds>(FetchGate::Clock::now() - start);
    REQUIRE(elapsed.count() >= 80);

    SECTION("other hosts are not delayed") {
        auto other_start = FetchGate::Clock::now();
        { FetchGate::Permit p = gate.acquire("other.example"); }
        auto other_elapsed = std::chrono::duration_cast<milliseconds>(FetchGate::Clock::now() - other_start);
        REQUIRE(other_elapsed.count() < 40);
    }
}

TEST_CASE("FetchGate: politeness holds when the cap is saturated", "[fetch_gate]") {
    FetchGate gate(1, milliseconds(200));
    FetchGate::Permit blocker = gate.acquire("other.example");
    REQUIRE(blocker);

    std::mutex times_mutex;
    std::vector<FetchGate::Clock::time_point> admitted;
    std::vector<std::future<void>> workers;
    for (int i = 0; i < 2; ++i) {
        workers.push_back(std::async(std::launch::async, [&gate, &times_mutex, &admitted]() {
            FetchGate::Permit permit = gate.acquire("example.com");
            std::lock_guard<std::mutex> lock(times_mutex);
            admitted.push_back(FetchGate::Clock::now());
        }));
    }

    // Both requests queue for the only slot well past their politeness delay
    std::this_thread::sleep_for(milliseconds(500));
    blocker.release();
    for (auto& worker : workers) {
        worker.get();
    }

    REQUIRE(admitted.size() == 2);
    auto gap = std::chrono::duration_cast<milliseconds>(admitted[1] - admitted[0]);
    REQUIRE(gap.count() >= 190);
    REQUIRE(gate.peak_in_flight() == 1);
}

TEST_CASE("FetchGate: cancellation", "[fetch_gate]") {
    SECTION("while waiting for a slot") {
        FetchGate gate(1, milliseconds(0));
        FetchGate::Permit held = gate.acquire("a.example");

        CancellationToken cancel;
        auto waiter = std::async(std::launch::async, [&gate, &cancel]() {
            return static_cast<bool>(gate.acquire("b.example", &cancel));
        });
        std::this_thread::sleep_for(milliseconds(20));
        cancel.cancel();
        REQUIRE_FALSE(waiter.get());
        REQUIRE(gate.in_flight() == 1);
    }

    SECTION("while waiting out the politeness delay") {
        FetchGate gate(4, milliseconds(5000));
        { FetchGate::Permit first = gate.acquire("slow.example"); }

        CancellationToken cancel;
        auto start = FetchGate::Clock::now();
        auto waiter = std::async(std::launch::async, [&gate, &cancel]() {
            return static_cast<bool>(gate.acquire("slow.example", &cancel));
        });
        std::this_thread::sleep_for(milliseconds(20));
        cancel.cancel();
        REQUIRE_FALSE(waiter.get());
        REQUIRE(std::chrono::duration_cast<milliseconds>(FetchGate::Clock::now() - start).count() < 2000);
    }

    SECTION("already cancelled") {
        FetchGate gate(1, milliseconds(0));
        CancellationToken cancel;
        cancel.cancel();
        REQUIRE_FALSE(gate.acquire("a.example", &cancel));
        REQUIRE(gate.in_flight() == 0);
    }
}
