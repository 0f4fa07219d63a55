#include "./handoff_queue.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <string>
#include <thread>

TEST_CASE("Values come out in the order they went in") {
    sluice::handoff_queue<std::string> q{3};
    CHECK(q.capacity() == 3);
    CHECK(q.push("a"));
    CHECK(q.push("b"));
    CHECK_FALSE(q.full());
    CHECK(q.push("c"));
    CHECK(q.full());
    CHECK(q.size() == 3);
    CHECK(q.pop() == "a");
    CHECK(q.try_pop() == "b");
    CHECK(q.pop() == "c");
    CHECK(q.size() == 0);
    CHECK(q.try_pop() == std::nullopt);
}

TEST_CASE("A finished queue drains before it ends") {
    sluice::handoff_queue<int> q{2};
    q.push(1);
    q.push(2);
    q.finish();
    CHECK(q.finished());
    CHECK_FALSE(q.closed());
    CHECK(q.pop() == 1);
    CHECK(q.pop() == 2);
    CHECK(q.pop() == std::nullopt);
    CHECK(q.pop() == std::nullopt);
}

TEST_CASE("A blocked push waits for room") {
    sluice::handoff_queue<int> q{1};
    q.push(1);
    std::atomic<bool> pushed{false};
    std::thread       producer{[&] {
        q.push(2);
        pushed = true;
        q.finish();
    }};
    CHECK(q.pop() == 1);
    CHECK(q.pop() == 2);
    CHECK(q.pop() == std::nullopt);
    producer.join();
    CHECK(pushed);
}

TEST_CASE("Closing a queue") {
    SECTION("drops queued values and rejects pushes") {
        sluice::handoff_queue<int> q{2};
        q.push(1);
        q.close();
        CHECK(q.closed());
        CHECK(q.size() == 0);
        CHECK_FALSE(q.push(2));
        CHECK(q.pop() == std::nullopt);
    }

    SECTION("wakes a blocked producer") {
        sluice::handoff_queue<int> q{1};
        q.push(1);
        std::atomic<int> result{-1};
        std::thread      producer{[&] { result = q.push(2) ? 1 : 0; }};
        // Give the producer a chance to block. The outcome is the same if it has not yet.
        std::this_thread::yield();
        q.close();
        producer.join();
        CHECK(result == 0);
    }

    SECTION("wakes a blocked consumer") {
        sluice::handoff_queue<int> q{1};
        std::atomic<bool>          got_value{true};
        std::thread                consumer{[&] { got_value = q.pop().has_value(); }};
        std::this_thread::yield();
        q.close();
        consumer.join();
        CHECK_FALSE(got_value);
    }
}
