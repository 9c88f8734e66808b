// ==============================================================================
// Unit Test: MpscQueue
// ==============================================================================
// FIFO order, non-blocking drain, and delivery under concurrent producers.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "engine/command.h"
#include "engine/command_queue.h"

#include <atomic>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace Acordes;

TEST_CASE("MpscQueue starts empty", "[engine][command_queue]") {
    MpscQueue<int> queue;
    CHECK(queue.empty());
    size_t calls = 0;
    CHECK(queue.drain([&](const int&) { ++calls; }) == 0);
    CHECK(calls == 0);
    CHECK(queue.droppedCount() == 0);
}

TEST_CASE("MpscQueue delivers in FIFO order", "[engine][command_queue]") {
    MpscQueue<int> queue;
    for (int i = 0; i < 100; ++i) {
        REQUIRE(queue.enqueue(i));
    }
    CHECK_FALSE(queue.empty());

    std::vector<int> received;
    CHECK(queue.drain([&](const int& v) { received.push_back(v); }) == 100);
    REQUIRE(received.size() == 100);
    for (int i = 0; i < 100; ++i) {
        CHECK(received[static_cast<size_t>(i)] == i);
    }
    CHECK(queue.empty());
}

TEST_CASE("MpscQueue interleaves enqueue and drain", "[engine][command_queue]") {
    MpscQueue<std::string> queue;
    std::vector<std::string> received;
    const auto collect = [&](const std::string& s) { received.push_back(s); };

    (void)queue.enqueue("a");
    (void)queue.drain(collect);
    (void)queue.enqueue("b");
    (void)queue.enqueue("c");
    (void)queue.drain(collect);
    (void)queue.drain(collect);

    CHECK(received == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("MpscQueue carries engine commands", "[engine][command_queue]") {
    MpscQueue<Command> queue;
    (void)queue.enqueue(NoteOnCommand{36, 100.0f});
    (void)queue.enqueue(makeParamUpdate({{"cutoff", 400.0}, {"waveform", std::string("sawtooth")}}));
    (void)queue.enqueue(AllNotesOffCommand{});

    std::vector<size_t> kinds;
    (void)queue.drain([&](const Command& c) { kinds.push_back(c.index()); });
    CHECK(kinds == std::vector<size_t>{0, 2, 3});
}

TEST_CASE("MpscQueue is FIFO per producer with concurrent producers",
          "[engine][command_queue]") {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 20000;

    struct Item {
        int producer;
        int sequence;
    };
    MpscQueue<Item> queue;

    std::atomic<bool> go{false};
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            for (int s = 0; s < kPerProducer; ++s) {
                (void)queue.enqueue(Item{p, s});
            }
        });
    }

    std::vector<int> nextExpected(kProducers, 0);
    bool ordered = true;
    int total = 0;
    const auto consume = [&](const Item& item) {
        if (item.sequence != nextExpected[static_cast<size_t>(item.producer)]) {
            ordered = false;
        }
        nextExpected[static_cast<size_t>(item.producer)] = item.sequence + 1;
        ++total;
    };

    go.store(true, std::memory_order_release);
    while (total < kProducers * kPerProducer) {
        (void)queue.drain(consume);
    }
    for (auto& t : producers) {
        t.join();
    }
    (void)queue.drain(consume);

    CHECK(ordered);
    CHECK(total == kProducers * kPerProducer);
    for (int count : nextExpected) {
        CHECK(count == kPerProducer);
    }
    CHECK(queue.droppedCount() == 0);
}
