// =================================================================
// tests/WorkQueueTest.cpp
// =================================================================
// Unit tests for the bounded WorkQueue.

#include "Distill/WorkQueue.hpp"
#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <numeric>
#include <thread>
#include <vector>

class WorkQueueTest {
public:
    void testFifoOrder() {
        std::cout << "Testing FIFO order..." << std::endl;

        Distill::WorkQueue<int> queue(4);
        assert(queue.capacity() == 4);
        assert(queue.push(1));
        assert(queue.push(2));
        assert(queue.push(3));
        assert(queue.size() == 3);

        int value = 0;
        assert(queue.pop(value) && value == 1);
        assert(queue.pop(value) && value == 2);
        assert(queue.pop(value) && value == 3);
        assert(queue.size() == 0);

        Distill::WorkQueue<int> zero(0);
        assert(zero.capacity() == 1 && "Capacity is at least one");

        std::cout << "✓ FIFO order test passed" << std::endl;
    }

    void testCloseDrains() {
        std::cout << "Testing close drains pending items..." << std::endl;

        Distill::WorkQueue<int> queue(8);
        queue.push(10);
        queue.push(20);
        queue.close();

        assert(queue.isClosed());
        assert(!queue.push(30) && "A closed queue refuses new items");

        int value = 0;
        assert(queue.pop(value) && value == 10);
        assert(queue.pop(value) && value == 20);
        assert(!queue.pop(value) && "Closed and drained");

        std::cout << "✓ Close drains test passed" << std::endl;
    }

    void testCancelDiscards() {
        std::cout << "Testing cancel discards pending items..." << std::endl;

        Distill::WorkQueue<int> queue(8);
        queue.push(1);
        queue.push(2);
        queue.push(3);

        assert(queue.cancel() == 3);
        int value = 0;
        assert(!queue.pop(value));
        assert(!queue.push(4));
        assert(queue.cancel() == 0 && "Cancelling twice discards nothing more");

        std::cout << "✓ Cancel discards test passed" << std::endl;
    }

    void testBackpressure() {
        std::cout << "Testing producer backpressure..." << std::endl;

        Distill::WorkQueue<int> queue(2);
        std::atomic<int> pushed{0};

        std::thread producer([&queue, &pushed]() {
            for (int i = 0; i < 5; ++i) {
                if (!queue.push(i)) {
                    return;
                }
                ++pushed;
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(pushed.load() == 2 && "The producer blocks on a full queue");
        assert(queue.size() == 2);

        int value = 0;
        for (int expected = 0; expected < 5; ++expected) {
            assert(queue.pop(value));
            assert(value == expected);
        }
        producer.join();
        assert(pushed.load() == 5);

        std::cout << "✓ Backpressure test passed" << std::endl;
    }

    void testCancelWakesBlockedThreads() {
        std::cout << "Testing cancel wakes blocked threads..." << std::endl;

        Distill::WorkQueue<int> full(1);
        full.push(0);
        std::atomic<bool> push_result{true};
        std::thread producer([&full, &push_result]() { push_result = full.push(1); });

        Distill::WorkQueue<int> empty(1);
        std::atomic<bool> pop_result{true};
        std::thread consumer([&empty, &pop_result]() {
            int value = 0;
            pop_result = empty.pop(value);
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        full.cancel();
        empty.cancel();
        producer.join();
        consumer.join();

        assert(!push_result.load());
        assert(!pop_result.load());

        std::cout << "✓ Cancel wakes blocked threads test passed" << std::endl;
    }

    void testManyProducersAndConsumers() {
        std::cout << "Testing multiple producers and consumers..." << std::endl;

        const int producers = 4;
        const int per_producer = 2500;
        Distill::WorkQueue<int> queue(16);

        std::vector<long long> sums(6, 0);
        std::vector<size_t> counts(6, 0);
        std::vector<std::thread> consumers;
        for (size_t c = 0; c < sums.size(); ++c) {
            consumers.emplace_back([&queue, &sums, &counts, c]() {
                int value = 0;
                while (queue.pop(value)) {
                    sums[c] += value;
                    ++counts[c];
                }
            });
        }

        std::vector<std::thread> threads;
        for (int p = 0; p < producers; ++p) {
            threads.emplace_back([&queue, p, per_producer]() {
                for (int i = 0; i < per_producer; ++i) {
                    queue.push(p * per_producer + i);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        queue.close();
        for (auto& consumer : consumers) {
            consumer.join();
        }

        const long long n = producers * per_producer;
        assert(std::accumulate(counts.begin(), counts.end(), size_t{0}) == static_cast<size_t>(n) &&
               "Every item is delivered exactly once");
        assert(std::accumulate(sums.begin(), sums.end(), 0LL) == n * (n - 1) / 2);

        std::cout << "✓ Multiple producers and consumers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running WorkQueue unit tests..." << std::endl;

        testFifoOrder();
        testCloseDrains();
        testCancelDiscards();
        testBackpressure();
        testCancelWakesBlockedThreads();
        testManyProducersAndConsumers();

        std::cout << "All WorkQueue tests passed!" << std::endl;
    }
};

int main() {
    try {
        WorkQueueTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All WorkQueue component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
