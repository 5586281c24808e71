#include "input/InputSystem.h"

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <thread>
#include <vector>

using namespace actuate::input;

TEST(GlobalInputTest, ConcurrentFirstAccessCreatesOneInstance) {
    constexpr std::size_t threadCount = 8;

    std::array<InputSystem*, threadCount> seen{};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    threads.reserve(threadCount);

    for (std::size_t i = 0; i < threadCount; ++i) {
        threads.emplace_back([&seen, &go, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            seen[i] = &getGlobalInputSystem();
        });
    }

    go.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_NE(seen[0], nullptr);
    for (const InputSystem* system : seen) {
        EXPECT_EQ(system, seen[0]);
    }
    EXPECT_EQ(&getGlobalInputSystem(), seen[0]);
}
