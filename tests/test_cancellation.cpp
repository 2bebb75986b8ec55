#include "tvdeck/core/Cancellation.hpp"
#include "support/TestSupport.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using namespace tvdeck;

namespace {

void testDefaultTokenNeverCancels() {
    core::CancellationToken token;
    ASSERT_TRUE(!token.isCancelled(), "default token is live");
    ASSERT_TRUE(token.sleepFor(5ms), "default token sleeps to completion");
    ASSERT_TRUE(token.sleepFor(0ms), "zero sleep on a live token");
}

void testCancelBeforeSleep() {
    core::CancellationSource source;
    auto token = source.token();
    source.cancel();
    source.cancel();
    ASSERT_TRUE(token.isCancelled(), "copies see the cancellation");
    ASSERT_TRUE(!token.sleepFor(0ms), "zero sleep reports cancellation");
    ASSERT_TRUE(!token.sleepFor(10s), "already-cancelled sleep returns at once");
}

void testCancelWakesSleeper() {
    core::CancellationSource source;
    const auto token = source.token();
    std::atomic<bool> completed{true};

    const auto start = std::chrono::steady_clock::now();
    std::thread sleeper([&] { completed = token.sleepFor(10s); });
    std::this_thread::sleep_for(50ms);
    source.cancel();
    sleeper.join();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(!completed.load(), "interrupted sleep reports cancellation");
    ASSERT_TRUE(elapsed < 2s, "cancel wakes the sleeper promptly");
}

} // namespace

int main() {
    testDefaultTokenNeverCancels();
    testCancelBeforeSleep();
    testCancelWakesSleeper();
    return test::finish("Cancellation");
}
