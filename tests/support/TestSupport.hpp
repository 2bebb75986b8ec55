#pragma once

#include "tvdeck/core/Expected.hpp"
#include "tvdeck/log/Log.hpp"
#include "tvdeck/tv/DeviceTransport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace tvdeck::test {

inline int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ::tvdeck::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++::tvdeck::test::g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ::tvdeck::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++::tvdeck::test::g_failures; } } while(0)

inline int finish(const char* suite) {
    if (g_failures) {
        logError(suite, " tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    logInfo(suite, " tests passed.\n");
    return 0;
}

/// Minimal valid-looking PNG header plus padding.
inline std::vector<std::uint8_t> fakePng() {
    return {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0, 0, 0, 13, 'I', 'H', 'D', 'R'};
}

/**
 * @brief Collects every log message while alive, at Debug level.
 *
 * Restores the default sinks and the previous threshold on destruction.
 */
class LogCapture {
public:
    LogCapture()
    : state_(std::make_shared<State>())
    , previous_(log::logLevel()) {
        auto sink = [state = state_](std::string_view message) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->messages.emplace_back(message);
        };
        setLogHandlers(sink, sink);
        setLogLevel(LogLevel::Debug);
    }

    ~LogCapture() {
        resetLogHandlers();
        setLogLevel(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->messages;
    }

    /// Messages that would run into the next line of output.
    std::vector<std::string> unterminated() const {
        std::vector<std::string> out;
        for (const auto& m : messages()) {
            if (m.empty() || m.back() != '\n') out.push_back(m);
        }
        return out;
    }

private:
    struct State {
        std::mutex mutex;
        std::vector<std::string> messages;
    };
    std::shared_ptr<State> state_;
    LogLevel previous_;
};

/**
 * @brief Scripted in-memory device transport.
 *
 * Records every executed command per device in order, answers shell lines
 * from prefix rules, and injects open/probe/command failures and latency.
 * Also tracks how many commands overlap, per device and overall.
 */
class MockTransport : public tv::DeviceTransport {
public:
    using Responder = std::function<tv::CommandResult(const core::Device&, const tv::Command&)>;

    struct Recorded {
        std::string deviceId;
        std::string line;
        tv::CommandKind kind;
    };

    MockTransport() : state_(std::make_shared<State>()) {}

    expected<std::shared_ptr<tv::DeviceConnection>>
    open(const core::Device& device, std::chrono::milliseconds) override {
        std::chrono::milliseconds latency{};
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->opens;
            latency = state_->openLatency;
        }
        if (latency.count() > 0) std::this_thread::sleep_for(latency);

        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failOpens != 0) {
            if (state_->failOpens > 0) --state_->failOpens;
            core::Error err(core::ErrorKind::Connection, "connection refused");
            err.deviceId = device.id;
            return unexpected(std::move(err));
        }
        return std::shared_ptr<tv::DeviceConnection>(std::make_shared<Connection>(device, state_));
    }

    // -- scripting --------------------------------------------------------------

    /// Answer shell lines starting with @p prefix; successive calls walk @p outputs, the last repeats.
    void respond(std::string prefix, std::vector<std::string> outputs) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->rules.push_back(Rule{std::move(prefix), std::move(outputs), 0});
    }
    void respond(std::string prefix, std::string output) {
        respond(std::move(prefix), std::vector<std::string>{std::move(output)});
    }

    /// Full override, consulted before the prefix rules.
    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->responder = std::move(responder);
    }

    /// Fail the next @p count opens; -1 fails forever.
    void failOpens(int count) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->failOpens = count;
    }

    void failProbes(int count) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->failProbes = count;
    }

    /// Fail the next @p count commands with @p kind.
    void failCommands(int count, core::ErrorKind kind) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->failCommands = count;
        state_->failKind = kind;
    }

    void setLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->latency = latency;
    }

    void setOpenLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->openLatency = latency;
    }

    // -- inspection -------------------------------------------------------------

    std::vector<std::string> commands(const std::string& deviceId = {}) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        std::vector<std::string> out;
        for (const auto& r : state_->log) {
            if (deviceId.empty() || r.deviceId == deviceId) out.push_back(r.line);
        }
        return out;
    }

    int count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return static_cast<int>(std::count_if(state_->log.begin(), state_->log.end(),
            [&](const Recorded& r) { return r.line.rfind(prefix, 0) == 0; }));
    }

    int executes() const { std::lock_guard<std::mutex> lock(state_->mutex); return state_->executes; }
    int opens() const { std::lock_guard<std::mutex> lock(state_->mutex); return state_->opens; }
    int probes() const { std::lock_guard<std::mutex> lock(state_->mutex); return state_->probes; }
    int closes() const { std::lock_guard<std::mutex> lock(state_->mutex); return state_->closes; }
    int maxConcurrentPerDevice() const { std::lock_guard<std::mutex> lock(state_->mutex); return state_->maxPerDevice; }
    int maxConcurrentOverall() const { std::lock_guard<std::mutex> lock(state_->mutex); return state_->maxOverall; }

private:
    struct Rule {
        std::string prefix;
        std::vector<std::string> outputs;
        std::size_t next;
    };

    struct State {
        mutable std::mutex mutex;
        std::vector<Rule> rules;
        Responder responder;
        std::vector<Recorded> log;
        std::map<std::string, int> inFlight;
        int overall = 0;
        int maxPerDevice = 0;
        int maxOverall = 0;
        int failOpens = 0;
        int failProbes = 0;
        int failCommands = 0;
        core::ErrorKind failKind = core::ErrorKind::Timeout;
        std::chrono::milliseconds latency{};
        std::chrono::milliseconds openLatency{};
        int executes = 0;
        int opens = 0;
        int probes = 0;
        int closes = 0;
    };

    class Connection : public tv::DeviceConnection {
    public:
        Connection(core::Device device, std::shared_ptr<State> state)
        : device_(std::move(device)), state_(std::move(state)) {}

        const core::Device& device() const override { return device_; }

        expected<void> probe(std::chrono::milliseconds) override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->probes;
            if (state_->failProbes != 0) {
                if (state_->failProbes > 0) --state_->failProbes;
                return fail(core::ErrorKind::Connection, "device state is 'offline'");
            }
            return {};
        }

        tv::CommandResult execute(const tv::Command& command) override {
            const auto line = command.shellLine();
            std::chrono::milliseconds latency{};
            Responder responder;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                ++state_->executes;
                latency = state_->latency;
                responder = state_->responder;
                const int device = ++state_->inFlight[device_.id];
                const int overall = ++state_->overall;
                state_->maxPerDevice = std::max(state_->maxPerDevice, device);
                state_->maxOverall = std::max(state_->maxOverall, overall);
            }
            if (latency.count() > 0) std::this_thread::sleep_for(latency);

            tv::CommandResult result = answer(command, line, responder);

            std::lock_guard<std::mutex> lock(state_->mutex);
            --state_->inFlight[device_.id];
            --state_->overall;
            if (result) {
                state_->log.push_back(Recorded{device_.id, line, command.kind()});
            }
            return result;
        }

        void close() override {
            if (!open_.exchange(false)) return;
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->closes;
        }

        bool isOpen() const override { return open_.load(); }

    private:
        tv::CommandResult answer(const tv::Command& command, const std::string& line,
                                 const Responder& responder) {
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (state_->failCommands != 0) {
                    if (state_->failCommands > 0) --state_->failCommands;
                    core::Error err(state_->failKind, "injected failure");
                    err.deviceId = device_.id;
                    err.command = line;
                    return unexpected(std::move(err));
                }
            }
            if (responder) {
                return responder(device_, command);
            }
            if (command.kind() == tv::CommandKind::ScreenCapture) {
                return tv::CommandOutput{fakePng()};
            }
            std::lock_guard<std::mutex> lock(state_->mutex);
            for (auto& rule : state_->rules) {
                if (line.rfind(rule.prefix, 0) != 0 || rule.outputs.empty()) continue;
                const auto& text = rule.outputs[std::min(rule.next, rule.outputs.size() - 1)];
                ++rule.next;
                return tv::CommandOutput::fromText(text);
            }
            return tv::CommandOutput{};
        }

        core::Device device_;
        std::shared_ptr<State> state_;
        std::atomic<bool> open_{true};
    };

    std::shared_ptr<State> state_;
};

} // namespace tvdeck::test
