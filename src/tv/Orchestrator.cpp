#include "tvdeck/tv/Orchestrator.hpp"

#include "tvdeck/log/Log.hpp"

#include <algorithm>
#include <future>
#include <sstream>

namespace tvdeck::tv {

using core::ErrorKind;

namespace {

constexpr const char* VIEW_ACTION = "android.intent.action.VIEW";
constexpr const char* LAUNCHER_CATEGORY = "android.intent.category.LAUNCHER";

core::Error cancelledBefore(const core::Device& device, const std::string& step) {
    core::Error err(ErrorKind::Cancelled, "cancelled before " + step);
    err.withContext(device.id, step);
    return err;
}

std::string launchLine(const LaunchIntent& intent) {
    std::ostringstream line;
    if (intent.uri) {
        line << "am start -a " << VIEW_ACTION;
        if (!intent.component.empty()) {
            line << " -n " << intent.component;
        } else if (!intent.package.empty()) {
            line << " -p " << intent.package;
        }
        if (intent.clearTask) line << " --activity-clear-task";
        line << " -d " << Command::quoteArgument(*intent.uri);
    } else if (!intent.component.empty()) {
        line << "am start -n " << intent.component
             << " -a android.intent.action.MAIN -c " << LAUNCHER_CATEGORY;
        if (intent.clearTask) line << " --activity-clear-task";
    } else {
        line << "monkey -p " << intent.package << " -c " << LAUNCHER_CATEGORY << " 1";
    }
    return line.str();
}

} // namespace

// -- DeviceQueue ---------------------------------------------------------------

std::uint64_t Orchestrator::DeviceQueue::enqueue() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_++;
}

void Orchestrator::DeviceQueue::waitTurn(std::uint64_t ticket) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return serving_ == ticket; });
}

void Orchestrator::DeviceQueue::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++serving_;
    }
    cv_.notify_all();
}

Orchestrator::Turn::Turn(DeviceQueue& queue)
: queue_(queue) {
    queue_.waitTurn(queue_.enqueue());
}

Orchestrator::Turn::~Turn() {
    queue_.release();
}

// -- Orchestrator --------------------------------------------------------------

Orchestrator::Orchestrator(core::DeviceRegistry devices,
                           std::shared_ptr<DeviceTransport> transport,
                           OrchestratorSettings settings)
: devices_(std::move(devices))
, settings_(std::move(settings))
, connections_(std::move(transport), settings_.connection)
, appCache_(settings_.appCacheTtl) {
    settings_.maxAttempts = std::max(1, settings_.maxAttempts);
    settings_.powerVerifyAttempts = std::max(1, settings_.powerVerifyAttempts);

    for (const auto& device : devices_.devices()) {
        queues_.emplace(device.id, std::make_unique<DeviceQueue>());
    }

    if (!settings_.appCachePath.empty()) {
        auto loaded = appCache_.load(settings_.appCachePath);
        if (!loaded) {
            logDebug("[Orchestrator] starting with an empty app cache: ", loaded.error().message, "\n");
        }
    }
    logInfo("[Orchestrator] managing ", devices_.size(), " device(s)\n");
}

Orchestrator::~Orchestrator() {
    persistAppCache();
    connections_.closeAll();
}

expected<const core::Device*> Orchestrator::lookup(const std::string& deviceId) const {
    if (const auto* device = devices_.find(deviceId)) {
        return device;
    }
    std::string known;
    for (const auto& device : devices_.devices()) {
        known += known.empty() ? device.id : ", " + device.id;
    }
    core::Error err(ErrorKind::UnknownDevice,
                    "unknown device '" + deviceId + "' (configured: " + known + ")");
    err.deviceId = deviceId;
    return unexpected(std::move(err));
}

Orchestrator::DeviceQueue& Orchestrator::queueFor(const core::Device& device) {
    return *queues_.at(device.id);
}

CommandResult Orchestrator::runWithRetry(const core::Device& device, const Command& command,
                                         const core::CancellationToken& cancel) {
    const int attempts = settings_.maxAttempts;
    core::Error last;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (cancel.isCancelled()) {
            return unexpected(cancelledBefore(device, command.describe()));
        }

        auto connection = connections_.ensure(device);
        if (!connection) {
            last = connection.error();
            last.withContext(device.id, command.describe());
            if (!last.isConnectionLevel()) {
                return unexpected(last);
            }
        } else {
            auto result = executor_.run(**connection, command);
            if (result) {
                return result;
            }
            last = result.error();
            if (!last.isConnectionLevel()) {
                return unexpected(last);
            }
            connections_.invalidate(device.id, *connection);
        }

        logWarning("[Orchestrator] ", device.id, " attempt ", attempt, "/", attempts,
                   " failed: ", last.describe(), "\n");

        if (attempt < attempts && !cancel.sleepFor(settings_.retryBackoff * attempt)) {
            return unexpected(cancelledBefore(device, command.describe()));
        }
    }

    logError("[Orchestrator] ", device.id, " giving up on '", command.describe(),
             "' after ", attempts, " attempt(s): ", last.describe(), "\n");
    return unexpected(last);
}

expected<void> Orchestrator::sendKey(const core::Device& device, const char* keycode,
                                     const core::CancellationToken& cancel) {
    auto result = runWithRetry(device, Command::keyEvent(keycode), cancel);
    if (!result) return unexpected(result.error());
    return {};
}

expected<PlaybackState> Orchestrator::readStatus(const core::Device& device,
                                                 const core::CancellationToken& cancel) {
    auto result = runWithRetry(device, Command::shell(PlaybackStateParser::statusCommand()), cancel);
    if (!result) return unexpected(result.error());
    return PlaybackStateParser::parse(result->text());
}

expected<AppInventory> Orchestrator::scanInventory(const core::Device& device,
                                                   const core::CancellationToken& cancel) {
    auto result = runWithRetry(device, Command::shell(AppCache::scanCommand()), cancel);
    if (!result) return unexpected(result.error());
    return AppCache::parsePackageList(result->text(), std::chrono::system_clock::now());
}

void Orchestrator::persistAppCache() {
    if (settings_.appCachePath.empty()) return;
    auto saved = appCache_.save(settings_.appCachePath);
    if (!saved) {
        logWarning("[Orchestrator] app cache not saved: ", saved.error().describe(), "\n");
    }
}

// -- play ----------------------------------------------------------------------

expected<PlayOutcome> Orchestrator::play(const std::string& deviceId, std::string_view app,
                                         std::string_view queryOrUrl,
                                         const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());
    const core::Device& dev = **device;

    Turn turn(queueFor(dev));
    if (cancel.isCancelled()) {
        return unexpected(cancelledBefore(dev, "play"));
    }

    // Prefer the package actually installed when the app ships several variants.
    std::optional<AppInventory> inventory = appCache_.fresh(dev.id);
    if (!inventory) {
        const auto* profile = resolver_.catalog().findByName(app);
        if (profile != nullptr && profile->packages.size() > 1) {
            auto scanned = scanInventory(dev, cancel);
            if (scanned) {
                appCache_.store(dev.id, *scanned);
                persistAppCache();
                inventory = std::move(*scanned);
            } else if (scanned.error().isConnectionLevel()
                       || scanned.error().kind == ErrorKind::Cancelled) {
                return unexpected(scanned.error());
            } else {
                logWarning("[Orchestrator] ", dev.id, " inventory unavailable, using catalog defaults: ",
                           scanned.error().describe(), "\n");
            }
        }
    }

    auto intent = inventory ? resolver_.resolve(app, queryOrUrl, inventory->packages)
                            : resolver_.resolve(app, queryOrUrl);
    if (!intent) {
        auto err = intent.error();
        err.withContext(dev.id, "resolve " + std::string(app));
        logError("[Orchestrator] ", err.describe(), "\n");
        return unexpected(err);
    }

    PlayOutcome outcome;
    outcome.intent = std::move(*intent);
    const LaunchIntent& li = outcome.intent;
    logInfo("[Orchestrator] ", dev.id, " play ", li.describe(), "\n");

    auto step = [&](const Command& command) -> expected<void> {
        if (cancel.isCancelled()) {
            return unexpected(cancelledBefore(dev, command.describe()));
        }
        auto result = runWithRetry(dev, command, cancel);
        if (!result) return unexpected(result.error());
        outcome.steps.push_back(command.shellLine());
        return {};
    };
    auto settle = [&](std::chrono::milliseconds delay, const char* next) -> expected<void> {
        if (!cancel.sleepFor(delay)) {
            return unexpected(cancelledBefore(dev, next));
        }
        return {};
    };

    if (li.wakeFirst) {
        if (auto r = step(Command::keyEvent(keycode::WAKEUP)); !r) return unexpected(r.error());
    }

    if (auto r = step(Command::shell(launchLine(li))); !r) return unexpected(r.error());

    if (li.inAppSearch) {
        if (auto r = settle(settings_.launchSettle, "search"); !r) return unexpected(r.error());
        if (auto r = step(Command::keyEvent(keycode::SEARCH)); !r) return unexpected(r.error());
        if (auto r = settle(settings_.keySettle, "text input"); !r) return unexpected(r.error());
        if (auto r = step(Command::textInput(li.query)); !r) return unexpected(r.error());
        if (auto r = settle(settings_.keySettle, "submit"); !r) return unexpected(r.error());
        if (auto r = step(Command::keyEvent(keycode::ENTER)); !r) return unexpected(r.error());
    }

    if (li.selectAfterLaunch) {
        if (auto r = settle(settings_.launchSettle, "select"); !r) return unexpected(r.error());
        if (auto r = step(Command::keyEvent(keycode::DPAD_CENTER)); !r) return unexpected(r.error());
    }

    if (li.isGeneric()) {
        logWarning("[Orchestrator] ", dev.id, " opened ", li.appName, " without content: ",
                   li.fallbackReason, "\n");
    }

    if (settings_.verifyPlayback) {
        if (auto r = settle(settings_.keySettle, "status check"); !r) return unexpected(r.error());
        auto status = readStatus(dev, cancel);
        if (status) {
            outcome.playbackVerified = status->isPlaying();
            outcome.status = std::move(*status);
            if (!outcome.playbackVerified) {
                logWarning("[Orchestrator] ", dev.id, " content opened but playback not observed: ",
                           outcome.status->summary(), "\n");
            }
        } else if (status.error().kind == ErrorKind::Cancelled) {
            return unexpected(status.error());
        } else {
            logWarning("[Orchestrator] ", dev.id, " status after play unavailable: ",
                       status.error().describe(), "\n");
        }
    }

    return outcome;
}

// -- single-command operations -------------------------------------------------

expected<void> Orchestrator::navigate(const std::string& deviceId, Direction direction,
                                      const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());

    Turn turn(queueFor(**device));
    logDebug("[Orchestrator] ", deviceId, " navigate ", toString(direction), "\n");
    return sendKey(**device, keycodeFor(direction), cancel);
}

expected<void> Orchestrator::navigate(const std::string& deviceId, std::string_view direction,
                                      const core::CancellationToken& cancel) {
    auto parsed = parseDirection(direction);
    if (!parsed) {
        core::Error err(ErrorKind::InvalidArgument,
                        "unknown direction '" + std::string(direction)
                        + "' (use up, down, left, right, select, back, home)");
        err.deviceId = deviceId;
        return unexpected(std::move(err));
    }
    return navigate(deviceId, *parsed, cancel);
}

expected<void> Orchestrator::volume(const std::string& deviceId, VolumeAction action,
                                    const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());

    Turn turn(queueFor(**device));
    logDebug("[Orchestrator] ", deviceId, " volume ", toString(action), "\n");
    return sendKey(**device, keycodeFor(action), cancel);
}

expected<void> Orchestrator::volume(const std::string& deviceId, std::string_view action,
                                    const core::CancellationToken& cancel) {
    auto parsed = parseVolumeAction(action);
    if (!parsed) {
        core::Error err(ErrorKind::InvalidArgument,
                        "unknown volume action '" + std::string(action) + "' (use up, down, mute)");
        err.deviceId = deviceId;
        return unexpected(std::move(err));
    }
    return volume(deviceId, *parsed, cancel);
}

expected<void> Orchestrator::power(const std::string& deviceId, const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());

    Turn turn(queueFor(**device));
    return sendKey(**device, keycode::POWER, cancel);
}

expected<void> Orchestrator::playPause(const std::string& deviceId,
                                       const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());

    Turn turn(queueFor(**device));
    return sendKey(**device, keycode::MEDIA_PLAY_PAUSE, cancel);
}

expected<void> Orchestrator::typeText(const std::string& deviceId, std::string_view text,
                                      const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());
    if (Command::escapeInputText(text).empty()) {
        core::Error err(ErrorKind::InvalidArgument, "nothing to type");
        err.deviceId = deviceId;
        return unexpected(std::move(err));
    }

    Turn turn(queueFor(**device));
    auto result = runWithRetry(**device, Command::textInput(std::string(text)), cancel);
    if (!result) return unexpected(result.error());
    return {};
}

expected<std::vector<std::uint8_t>> Orchestrator::screenshot(const std::string& deviceId,
                                                             const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());

    Turn turn(queueFor(**device));
    auto result = runWithRetry(**device, Command::screenCapture(), cancel);
    if (!result) return unexpected(result.error());
    logInfo("[Orchestrator] ", deviceId, " screenshot ", result->bytes.size(), " bytes\n");
    return std::move(result->bytes);
}

expected<PlaybackState> Orchestrator::getStatus(const std::string& deviceId,
                                                const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());

    Turn turn(queueFor(**device));
    return readStatus(**device, cancel);
}

// -- power ---------------------------------------------------------------------

expected<PowerOutcome> Orchestrator::turnOn(const std::string& deviceId,
                                            const core::CancellationToken& cancel) {
    return setPower(deviceId, PowerState::On, cancel);
}

expected<PowerOutcome> Orchestrator::turnOff(const std::string& deviceId,
                                             const core::CancellationToken& cancel) {
    return setPower(deviceId, PowerState::Off, cancel);
}

expected<PowerOutcome> Orchestrator::setPower(const std::string& deviceId, PowerState target,
                                              const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());
    const core::Device& dev = **device;

    Turn turn(queueFor(dev));

    auto before = readStatus(dev, cancel);
    if (!before) return unexpected(before.error());

    PowerOutcome outcome;
    outcome.before = before->power;
    const bool dreaming = before->screensaver;
    if (outcome.before == target && !(target == PowerState::On && dreaming)) {
        logInfo("[Orchestrator] ", deviceId, " already ", toString(target), "\n");
        outcome.after = target;
        return outcome;
    }

    const char* key = target == PowerState::On ? keycode::WAKEUP : keycode::SLEEP;
    if (auto sent = sendKey(dev, key, cancel); !sent) {
        return unexpected(sent.error());
    }

    PowerState observed = PowerState::Unknown;
    for (int attempt = 0; attempt < settings_.powerVerifyAttempts; ++attempt) {
        if (!cancel.sleepFor(settings_.powerVerifyDelay)) {
            return unexpected(cancelledBefore(dev, "power verification"));
        }
        auto now = readStatus(dev, cancel);
        if (!now) return unexpected(now.error());
        observed = now->power;
        if (observed == target && !(target == PowerState::On && now->screensaver)) {
            outcome.after = observed;
            outcome.changed = true;
            logInfo("[Orchestrator] ", deviceId, " turned ", toString(target), "\n");
            return outcome;
        }
    }

    core::Error err(ErrorKind::Rejected,
                    std::string("sent ") + key + " but device still reports power "
                    + toString(observed));
    err.withContext(deviceId, key);
    logError("[Orchestrator] ", err.describe(), "\n");
    return unexpected(std::move(err));
}

// -- inventory -----------------------------------------------------------------

expected<std::vector<AppEntry>> Orchestrator::listApps(const std::string& deviceId, bool forceRescan,
                                                       const core::CancellationToken& cancel) {
    auto device = lookup(deviceId);
    if (!device) return unexpected(device.error());
    const core::Device& dev = **device;

    if (!forceRescan) {
        if (auto cached = appCache_.fresh(dev.id)) {
            return cached->apps;
        }
    }

    bool scanned = false;
    const auto refresh = [&] {
        return appCache_.getOrRefresh(dev.id, forceRescan, [&]() -> expected<AppInventory> {
            Turn turn(queueFor(dev));
            if (!forceRescan) {
                if (auto cached = appCache_.fresh(dev.id)) {
                    return *cached;
                }
            }
            scanned = true;
            return scanInventory(dev, cancel);
        });
    };

    auto inventory = refresh();
    if (!inventory && inventory.error().kind == ErrorKind::Cancelled && !scanned && !cancel.isCancelled()) {
        // The shared scan was abandoned by the caller that started it, not by us.
        logDebug("[Orchestrator] ", dev.id, " joined scan was cancelled, scanning again\n");
        inventory = refresh();
    }
    if (!inventory) return unexpected(inventory.error());
    if (scanned) {
        persistAppCache();
    }
    return inventory->apps;
}

std::vector<DeviceAvailability> Orchestrator::listDevices() {
    std::vector<std::future<bool>> probes;
    probes.reserve(devices_.size());
    for (const auto& device : devices_.devices()) {
        probes.push_back(std::async(std::launch::async, [this, &device] {
            return connections_.isReachable(device);
        }));
    }

    std::vector<DeviceAvailability> out;
    out.reserve(devices_.size());
    for (std::size_t i = 0; i < probes.size(); ++i) {
        out.push_back(DeviceAvailability{devices_.devices()[i], probes[i].get()});
    }
    return out;
}

} // namespace tvdeck::tv
