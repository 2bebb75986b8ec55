#include "tvdeck/adb/AdbTransport.hpp"
#include "tvdeck/config/Config.hpp"
#include "tvdeck/log/Log.hpp"
#include "tvdeck/tv/Orchestrator.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace tvdeck;

namespace {

void printUsage() {
    std::cerr <<
        "usage: tvdeck_cli [--config FILE] [--verbose] <command> [device] [args...]\n"
        "\n"
        "  devices                        list configured TVs and whether they answer\n"
        "  status      <device>           power, foreground app, playback, volume\n"
        "  play        <device> <app> [query-or-url]\n"
        "  navigate    <device> <up|down|left|right|select|back|home>\n"
        "  volume      <device> <up|down|mute>\n"
        "  power       <device>           toggle the power key\n"
        "  on          <device>\n"
        "  off         <device>\n"
        "  play-pause  <device>\n"
        "  type        <device> <text>\n"
        "  screenshot  <device> <out.png>\n"
        "  apps        <device> [--rescan]\n"
        "\n"
        "Without --config, devices come from TV_DEVICES.\n";
}

int reportFailure(const core::Error& err) {
    std::cerr << "error: " << err.describe() << "\n"
              << "hint:  " << err.userHint() << "\n";
    return 1;
}

std::string joinArgs(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

int printStatus(const tv::PlaybackState& state) {
    std::cout << "power:      " << tv::toString(state.power)
              << (state.screensaver ? " (screensaver)" : "") << "\n"
              << "foreground: " << state.foregroundPackage.value_or("unknown") << "\n";
    if (state.context) {
        std::cout << "context:    " << *state.context << "\n";
    }
    std::cout << "playback:   " << tv::toString(state.phase) << "\n";
    if (state.title) {
        std::cout << "title:      " << *state.title << "\n";
    }
    std::cout << "volume:     " << (state.volume ? std::to_string(*state.volume) + "%" : "unknown");
    if (state.muted && *state.muted) std::cout << " (muted)";
    std::cout << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath;
    bool verbose = false;
    std::vector<std::string> positional;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            configPath = args[++i];
        } else if (args[i] == "--verbose" || args[i] == "-v") {
            verbose = true;
        } else if (args[i] == "--help" || args[i] == "-h") {
            printUsage();
            return 0;
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.empty()) {
        printUsage();
        return 2;
    }

    setLogLevel(verbose ? LogLevel::Debug : LogLevel::Warning);

    auto loaded = configPath.empty() ? config::loadConfigFromEnvironment()
                                     : config::loadConfigFile(configPath);
    if (!loaded) {
        return reportFailure(loaded.error());
    }

    auto registry = core::DeviceRegistry::create(loaded->devices);
    if (!registry) {
        return reportFailure(registry.error());
    }

    auto transport = std::make_shared<adb::AdbTransport>(loaded->adbServer);
    tv::Orchestrator orchestrator(std::move(*registry), transport, loaded->settings);

    const std::string& command = positional[0];

    if (command == "devices") {
        for (const auto& entry : orchestrator.listDevices()) {
            std::cout << entry.device.name << " (" << entry.device.id << ") "
                      << entry.device.serial() << " - "
                      << (entry.online ? "online" : "offline") << "\n";
        }
        return 0;
    }

    if (positional.size() < 2) {
        printUsage();
        return 2;
    }
    const std::string& device = positional[1];

    if (command == "status") {
        auto state = orchestrator.getStatus(device);
        if (!state) return reportFailure(state.error());
        return printStatus(*state);
    }

    if (command == "play") {
        if (positional.size() < 3) {
            printUsage();
            return 2;
        }
        auto outcome = orchestrator.play(device, positional[2], joinArgs(positional, 3));
        if (!outcome) return reportFailure(outcome.error());
        std::cout << "launched " << outcome->intent.describe() << "\n";
        for (const auto& step : outcome->steps) {
            std::cout << "  " << step << "\n";
        }
        if (outcome->status) {
            std::cout << (outcome->playbackVerified ? "playing: " : "not verified: ")
                      << outcome->status->summary() << "\n";
        }
        return 0;
    }

    if (command == "navigate" || command == "volume" || command == "type") {
        if (positional.size() < 3) {
            printUsage();
            return 2;
        }
        expected<void> result;
        if (command == "navigate") {
            result = orchestrator.navigate(device, std::string_view(positional[2]));
        } else if (command == "volume") {
            result = orchestrator.volume(device, std::string_view(positional[2]));
        } else {
            result = orchestrator.typeText(device, joinArgs(positional, 2));
        }
        if (!result) return reportFailure(result.error());
        std::cout << command << " " << joinArgs(positional, 2) << ": ok\n";
        return 0;
    }

    if (command == "power" || command == "play-pause") {
        auto result = command == "power" ? orchestrator.power(device) : orchestrator.playPause(device);
        if (!result) return reportFailure(result.error());
        std::cout << command << ": ok\n";
        return 0;
    }

    if (command == "on" || command == "off") {
        auto result = command == "on" ? orchestrator.turnOn(device) : orchestrator.turnOff(device);
        if (!result) return reportFailure(result.error());
        std::cout << device << " is " << tv::toString(result->after)
                  << (result->changed ? "" : " (no change needed)") << "\n";
        return 0;
    }

    if (command == "screenshot") {
        if (positional.size() < 3) {
            printUsage();
            return 2;
        }
        auto png = orchestrator.screenshot(device);
        if (!png) return reportFailure(png.error());
        std::ofstream out(positional[2], std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(png->data()), static_cast<std::streamsize>(png->size()));
        if (!out) {
            std::cerr << "error: cannot write " << positional[2] << "\n";
            return 1;
        }
        std::cout << "wrote " << png->size() << " bytes to " << positional[2] << "\n";
        return 0;
    }

    if (command == "apps") {
        const bool rescan = positional.size() > 2 && positional[2] == "--rescan";
        auto apps = orchestrator.listApps(device, rescan);
        if (!apps) return reportFailure(apps.error());
        for (const auto& app : *apps) {
            std::cout << app.name << "  " << app.package << "\n";
        }
        if (apps->empty()) {
            std::cout << "no streaming apps found\n";
        }
        return 0;
    }

    std::cerr << "unknown command '" << command << "'\n";
    printUsage();
    return 2;
}
