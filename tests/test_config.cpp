#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names) : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.push_back(current ? std::string{current} : std::string{});
            had_.push_back(current != nullptr);
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (had_[i]) {
                ::setenv(names_[i].c_str(), saved_[i].c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

    std::vector<std::string> names_;
    std::vector<std::string> saved_;
    std::vector<bool> had_;
};

::vpb::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::vpb::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsRuntimeError(const std::vector<std::string>& args, const std::string& expectedKey) {
    try {
        runConfig(args);
    } catch (const std::runtime_error& ex) {
        if (std::string{ex.what()}.find(expectedKey) == std::string::npos) {
            std::cerr << "Error did not name " << expectedKey << ": " << ex.what() << "\n";
            return false;
        }
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard guard({"LOG_LEVEL", "VPB_PROVIDER", "VPB_SYMBOL", "VPB_TIMEFRAME", "VPB_BUFFER_MULTIPLE",
                    "VPB_MAX_BARS", "VPB_MIN_BARS", "VPB_RECENT_WINDOW_MS"});

    // Defaults.
    {
        const auto config = runConfig({"app"});
        if (config.provider != "synthetic" || config.timeframe != "5m" || config.logLevel != vpb::log::Level::Info) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
        if (config.planner.bufferMultiple != 3.0 || config.planner.maxVelocityFactor != 3.0
            || config.planner.jitterFraction != 0.05 || config.planner.recentWindow != std::chrono::seconds(30)) {
            std::cerr << "Unexpected planner defaults\n";
            return 1;
        }
    }

    // Environment overrides defaults.
    ::setenv("VPB_PROVIDER", "Binance", 1);
    ::setenv("VPB_BUFFER_MULTIPLE", "2.5", 1);
    ::setenv("LOG_LEVEL", "debug", 1);
    {
        const auto config = runConfig({"app"});
        if (config.provider != "binance" || config.planner.bufferMultiple != 2.5
            || config.logLevel != vpb::log::Level::Debug) {
            std::cerr << "Expected environment values to apply\n";
            return 1;
        }
    }

    // Flags override the environment, in both spellings.
    {
        const auto config = runConfig({"app", "--provider", "synthetic", "--buffer-multiple=4", "--timeframe", "1d",
                                       "--max-bars", "500", "--recent-window-ms=1000", "--pan-step-minutes", "-15"});
        if (config.provider != "synthetic" || config.planner.bufferMultiple != 4.0) {
            std::cerr << "Expected flags to win over the environment\n";
            return 1;
        }
        if (config.timeframe != "1D" || config.planner.maxBars != 500
            || config.planner.recentWindow != std::chrono::milliseconds(1000) || config.panStepMinutes != -15) {
            std::cerr << "Expected flag values to be parsed\n";
            return 1;
        }
    }
    ::unsetenv("VPB_PROVIDER");
    ::unsetenv("VPB_BUFFER_MULTIPLE");
    ::unsetenv("LOG_LEVEL");

    // Invalid values name the offending key.
    if (!throwsRuntimeError({"app", "--provider", "carrier-pigeon"}, "--provider")
        || !throwsRuntimeError({"app", "--timeframe=7m"}, "--timeframe")
        || !throwsRuntimeError({"app", "--max-bars", "0"}, "--max-bars")
        || !throwsRuntimeError({"app", "--proximity", "1.5"}, "--proximity")
        || !throwsRuntimeError({"app", "--fetch-threads", "two"}, "--fetch-threads")
        || !throwsRuntimeError({"app", "--log-level", "loud"}, "--log-level")
        || !throwsRuntimeError({"app", "--min-bars", "50", "--max-bars", "40"}, "--max-bars")) {
        std::cerr << "Expected invalid values to be rejected\n";
        return 1;
    }

    ::setenv("VPB_MIN_BARS", "-3", 1);
    if (!throwsRuntimeError({"app"}, "VPB_MIN_BARS")) {
        std::cerr << "Expected a bad environment value to name the variable\n";
        return 1;
    }

    std::cout << "config tests passed\n";
    return 0;
}
