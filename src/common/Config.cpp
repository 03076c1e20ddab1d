#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "domain/Timeframe.hpp"

namespace vpb::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint32_t parseCount(const std::string& value, const std::string& label, bool allowZero) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if ((!allowZero && parsed == 0U) || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("count out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

std::int32_t parseSigned(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stol(value, &consumed);
        if (consumed != value.size() || parsed < std::numeric_limits<std::int32_t>::min()
            || parsed > std::numeric_limits<std::int32_t>::max()) {
            throw std::out_of_range("value out of range");
        }
        return static_cast<std::int32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

double parsePositiveDouble(const std::string& value, const std::string& label, bool allowZero) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || parsed < 0.0 || (!allowZero && parsed == 0.0)) {
            throw std::out_of_range("value out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

double parseFraction(const std::string& value, const std::string& label) {
    const auto parsed = parsePositiveDouble(value, label, true);
    if (parsed > 1.0) {
        throw std::runtime_error("Valor inválido para " + label + " (esperado 0..1): " + value);
    }
    return parsed;
}

std::string parseProvider(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    if (normalized == "synthetic" || normalized == "binance") {
        return normalized;
    }
    throw std::runtime_error("Valor inválido para " + label + ": " + value);
}

std::string parseTimeframe(const std::string& value, const std::string& label) {
    const auto trimmed = trim(value);
    const auto timeframe = domain::timeframeFromLabel(trimmed);
    if (!timeframe) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
    return timeframe->label;
}

log::Level parseLevel(const std::string& value, const std::string& label) {
    try {
        return log::levelFromString(toLower(trim(value)));
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

// A setting read from the environment first and then from the command line, so the flag wins.
// `apply` receives the raw text and the name of the source it came from.
template <typename Apply>
void readSetting(int argc, char** argv, const char* envName, const std::string& flag, Apply&& apply) {
    if (const char* envValue = std::getenv(envName)) {
        if (*envValue != '\0') {
            apply(std::string{envValue}, std::string{envName});
        }
    }
    if (auto argValue = valueFromArgs(argc, argv, flag); !argValue.empty()) {
        apply(argValue, flag);
    }
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};
    auto& planner = config.planner;

    readSetting(argc, argv, "LOG_LEVEL", "--log-level", [&](const std::string& v, const std::string& key) {
        config.logLevel = parseLevel(v, key);
    });
    readSetting(argc, argv, "VPB_PROVIDER", "--provider", [&](const std::string& v, const std::string& key) {
        config.provider = parseProvider(v, key);
    });
    readSetting(argc, argv, "VPB_SYMBOL", "--symbol", [&](const std::string& v, const std::string& key) {
        auto symbol = trim(v);
        if (symbol.empty()) {
            throw std::runtime_error("Valor inválido para " + key + ": símbolo vacío");
        }
        config.symbol = std::move(symbol);
    });
    readSetting(argc, argv, "VPB_TIMEFRAME", "--timeframe", [&](const std::string& v, const std::string& key) {
        config.timeframe = parseTimeframe(v, key);
    });
    readSetting(argc, argv, "VPB_VIEWPORT_MINUTES", "--viewport-minutes",
                [&](const std::string& v, const std::string& key) {
                    config.viewportMinutes = parseCount(v, key, false);
                });
    readSetting(argc, argv, "VPB_PAN_STEPS", "--pan-steps", [&](const std::string& v, const std::string& key) {
        config.panSteps = parseCount(v, key, true);
    });
    readSetting(argc, argv, "VPB_PAN_STEP_MINUTES", "--pan-step-minutes",
                [&](const std::string& v, const std::string& key) {
                    config.panStepMinutes = parseSigned(v, key);
                });
    readSetting(argc, argv, "VPB_PAN_INTERVAL_MS", "--pan-interval-ms",
                [&](const std::string& v, const std::string& key) {
                    config.panIntervalMs = parseCount(v, key, true);
                });
    readSetting(argc, argv, "VPB_FETCH_THREADS", "--fetch-threads", [&](const std::string& v, const std::string& key) {
        config.fetchThreads = parseCount(v, key, false);
    });
    readSetting(argc, argv, "VPB_HTTP_TIMEOUT_SEC", "--http-timeout-sec",
                [&](const std::string& v, const std::string& key) {
                    config.httpTimeoutSec = static_cast<int>(parseCount(v, key, false));
                });
    readSetting(argc, argv, "VPB_SYNTHETIC_LATENCY_MS", "--synthetic-latency-ms",
                [&](const std::string& v, const std::string& key) {
                    config.syntheticLatencyMs = parseCount(v, key, true);
                });

    readSetting(argc, argv, "VPB_BUFFER_MULTIPLE", "--buffer-multiple",
                [&](const std::string& v, const std::string& key) {
                    planner.bufferMultiple = parsePositiveDouble(v, key, false);
                });
    readSetting(argc, argv, "VPB_VELOCITY_K", "--velocity-k", [&](const std::string& v, const std::string& key) {
        planner.velocityK = parsePositiveDouble(v, key, false);
    });
    readSetting(argc, argv, "VPB_MAX_VELOCITY_FACTOR", "--max-velocity-factor",
                [&](const std::string& v, const std::string& key) {
                    planner.maxVelocityFactor = parsePositiveDouble(v, key, false);
                    if (planner.maxVelocityFactor < 1.0) {
                        throw std::runtime_error("Valor inválido para " + key + " (mínimo 1): " + v);
                    }
                });
    readSetting(argc, argv, "VPB_MIN_BARS", "--min-bars", [&](const std::string& v, const std::string& key) {
        planner.minBars = parseCount(v, key, true);
    });
    readSetting(argc, argv, "VPB_MAX_BARS", "--max-bars", [&](const std::string& v, const std::string& key) {
        planner.maxBars = parseCount(v, key, false);
    });
    readSetting(argc, argv, "VPB_PROXIMITY", "--proximity", [&](const std::string& v, const std::string& key) {
        planner.proximityThreshold = parseFraction(v, key);
    });
    readSetting(argc, argv, "VPB_JITTER_FRACTION", "--jitter-fraction",
                [&](const std::string& v, const std::string& key) {
                    planner.jitterFraction = parseFraction(v, key);
                });
    readSetting(argc, argv, "VPB_RECENT_WINDOW_MS", "--recent-window-ms",
                [&](const std::string& v, const std::string& key) {
                    planner.recentWindow = std::chrono::milliseconds(parseCount(v, key, true));
                });
    readSetting(argc, argv, "VPB_VELOCITY_HISTORY", "--velocity-history",
                [&](const std::string& v, const std::string& key) {
                    planner.velocityHistory = parseCount(v, key, false);
                    if (planner.velocityHistory < 2) {
                        throw std::runtime_error("Valor inválido para " + key + " (mínimo 2): " + v);
                    }
                });

    if (planner.maxBars < planner.minBars) {
        throw std::runtime_error("--max-bars (" + std::to_string(planner.maxBars) + ") debe ser >= --min-bars ("
                                 + std::to_string(planner.minBars) + ")");
    }

    return config;
}

}  // namespace vpb::common
