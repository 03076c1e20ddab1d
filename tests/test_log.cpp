#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Log.hpp"

using vpb::log::Level;

int main() {
    // Level names parse case-insensitively, with aliases.
    {
        if (vpb::log::levelFromString("WARNING") != Level::Warn || vpb::log::levelFromString("err") != Level::Error
            || vpb::log::levelFromString("Debug") != Level::Debug) {
            std::cerr << "Expected level names to parse case-insensitively\n";
            return 1;
        }

        std::string message;
        try {
            vpb::log::levelFromString("loud");
        } catch (const std::invalid_argument& ex) {
            message = ex.what();
        }
        if (message.find("Nivel de log desconocido") == std::string::npos || message.find("loud") == std::string::npos) {
            std::cerr << "Expected an unknown level to name itself, got '" << message << "'\n";
            return 1;
        }
    }

    // The threshold filters lines before they reach the sink.
    {
        const auto previous = vpb::log::getLevel();
        std::vector<std::pair<Level, std::string>> lines;
        {
            vpb::log::ScopedSink sink([&](Level level, const std::string& line) { lines.emplace_back(level, line); });
            vpb::log::setLevel(Level::Info);
            LOG_DEBUG("hidden");
            LOG_INFO("shown " << 42);
            LOG_ERR("broken");
        }
        vpb::log::setLevel(previous);

        if (lines.size() != 2 || lines[0].first != Level::Info || lines[1].first != Level::Error) {
            std::cerr << "Expected Info and Error lines only, got " << lines.size() << "\n";
            return 1;
        }
        if (lines[0].second.find("shown 42") == std::string::npos) {
            std::cerr << "Expected the streamed message in the line, got '" << lines[0].second << "'\n";
            return 1;
        }
    }

    std::cout << "log tests passed\n";
    return 0;
}
