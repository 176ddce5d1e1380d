#include "growin/analysis/analysis_config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace growin {

namespace {

std::size_t readPeriod(const nlohmann::json& section, const char* key, std::size_t fallback) {
    if (section.contains(key) && !section[key].is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer, got " + section[key].dump());
    }
    const auto value = section.value(key, static_cast<long long>(fallback));
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive, got " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

const nlohmann::json& section(const nlohmann::json& config, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    return (config.contains(key) && config[key].is_object()) ? config[key] : empty;
}

}  // namespace

AnalysisConfig AnalysisConfig::fromJson(const nlohmann::json& config) {
    AnalysisConfig c;

    const auto& rsi = section(config, "rsi");
    c.rsiPeriod     = readPeriod(rsi, "period", c.rsiPeriod);
    c.overbought    = rsi.value("overbought", c.overbought);
    c.oversold      = rsi.value("oversold", c.oversold);

    const auto& macd = section(config, "macd");
    c.macdFast       = readPeriod(macd, "fast", c.macdFast);
    c.macdSlow       = readPeriod(macd, "slow", c.macdSlow);
    c.macdSignal     = readPeriod(macd, "signal", c.macdSignal);

    const auto& bbands = section(config, "bbands");
    c.bbPeriod         = readPeriod(bbands, "period", c.bbPeriod);
    c.bbStdDev         = bbands.value("std_dev", c.bbStdDev);

    const auto& ema = section(config, "ema");
    c.emaShort      = readPeriod(ema, "short", c.emaShort);
    c.emaLong       = readPeriod(ema, "long", c.emaLong);

    c.volumeSmaPeriod = readPeriod(section(config, "volume_sma"), "period", c.volumeSmaPeriod);

    return c;
}

bool AnalysisConfig::load(const std::string& path, AnalysisConfig& out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open config file: " << path << std::endl;
        return false;
    }

    try {
        nlohmann::json config;
        f >> config;
        out = fromJson(config);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return false;
    }

    return true;
}

nlohmann::json AnalysisConfig::toJson() const {
    // clang-format off
    return {
        {"rsi",        {{"period", rsiPeriod}, {"overbought", overbought}, {"oversold", oversold}}},
        {"macd",       {{"fast", macdFast}, {"slow", macdSlow}, {"signal", macdSignal}}},
        {"bbands",     {{"period", bbPeriod}, {"std_dev", bbStdDev}}},
        {"ema",        {{"short", emaShort}, {"long", emaLong}}},
        {"volume_sma", {{"period", volumeSmaPeriod}}},
    };
    // clang-format on
}

}  // namespace growin
