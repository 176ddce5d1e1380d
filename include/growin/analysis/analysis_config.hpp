#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace growin {

/**
 * @brief Indicator periods and signal thresholds used by TechnicalAnalyzer.
 *
 * Mirrors config/analysis.json. Every key is optional; absent keys keep the
 * defaults below.
 */
struct AnalysisConfig {
    std::size_t rsiPeriod  = 14;
    double      overbought = 70.0;
    double      oversold   = 30.0;

    std::size_t macdFast   = 12;
    std::size_t macdSlow   = 26;
    std::size_t macdSignal = 9;

    std::size_t bbPeriod = 20;
    double      bbStdDev = 2.0;

    std::size_t emaShort = 50;
    std::size_t emaLong  = 200;

    std::size_t volumeSmaPeriod = 20;

    /**
     * @brief Read a config object.
     * @throws nlohmann::json::exception on wrongly typed values.
     * @throws std::invalid_argument if a period is not a positive integer.
     */
    [[nodiscard]] static AnalysisConfig fromJson(const nlohmann::json& config);

    /**
     * @brief Load a config file. Errors are reported on stderr.
     * @param path Path to analysis.json
     * @param out  Receives the config on success; untouched on failure.
     * @return false if the file cannot be opened, parsed or validated.
     */
    static bool load(const std::string& path, AnalysisConfig& out);

    [[nodiscard]] nlohmann::json toJson() const;
};

}  // namespace growin
