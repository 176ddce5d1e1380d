#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace growin {

struct PriceHistory {
    /**
     * @brief Canonical ticker
     * @example "VOD.L", "AAPL", etc.
     */
    std::string ticker = "";

    /* HISTORICAL DATA (ascending by timestamp) */

    /**
     * @brief Bar open time in milliseconds since epoch
     * @example [1705641600000, 1705728000000, ...]
     */
    std::vector<int64_t> timestamps;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> open;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> high;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> low;

    /**
     * @brief
     * @example [100.0, 101.0, ...]
     */
    std::vector<double> close;

    /**
     * @brief
     * @example [1200.0, 980.0, ...]
     */
    std::vector<double> volume;

    [[nodiscard]] std::size_t size() const { return close.size(); }

    [[nodiscard]] bool empty() const { return close.empty(); }

    /**
     * @brief Build a history from OHLCV bars.
     * @param doc Either an array of bars, or an object {"ticker": "...", "bars": [...]}.
     *        A bar is {"t": ms, "o": x, "h": x, "l": x, "c": x, "v": x}; missing or null
     *        fields read as 0.0.
     * @return Bars sorted ascending by "t", ticker normalized; nullptr on malformed input.
     */
    [[nodiscard]] static std::shared_ptr<PriceHistory> fromJson(const nlohmann::json& doc);

    /**
     * @brief Read and parse a JSON bar file.
     * @return nullptr if the file cannot be opened or parsed.
     */
    [[nodiscard]] static std::shared_ptr<PriceHistory> load(const std::string& path);
};

}  // namespace growin
