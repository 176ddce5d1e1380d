#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "growin/analysis/analysis_config.hpp"
#include "growin/price_history.hpp"

namespace growin {

enum class Trend
{
    Neutral,
    Bullish,  // price > short EMA > long EMA
    Bearish   // price < short EMA < long EMA
};

enum class Momentum
{
    Neutral,
    Overbought,
    Oversold
};

enum class Volatility
{
    Neutral,
    High,  // price above the upper band
    Low    // price below the lower band
};

enum class Action
{
    Hold,
    Buy,
    Sell
};

struct Signals {
    Trend      trend      = Trend::Neutral;
    Momentum   momentum   = Momentum::Neutral;
    Volatility volatility = Volatility::Neutral;
    Action     overall    = Action::Hold;
};

/**
 * @brief Latest indicator values of a price history.
 *
 * Values inside a warm-up period carry the indicator's padding value
 * (50.0 for RSI, 0.0 otherwise). The EMAs are absent when the history is
 * shorter than their period, the volume SMA when the history has no volumes.
 */
struct TechnicalSnapshot {
    double rsi        = 0.0;
    double macd       = 0.0;
    double macdSignal = 0.0;
    double macdHist   = 0.0;
    double bbUpper    = 0.0;
    double bbMiddle   = 0.0;
    double bbLower    = 0.0;

    std::optional<double> emaShort;
    std::optional<double> emaLong;

    std::optional<double> volumeSma;

    double      currentPrice = 0.0;
    std::size_t dataPoints   = 0;

    Signals signals;
};

class TechnicalAnalyzer {
   public:
    /**
     * @brief Compute the snapshot for the last bar of a history.
     * @return std::nullopt if the history has no bars.
     * @throws std::invalid_argument if a configured period is 0.
     */
    [[nodiscard]] static std::optional<TechnicalSnapshot> analyze(const PriceHistory&   history,
                                                                  const AnalysisConfig& config = {});

    /**
     * @brief Run analyze() and render the result as JSON.
     * @return {"indicators", "signals", "current_price", "data_points"}, or
     *         {"error": "..."} when there is no data or the config is unusable.
     */
    [[nodiscard]] static nlohmann::json analyzeJson(const PriceHistory& history, const AnalysisConfig& config = {});

    /**
     * @brief Derive trend/momentum/volatility signals from indicator values.
     *
     * A value of exactly 0.0 (padding) never triggers a signal.
     */
    [[nodiscard]] static Signals generateSignals(const TechnicalSnapshot& snapshot, const AnalysisConfig& config);

    [[nodiscard]] static nlohmann::json toJson(const TechnicalSnapshot& snapshot, const AnalysisConfig& config);

    [[nodiscard]] static std::string toString(Trend trend);
    [[nodiscard]] static std::string toString(Momentum momentum);
    [[nodiscard]] static std::string toString(Volatility volatility);
    [[nodiscard]] static std::string toString(Action action);
};

}  // namespace growin
