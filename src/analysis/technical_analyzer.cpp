#include "growin/analysis/technical_analyzer.hpp"

#include <stdexcept>

#include "growin/indicator.hpp"

namespace growin {

namespace {

bool counts(double value) {
    return value != 0.0;
}

bool counts(const std::optional<double>& value) {
    return value.has_value() && *value != 0.0;
}

nlohmann::json optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

std::optional<TechnicalSnapshot> TechnicalAnalyzer::analyze(const PriceHistory& history, const AnalysisConfig& config) {
    if (history.empty()) {
        return std::nullopt;
    }

    const auto& close = history.close;

    TechnicalSnapshot snapshot;

    snapshot.rsi = indicator::rsi(close, config.rsiPeriod).back();

    const auto macd     = indicator::macd(close, config.macdFast, config.macdSlow, config.macdSignal);
    snapshot.macd       = macd.macdLine.back();
    snapshot.macdSignal = macd.signalLine.back();
    snapshot.macdHist   = macd.histogram.back();

    const auto bands  = indicator::bbands(close, config.bbPeriod, config.bbStdDev);
    snapshot.bbUpper  = bands.upper.back();
    snapshot.bbMiddle = bands.middle.back();
    snapshot.bbLower  = bands.lower.back();

    // Only report an EMA once a full window of closes exists.
    if (close.size() >= config.emaShort) {
        snapshot.emaShort = indicator::ema(close, config.emaShort).back();
    }
    if (close.size() >= config.emaLong) {
        snapshot.emaLong = indicator::ema(close, config.emaLong).back();
    }

    if (!history.volume.empty()) {
        snapshot.volumeSma = indicator::sma(history.volume, config.volumeSmaPeriod).back();
    }

    snapshot.currentPrice = close.back();
    snapshot.dataPoints   = history.size();
    snapshot.signals      = generateSignals(snapshot, config);

    return snapshot;
}

nlohmann::json TechnicalAnalyzer::analyzeJson(const PriceHistory& history, const AnalysisConfig& config) {
    try {
        const auto snapshot = analyze(history, config);
        if (!snapshot) {
            return {{"error", "No OHLCV data provided"}};
        }
        return toJson(*snapshot, config);
    } catch (const std::invalid_argument& e) {
        return {{"error", std::string("Indicator calculation failed: ") + e.what()}};
    }
}

Signals TechnicalAnalyzer::generateSignals(const TechnicalSnapshot& snapshot, const AnalysisConfig& config) {
    Signals      signals;
    const double price = snapshot.currentPrice;

    /* Trend (EMA alignment) */
    if (counts(snapshot.emaShort) && counts(snapshot.emaLong)) {
        const double shortEma = *snapshot.emaShort;
        const double longEma  = *snapshot.emaLong;
        if (price > shortEma && shortEma > longEma) {
            signals.trend = Trend::Bullish;
        } else if (price < shortEma && shortEma < longEma) {
            signals.trend = Trend::Bearish;
        }
    }

    /* Momentum (RSI) */
    if (counts(snapshot.rsi)) {
        if (snapshot.rsi > config.overbought) {
            signals.momentum = Momentum::Overbought;
        } else if (snapshot.rsi < config.oversold) {
            signals.momentum = Momentum::Oversold;
        }
    }

    /* Volatility (Bollinger Bands) */
    if (counts(snapshot.bbUpper) && counts(snapshot.bbLower)) {
        if (price > snapshot.bbUpper) {
            signals.volatility = Volatility::High;
        } else if (price < snapshot.bbLower) {
            signals.volatility = Volatility::Low;
        }
    }

    if (signals.trend == Trend::Bullish && signals.momentum == Momentum::Oversold) {
        signals.overall = Action::Buy;
    } else if (signals.trend == Trend::Bearish && signals.momentum == Momentum::Overbought) {
        signals.overall = Action::Sell;
    }

    return signals;
}

nlohmann::json TechnicalAnalyzer::toJson(const TechnicalSnapshot& snapshot, const AnalysisConfig& config) {
    nlohmann::json indicators = {
        {"rsi", snapshot.rsi},
        {"macd", snapshot.macd},
        {"macd_signal", snapshot.macdSignal},
        {"macd_hist", snapshot.macdHist},
        {"bb_upper", snapshot.bbUpper},
        {"bb_middle", snapshot.bbMiddle},
        {"bb_lower", snapshot.bbLower},
    };
    indicators["volume_sma"] = optionalToJson(snapshot.volumeSma);
    indicators["ema_" + std::to_string(config.emaShort)] = optionalToJson(snapshot.emaShort);
    indicators["ema_" + std::to_string(config.emaLong)]  = optionalToJson(snapshot.emaLong);

    const nlohmann::json signals = {
        {"trend", toString(snapshot.signals.trend)},
        {"momentum", toString(snapshot.signals.momentum)},
        {"volatility", toString(snapshot.signals.volatility)},
        {"overall_signal", toString(snapshot.signals.overall)},
    };

    return {
        {"indicators", indicators},
        {"signals", signals},
        {"current_price", snapshot.currentPrice},
        {"data_points", snapshot.dataPoints},
    };
}

std::string TechnicalAnalyzer::toString(Trend trend) {
    switch (trend) {
    case Trend::Bullish:
        return "bullish";
    case Trend::Bearish:
        return "bearish";
    case Trend::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::string TechnicalAnalyzer::toString(Momentum momentum) {
    switch (momentum) {
    case Momentum::Overbought:
        return "overbought";
    case Momentum::Oversold:
        return "oversold";
    case Momentum::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::string TechnicalAnalyzer::toString(Volatility volatility) {
    switch (volatility) {
    case Volatility::High:
        return "high";
    case Volatility::Low:
        return "low";
    case Volatility::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::string TechnicalAnalyzer::toString(Action action) {
    switch (action) {
    case Action::Buy:
        return "buy";
    case Action::Sell:
        return "sell";
    case Action::Hold:
        return "hold";
    }
    return "hold";
}

}  // namespace growin
