#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "growin/analysis/technical_analyzer.hpp"
#include "growin/price_history.hpp"

namespace {

void printRow(const std::string& name, double value) {
    std::clog << std::left << std::setw(20) << name << std::right << std::fixed << std::setprecision(4)
              << std::setw(14) << value << std::endl;
}

void printRow(const std::string& name, const std::optional<double>& value) {
    if (value) {
        printRow(name, *value);
    } else {
        std::clog << std::left << std::setw(20) << name << std::right << std::setw(14) << "n/a" << std::endl;
    }
}

void printSummary(const growin::TechnicalSnapshot& s, const growin::AnalysisConfig& config, const std::string& ticker) {
    using growin::TechnicalAnalyzer;

    std::clog << std::endl;
    std::clog << "=== Technical Analysis: " << (ticker.empty() ? "(unnamed)" : ticker) << " ===" << std::endl;
    std::clog << "Bars:           " << s.dataPoints << std::endl;
    std::clog << std::string(34, '-') << std::endl;
    printRow("Close", s.currentPrice);
    printRow("RSI(" + std::to_string(config.rsiPeriod) + ")", s.rsi);
    printRow("MACD", s.macd);
    printRow("MACD signal", s.macdSignal);
    printRow("MACD histogram", s.macdHist);
    printRow("BB upper", s.bbUpper);
    printRow("BB middle", s.bbMiddle);
    printRow("BB lower", s.bbLower);
    printRow("EMA(" + std::to_string(config.emaShort) + ")", s.emaShort);
    printRow("EMA(" + std::to_string(config.emaLong) + ")", s.emaLong);
    printRow("Volume SMA", s.volumeSma);
    std::clog << std::string(34, '-') << std::endl;
    std::clog << "Trend:          " << TechnicalAnalyzer::toString(s.signals.trend) << std::endl;
    std::clog << "Momentum:       " << TechnicalAnalyzer::toString(s.signals.momentum) << std::endl;
    std::clog << "Volatility:     " << TechnicalAnalyzer::toString(s.signals.volatility) << std::endl;
    std::clog << "SIGNAL:         " << TechnicalAnalyzer::toString(s.signals.overall) << std::endl;
    std::clog << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: technical_analysis <bars.json> [analysis.json]" << std::endl;
        return 1;
    }

    growin::AnalysisConfig config;
    if (argc > 2 && !growin::AnalysisConfig::load(argv[2], config)) {
        return 1;
    }

    const auto history = growin::PriceHistory::load(argv[1]);
    if (!history) {
        return 1;
    }

    std::cerr << "Loaded " << history->size() << " bars from " << argv[1] << std::endl;

    std::optional<growin::TechnicalSnapshot> snapshot;
    try {
        snapshot = growin::TechnicalAnalyzer::analyze(*history, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Indicator calculation failed: " << e.what() << std::endl;
        return 1;
    }
    if (!snapshot) {
        std::cerr << "Error: No OHLCV data provided" << std::endl;
        return 1;
    }

    printSummary(*snapshot, config, history->ticker);

    auto output      = growin::TechnicalAnalyzer::toJson(*snapshot, config);
    output["ticker"] = history->ticker;
    output["config"] = config.toJson();
    std::cout << output.dump(4) << std::endl;

    return 0;
}
