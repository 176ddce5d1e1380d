#include "growin/indicator.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace growin::indicator {

namespace {

void requirePositive(std::size_t value, const char* function, const char* parameter) {
    if (value == 0) {
        throw std::invalid_argument(std::string("indicator::") + function + ": " + parameter + " must be positive");
    }
}

}  // namespace

std::vector<double> sma(const std::vector<double>& data, std::size_t period) {
    requirePositive(period, "sma", "period");

    std::vector<double> result;
    result.reserve(data.size());

    const auto window = static_cast<double>(period);

    // Running sum: add the incoming value, drop the one leaving the window.
    double sum = 0.0;
    for (std::size_t i = 0; i < data.size(); ++i) {
        sum += data[i];
        if (i >= period) {
            sum -= data[i - period];
            result.push_back(sum / window);
        } else if (i == period - 1) {
            result.push_back(sum / window);
        } else {
            result.push_back(kPadding);
        }
    }

    return result;
}

std::vector<double> ema(const std::vector<double>& data, std::size_t period) {
    requirePositive(period, "ema", "period");

    if (data.empty()) {
        return {};
    }

    const double k = 2.0 / (static_cast<double>(period) + 1.0);

    // Seed index: the first full window, or the first value if the series is shorter.
    const std::size_t start = (data.size() >= period) ? period - 1 : 0;

    std::vector<double> result;
    result.reserve(data.size());
    result.assign(start, kPadding);

    double sum = 0.0;
    for (std::size_t i = 0; i <= start; ++i) {
        sum += data[i];
    }
    double current = sum / static_cast<double>(start + 1);
    result.push_back(current);

    for (std::size_t i = start + 1; i < data.size(); ++i) {
        current = (data[i] * k) + (current * (1.0 - k));
        result.push_back(current);
    }

    return result;
}

std::vector<double> rsi(const std::vector<double>& prices, std::size_t period) {
    requirePositive(period, "rsi", "period");

    if (prices.size() < period) {
        return std::vector<double>(prices.size(), kRsiPadding);
    }

    std::vector<double> diffs;
    diffs.reserve(prices.size());
    diffs.push_back(0.0);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        diffs.push_back(prices[i] - prices[i - 1]);
    }

    std::vector<double> result;
    result.reserve(prices.size());
    result.assign(period, kRsiPadding);

    // Simple average of the first 'period' changes (fewer if the series is exactly 'period' long)
    const std::size_t warmupEnd = (diffs.size() > period) ? period : diffs.size() - 1;

    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 1; i <= warmupEnd; ++i) {
        const double change = diffs[i];
        if (change > 0.0) {
            avgGain += change;
        } else {
            avgLoss += std::abs(change);
        }
    }

    const double denominator = (warmupEnd > 0) ? static_cast<double>(warmupEnd) : 1.0;
    avgGain /= denominator;
    avgLoss /= denominator;

    const auto n = static_cast<double>(period);

    for (std::size_t i = period; i < prices.size(); ++i) {
        const double change = diffs[i];
        const double gain   = (change > 0.0) ? change : 0.0;
        const double loss   = (change > 0.0) ? 0.0 : std::abs(change);

        // The warm-up average is itself the first smoothed value.
        if (i != period) {
            avgGain = ((avgGain * (n - 1.0)) + gain) / n;
            avgLoss = ((avgLoss * (n - 1.0)) + loss) / n;
        }

        if (avgLoss == 0.0) {
            result.push_back(100.0);
        } else {
            const double rs = avgGain / avgLoss;
            result.push_back(100.0 - (100.0 / (1.0 + rs)));
        }
    }

    return result;
}

MacdResult macd(const std::vector<double>& data, std::size_t fast, std::size_t slow, std::size_t signal) {
    requirePositive(fast, "macd", "fast");
    requirePositive(slow, "macd", "slow");
    requirePositive(signal, "macd", "signal");

    const auto emaFast = ema(data, fast);
    const auto emaSlow = ema(data, slow);

    MacdResult result;
    result.macdLine.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        // Leading zero paddings subtract to 0.0.
        result.macdLine.push_back(emaFast[i] - emaSlow[i]);
    }

    result.signalLine = ema(result.macdLine, signal);

    result.histogram.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        result.histogram.push_back(result.macdLine[i] - result.signalLine[i]);
    }

    return result;
}

BollingerBands bbands(const std::vector<double>& data, std::size_t period, double stdDev) {
    requirePositive(period, "bbands", "period");

    BollingerBands bands;
    bands.upper.reserve(data.size());
    bands.middle.reserve(data.size());
    bands.lower.reserve(data.size());

    const auto window = static_cast<double>(period);

    for (std::size_t i = 0; i < data.size(); ++i) {
        if (i < period - 1) {
            bands.upper.push_back(kPadding);
            bands.middle.push_back(kPadding);
            bands.lower.push_back(kPadding);
            continue;
        }

        const std::size_t first = (i + 1) - period;

        double sum = 0.0;
        for (std::size_t j = first; j <= i; ++j) {
            sum += data[j];
        }
        const double mean = sum / window;

        // Population variance (divisor = period)
        double variance = 0.0;
        for (std::size_t j = first; j <= i; ++j) {
            const double d = data[j] - mean;
            variance += d * d;
        }
        variance /= window;
        const double sd = std::sqrt(variance);

        bands.middle.push_back(mean);
        bands.upper.push_back(mean + (stdDev * sd));
        bands.lower.push_back(mean - (stdDev * sd));
    }

    return bands;
}

}  // namespace growin::indicator
