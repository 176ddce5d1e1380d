#include "growin/price_history.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <numeric>

#include "growin/ticker_normalizer.hpp"

namespace growin {

namespace {

double fieldOrZero(const nlohmann::json& bar, const char* key) {
    if (!bar.contains(key) || bar[key].is_null()) {
        return 0.0;
    }
    return bar[key].get<double>();
}

}  // namespace

std::shared_ptr<PriceHistory> PriceHistory::fromJson(const nlohmann::json& doc) {
    const nlohmann::json* bars = &doc;
    std::string           ticker;

    if (doc.is_object()) {
        if (!doc.contains("bars")) {
            std::cerr << "Price history: missing \"bars\" array" << std::endl;
            return nullptr;
        }
        bars = &doc["bars"];
        if (doc.contains("ticker") && doc["ticker"].is_string()) {
            ticker = doc["ticker"].get<std::string>();
        }
    }

    if (!bars->is_array()) {
        std::cerr << "Price history: bars must be a JSON array" << std::endl;
        return nullptr;
    }

    auto history    = std::make_shared<PriceHistory>();
    history->ticker = TickerNormalizer::normalize(ticker);

    try {
        /* Order bars by open time; equal timestamps keep input order */
        std::vector<std::size_t> order(bars->size());
        std::iota(order.begin(), order.end(), 0);

        std::vector<int64_t> times;
        times.reserve(bars->size());
        for (const auto& bar : *bars) {
            times.push_back(bar.value("t", static_cast<int64_t>(0)));
        }
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return times[a] < times[b]; });

        history->timestamps.reserve(order.size());
        history->open.reserve(order.size());
        history->high.reserve(order.size());
        history->low.reserve(order.size());
        history->close.reserve(order.size());
        history->volume.reserve(order.size());

        for (const auto idx : order) {
            const auto& bar = (*bars)[idx];
            history->timestamps.push_back(times[idx]);
            history->open.push_back(fieldOrZero(bar, "o"));
            history->high.push_back(fieldOrZero(bar, "h"));
            history->low.push_back(fieldOrZero(bar, "l"));
            history->close.push_back(fieldOrZero(bar, "c"));
            history->volume.push_back(fieldOrZero(bar, "v"));
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Price history: malformed bar: " << e.what() << std::endl;
        return nullptr;
    }

    return history;
}

std::shared_ptr<PriceHistory> PriceHistory::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open price file: " << path << std::endl;
        return nullptr;
    }

    nlohmann::json doc;
    try {
        f >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Price file parse error: " << e.what() << std::endl;
        return nullptr;
    }

    return fromJson(doc);
}

}  // namespace growin
