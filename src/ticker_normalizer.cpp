#include "growin/ticker_normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace growin {

namespace {

bool endsWith(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool endsWithAny(std::string_view value, std::string_view chars) {
    return !value.empty() && chars.find(value.back()) != std::string_view::npos;
}

bool startsWithAny(std::string_view value, std::string_view chars) {
    return !value.empty() && chars.find(value.front()) != std::string_view::npos;
}

}  // namespace

std::string TickerNormalizer::normalize(const std::string& ticker) {
    if (ticker.empty()) {
        return "";
    }

    auto symbol = clean(ticker);

    /* Already normalized */
    if (symbol.find('.') != std::string::npos) {
        return symbol;
    }

    const auto original = symbol;

    symbol = stripSuffixes(std::move(symbol));
    symbol = applySpecialMapping(std::move(symbol));
    symbol = stripRowVersion(std::move(symbol));

    /* Exchange classification (UK vs US) */
    const bool explicitUk = original.find("_EQ") != std::string::npos && original.find("_US") == std::string::npos;
    const bool excluded   = isUsExclusion(symbol);
    const bool likelyUk   = (symbol.size() <= 5 || endsWith(symbol, "L")) && !excluded;

    // UK depositary-receipt artifact: "BARCL" -> "BARC". Must run before the leveraged check.
    if (likelyUk && endsWith(symbol, "L") && symbol.size() > 3 && !excluded) {
        symbol.pop_back();
    }

    const bool leveraged = startsWithAny(symbol, "357") || endsWithAny(symbol, "2357");

    if (explicitUk || likelyUk || leveraged) {
        if (!endsWith(symbol, ".L") && symbol.find('.') == std::string::npos) {
            symbol += ".L";
        }
    }

    return symbol;
}

bool TickerNormalizer::isUsExclusion(std::string_view symbol) {
    return std::find(usExclusions_.begin(), usExclusions_.end(), symbol) != usExclusions_.end();
}

std::string TickerNormalizer::clean(const std::string& ticker) {
    std::string result(ticker);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    const auto first   = std::find_if_not(result.begin(), result.end(), isSpace);
    const auto last    = std::find_if_not(result.rbegin(), result.rend(), isSpace).base();
    result             = (first < last) ? std::string(first, last) : std::string();

    result.erase(std::remove(result.begin(), result.end(), '$'), result.end());
    return result;
}

std::string TickerNormalizer::stripSuffixes(std::string symbol) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto suffix : suffixes_) {
            if (endsWith(symbol, suffix)) {
                symbol.resize(symbol.size() - suffix.size());
                changed = true;
            }
        }
    }

    symbol.erase(std::remove(symbol.begin(), symbol.end(), '_'), symbol.end());
    return symbol;
}

std::string TickerNormalizer::applySpecialMapping(std::string symbol) {
    for (const auto& [from, to] : specialMappings_) {
        if (symbol == from) {
            return std::string(to);
        }
    }
    return symbol;
}

std::string TickerNormalizer::stripRowVersion(std::string symbol) {
    if (endsWith(symbol, "1") && symbol.size() > 3) {
        const std::string_view stem(symbol.data(), symbol.size() - 1);
        if (std::find(protectedStems_.begin(), protectedStems_.end(), stem) != protectedStems_.end()) {
            symbol.pop_back();
        }
    }
    return symbol;
}

}  // namespace growin
