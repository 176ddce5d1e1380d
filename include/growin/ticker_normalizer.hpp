#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace growin {

/**
 * @brief Reconciles broker/vendor ticker spellings (Trading212, Yahoo Finance,
 *        Alpaca, Finnhub) into one canonical market symbol.
 *
 * London-listed instruments receive a ".L" suffix. All tables are read-only,
 * so normalize() may be called concurrently from any thread.
 */
class TickerNormalizer {
   public:
    TickerNormalizer()  = delete;
    ~TickerNormalizer() = delete;

    TickerNormalizer(const TickerNormalizer& other) = delete;
    TickerNormalizer(TickerNormalizer&& other)      = delete;

    TickerNormalizer& operator=(const TickerNormalizer& other) = delete;
    TickerNormalizer& operator=(TickerNormalizer&& other) = delete;

    /**
     * @brief Normalize a raw ticker.
     * @param ticker Raw ticker (e.g., "VOD_EQ", "aapl_us", "$3UKL")
     * @return Canonical ticker (e.g., "VOD.L", "AAPL", "3UK.L"). Empty input yields "".
     *
     * Tickers that already contain '.' are returned after cleaning only, which makes
     * normalize() idempotent on its own output whenever that output carries ".L".
     */
    [[nodiscard]] static std::string normalize(const std::string& ticker);

    /**
     * @brief Whether a symbol is a known US listing that must never receive ".L".
     */
    [[nodiscard]] static bool isUsExclusion(std::string_view symbol);

   private:
    /* Uppercase, trim, drop '$' */
    [[nodiscard]] static std::string clean(const std::string& ticker);

    /* Remove chained vendor suffixes such as "_US_EQ", then any stray '_' */
    [[nodiscard]] static std::string stripSuffixes(std::string symbol);

    /* First exact match in table order wins */
    [[nodiscard]] static std::string applySpecialMapping(std::string symbol);

    /* "LLOY1" -> "LLOY" when the stem is a protected UK symbol */
    [[nodiscard]] static std::string stripRowVersion(std::string symbol);

    // clang-format off
    static constexpr std::array<std::string_view, 9> suffixes_ = {
        "_EQ", "_US", "_BE", "_DE", "_GB", "_FR", "_NL", "_ES", "_IT",
    };

    static constexpr std::array<std::pair<std::string_view, std::string_view>, 33> specialMappings_ = {{
        {"SSLNL", "SSLN"}, {"SGLNL", "SGLN"}, {"3GLD", "3GLD"},   {"SGLN", "SGLN"},
        {"PHGP", "PHGP"},  {"PHAU", "PHAU"},  {"3LTS", "3LTS"},   {"3USL", "3USL"},
        {"LLOY1", "LLOY"}, {"VOD1", "VOD"},   {"BARC1", "BARC"},  {"TSCO1", "TSCO"},
        {"BPL1", "BP"},    {"BPL", "BP"},     {"AZNL1", "AZN"},   {"AZNL", "AZN"},    // BP, AstraZeneca
        {"SGLN1", "SGLN"}, {"MAG5", "MAG5"},  {"MAG5L", "MAG5"},  {"MAG7", "MAG7"},
        {"MAG7L", "MAG7"}, {"GLD3", "GLD3"},  {"3UKL", "3UKL"},   {"5QQQ", "5QQQ"},
        {"TSL3", "TSL3"},  {"NVD3", "NVD3"},  {"AVL", "AV"},      {"UUL", "UU"},      // Aviva, United Utilities
        {"BAL", "BA"},     {"SLL", "SL"},     {"AU", "AUT"},      {"RBL", "RKT"},     // BAE, Standard Life, Auto Trader, Reckitt
        {"MICCL", "MICC"},
    }};

    static constexpr std::array<std::string_view, 11> protectedStems_ = {
        "LLOY", "BARC", "VOD", "HSBA", "TSCO", "BP", "AZN", "RR", "NG", "SGLN", "SSLN",
    };

    static constexpr std::array<std::string_view, 123> usExclusions_ = {
        /* Tech & Growth */
        "AAPL", "MSFT", "GOOG", "AMZN", "NVDA", "TSLA", "META", "NFLX",
        "AMD", "INTC", "PYPL", "ADBE", "CSCO", "PEP", "COST", "AVGO", "QCOM", "TXN",
        "ORCL", "CRM", "IBM", "UBER", "ABNB", "SNOW", "PLTR", "SQ", "SHOP", "SPOT",
        "GOOGL",
        /* Financials */
        "JPM", "BAC", "WFC", "C", "GS", "MS", "BLK", "AXP", "V", "MA", "COF", "USB",
        /* Industrial & Auto */
        "CAT", "DE", "GE", "GM", "F", "BA", "LMT", "RTX", "HON", "UPS", "FDX", "UNP", "MMM",
        /* Consumer */
        "WMT", "TGT", "HD", "LOW", "MCD", "SBUX", "NKE", "KO", "PEP", "PG", "CL", "MO", "PM", "DIS", "CMCSA",
        /* Healthcare */
        "JNJ", "PFE", "MRK", "ABBV", "LLY", "UNH", "CVS", "AMGN", "GILD", "BMY", "ISRG", "TMO", "ABT", "DHR",
        /* Energy */
        "XOM", "CVX", "COP", "SLB", "EOG", "OXY", "KMI", "HAL",
        /* Telecom */
        "T", "VZ", "TMUS",
        /* ETFs */
        "SPY", "QQQ", "DIA", "IWM", "IVV", "VOO", "VTI", "GLD", "SLV", "ARKK", "SMH", "XLF", "XLE", "XLK", "XLV",
        /* Single-letter US tickers */
        "F", "T", "C", "V", "Z", "O", "D", "R", "K", "X", "S", "M", "A", "G",
    };
    // clang-format on
};

}  // namespace growin
