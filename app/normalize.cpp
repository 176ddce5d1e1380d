#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "growin/ticker_normalizer.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> tickers(argv + 1, argv + argc);
    if (tickers.empty()) {
        tickers = {"VOD_EQ", "AAPL_US_EQ", "3UKL", "LLOY1", "BARCL", "$tsla", "SGLN1_EQ", "VOD.L"};
    }

    // clang-format off
    std::clog << std::left
        << std::setw(20) << "(Raw)"
        << std::setw(20) << "(Canonical)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (const auto& ticker : tickers) {
        std::clog << std::left << std::setw(20) << ticker << std::setw(20)
                  << growin::TickerNormalizer::normalize(ticker) << std::endl;
    }

    return 0;
}
