#include "signals.H"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace tickpipe::strategy {

SIGNAL price_signal(double short_ma, double long_ma) {
    if (short_ma > long_ma) {
        return SIGNAL::BUY;
    }
    if (short_ma < long_ma) {
        return SIGNAL::SELL;
    }
    return SIGNAL::HOLD;
}

SIGNAL news_signal(int sentiment, const strategy_params& params) {
    if (sentiment > params.bullish_threshold) {
        return SIGNAL::BUY;
    }
    if (sentiment < params.bearish_threshold) {
        return SIGNAL::SELL;
    }
    return SIGNAL::HOLD;
}

std::optional<decision> evaluate(const PriceHistory& history, int sentiment, POSITION position,
    const strategy_params& params) {

    if (history.size() < params.long_window) {
        return std::nullopt;
    }

    double short_ma = history.mean_of_last(params.short_window);
    double long_ma = history.mean_of_last(params.long_window);

    SIGNAL from_price = price_signal(short_ma, long_ma);
    SIGNAL from_news = news_signal(sentiment, params);
    if (from_price != from_news || from_price == SIGNAL::HOLD) {
        return std::nullopt;
    }

    decision d;
    if (from_price == SIGNAL::BUY) {
        d.side = SIDE::BUY;
        d.desired_position = POSITION::LONG;
        d.reason = "Both price and news signals indicate BUY";
    } else {
        d.side = SIDE::SELL;
        d.desired_position = POSITION::SHORT;
        d.reason = "Both price and news signals indicate SELL";
    }

    if (d.desired_position == position) {
        return std::nullopt;
    }

    d.short_ma = short_ma;
    d.long_ma = long_ma;
    return d;
}

std::optional<int> parse_sentiment(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    if (begin == end) {
        return std::nullopt;
    }

    std::string digits(text.substr(begin, end - begin));
    char* stop = nullptr;
    errno = 0;
    long value = std::strtol(digits.c_str(), &stop, 10);
    if (errno != 0 || stop != digits.c_str() + digits.size()) {
        return std::nullopt;
    }
    if (value < 0 || value > 100) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

} // namespace tickpipe::strategy
