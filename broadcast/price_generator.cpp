#include "price_generator.H"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace tickpipe::hub {

RandomWalkPriceGenerator::RandomWalkPriceGenerator(const std::vector<std::string>& symbols, uint64_t seed)
    : gen(seed), walk_value(-MAX_STEP, MAX_STEP) {

    std::uniform_real_distribution<double> start_dist(MIN_START_PRICE, MAX_START_PRICE);
    prices.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        prices.push_back({symbol, start_dist(gen)});
    }
}

RandomWalkPriceGenerator::RandomWalkPriceGenerator(uint64_t seed)
    : gen(seed), walk_value(-MAX_STEP, MAX_STEP) {}

RandomWalkPriceGenerator RandomWalkPriceGenerator::from_prices(std::vector<price_update> start, uint64_t seed) {
    RandomWalkPriceGenerator walk(seed);
    walk.prices = std::move(start);
    return walk;
}

const std::vector<price_update>& RandomWalkPriceGenerator::step() {
    for (auto& update : prices) {
        update.price = std::max(MIN_PRICE, update.price + walk_value(gen));
    }
    return prices;
}

std::string format_price_record(const price_update& update) {
    return fmt::format("{},{:.2f}", update.symbol, update.price);
}

SentimentGenerator::SentimentGenerator(uint64_t seed)
    : gen(seed), sentiment_dist(MIN_SENTIMENT, MAX_SENTIMENT) {}

} // namespace tickpipe::hub
