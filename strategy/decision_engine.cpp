#include "decision_engine.H"
#include "common/utils.H"

#include <stdexcept>

namespace tickpipe::strategy {

DecisionEngine::DecisionEngine(std::string symbol, strategy_params params, uint32_t quantity, std::shared_ptr<spdlog::logger> logger)
    : traded_symbol(std::move(symbol)), params(params), quantity(quantity), prices(params.long_window), logger(logger)
{
    if (params.short_window == 0 || params.short_window > params.long_window) {
        throw std::invalid_argument("Short window must be in [1, long window]");
    }
}

std::optional<order_intent> DecisionEngine::on_news(std::string_view frame, const store::SharedPriceTable& table) {
    auto sentiment = parse_sentiment(frame);
    if (!sentiment) {
        logger->warn("Could not parse sentiment from message: '{}'", frame);
        return std::nullopt;
    }

    auto price = table.read(traded_symbol);
    if (!price) {
        logger->warn("No price available yet for {}. Skipping tick", traded_symbol);
        return std::nullopt;
    }

    return on_tick(*sentiment, *price);
}

std::optional<order_intent> DecisionEngine::on_tick(int sentiment, double price) {
    prices.push(price);

    auto d = evaluate(prices, sentiment, current, params);
    if (!d) {
        logger->debug("{} price={:.2f} sentiment={} history={} position={}: no order",
            traded_symbol, price, sentiment, prices.size(), to_string(current));
        return std::nullopt;
    }

    order_intent order;
    order.symbol = traded_symbol;
    order.side = d->side;
    order.quantity = quantity;
    order.price = price;
    order.sentiment = sentiment;
    order.short_ma = d->short_ma;
    order.long_ma = d->long_ma;
    order.position_before = current;
    order.position_after = d->desired_position;
    order.reason = d->reason;
    order.timestamp = epoch_seconds();
    return order;
}

void DecisionEngine::confirm(const order_intent& order) {
    logger->info("{} position {} -> {} after {} {} @ {:.2f}", traded_symbol, to_string(current),
        to_string(order.position_after), to_string(order.side), order.quantity, order.price);
    current = order.position_after;
}

} // namespace tickpipe::strategy
