#include "order_intent.H"

#include <stdexcept>

namespace tickpipe {

namespace {

SIDE side_from_string(const std::string& value) {
    if (value == "BUY") {
        return SIDE::BUY;
    }
    if (value == "SELL") {
        return SIDE::SELL;
    }
    throw std::invalid_argument("Unknown side: " + value);
}

POSITION position_from_string(const std::string& value) {
    if (value == "FLAT") {
        return POSITION::FLAT;
    }
    if (value == "LONG") {
        return POSITION::LONG;
    }
    if (value == "SHORT") {
        return POSITION::SHORT;
    }
    throw std::invalid_argument("Unknown position: " + value);
}

}

void to_json(nlohmann::json& j, const order_intent& order) {
    j = nlohmann::json{
        {"symbol", order.symbol},
        {"side", to_string(order.side)},
        {"quantity", order.quantity},
        {"price", order.price},
        {"sentiment", order.sentiment},
        {"short_ma", order.short_ma},
        {"long_ma", order.long_ma},
        {"position_before", to_string(order.position_before)},
        {"position_after", to_string(order.position_after)},
        {"reason", order.reason},
        {"timestamp", order.timestamp}};
}

void from_json(const nlohmann::json& j, order_intent& order) {
    j.at("symbol").get_to(order.symbol);
    order.side = side_from_string(j.at("side").get<std::string>());
    j.at("quantity").get_to(order.quantity);
    j.at("price").get_to(order.price);
    j.at("sentiment").get_to(order.sentiment);
    j.at("short_ma").get_to(order.short_ma);
    j.at("long_ma").get_to(order.long_ma);
    order.position_before = position_from_string(j.at("position_before").get<std::string>());
    order.position_after = position_from_string(j.at("position_after").get<std::string>());
    j.at("reason").get_to(order.reason);
    j.at("timestamp").get_to(order.timestamp);
}

} // namespace tickpipe
