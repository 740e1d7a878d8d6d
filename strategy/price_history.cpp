#include "price_history.H"

#include <numeric>
#include <stdexcept>
#include <string>

namespace tickpipe::strategy {

PriceHistory::PriceHistory(size_t capacity) : max_size(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("Price history capacity must be positive");
    }
}

void PriceHistory::push(double price) {
    prices.push_back(price);
    if (prices.size() > max_size) {
        prices.pop_front();
    }
}

double PriceHistory::mean_of_last(size_t n) const {
    if (n == 0 || n > prices.size()) {
        throw std::out_of_range("Cannot average last " + std::to_string(n) + " of "
            + std::to_string(prices.size()) + " prices");
    }
    double sum = std::accumulate(prices.end() - n, prices.end(), 0.0);
    return sum / n;
}

} // namespace tickpipe::strategy
