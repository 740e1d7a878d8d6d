#include "config.H"
#include "types.H"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace tickpipe {

namespace {

// reads an integer field wide and rejects values the target type cannot hold
template <typename T>
T bounded_value(const nlohmann::json& j, const char* key, T fallback, int64_t min, int64_t max) {
    int64_t value = j.value(key, static_cast<int64_t>(fallback));
    if (value < min || value > max) {
        throw std::invalid_argument(std::string(key) + " must be in [" + std::to_string(min) + ", "
            + std::to_string(max) + "], got " + std::to_string(value));
    }
    return static_cast<T>(value);
}

constexpr int64_t MAX_PORT = std::numeric_limits<uint16_t>::max();
constexpr int64_t MAX_U32 = std::numeric_limits<uint32_t>::max();

}

pipeline_config config_from_json(const nlohmann::json& j) {
    pipeline_config config;
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    try {
        config.host = j.value("host", config.host);
        config.price_port = bounded_value(j, "price_port", config.price_port, 0, MAX_PORT);
        config.news_port = bounded_value(j, "news_port", config.news_port, 0, MAX_PORT);
        config.order_port = bounded_value(j, "order_port", config.order_port, 0, MAX_PORT);
        config.symbols = j.value("symbols", config.symbols);
        config.shm_name = j.value("shm_name", config.shm_name);

        config.short_window = bounded_value(j, "short_window", config.short_window, 1, MAX_U32);
        config.long_window = bounded_value(j, "long_window", config.long_window, 1, MAX_U32);
        config.bullish_threshold = bounded_value(j, "bullish_threshold", config.bullish_threshold, 0, 100);
        config.bearish_threshold = bounded_value(j, "bearish_threshold", config.bearish_threshold, 0, 100);
        config.trade_quantity = bounded_value(j, "trade_quantity", config.trade_quantity, 1, MAX_U32);

        config.price_interval_ms = bounded_value(j, "price_interval_ms", config.price_interval_ms, 1, MAX_U32);
        config.news_interval_ms = bounded_value(j, "news_interval_ms", config.news_interval_ms, 1, MAX_U32);
        config.reconnect_interval_ms = bounded_value(j, "reconnect_interval_ms", config.reconnect_interval_ms, 1, MAX_U32);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("config field has the wrong type: ") + e.what());
    }

    validate_config(config);
    return config;
}

pipeline_config load_config(const std::string& path) {
    pipeline_config config;
    if (!path.empty()) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open config file " + path);
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("Failed to parse config file " + path + ": " + e.what());
        }
        config = config_from_json(j);
    }

    const char* shm_name = std::getenv(SHM_NAME_ENV);
    if (shm_name != nullptr && shm_name[0] != '\0') {
        config.shm_name = shm_name;
    }

    validate_config(config);
    return config;
}

void validate_config(const pipeline_config& config) {
    if (config.symbols.empty()) {
        throw std::invalid_argument("symbols must not be empty");
    }

    for (const auto& symbol : config.symbols) {
        if (symbol.empty() || symbol.size() > MAX_SYMBOL_BYTES) {
            throw std::invalid_argument("symbol '" + symbol + "' must be 1 to "
                + std::to_string(MAX_SYMBOL_BYTES) + " bytes");
        }
    }

    if (config.shm_name.empty()) {
        throw std::invalid_argument("shm_name must not be empty");
    }

    if (config.short_window == 0 || config.long_window == 0) {
        throw std::invalid_argument("moving average windows must be positive");
    }

    if (config.short_window > config.long_window) {
        throw std::invalid_argument("short_window must not exceed long_window");
    }

    if (config.bearish_threshold >= config.bullish_threshold) {
        throw std::invalid_argument("bearish_threshold must be below bullish_threshold");
    }

    if (config.trade_quantity == 0) {
        throw std::invalid_argument("trade_quantity must be positive");
    }
}

} // namespace tickpipe
