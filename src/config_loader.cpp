#include "config/simulation_config.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <fstream>
#include <sstream>

namespace perpx {

namespace {

// Minimal JSON value for config loading (no external deps).
// Booleans are stored as numbers 1/0.
struct JsonValue {
    enum Type { Null, Number, String, Array, Object };
    Type type = Null;
    double number = 0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* find(const std::string& key) const {
        for (const auto& [k, v] : obj) {
            if (k == key) return &v;
        }
        return nullptr;
    }

    bool get_bool(const std::string& key, bool def) const {
        const JsonValue* v = find(key);
        return (v && v->type == Number) ? v->number != 0 : def;
    }
    std::string get_string(const std::string& key, const std::string& def = "") const {
        const JsonValue* v = find(key);
        return (v && v->type == String) ? v->str : def;
    }
    const JsonValue* get_array(const std::string& key) const {
        const JsonValue* v = find(key);
        return (v && v->type == Array) ? v : nullptr;
    }
    const JsonValue* get_object(const std::string& key) const {
        const JsonValue* v = find(key);
        return (v && v->type == Object) ? v : nullptr;
    }
};

// Simple recursive descent JSON parser
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonValue parse() {
        skip_ws();
        JsonValue v = parse_value();
        skip_ws();
        if (pos_ != input_.size()) fail("trailing characters");
        return v;
    }

private:
    std::string input_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        throw ConfigError("json: " + what + " at offset " + std::to_string(pos_));
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
    void expect(char c) {
        if (next() != c) fail(std::string("expected '") + c + "'");
    }
    void expect_literal(const std::string& lit) {
        if (input_.compare(pos_, lit.size(), lit) != 0) fail("invalid literal");
        pos_ += lit.size();
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 'n') { expect_literal("null"); return JsonValue{}; }
        if (c == 't') { expect_literal("true"); JsonValue v; v.type = JsonValue::Number; v.number = 1; return v; }
        if (c == 'f') { expect_literal("false"); JsonValue v; v.type = JsonValue::Number; v.number = 0; return v; }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        fail("unexpected character");
    }

    JsonValue parse_string() {
        expect('"');
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"') {
            if (peek() == '\0') fail("unterminated string");
            if (peek() == '\\') { next(); v.str += next(); }
            else v.str += next();
        }
        next(); // closing "
        return v;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') next();
        while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        if (peek() == '.') { next(); while (std::isdigit(static_cast<unsigned char>(peek()))) next(); }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        }
        JsonValue v;
        v.type = JsonValue::Number;
        try {
            v.number = std::stod(input_.substr(start, pos_ - start));
        } catch (const std::exception&) {
            fail("malformed number");
        }
        return v;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { next(); return v; }
        while (true) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() == ',') { next(); skip_ws(); }
            else break;
        }
        skip_ws();
        expect(']');
        return v;
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { next(); return v; }
        while (true) {
            skip_ws();
            auto key = parse_string();
            skip_ws();
            expect(':');
            auto val = parse_value();
            v.obj.emplace_back(key.str, std::move(val));
            skip_ws();
            if (peek() == ',') { next(); }
            else break;
        }
        skip_ws();
        expect('}');
        return v;
    }
};

// Amounts are written as decimal strings ("2000.5") or plain numbers.
Amount read_amount(const JsonValue& v, const std::string& where) {
    std::string text;
    if (v.type == JsonValue::String) {
        text = v.str;
    } else if (v.type == JsonValue::Number && v.number >= 0) {
        std::ostringstream ss;
        ss.precision(18);
        ss << std::fixed << v.number;
        text = ss.str();
    } else {
        throw ConfigError(where + ": expected an amount");
    }

    try {
        return parse_amount(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(where + ": " + e.what());
    }
}

Amount get_amount(const JsonValue& obj, const std::string& key, const std::string& where) {
    const JsonValue* v = obj.find(key);
    if (!v) return 0;
    return read_amount(*v, where + "." + key);
}

std::unordered_map<MarketId, Amount> read_price_map(const JsonValue* obj, const std::string& where) {
    std::unordered_map<MarketId, Amount> prices;
    if (!obj) return prices;
    for (const auto& [market, value] : obj->obj) {
        prices[market] = read_amount(value, where + "." + market);
    }
    return prices;
}

// Whole number in [min, max], or def when the key is absent.
double get_bounded(const JsonValue& obj, const std::string& key, double def,
                   double min, double max, const std::string& where) {
    const JsonValue* v = obj.find(key);
    if (!v) return def;
    if (v->type != JsonValue::Number || !std::isfinite(v->number)
        || v->number < min || v->number > max || std::floor(v->number) != v->number) {
        std::ostringstream ss;
        ss << where << "." << key << ": expected a whole number in [" << std::fixed
           << std::setprecision(0) << min << ", " << max << "]";
        throw ConfigError(ss.str());
    }
    return v->number;
}

uint32_t get_u32(const JsonValue& obj, const std::string& key, uint32_t def,
                 const std::string& where, uint32_t max = std::numeric_limits<uint32_t>::max()) {
    return static_cast<uint32_t>(get_bounded(obj, key, def, 0, max, where));
}

// Seconds; bounded well inside double's exact integer range.
constexpr double kMaxSeconds = 1e15;

Timestamp get_seconds(const JsonValue& obj, const std::string& key, Timestamp def,
                      const std::string& where) {
    return static_cast<Timestamp>(get_bounded(obj, key, static_cast<double>(def),
                                              0, kMaxSeconds, where));
}

RequestType parse_request_type(const std::string& name, const std::string& where) {
    if (name == "open")     return RequestType::Open;
    if (name == "close")    return RequestType::Close;
    if (name == "increase") return RequestType::Increase;
    if (name == "reduce")   return RequestType::Reduce;
    throw ConfigError(where + ": unknown request type '" + name + "'");
}

} // anonymous namespace

const char* to_string(RequestType type) {
    switch (type) {
        case RequestType::Open:     return "open";
        case RequestType::Close:    return "close";
        case RequestType::Increase: return "increase";
        case RequestType::Reduce:   return "reduce";
    }
    return "unknown";
}

SimulationConfig parse_simulation_config(const std::string& json_text) {
    JsonParser parser(json_text);
    auto root = parser.parse();
    if (root.type != JsonValue::Object) {
        throw ConfigError("config root must be an object");
    }

    SimulationConfig config;
    config.owner = root.get_string("owner", config.owner);
    config.max_price_deviation_bps = get_u32(root, "max_price_deviation_bps",
                                             config.max_price_deviation_bps, "config");
    config.start_time = get_seconds(root, "start_time", config.start_time, "config");
    config.compensate_on_slippage = root.get_bool("compensate_on_slippage", true);

    // Parse venues
    if (auto* vens = root.get_array("venues")) {
        for (const auto& ven : vens->arr) {
            SimVenueConfig vc;
            vc.id = ven.get_string("id");
            if (vc.id.empty()) throw ConfigError("venue without id");
            std::string where = "venues." + vc.id;

            vc.name = ven.get_string("name", vc.id);
            vc.max_leverage = get_u32(ven, "max_leverage", 50, where);
            vc.fee_rate_bps = get_u32(ven, "fee_rate_bps", 10, where, kBpsDenominator);
            vc.active = ven.get_bool("active", true);
            vc.fail_quotes = ven.get_bool("fail_quotes", false);
            vc.fail_execution = ven.get_bool("fail_execution", false);
            vc.fill_ratio_bps = get_u32(ven, "fill_ratio_bps", kBpsDenominator, where, kBpsDenominator);
            vc.mark_prices = read_price_map(ven.get_object("prices"), where + ".prices");
            vc.quote_overrides = read_price_map(ven.get_object("quote_overrides"),
                                                where + ".quote_overrides");
            config.venues.push_back(std::move(vc));
        }
    }

    // Parse markets
    if (auto* mkts = root.get_array("markets")) {
        for (const auto& mkt : mkts->arr) {
            SimMarketConfig mc;
            mc.id = mkt.get_string("id");
            if (mc.id.empty()) throw ConfigError("market without id");
            mc.oracle_price = get_amount(mkt, "oracle_price", "markets." + mc.id);
            mc.oracle_age_s = get_seconds(mkt, "oracle_age_s", 0, "markets." + mc.id);
            mc.bound = mkt.get_bool("bound", true);
            config.markets.push_back(std::move(mc));
        }
    }

    // Parse requests
    if (auto* reqs = root.get_array("requests")) {
        size_t index = 0;
        for (const auto& req : reqs->arr) {
            std::string where = "requests[" + std::to_string(index++) + "]";
            SimRequest r;
            r.type = parse_request_type(req.get_string("type", "open"), where);
            r.trader = req.get_string("trader", "trader");
            r.market = req.get_string("market");
            r.is_long = req.get_bool("is_long", true);
            r.amount = get_amount(req, "amount", where);
            r.leverage = get_u32(req, "leverage", 0, where);
            r.min_out = get_amount(req, "min_out", where);
            r.deadline_s = static_cast<int64_t>(
                get_bounded(req, "deadline_s", 300, -kMaxSeconds, kMaxSeconds, where));
            r.advance_s = get_seconds(req, "advance_s", 0, where);
            config.requests.push_back(std::move(r));
        }
    }

    return config;
}

SimulationConfig load_simulation_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    return parse_simulation_config(content);
}

} // namespace perpx
