#include "mboum/message_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace moverwatch::mboum {

using json = nlohmann::json;

namespace {

/// First of the candidate keys present and non-null, or nullptr
const json* find_field(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

double finite(double value, const json& source) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite number: " + source.dump());
    }
    return value;
}

/// Numeric value that may arrive as a number, a formatted string
/// ("1,234.5", "6.2%", "$12") or a {"raw": n, "fmt": "..."} pair.
/// Throws std::invalid_argument for anything else, NaN and infinities included.
double to_number(const json& value) {
    if (value.is_number()) {
        return finite(value.get<double>(), value);
    }
    if (value.is_object() && value.contains("raw")) {
        return to_number(value["raw"]);
    }
    if (value.is_string()) {
        std::string cleaned;
        for (char c : value.get<std::string>()) {
            if (c != ',' && c != '%' && c != '$' && c != '+' &&
                !std::isspace(static_cast<unsigned char>(c))) {
                cleaned += c;
            }
        }
        std::size_t consumed = 0;
        double result = std::stod(cleaned, &consumed);
        if (consumed != cleaned.size()) {
            throw std::invalid_argument("trailing characters in number: " + value.get<std::string>());
        }
        return finite(result, value);
    }
    throw std::invalid_argument("not a number: " + value.dump());
}

std::optional<double> number_field(const json& obj, std::initializer_list<const char*> keys) {
    if (const json* value = find_field(obj, keys)) {
        return to_number(*value);
    }
    return std::nullopt;
}

double required_number(const json& obj, std::initializer_list<const char*> keys) {
    auto value = number_field(obj, keys);
    if (!value) {
        throw std::invalid_argument(std::string("missing field ") + *keys.begin());
    }
    return *value;
}

/// Throws unless value converts to Shares. Also applied to dollar amounts
/// the formatter prints as whole numbers.
double in_share_range(double value) {
    // 2^63 is exactly representable, so the upper bound is exclusive
    constexpr double lower = static_cast<double>(std::numeric_limits<Shares>::min());
    constexpr double upper = -lower;
    if (!(value >= lower && value < upper)) {
        throw std::out_of_range("number out of range: " + std::to_string(value));
    }
    return value;
}

Shares to_shares(double value) {
    return static_cast<Shares>(std::llround(in_share_range(value)));
}

std::string string_field(const json& obj, std::initializer_list<const char*> keys) {
    if (const json* value = find_field(obj, keys)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
        if (value->is_number()) {
            return value->dump();
        }
    }
    return {};
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

/// Locate the record array: top-level array, "body" array, or an
/// array nested one level inside "body" (e.g. body.data).
const json* record_array(const json& root) {
    if (root.is_array()) {
        return &root;
    }
    if (!root.is_object() || !root.contains("body")) {
        return nullptr;
    }
    const json& body = root["body"];
    if (body.is_array()) {
        return &body;
    }
    if (body.is_object()) {
        for (const char* key : {"data", "rows", "table", "quotes"}) {
            auto it = body.find(key);
            if (it != body.end() && it->is_array()) {
                return &*it;
            }
        }
    }
    return nullptr;
}

InstrumentSnapshot parse_instrument(const json& row) {
    InstrumentSnapshot snapshot;
    snapshot.symbol = upper(string_field(row, {"symbol", "ticker"}));
    if (snapshot.symbol.empty()) {
        throw std::invalid_argument("missing symbol");
    }
    snapshot.name = string_field(row, {"shortName", "longName", "companyName", "name"});
    snapshot.price = required_number(row, {"regularMarketPrice", "lastSalePrice", "price"});
    snapshot.change_percent = required_number(
        row, {"regularMarketChangePercent", "percentageChange", "changePercent"});
    snapshot.volume = to_shares(number_field(row, {"regularMarketVolume", "volume"}).value_or(0.0));
    snapshot.bid = number_field(row, {"bid"}).value_or(0.0);
    snapshot.bid_size = to_shares(number_field(row, {"bidSize"}).value_or(0.0));
    snapshot.ask = number_field(row, {"ask"}).value_or(0.0);
    snapshot.ask_size = to_shares(number_field(row, {"askSize"}).value_or(0.0));
    return snapshot;
}

InsiderTrade parse_insider(const json& row) {
    InsiderTrade trade;
    trade.symbol = upper(string_field(row, {"symbol", "ticker"}));
    trade.insider = string_field(row, {"insiderName", "name", "filerName", "insider"});
    trade.side = MessageParser::parse_trade_side(
        string_field(row, {"transactionType", "transaction", "transactionText", "type"}));
    trade.shares = to_shares(std::fabs(
        required_number(row, {"shares", "sharesTraded", "transactionShares", "qty"})));
    trade.price = number_field(row, {"price", "lastPrice", "transactionPrice"}).value_or(0.0);
    trade.value = in_share_range(number_field(row, {"value", "transactionValue"}).value_or(0.0));
    return trade;
}

DerivativeEvent parse_derivative(const json& row) {
    DerivativeEvent event;

    // Contract rows carry the underlying in baseSymbol and the OCC code in symbol
    event.underlying = upper(string_field(row, {"baseSymbol", "underlyingSymbol", "underlying"}));
    if (event.underlying.empty()) {
        event.underlying = upper(string_field(row, {"symbol"}));
    } else {
        event.contract = string_field(row, {"symbol", "contractSymbol"});
    }
    if (event.underlying.empty()) {
        throw std::invalid_argument("missing underlying symbol");
    }

    auto type = upper(string_field(row, {"symbolType", "optionType", "type"}));
    if (type.rfind("CALL", 0) == 0) {
        event.type = ContractType::Call;
    } else if (type.rfind("PUT", 0) == 0) {
        event.type = ContractType::Put;
    }

    event.strike = number_field(row, {"strikePrice", "strike"}).value_or(0.0);
    event.expiration = string_field(row, {"expirationDate", "expiration", "expiry"});
    event.volume = to_shares(required_number(row, {"volume"}));
    event.open_interest = to_shares(number_field(row, {"openInterest"}).value_or(0.0));

    if (auto ratio = number_field(row, {"volumeOpenInterestRatio", "volOIRatio", "volumeOIRatio"})) {
        event.volume_oi_ratio = *ratio;
    } else if (event.open_interest > 0) {
        event.volume_oi_ratio = static_cast<double>(event.volume) /
                                static_cast<double>(event.open_interest);
    }
    return event;
}

/// Parse every record with `parse_one`, skipping the ones that throw
template <typename T, typename F>
Result<std::vector<T>, std::string> parse_batch(std::string_view json_str,
                                                std::string_view what,
                                                F parse_one) {
    json root;
    try {
        root = json::parse(json_str);
    } catch (const json::exception& e) {
        return Result<std::vector<T>, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }

    const json* rows = record_array(root);
    if (rows == nullptr) {
        return Result<std::vector<T>, std::string>::Err(
            "No record array in " + std::string(what) + " response"
        );
    }

    std::vector<T> records;
    records.reserve(rows->size());
    std::size_t skipped = 0;

    for (const auto& row : *rows) {
        try {
            if (!row.is_object()) {
                throw std::invalid_argument("record is not an object");
            }
            records.push_back(parse_one(row));
        } catch (const std::exception& e) {
            ++skipped;
            spdlog::debug("Skipping {} record: {}", what, e.what());
        }
    }

    if (skipped > 0) {
        spdlog::warn("Skipped {} malformed {} record(s) of {}", skipped, what, rows->size());
    }

    return Result<std::vector<T>, std::string>::Ok(std::move(records));
}

bool truthy(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        auto s = upper(value.get<std::string>());
        return s == "TRUE" || s == "YES" || s == "Y" || s == "1";
    }
    return false;
}

}  // namespace

Result<std::vector<InstrumentSnapshot>, std::string> MessageParser::parse_screener(std::string_view json_str) {
    return parse_batch<InstrumentSnapshot>(json_str, "screener", parse_instrument);
}

Result<std::vector<InsiderTrade>, std::string> MessageParser::parse_insider_trades(std::string_view json_str) {
    return parse_batch<InsiderTrade>(json_str, "insider trade", parse_insider);
}

Result<std::vector<DerivativeEvent>, std::string> MessageParser::parse_unusual_options(std::string_view json_str) {
    return parse_batch<DerivativeEvent>(json_str, "unusual options", parse_derivative);
}

Result<bool, std::string> MessageParser::parse_halt_status(std::string_view json_str) {
    try {
        auto root = json::parse(json_str);

        const json* quote = &root;
        if (const json* rows = record_array(root)) {
            if (rows->empty()) {
                return Result<bool, std::string>::Err("Empty quote response");
            }
            quote = &rows->front();
        } else if (root.is_object() && root.contains("body") && root["body"].is_object()) {
            quote = &root["body"];
        }

        if (!quote->is_object()) {
            return Result<bool, std::string>::Err("Quote is not an object");
        }

        if (const json* flag = find_field(*quote, {"tradingHalted", "isHalted", "halted"})) {
            return Result<bool, std::string>::Ok(truthy(*flag));
        }

        auto status = upper(string_field(*quote, {"tradingStatus", "marketState", "status"}));
        return Result<bool, std::string>::Ok(status.find("HALT") != std::string::npos);

    } catch (const json::exception& e) {
        return Result<bool, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }
}

TradeSide MessageParser::parse_trade_side(std::string_view label) {
    auto text = upper(std::string(label));

    if (text.find("SALE") != std::string::npos || text.find("SELL") != std::string::npos ||
        text.find("SOLD") != std::string::npos || text == "S" || text.rfind("S -", 0) == 0) {
        return TradeSide::Sell;
    }
    if (text.find("PURCHASE") != std::string::npos || text.find("BUY") != std::string::npos ||
        text.find("BOUGHT") != std::string::npos || text == "P" || text.rfind("P -", 0) == 0) {
        return TradeSide::Buy;
    }
    return TradeSide::Other;
}

}  // namespace moverwatch::mboum
