#include "rest_broker_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace execution {

namespace rest {

    namespace {

        const char* const kPostOrderPath = "/tinkoff.public.invest.api.contract.v1.OrdersService/PostOrder";

        bool isBuy(core::SignalAction action) {
            return action == core::SignalAction::EnterLong || action == core::SignalAction::ExitShort;
        }

        long long jsonToInteger(const json& value) {
            if (value.is_string()) {
                return std::stoll(value.get<std::string>());
            }
            return value.get<long long>();
        }

        std::string errorMessage(const std::string& body) {
            json parsed = json::parse(body, nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
                return parsed["message"].get<std::string>();
            }
            return body.substr(0, 200);
        }

    } // end anonymous namespace

    double quotationToDouble(const json& quotation) {
        if (!quotation.is_object()) {
            throw core::ApiRequestException("Quotation must be an object with 'units' and 'nano'.");
        }
        long long units = quotation.contains("units") ? jsonToInteger(quotation["units"]) : 0;
        long long nano = quotation.contains("nano") ? jsonToInteger(quotation["nano"]) : 0;
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    std::optional<long long> sharesToLots(long long shares, long long lot) {
        if (lot < 1 || shares <= 0 || shares % lot != 0) {
            return std::nullopt;
        }
        return shares / lot;
    }

    InstrumentInfo parseInstrumentResponse(const std::string& symbol, const std::string& body) {
        json response = json::parse(body, nullptr, false);
        if (response.is_discarded() || !response.is_object() || !response.contains("instrument") ||
            !response["instrument"].is_object()) {
            throw core::ApiRequestException(fmt::format("Malformed instrument response for {}.", symbol));
        }

        const json& item = response["instrument"];
        InstrumentInfo info;
        info.symbol = symbol;
        try {
            info.figi = item.value("figi", std::string{});
            info.class_code = item.value("classCode", std::string{});
            info.lot = item.contains("lot") ? jsonToInteger(item["lot"]) : 0;
        } catch (const json::exception& e) {
            throw core::ApiRequestException(fmt::format("Malformed instrument response for {}: {}", symbol, e.what()));
        } catch (const std::logic_error& e) { // std::stoll
            throw core::ApiRequestException(fmt::format("Malformed instrument response for {}: {}", symbol, e.what()));
        }

        if (info.figi.empty()) {
            throw core::ApiRequestException(fmt::format("Instrument response for {} has no FIGI.", symbol));
        }
        if (info.lot < 1) {
            throw core::ApiRequestException(fmt::format("Instrument response for {} has invalid lot size {}.", symbol, info.lot));
        }
        return info;
    }

    json buildPostOrderRequest(const core::Order& order, const InstrumentInfo& instrument, const std::string& account_id) {
        const auto lots = sharesToLots(order.quantity, instrument.lot);
        if (!lots) {
            throw std::invalid_argument(fmt::format("{} shares of {} is not a whole number of {}-share lots",
                                                    order.quantity, order.symbol, instrument.lot));
        }
        return json{
            {"instrumentId", instrument.figi},
            {"quantity", std::to_string(*lots)},
            {"direction", isBuy(order.action) ? "ORDER_DIRECTION_BUY" : "ORDER_DIRECTION_SELL"},
            {"accountId", account_id},
            {"orderType", "ORDER_TYPE_MARKET"},
            {"orderId", order.order_id}
        };
    }

    ExecutionResult parsePostOrderResponse(const core::Order& order, const InstrumentInfo& instrument,
                                           long status_code, const std::string& body) {
        if (status_code != 200) {
            return core::Rejection{order.order_id, fmt::format("HTTP {}: {}", status_code, errorMessage(body))};
        }

        json response = json::parse(body, nullptr, false);
        if (response.is_discarded() || !response.is_object()) {
            return core::Rejection{order.order_id, "malformed broker response"};
        }

        try {
            const std::string status = response.value("executionReportStatus", std::string{});
            long long executed_lots = response.contains("lotsExecuted") ? jsonToInteger(response["lotsExecuted"]) : 0;

            const bool filled = status == "EXECUTION_REPORT_STATUS_FILL" ||
                                (status == "EXECUTION_REPORT_STATUS_PARTIALLYFILL" && executed_lots > 0);
            if (!filled) {
                return core::Rejection{order.order_id, status.empty() ? "unknown order status" : status};
            }

            core::Fill fill;
            fill.order_id = order.order_id;
            fill.timestamp = order.timestamp;
            fill.symbol = order.symbol;
            fill.action = order.action;
            fill.quantity = executed_lots > 0 ? executed_lots * instrument.lot : order.quantity;
            fill.price = response.contains("executedOrderPrice") ? quotationToDouble(response["executedOrderPrice"]) : 0.0;
            if (fill.price <= 0.0) {
                fill.price = order.reference_price;
            }
            if (response.contains("executedCommission")) {
                fill.commission = quotationToDouble(response["executedCommission"]);
            } else if (response.contains("initialCommission")) {
                fill.commission = quotationToDouble(response["initialCommission"]);
            }
            return fill;
        } catch (const json::exception& e) {
            return core::Rejection{order.order_id, fmt::format("malformed broker response: {}", e.what())};
        } catch (const std::logic_error& e) { // std::stoll
            return core::Rejection{order.order_id, fmt::format("malformed broker response: {}", e.what())};
        } catch (const core::ApiRequestException& e) {
            return core::Rejection{order.order_id, e.what()};
        }
    }

    std::vector<core::Position> parsePortfolioResponse(const std::string& body,
                                                       const std::map<std::string, InstrumentInfo>& instruments_by_figi) {
        auto logger = core::logging::getLogger();
        std::vector<core::Position> positions;

        json response = json::parse(body, nullptr, false);
        if (response.is_discarded() || !response.is_object()) {
            throw core::ApiRequestException("Malformed portfolio response.");
        }
        if (!response.contains("positions")) {
            return positions;
        }
        if (!response["positions"].is_array()) {
            throw core::ApiRequestException("Portfolio 'positions' is not an array.");
        }

        try {
            for (const auto& item : response["positions"]) {
                if (item.value("instrumentType", std::string{"share"}) != "share") {
                    continue;
                }
                const std::string figi = item.value("figi", std::string{});
                const auto known = instruments_by_figi.find(figi);

                std::string symbol;
                if (item.contains("ticker")) {
                    symbol = item["ticker"].get<std::string>();
                } else if (known != instruments_by_figi.end()) {
                    symbol = known->second.symbol;
                } else {
                    symbol = figi;
                }

                // 'quantity' is in shares; 'quantityLots' needs the lot size to convert
                double quantity = 0.0;
                if (item.contains("quantity")) {
                    quantity = quotationToDouble(item["quantity"]);
                } else if (item.contains("quantityLots") && known != instruments_by_figi.end()) {
                    quantity = quotationToDouble(item["quantityLots"]) * static_cast<double>(known->second.lot);
                } else {
                    logger->warn("Skipping portfolio entry {} without a share quantity.", symbol.empty() ? "?" : symbol);
                    continue;
                }
                if (symbol.empty()) {
                    logger->warn("Skipping portfolio entry without instrument.");
                    continue;
                }
                if (std::fabs(quantity) < 1e-9) {
                    continue;
                }

                core::Position position;
                position.symbol = symbol;
                position.direction = quantity > 0 ? core::Direction::Long : core::Direction::Short;
                position.quantity = static_cast<long long>(std::llround(std::fabs(quantity)));
                position.entry_price = item.contains("averagePositionPrice") ? quotationToDouble(item["averagePositionPrice"]) : 0.0;
                position.entry_time = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
                positions.push_back(position);
            }
        } catch (const json::exception& e) {
            throw core::ApiRequestException(fmt::format("Malformed portfolio position: {}", e.what()));
        }
        return positions;
    }

} // namespace rest

namespace {

    cpr::Header authorizedHeaders(const std::string& token) {
        return cpr::Header{
            {"Accept", "application/json"},
            {"Content-Type", "application/json"},
            {"Authorization", "Bearer " + token}
        };
    }

} // end anonymous namespace

RestBrokerClient::RestBrokerClient(const core::BrokerSettings& settings)
    : base_url_(settings.base_url), account_id_(settings.account_id), class_code_(settings.class_code),
      token_(settings.token)
{
    auto logger = core::logging::getLogger();
    logger->debug("RestBrokerClient created for {} (board {})", base_url_, class_code_);
    if (token_.empty()) {
        logger->warn("RestBrokerClient created without access token (BROKER_TOKEN is not set).");
    }
    if (account_id_.empty()) {
        logger->warn("RestBrokerClient created without broker account id.");
    }
}

InstrumentInfo RestBrokerClient::getInstrument(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(instruments_mutex_);
        auto cached = instruments_.find(symbol);
        if (cached != instruments_.end()) {
            return cached->second;
        }
    }

    auto logger = core::logging::getLogger();
    if (token_.empty()) {
        throw core::ApiRequestException(fmt::format("Cannot resolve {}: access token is missing.", symbol));
    }

    const std::string full_url = base_url_ + "/tinkoff.public.invest.api.contract.v1.InstrumentsService/ShareBy";
    const std::string payload = nlohmann::json{
        {"idType", "INSTRUMENT_ID_TYPE_TICKER"},
        {"classCode", class_code_},
        {"id", symbol}
    }.dump();

    cpr::Response response = cpr::Post(cpr::Url{full_url}, authorizedHeaders(token_), cpr::Body{payload},
                                       cpr::Timeout{15000});
    if (response.error) {
        throw core::ApiRequestException(fmt::format("Instrument request for {} failed: {}", symbol, response.error.message));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Instrument request for {} failed: HTTP {}: {}",
                                                    symbol, response.status_code, response.text.substr(0, 200)));
    }

    InstrumentInfo info = rest::parseInstrumentResponse(symbol, response.text);
    logger->info("Resolved {} -> FIGI {}, lot {}", symbol, info.figi, info.lot);

    std::lock_guard<std::mutex> lock(instruments_mutex_);
    instruments_[symbol] = info;
    return info;
}

ExecutionResult RestBrokerClient::submitOrder(const core::Order& order, std::chrono::milliseconds timeout) {
    auto logger = core::logging::getLogger();
    if (token_.empty()) {
        return core::Rejection{order.order_id, "missing broker token"};
    }

    InstrumentInfo instrument;
    try {
        instrument = getInstrument(order.symbol);
    } catch (const core::ApiRequestException& e) {
        return core::Rejection{order.order_id, e.what()};
    }
    if (!rest::sharesToLots(order.quantity, instrument.lot)) {
        return core::Rejection{order.order_id,
                               fmt::format("quantity {} is not a multiple of lot size {}", order.quantity, instrument.lot)};
    }

    const std::string full_url = base_url_ + rest::kPostOrderPath;
    const std::string payload = rest::buildPostOrderRequest(order, instrument, account_id_).dump();
    logger->debug("POST {} for order {}", full_url, order.order_id);

    cpr::Response response = cpr::Post(cpr::Url{full_url}, authorizedHeaders(token_), cpr::Body{payload},
                                       cpr::Timeout{timeout});

    logger->debug("Broker response status {}, body size {}", response.status_code, response.text.length());

    if (response.error) {
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            return core::Rejection{order.order_id, "timeout"};
        }
        logger->error("Broker request failed (CPR error): Code={}, Message='{}'",
                      static_cast<int>(response.error.code), response.error.message);
        return core::Rejection{order.order_id, response.error.message};
    }
    if (response.status_code == 401) {
        logger->critical("Broker returned 401 Unauthorized. The access token may be invalid or expired.");
    }
    return rest::parsePostOrderResponse(order, instrument, response.status_code, response.text);
}

std::vector<core::Position> RestBrokerClient::getOpenPositions() {
    auto logger = core::logging::getLogger();
    if (token_.empty()) {
        throw core::ApiRequestException("Cannot query broker positions: access token is missing.");
    }

    const std::string full_url = base_url_ + "/tinkoff.public.invest.api.contract.v1.OperationsService/GetPortfolio";
    const std::string payload = nlohmann::json{{"accountId", account_id_}}.dump();

    cpr::Response response = cpr::Post(cpr::Url{full_url}, authorizedHeaders(token_), cpr::Body{payload},
                                       cpr::Timeout{15000});
    if (response.error) {
        throw core::ApiRequestException(fmt::format("Portfolio request failed: {}", response.error.message));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Portfolio request failed: HTTP {}: {}",
                                                    response.status_code, response.text.substr(0, 200)));
    }

    std::map<std::string, InstrumentInfo> by_figi;
    {
        std::lock_guard<std::mutex> lock(instruments_mutex_);
        for (const auto& entry : instruments_) {
            by_figi[entry.second.figi] = entry.second;
        }
    }

    std::vector<core::Position> positions = rest::parsePortfolioResponse(response.text, by_figi);
    logger->info("Broker reports {} open position(s).", positions.size());
    return positions;
}

} // namespace execution
