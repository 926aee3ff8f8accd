#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace wheel {

struct AccountBalances {
    bool success{false};
    double cash{0.0};
    double shares_held{0.0};        // Shares of the strategy's underlying
    double net_liquidation{0.0};
    std::string error;
};

// One line of the broker's position report
struct BrokerPosition {
    std::string contract_id;
    std::string symbol;
    bool is_option{false};
    OptionRight right{OptionRight::PUT};
    Price strike{0.0};
    Date expiration{};
    int quantity{0};                // Negative = short
    Price average_cost{0.0};        // Per share
};

struct OrderRequest {
    std::string client_order_id;
    std::string contract_id;
    std::string symbol;
    OptionRight right{OptionRight::PUT};
    Price strike{0.0};
    Date expiration{};
    Side side{Side::SELL};
    int quantity{0};
    OrderType type{OrderType::LIMIT};
    Price limit_price{0.0};
};

struct ModifyParams {
    std::optional<Price> limit_price;
    std::optional<int> quantity;
};

/**
 * Broker connectivity collaborator.
 *
 * Implementations own the session and the market-data transport. Every call
 * reports failure through `success`/`error` rather than throwing. Order
 * status updates arrive on the callback, possibly from another thread and in
 * any order.
 */
class BrokerClient {
public:
    using OrderStatusCallback = std::function<void(const OrderStatusEvent&)>;
    using ConnectionCallback = std::function<void(ConnectionStatus)>;

    struct ChainResult {
        bool success{false};
        ChainSnapshot chain;
        std::string error;
    };

    struct PositionsResult {
        bool success{false};
        std::vector<BrokerPosition> positions;
        std::string error;
    };

    struct PlaceResult {
        bool success{false};
        std::string broker_order_id;
        std::string error;
    };

    struct Result {
        bool success{false};
        std::string error;
    };

    virtual ~BrokerClient() = default;

    virtual std::string name() const = 0;

    // Connection
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    // Queries
    virtual ChainResult get_option_chain(const std::string& underlying) = 0;
    virtual PositionsResult get_positions() = 0;
    virtual AccountBalances get_account_balances(const std::string& underlying) = 0;

    // Orders
    virtual PlaceResult place_order(const OrderRequest& request) = 0;
    virtual Result cancel_order(const std::string& broker_order_id) = 0;
    virtual Result modify_order(const std::string& broker_order_id, const ModifyParams& params) = 0;

    // Event stream. Callbacks may be replaced while a worker thread emits.
    void set_order_status_callback(OrderStatusCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_order_status_ = std::move(cb);
    }
    void set_connection_callback(ConnectionCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_connection_ = std::move(cb);
    }

protected:
    void emit_order_status(const OrderStatusEvent& event) const {
        OrderStatusCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = on_order_status_;
        }
        if (cb) cb(event);
    }

    void emit_connection(ConnectionStatus status) const {
        ConnectionCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = on_connection_;
        }
        if (cb) cb(status);
    }

private:
    mutable std::mutex callback_mutex_;
    OrderStatusCallback on_order_status_;
    ConnectionCallback on_connection_;
};

} // namespace wheel
