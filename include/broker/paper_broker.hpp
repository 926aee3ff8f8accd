#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include "broker/broker_client.hpp"
#include "config/config.hpp"

namespace wheel {

/**
 * In-process simulated broker for paper and dry-run operation.
 *
 * Quotes a weekly chain around a spot price with Black-Scholes premiums,
 * keeps cash, shares and short options, and answers orders with status
 * events. Orders are acknowledged and filled at their limit either on
 * process_pending() or, in async mode, on a worker thread after a latency.
 * Expirations settle with assignment: ITM puts buy shares at the strike,
 * ITM calls deliver them. With auto_settle, positions and balances queries
 * settle every leg whose expiration is before the current market date.
 *
 * WARNING: fills at the limit price with no queue position or slippage.
 * Paper results say nothing about live fill quality.
 */
class PaperBroker : public BrokerClient {
public:
    struct Config {
        std::string symbol{"F"};
        double starting_cash{50000.0};
        double starting_shares{0.0};
        double spot{12.0};
        double implied_vol{0.35};
        double risk_free_rate{0.045};
        double strike_increment{0.5};
        int strikes_per_side{10};
        int weeks{8};
        unsigned expiry_weekday{5};
        int contract_multiplier{100};
        int64_t open_interest{500};
        double half_spread{0.02};
        bool provide_greeks{true};
        bool async_fills{false};
        int fill_latency_ms{50};
        // Settle expired legs on queries, by the broker clock's New York date
        bool auto_settle{true};
    };

    static Config config_from(const wheel::Config& app);

    explicit PaperBroker(const Config& config);
    ~PaperBroker() override;

    std::string name() const override { return "paper"; }

    bool connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected_.load(); }

    ChainResult get_option_chain(const std::string& underlying) override;
    PositionsResult get_positions() override;
    AccountBalances get_account_balances(const std::string& underlying) override;

    PlaceResult place_order(const OrderRequest& request) override;
    Result cancel_order(const std::string& broker_order_id) override;
    Result modify_order(const std::string& broker_order_id, const ModifyParams& params) override;

    // Acknowledge and (when auto fill is on) fill queued orders; returns orders handled
    size_t process_pending();

    // Stop and join the async fill worker. Orders it had not handled stay
    // queued for process_pending(). Call before tearing down the callback owner.
    void shutdown();

    // Simulation controls
    void set_spot(Price spot);
    Price spot() const;
    void set_implied_vol(double vol);
    void set_clock(std::function<WallClock()> clock);
    void set_auto_fill(bool enabled) { auto_fill_ = enabled; }
    void set_provide_greeks(bool enabled) { provide_greeks_ = enabled; }
    // Quotes stamped this far in the past
    void set_quote_age(std::chrono::seconds age);

    // Refuse the next `count` orders, optionally only on one side
    void reject_next(int count, std::optional<Side> side = std::nullopt, const std::string& reason = "simulated reject");

    // Fill a working order now, at its limit unless a price is given
    bool fill_order(const std::string& broker_order_id, std::optional<Price> price = std::nullopt);

    // Drop the session; queries and orders fail until connect()
    void simulate_disconnect();

    // Settle every option expiring before `as_of`; returns contracts settled
    int settle_expirations(Date as_of);

    // Test seeding
    void add_option_position(const BrokerPosition& pos);

    size_t working_order_count() const;
    double cash() const;
    double shares() const;

private:
    struct WorkingOrder {
        OrderRequest request;
        std::string broker_order_id;
        bool acked{false};
        bool queued{false};
        bool done{false};
    };

    struct PendingReject {
        std::optional<Side> side;
        std::string reason;
    };

    Config config_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> auto_fill_{true};
    std::atomic<bool> provide_greeks_{true};
    std::chrono::seconds quote_age_{0};

    mutable std::mutex mutex_;
    std::function<WallClock()> clock_;
    double spot_;
    double implied_vol_;
    double cash_;
    double shares_;
    std::map<std::string, BrokerPosition> options_;     // By contract id
    std::map<std::string, WorkingOrder> orders_;        // By broker order id
    std::deque<std::string> pending_;
    std::deque<PendingReject> rejects_;
    int64_t next_order_id_{1};

    // Async fill worker
    std::atomic<bool> running_{true};
    std::thread worker_thread_;
    std::condition_variable queue_cv_;
    void fill_loop();

    // Handles one queued order; returns the events to emit outside the lock
    std::vector<OrderStatusEvent> process_one_locked(const std::string& broker_order_id);
    OrderStatusEvent fill_locked(WorkingOrder& order, Price price);
    int settle_expirations_locked(Date as_of);
    void auto_settle_locked();

    double option_price_locked(OptionRight right, Price strike, Date expiration, WallClock now) const;
    WallClock clock_now_locked() const;

    void emit_all(const std::vector<OrderStatusEvent>& events) const;
};

// "F 20261023P00012500"
std::string make_contract_id(const std::string& symbol, Date expiration, OptionRight right, Price strike);

} // namespace wheel
