#include "broker/paper_broker.hpp"
#include "greeks/delta_monitor.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wheel {

std::string make_contract_id(const std::string& symbol, Date expiration, OptionRight right, Price strike) {
    return fmt::format("{} {}{}{:08d}", symbol, time_utils::format_expiry(expiration),
                       right == OptionRight::PUT ? 'P' : 'C',
                       static_cast<long long>(std::llround(strike * 1000.0)));
}

PaperBroker::Config PaperBroker::config_from(const wheel::Config& app) {
    Config c;
    c.symbol = app.strategy.symbol;
    c.starting_cash = app.broker.paper_starting_cash;
    c.starting_shares = app.broker.paper_starting_shares;
    c.spot = app.broker.paper_spot_price;
    c.implied_vol = app.broker.paper_implied_vol;
    c.risk_free_rate = app.market_data.risk_free_rate;
    c.strike_increment = app.broker.paper_strike_increment;
    c.strikes_per_side = app.broker.paper_strikes_per_side;
    c.weeks = app.broker.paper_weeks;
    c.expiry_weekday = static_cast<unsigned>(app.strategy.expiry_weekday);
    c.contract_multiplier = app.strategy.contract_multiplier;
    c.provide_greeks = app.broker.paper_provide_greeks;
    c.async_fills = app.broker.paper_async_fills;
    c.fill_latency_ms = app.broker.paper_fill_latency_ms;
    return c;
}

PaperBroker::PaperBroker(const Config& config)
    : config_(config)
    , provide_greeks_(config.provide_greeks)
    , clock_([] { return wall_now(); })
    , spot_(config.spot)
    , implied_vol_(config.implied_vol)
    , cash_(config.starting_cash)
    , shares_(config.starting_shares)
{
    if (config_.async_fills) {
        worker_thread_ = std::thread(&PaperBroker::fill_loop, this);
    }
}

PaperBroker::~PaperBroker() {
    shutdown();
}

void PaperBroker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::debug("Paper broker fill worker stopped");
    }
}

bool PaperBroker::connect() {
    connected_ = true;
    spdlog::info("Paper broker connected: {} spot {:.2f}, cash {:.2f}, shares {:.0f}",
                 config_.symbol, spot(), cash(), shares());
    emit_connection(ConnectionStatus::CONNECTED);
    return true;
}

void PaperBroker::disconnect() {
    if (!connected_.exchange(false)) return;
    spdlog::info("Paper broker disconnected");
    emit_connection(ConnectionStatus::DISCONNECTED);
}

void PaperBroker::simulate_disconnect() {
    connected_ = false;
    spdlog::warn("Paper broker: simulated connection loss");
    emit_connection(ConnectionStatus::DISCONNECTED);
}

WallClock PaperBroker::clock_now_locked() const {
    return clock_();
}

double PaperBroker::option_price_locked(OptionRight right, Price strike, Date expiration, WallClock now) const {
    double T = time_utils::years_to_expiry(now, expiration);
    double r = config_.risk_free_rate;
    double d1 = DeltaMonitor::bs_d1(spot_, strike, T, r, implied_vol_);
    double d2 = d1 - implied_vol_ * std::sqrt(T);
    double discount = std::exp(-r * T);

    if (right == OptionRight::CALL) {
        return spot_ * DeltaMonitor::normal_cdf(d1) - strike * discount * DeltaMonitor::normal_cdf(d2);
    }
    return strike * discount * DeltaMonitor::normal_cdf(-d2) - spot_ * DeltaMonitor::normal_cdf(-d1);
}

BrokerClient::ChainResult PaperBroker::get_option_chain(const std::string& underlying) {
    ChainResult result;
    if (!connected_) {
        result.error = "not connected";
        return result;
    }
    if (underlying != config_.symbol) {
        result.error = "unknown underlying: " + underlying;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    WallClock now = clock_now_locked();
    Date today = time_utils::market_date(now);

    ChainSnapshot& chain = result.chain;
    chain.symbol = config_.symbol;
    chain.underlying_last = spot_;
    chain.underlying_close = spot_;
    chain.underlying_bid = spot_ - 0.01;
    chain.underlying_ask = spot_ + 0.01;
    chain.as_of = now;

    double inc = config_.strike_increment > 0.0 ? config_.strike_increment : 0.5;
    double center = std::round(spot_ / inc) * inc;
    bool greeks = provide_greeks_.load();

    Date expiry = time_utils::next_weekday_on_or_after(today, config_.expiry_weekday);
    for (int w = 0; w < config_.weeks; ++w, expiry += std::chrono::days{7}) {
        double T = time_utils::years_to_expiry(now, expiry);
        for (int k = -config_.strikes_per_side; k <= config_.strikes_per_side; ++k) {
            double strike = center + k * inc;
            if (strike <= 0.0) continue;

            for (OptionRight right : {OptionRight::PUT, OptionRight::CALL}) {
                double theo = std::max(0.0, option_price_locked(right, strike, expiry, now));

                OptionContract c;
                c.contract_id = make_contract_id(config_.symbol, expiry, right, strike);
                c.symbol = config_.symbol;
                c.right = right;
                c.strike = strike;
                c.expiration = expiry;
                c.bid = std::max(0.0, std::round((theo - config_.half_spread) * 100.0) / 100.0);
                c.ask = std::max(0.01, std::round((theo + config_.half_spread) * 100.0) / 100.0);
                c.last = std::round(theo * 100.0) / 100.0;
                c.open_interest = config_.open_interest;
                c.implied_vol = implied_vol_;
                if (greeks) {
                    c.delta = DeltaMonitor::black_scholes_delta(right, spot_, strike, T,
                                                                config_.risk_free_rate, implied_vol_);
                }
                c.quote_time = now - quote_age_;
                chain.contracts.push_back(std::move(c));
            }
        }
    }

    result.success = true;
    return result;
}

BrokerClient::PositionsResult PaperBroker::get_positions() {
    PositionsResult result;
    if (!connected_) {
        result.error = "not connected";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto_settle_locked();
    if (shares_ != 0.0) {
        BrokerPosition stock;
        stock.contract_id = config_.symbol;
        stock.symbol = config_.symbol;
        stock.quantity = static_cast<int>(shares_);
        stock.average_cost = spot_;
        result.positions.push_back(stock);
    }
    for (const auto& [id, pos] : options_) {
        result.positions.push_back(pos);
    }
    result.success = true;
    return result;
}

AccountBalances PaperBroker::get_account_balances(const std::string& underlying) {
    AccountBalances balances;
    if (!connected_) {
        balances.error = "not connected";
        return balances;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto_settle_locked();
    WallClock now = clock_now_locked();

    double option_value = 0.0;
    for (const auto& [id, pos] : options_) {
        double px = std::max(0.0, option_price_locked(pos.right, pos.strike, pos.expiration, now));
        option_value += pos.quantity * px * config_.contract_multiplier;
    }

    balances.cash = cash_;
    balances.shares_held = underlying == config_.symbol ? shares_ : 0.0;
    balances.net_liquidation = cash_ + shares_ * spot_ + option_value;
    balances.success = true;
    return balances;
}

BrokerClient::PlaceResult PaperBroker::place_order(const OrderRequest& request) {
    PlaceResult result;
    if (!connected_) {
        result.error = "not connected";
        return result;
    }
    if (request.quantity <= 0) {
        result.error = "quantity must be positive";
        return result;
    }
    if (request.type == OrderType::LIMIT && request.limit_price <= 0.0) {
        result.error = "limit price must be positive";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        WorkingOrder order;
        order.request = request;
        order.broker_order_id = fmt::format("PB-{}", next_order_id_++);
        order.queued = true;
        result.broker_order_id = order.broker_order_id;
        orders_[order.broker_order_id] = order;
        pending_.push_back(result.broker_order_id);
    }

    spdlog::debug("Paper broker accepted {} {} {} x{} @ {:.2f} as {}", side_to_string(request.side),
                  request.contract_id, order_type_to_string(request.type), request.quantity,
                  request.limit_price, result.broker_order_id);

    queue_cv_.notify_one();
    result.success = true;
    return result;
}

BrokerClient::Result PaperBroker::cancel_order(const std::string& broker_order_id) {
    Result result;
    if (!connected_) {
        result.error = "not connected";
        return result;
    }

    OrderStatusEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(broker_order_id);
        if (it == orders_.end()) {
            result.error = "unknown order: " + broker_order_id;
            return result;
        }
        if (it->second.done) {
            result.error = "order already complete: " + broker_order_id;
            return result;
        }
        it->second.done = true;
        event.broker_order_id = broker_order_id;
        event.status = BrokerOrderStatus::CANCELLED;
        event.message = "canceled by request";
        event.time = clock_now_locked();
    }

    emit_order_status(event);
    result.success = true;
    return result;
}

BrokerClient::Result PaperBroker::modify_order(const std::string& broker_order_id, const ModifyParams& params) {
    Result result;
    if (!connected_) {
        result.error = "not connected";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(broker_order_id);
    if (it == orders_.end()) {
        result.error = "unknown order: " + broker_order_id;
        return result;
    }
    if (it->second.done) {
        result.error = "order already complete: " + broker_order_id;
        return result;
    }
    if (params.limit_price) {
        if (*params.limit_price <= 0.0) {
            result.error = "limit price must be positive";
            return result;
        }
        it->second.request.limit_price = *params.limit_price;
    }
    if (params.quantity) {
        it->second.request.quantity = *params.quantity;
    }
    result.success = true;
    return result;
}

size_t PaperBroker::process_pending() {
    std::deque<std::string> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pending_);
    }

    for (const auto& id : batch) {
        std::vector<OrderStatusEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events = process_one_locked(id);
        }
        emit_all(events);
    }
    return batch.size();
}

void PaperBroker::fill_loop() {
    while (running_) {
        std::string id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return !pending_.empty() || !running_; });
            if (!running_) break;
            id = pending_.front();
            pending_.pop_front();
        }

        std::vector<OrderStatusEvent> events;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Latency; shutdown cuts it short and hands the order back
            if (queue_cv_.wait_for(lock, std::chrono::milliseconds(config_.fill_latency_ms),
                                   [this] { return !running_; })) {
                pending_.push_front(id);
                break;
            }
            events = process_one_locked(id);
        }
        emit_all(events);
    }
}

std::vector<OrderStatusEvent> PaperBroker::process_one_locked(const std::string& broker_order_id) {
    std::vector<OrderStatusEvent> events;

    auto it = orders_.find(broker_order_id);
    if (it == orders_.end()) return events;
    WorkingOrder& order = it->second;
    order.queued = false;
    if (order.done || order.acked) return events;

    WallClock now = clock_now_locked();

    auto reject = std::find_if(rejects_.begin(), rejects_.end(), [&](const PendingReject& r) {
        return !r.side || *r.side == order.request.side;
    });
    if (reject != rejects_.end()) {
        order.done = true;
        OrderStatusEvent ev;
        ev.broker_order_id = broker_order_id;
        ev.status = BrokerOrderStatus::REJECTED;
        ev.message = reject->reason;
        ev.time = now;
        rejects_.erase(reject);
        events.push_back(ev);
        return events;
    }

    order.acked = true;
    OrderStatusEvent ack;
    ack.broker_order_id = broker_order_id;
    ack.status = BrokerOrderStatus::ACKED;
    ack.time = now;
    events.push_back(ack);

    if (auto_fill_) {
        Price price = order.request.limit_price;
        if (order.request.type == OrderType::MARKET || price <= 0.0) {
            price = std::max(0.01, option_price_locked(order.request.right, order.request.strike,
                                                       order.request.expiration, now));
        }
        events.push_back(fill_locked(order, price));
    }
    return events;
}

OrderStatusEvent PaperBroker::fill_locked(WorkingOrder& order, Price price) {
    const OrderRequest& req = order.request;
    double notional = price * req.quantity * config_.contract_multiplier;

    auto it = options_.find(req.contract_id);
    if (it == options_.end()) {
        BrokerPosition pos;
        pos.contract_id = req.contract_id;
        pos.symbol = req.symbol;
        pos.is_option = true;
        pos.right = req.right;
        pos.strike = req.strike;
        pos.expiration = req.expiration;
        pos.average_cost = price;
        it = options_.emplace(req.contract_id, pos).first;
    }

    if (req.side == Side::SELL) {
        cash_ += notional;
        it->second.quantity -= req.quantity;
    } else {
        cash_ -= notional;
        it->second.quantity += req.quantity;
    }
    if (it->second.quantity == 0) {
        options_.erase(it);
    }

    order.done = true;

    OrderStatusEvent ev;
    ev.broker_order_id = order.broker_order_id;
    ev.status = BrokerOrderStatus::FILLED;
    ev.filled_quantity = req.quantity;
    ev.fill_price = price;
    ev.time = clock_now_locked();
    return ev;
}

bool PaperBroker::fill_order(const std::string& broker_order_id, std::optional<Price> price) {
    OrderStatusEvent ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(broker_order_id);
        if (it == orders_.end() || it->second.done) return false;
        ev = fill_locked(it->second, price.value_or(it->second.request.limit_price));
    }
    emit_order_status(ev);
    return true;
}

void PaperBroker::emit_all(const std::vector<OrderStatusEvent>& events) const {
    for (const auto& ev : events) {
        emit_order_status(ev);
    }
}

void PaperBroker::reject_next(int count, std::optional<Side> side, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < count; ++i) {
        rejects_.push_back({side, reason});
    }
}

int PaperBroker::settle_expirations(Date as_of) {
    std::lock_guard<std::mutex> lock(mutex_);
    return settle_expirations_locked(as_of);
}

void PaperBroker::auto_settle_locked() {
    if (!config_.auto_settle) return;
    settle_expirations_locked(time_utils::market_date(clock_now_locked()));
}

int PaperBroker::settle_expirations_locked(Date as_of) {
    int settled = 0;
    for (auto it = options_.begin(); it != options_.end();) {
        const BrokerPosition& pos = it->second;
        if (pos.expiration >= as_of) {
            ++it;
            continue;
        }

        int contracts = -pos.quantity;   // Short > 0
        double delivered = static_cast<double>(contracts) * config_.contract_multiplier;
        bool itm = pos.right == OptionRight::PUT ? spot_ < pos.strike : spot_ > pos.strike;

        if (itm && pos.right == OptionRight::PUT) {
            shares_ += delivered;
            cash_ -= delivered * pos.strike;
            spdlog::info("Paper broker: {} assigned, bought {:.0f} shares @ {:.2f}",
                         pos.contract_id, delivered, pos.strike);
        } else if (itm) {
            shares_ -= delivered;
            cash_ += delivered * pos.strike;
            spdlog::info("Paper broker: {} assigned, delivered {:.0f} shares @ {:.2f}",
                         pos.contract_id, delivered, pos.strike);
        } else {
            spdlog::info("Paper broker: {} expired worthless", pos.contract_id);
        }

        it = options_.erase(it);
        ++settled;
    }
    return settled;
}

void PaperBroker::add_option_position(const BrokerPosition& pos) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_[pos.contract_id] = pos;
}

void PaperBroker::set_spot(Price spot) {
    std::lock_guard<std::mutex> lock(mutex_);
    spot_ = spot;
}

Price PaperBroker::spot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spot_;
}

void PaperBroker::set_implied_vol(double vol) {
    std::lock_guard<std::mutex> lock(mutex_);
    implied_vol_ = vol;
}

void PaperBroker::set_quote_age(std::chrono::seconds age) {
    std::lock_guard<std::mutex> lock(mutex_);
    quote_age_ = age;
}

void PaperBroker::set_clock(std::function<WallClock()> clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

size_t PaperBroker::working_order_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(orders_.begin(), orders_.end(), [](const auto& kv) {
        return !kv.second.done;
    }));
}

double PaperBroker::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_;
}

double PaperBroker::shares() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_;
}

} // namespace wheel
