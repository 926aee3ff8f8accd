#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "broker/paper_broker.hpp"
#include "core/wheel_runner.hpp"
#include "persistence/decision_ledger.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"

using namespace wheel;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/wheelroll.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("wheelroll", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

void print_startup_banner(const Config& config) {
    const auto& s = config.strategy;

    std::cout << "\n┌─────────────────────────────────────────────────────────────────────────────┐\n";
    std::cout << "│ WHEELROLL - weekly wheel rolling decision engine                            │\n";
    std::cout << "├─────────────────────────────────────────────────────────────────────────────┤\n";
    std::cout << "│ This is NOT financial advice. Short options carry assignment risk.          │\n";
    std::cout << "└─────────────────────────────────────────────────────────────────────────────┘\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Underlying:      " << s.symbol << "\n";
    std::cout << "  Target shares:   " << s.target_shares << "\n";
    std::cout << "  Weekly slots:    " << s.num_slots << " x " << s.contracts_per_slot << " contract(s)\n";
    std::cout << "  Roll at |delta|: " << s.roll_delta_threshold << "\n";
    std::cout << "  Target delta:    " << s.base_target_delta << " .. " << s.max_target_delta << "\n\n";

    if (config.mode == TradingMode::PAPER) {
        std::cout << "[PAPER MODE] Orders filled by the in-process simulated broker.\n\n";
    } else if (config.mode == TradingMode::DRY_RUN) {
        std::cout << "[DRY-RUN MODE] Decisions computed and logged, no orders placed.\n\n";
    }
}

void print_cycle(const CycleResult& result) {
    std::cout << "Cycle " << result.cycle << " @ " << time_utils::to_iso8601(result.time)
              << "  bias " << std::setprecision(3) << result.portfolio.allocation_bias
              << "  cash " << std::setprecision(2) << result.portfolio.cash_balance
              << "  shares " << std::setprecision(0) << result.portfolio.shares_held << "\n";
    for (const auto& d : result.batch.decisions) {
        std::cout << "  slot " << d.slot_id << ": " << std::setw(5) << action_to_string(d.action)
                  << "  " << d.reason << "\n";
    }
    for (const auto& r : result.reports) {
        std::cout << "  ! " << condition_to_string(r.type) << " slot " << r.slot_id << ": " << r.reason << "\n";
    }
    if (!result.error.empty()) {
        std::cout << "  error: " << result.error << "\n";
    }
    std::cout << std::setprecision(2);
}

void print_slots(WheelRunner& runner) {
    auto positions = runner.book().positions();
    for (const auto& slot : runner.schedule().window().slots) {
        std::cout << "  slot " << slot.slot_id << "  " << time_utils::format_date(slot.target_expiration)
                  << "  " << slot_state_to_string(runner.schedule().slot_state(slot.slot_id, positions)) << "\n";
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"WheelRoll - weekly wheel options rolling decision engine"};

    std::string config_path = "configs/wheel.json";
    bool dry_run = false;
    bool paper_mode = false;
    bool live_mode = false;
    bool once = false;
    bool market_hours_only = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_flag("--dry-run", dry_run, "Dry-run mode: compute decisions without placing orders");
    app.add_flag("--paper", paper_mode, "Paper mode: orders go to the simulated broker");
    app.add_flag("--live", live_mode, "Live mode (requires a live broker adapter)");
    app.add_flag("--once", once, "Run a single evaluation cycle and exit");
    app.add_flag("--market-hours-only", market_hours_only, "Skip order dispatch outside regular market hours");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "WheelRoll v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else {
            std::cerr << "Config " << config_path << " not found, using defaults.\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (dry_run) {
        config.mode = TradingMode::DRY_RUN;
    } else if (paper_mode) {
        config.mode = TradingMode::PAPER;
    } else if (live_mode) {
        config.mode = TradingMode::LIVE;
    }
    if (market_hours_only) {
        config.loop.market_hours_only = true;
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration in {}", config_path);
        return 1;
    }

    if (config.mode == TradingMode::LIVE) {
        spdlog::error("LIVE mode requested but this build has no live broker adapter; use --paper or --dry-run");
        return 1;
    }

    print_startup_banner(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Initializing WheelRoll...");

    auto paper_config = PaperBroker::config_from(config);
    // The loop consumes fills as they arrive; --once leaves orders working
    paper_config.async_fills = !once || config.broker.paper_async_fills;
    auto broker = std::make_shared<PaperBroker>(paper_config);

    auto ledger = std::make_shared<DecisionLedger>(config.decision_ledger_path);
    WheelRunner runner(config, broker, ledger);

    if (!runner.initialize(wall_now())) {
        spdlog::error("Startup reconciliation failed; not evaluating");
        broker->shutdown();
        return 1;
    }

    spdlog::info("WheelRoll started. Mode: {}", mode_to_string(config.mode));

    if (once) {
        CycleResult result = runner.run_cycle();
        print_cycle(result);
        print_slots(runner);
        broker->shutdown();
        ledger->flush();
        return result.error.empty() ? 0 : 2;
    }

    runner.start();
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down...");
    runner.stop();
    // No fill may reach the runner's queue once it starts tearing down
    broker->shutdown();
    broker->disconnect();
    ledger->flush();

    print_cycle(runner.last_result());
    print_slots(runner);

    auto working = runner.lifecycle().get_open_orders();
    if (!working.empty()) {
        spdlog::warn("{} orders still working at the broker", working.size());
    }
    spdlog::info("Orders submitted: {}, filled: {}, rejected: {}, rolls completed: {}, partial roll failures: {}",
                 runner.lifecycle().orders_submitted(), runner.lifecycle().orders_filled(),
                 runner.lifecycle().orders_rejected(),
                 runner.lifecycle().rolls_completed(), runner.lifecycle().partial_roll_failures());
    spdlog::info("Premium collected ${:.2f}, buybacks ${:.2f}, realized PnL ${:.2f}, unrealized ${:.2f}",
                 runner.book().premium_collected(), runner.book().buyback_cost(),
                 runner.book().realized_pnl(), runner.book().unrealized_pnl());

    spdlog::info("Counters: {}", MetricsRegistry::instance().summary());
    std::cout << "\nMetrics:\n" << MetricsRegistry::instance().to_json().dump(2) << "\n";

    spdlog::info("WheelRoll shutdown complete.");
    return 0;
}
