/**
 * Sniper Bot
 *
 * Polls the Gamma markets endpoint for the configured markets and runs every
 * tick through valuation, detection, the risk gate and the execution
 * scheduler. In dry_run mode fills are simulated against the latest quote;
 * in live mode transactions go through the configured signing service.
 *
 * Usage: sniper_bot <config.toml>
 */

#include <sniper/sniper.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace sniper;

// ============================================
// Signal handling
// ============================================

std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested.store(true);
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <config.toml>" << std::endl;
        return 2;
    }

    Config config;
    try {
        config = Config::from_file(argv[1]);
        config.validate();
        log::init(config.general.log_level);
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }

    auto logger = log::get("bot");
    logger->info("Sniper bot starting: {} market(s), mode {}, identity {}",
                 config.feed.markets.size(), to_string(config.general.mode),
                 config.general.identity);

    SystemClock clock;

    std::unique_ptr<Signer> signer;
    if (config.general.mode == ExecutionMode::Live) {
        signer = std::make_unique<RpcSigner>(config.signer);
    }

    std::unique_ptr<FeeOracle> fee_oracle;
    if (!config.signer.node_url.empty()) {
        fee_oracle = std::make_unique<RpcFeeOracle>(config.signer.node_url);
    } else {
        fee_oracle = std::make_unique<StaticFeeOracle>(config.execution.default_base_fee_gwei);
    }

    try {
        GammaPollingFeed feed(config.feed, clock);
        Pipeline pipeline(config, clock, signer.get(), fee_oracle.get());

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::thread watcher([&pipeline] {
            while (!g_stop_requested.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            pipeline.stop();
        });

        try {
            pipeline.run(feed);
        } catch (const std::exception&) {
            g_stop_requested.store(true);
            watcher.join();
            throw;
        }

        g_stop_requested.store(true);
        watcher.join();

        log_report(pipeline.report(), *logger);
    } catch (const Error& e) {
        logger->critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
