/**
 * Sniper Backtest
 *
 * Replays a recorded CSV of one market through the same pipeline in dry_run
 * mode. A manual clock follows the tick timestamps, so cooldowns, staleness
 * and confirmation timing behave as they would have at recording time.
 *
 * Usage: sniper_backtest <config.toml> <recording.csv> <market_id>
 */

#include <sniper/sniper.hpp>
#include <iostream>

using namespace sniper;

int main(int argc, char** argv) {
    if (argc != 4) {
        std::cerr << "usage: " << argv[0] << " <config.toml> <recording.csv> <market_id>"
                  << std::endl;
        return 2;
    }

    Config config;
    try {
        config = Config::from_file(argv[1]);
        config.set_mode(ExecutionMode::DryRun);
        config.feed.markets = {argv[3]};
        config.validate();
        log::init(config.general.log_level);
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }

    auto logger = log::get("backtest");

    try {
        CsvReplayFeed feed(argv[2], argv[3]);
        logger->info("Replaying {} rows for {}", feed.rows(), argv[3]);

        ManualClock clock;
        StaticFeeOracle fee_oracle(config.execution.default_base_fee_gwei);
        Pipeline pipeline(config, clock, nullptr, &fee_oracle, Pipeline::Options{true});

        while (auto tick = feed.next()) {
            auto ts = tick->fields.find("timestamp");
            if (ts != tick->fields.end() && ts->is_string()) {
                try {
                    clock.set(QuoteNormalizer::parse_timestamp(ts->get<std::string>()));
                } catch (const std::invalid_argument& e) {
                    logger->debug("Clock not advanced: {}", e.what());
                }
            }
            pipeline.process_tick(*tick);
        }
        pipeline.flush();

        log_report(pipeline.report(), *logger);
    } catch (const Error& e) {
        logger->critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
