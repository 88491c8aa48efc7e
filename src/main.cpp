#include "async_flag_poller.hpp"
#include "config.hpp"
#include "definitions_fetcher.hpp"
#include "flag_cache.hpp"
#include "flag_poller.hpp"
#include "local_evaluator.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>

namespace {

nlohmann::json to_json(const flageval::outcome<flageval::flag_value>& r) {
    if (auto* inc = std::get_if<flageval::inconclusive>(&r)) {
        return {{"inconclusive", inc->reason}};
    }
    return std::get<flageval::flag_value>(r).to_json();
}

nlohmann::json evaluate(const flageval::local_evaluator& evaluator,
                        const std::string& flag_key,
                        bool all,
                        const std::string& distinct_id,
                        const flageval::attribute_map& attributes) {
    nlohmann::json out = nlohmann::json::object();

    if (all) {
        for (const auto& [key, r] : evaluator.evaluate_all(distinct_id, attributes)) {
            out[key] = to_json(r);
        }
        return out;
    }

    auto r = evaluator.evaluate_one(flag_key, distinct_id, attributes);
    if (auto* inc = std::get_if<flageval::inconclusive>(&r)) {
        out[flag_key] = {{"inconclusive", inc->reason}};
    } else if (const auto& v = std::get<std::optional<flageval::flag_value>>(r)) {
        out[flag_key] = v->to_json();
        if (auto p = evaluator.payload(flag_key, *v)) out["payload"] = *p;
    } else {
        out[flag_key] = nullptr;
    }
    return out;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("flageval",
        "Evaluate feature flags locally from cached definitions");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("k,flag", "Flag key to evaluate", cxxopts::value<std::string>())
        ("d,distinct-id", "Subject distinct id", cxxopts::value<std::string>())
        ("p,properties", "Subject attributes as a JSON object", cxxopts::value<std::string>()->default_value("{}"))
        ("a,all", "Evaluate every cached flag")
        ("f,definitions", "Definitions JSON file (overrides config)", cxxopts::value<std::string>())
        ("H,host", "API host (overrides config)", cxxopts::value<std::string>())
        ("w,watch", "Keep polling and re-evaluate on every interval")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config") || !result.count("distinct-id") ||
        (!result.count("flag") && !result.count("all"))) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stderr_color_mt("flageval");

    // Load config
    flageval::local_evaluation_config cfg;
    try {
        cfg = flageval::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("definitions")) cfg.definitions_file = result["definitions"].as<std::string>();
    if (result.count("host"))        cfg.api_host = result["host"].as<std::string>();
    if (result.count("verbose"))     cfg.log_level = "debug";

    // Set log level
    if (cfg.log_level == "trace")      spdlog::set_level(spdlog::level::trace);
    else if (cfg.log_level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    flageval::attribute_map attributes;
    try {
        auto props = nlohmann::json::parse(result["properties"].as<std::string>());
        if (!props.is_object()) throw std::runtime_error("properties must be a JSON object");
        for (const auto& [k, v] : props.items()) attributes[k] = v;
    } catch (const std::exception& e) {
        console->error("Invalid --properties: {}", e.what());
        return 1;
    }

    std::string flag_key = result.count("flag") ? result["flag"].as<std::string>() : "";
    std::string distinct_id = result["distinct-id"].as<std::string>();
    bool all = result.count("all") > 0;

    flageval::definitions_fetcher_sptr fetcher;
    if (!cfg.definitions_file.empty()) {
        fetcher = std::make_shared<flageval::file_definitions_fetcher>(cfg.definitions_file);
    } else {
        fetcher = std::make_shared<flageval::http_definitions_fetcher>(
            cfg.api_host, cfg.project_api_key, cfg.personal_api_key);
    }

    console->info("flageval starting");
    console->info("  source: {}", fetcher->describe());
    console->info("  poll interval: {}ms, request timeout: {}ms",
                 cfg.poll_interval.count(), cfg.request_timeout.count());

    flageval::flag_cache cache(console);
    flageval::local_evaluator evaluator(cache, console);

    if (!result.count("watch")) {
        // One-shot: a single synchronous load, no background polling
        flageval::flag_poller poller(cache, fetcher, cfg.poll_interval, cfg.request_timeout, console);
        if (!poller.load_flags()) return 2;

        std::cout << evaluate(evaluator, flag_key, all, distinct_id, attributes).dump(2) << std::endl;
        return 0;
    }

    // Watch mode: single-threaded io_context running the poller and the report loop
    asio::io_context ioc(1);
    flageval::async_flag_poller poller(ioc, cache, fetcher, cfg.poll_interval,
                                       cfg.request_timeout, console);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        asio::co_spawn(ioc,
            [&]() -> asio::awaitable<void> {
                co_await poller.stop();
                ioc.stop();
            },
            asio::detached);
    });

    asio::co_spawn(ioc,
        [&]() -> asio::awaitable<void> {
            co_await poller.start();

            asio::steady_timer timer(co_await asio::this_coro::executor);
            while (poller.is_running()) {
                std::cout << evaluate(evaluator, flag_key, all, distinct_id, attributes).dump()
                          << std::endl;
                timer.expires_after(cfg.poll_interval);
                co_await timer.async_wait(asio::use_awaitable);
            }
        },
        asio::detached);

    ioc.run();

    console->info("flageval stopped");
    return 0;
}
