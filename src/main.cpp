/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

using spdlog::info;
using spdlog::warn;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Everything a command needs, wired together from the configuration */
struct Runtime {
    explicit Runtime(const orbitcast::Config &config)
        : registry(orbitcast::ScenarioRegistry::withDefaults(std::chrono::system_clock::now(),
                                                             config.getElementSourceURL())),
          cache(config.getCacheTTL()),
          generator(config.getDeterministicGeneration()),
          catalog(registry, cache, generator,
                  [](const std::string &url) { return orbitcast::celestrak::fetchTLE(url); }),
          service(catalog, config) {}

    orbitcast::ScenarioRegistry registry;
    orbitcast::SatelliteCache cache;
    orbitcast::ConstellationGenerator generator;
    orbitcast::Catalog catalog;
    orbitcast::PositionService service;
};

/** Write a frame to stdout, returns false once stdout is closed */
bool printFrame(const orbitcast::Frame &frame) {
    std::cout << orbitcast::json::toJSON(frame) << std::endl;
    return static_cast<bool>(std::cout);
}

/** Pace frames onto stdout until the source ends, stdout closes or a signal arrives */
void runStream(orbitcast::FrameSource source, std::chrono::milliseconds delay,
               orbitcast::LiveStream *live = nullptr) {
    asio::io_context io;
    asio::signal_set signals{io, SIGINT, SIGTERM};
    orbitcast::FrameStreamer streamer(io, delay);

    std::optional<orbitcast::ControlReader> control;
    if (live != nullptr) {
        try {
            control.emplace(io, ::dup(STDIN_FILENO), [live](const std::string &line) {
                if (auto message = orbitcast::json::parseControlMessage(line)) {
                    live->applyControl(*message);
                }
            });
            control->start();
        } catch (const std::exception &e) {
            warn("Live control input disabled: {}", e.what());
            control.reset();
        }
    }

    signals.async_wait([&streamer](const asio::error_code &ec, int sig) {
        if (!ec) {
            info("Received signal {}.", sig);
            streamer.stop();
        }
    });

    streamer.start(std::move(source), printFrame, [&signals, &control] {
        signals.cancel();
        if (control) {
            control->stop();
        }
    });

    io.run();
}

/** Program entry point */
int main(int argc, char* argv[]) {

    // Logging goes to stderr so stdout only carries JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("orbitcast"));

    orbitcast::Config config;

    auto configFile = expandTilde("~/.orbitcast.toml");

    CLI::App app{"Orbitcast"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<int>("--cache-ttl",
        [&config](const int ttl) { config.setCacheTTL(std::chrono::seconds(ttl)); },
        "Seconds a downloaded or generated satellite set stays cached (default 3600)");
    app.add_option_function<std::string>("--source-url",
        [&config](const std::string &url) { config.setElementSourceURL(url); },
        "Celestrak GP endpoint used for downloaded scenarios");
    app.add_option_function<int>("--kepler-iterations",
        [&config](const int iterations) { config.setKeplerIterations(iterations); },
        "Fixed-point iterations of the Kepler solver (default 10)");
    app.add_option_function<double>("--kepler-tolerance",
        [&config](const double tolerance) { config.setKeplerTolerance(tolerance); },
        "Stop the Kepler solver once it moves less than this many radians (default 0, never)");
    app.add_flag_function("--deterministic",
        [&config](const int64_t v) { config.setDeterministicGeneration(v > 0); },
        "Seed generated constellations from the scenario id");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();

    // Informational commands
    auto infoCommand = app.add_subcommand("info", "Describe the service");
    auto healthCommand = app.add_subcommand("health", "Report service health");

    auto scenariosCommand = app.add_subcommand("scenarios", "List available scenarios");

    std::string scenarioID;
    auto scenarioCommand = app.add_subcommand("scenario", "Show one scenario, refreshing its satellite count");
    scenarioCommand->add_option("id", scenarioID, "Scenario id (ie. gps-constellation)")->required();

    auto satellitesCommand = app.add_subcommand("satellites", "List the satellites of a scenario");
    satellitesCommand->add_option("id", scenarioID, "Scenario id (ie. gps-constellation)")->required();

    // Positions command
    double timeOffset = 0.0;
    std::optional<int> chunkSize;
    int chunkIndex = 0;
    std::optional<int> limit;

    auto positionsCommand = app.add_subcommand("positions", "Positions of a scenario's satellites");
    positionsCommand->add_option("id", scenarioID, "Scenario id (ie. gps-constellation)")->required();
    positionsCommand->add_option("--offset", timeOffset, "Time offset in seconds from now (default 0)");
    positionsCommand->add_option("--chunk-size", chunkSize, "Satellites per chunk (default all)");
    positionsCommand->add_option("--chunk", chunkIndex, "Chunk index, counting from 0 (default 0)");
    positionsCommand->add_option("--limit", limit, "Only use the first N satellites (default all, 0 means all)");

    // Compare command
    std::string compareIDs;
    std::string metric = "count";

    auto compareCommand = app.add_subcommand("compare", "Compare scenarios");
    compareCommand->add_option("ids", compareIDs, "Comma separated scenario ids (ie. gps,gps-constellation)")->required();
    compareCommand->add_option("--metric", metric, "count, altitude, velocity or coverage (default count)");
    compareCommand->add_option("--offset", timeOffset, "Time offset in seconds from now (default 0)");
    compareCommand->add_option_function<int>("--sample-limit",
        [&config](const int sampleLimit) { config.setCompareSampleLimit(sampleLimit); },
        "Satellites sampled per scenario for statistics (default 100)");

    // Stream command
    double streamDuration = 3600.0;
    double streamStep = 60.0;

    auto streamCommand = app.add_subcommand("stream", "Stream positions over a time span");
    streamCommand->add_option("id", scenarioID, "Scenario id (ie. gps-constellation)")->required();
    streamCommand->add_option("--duration", streamDuration, "Simulated duration in seconds (default 3600)");
    streamCommand->add_option("--step", streamStep, "Simulated seconds between frames (default 60)");
    streamCommand->add_option_function<int>("--frame-delay",
        [&config](const int delay) { config.setFrameDelay(std::chrono::milliseconds(delay)); },
        "Real milliseconds between frames (default 100)");

    // Live command
    auto liveCommand = app.add_subcommand("live", "Stream live positions, controlled by JSON messages on stdin");
    liveCommand->add_option("id", scenarioID, "Scenario id (ie. gps-constellation)")->required();
    liveCommand->add_option_function<int>("--fps",
        [&config](const int fps) { config.setLiveFramesPerSecond(fps); },
        "Frames per second (default 1, max 30)");

    // Command callbacks

    infoCommand->final_callback([](void) {
        std::cout << orbitcast::json::serviceInfoJSON() << std::endl;
    });

    healthCommand->final_callback([](void) {
        std::cout << orbitcast::json::healthJSON(std::chrono::system_clock::now()) << std::endl;
    });

    scenariosCommand->final_callback([&config](void) {
        try {
            Runtime runtime(config);
            std::cout << orbitcast::json::toJSON(runtime.service.listScenarios()) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    scenarioCommand->final_callback([&config, &scenarioID](void) {
        try {
            Runtime runtime(config);
            auto scenario = runtime.service.getScenario(scenarioID);
            if (!scenario) {
                std::cout << orbitcast::json::errorJSON("Scenario not found") << std::endl;
                std::exit(1);
            }
            std::cout << orbitcast::json::toJSON(*scenario) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    satellitesCommand->final_callback([&config, &scenarioID](void) {
        try {
            Runtime runtime(config);
            std::cout << orbitcast::json::toJSON(runtime.service.satellites(scenarioID)) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    positionsCommand->final_callback([&config, &scenarioID, &timeOffset, &chunkSize, &chunkIndex, &limit](void) {
        try {
            Runtime runtime(config);
            auto batch = chunkSize
                ? runtime.service.positions(scenarioID, timeOffset, *chunkSize, chunkIndex, limit)
                : runtime.service.positions(scenarioID, timeOffset, limit);
            std::cout << orbitcast::json::toJSON(batch) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    compareCommand->final_callback([&config, &compareIDs, &metric, &timeOffset](void) {
        try {
            Runtime runtime(config);
            std::cout << orbitcast::json::toJSON(runtime.service.compare(compareIDs, metric, timeOffset)) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    streamCommand->final_callback([&config, &scenarioID, &streamDuration, &streamStep](void) {
        try {
            Runtime runtime(config);
            auto stream = runtime.service.stream(scenarioID, streamDuration, streamStep);
            runStream([&stream] { return stream.next(); }, config.getFrameDelay());
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    liveCommand->final_callback([&config, &scenarioID](void) {
        try {
            Runtime runtime(config);
            auto live = runtime.service.live(scenarioID);
            runStream([&live] { return std::optional<orbitcast::Frame>(live.next()); },
                      config.getLiveFrameInterval(), &live);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    // A closed stdout ends a stream instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
