/**
 * lanlink — Entry Point
 *
 * Loads config, starts the node (session listener, heartbeats, LAN
 * discovery) on an io_context thread and runs the console on the main
 * thread until /quit or end of input.
 */

#include <iostream>
#include <string>
#include <thread>

#include <asio.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cli/console.h"
#include "config/node_config.h"
#include "crypto/id_generator.h"
#include "node/node.h"

int main(int argc, char* argv[]) {
    // Console output owns stdout; logs go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("lanlink"));
    spdlog::set_level(spdlog::level::info);

    const std::string config_path = (argc > 1) ? argv[1] : "config.json";
    NodeConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Loaded config from {}", config_path);

    if (!IdGenerator::init()) {
        spdlog::error("libsodium failed to initialise");
        return 1;
    }

    asio::io_context io;
    auto work = asio::make_work_guard(io);

    Node node(io, config);
    try {
        node.start();
    } catch (const std::exception& e) {
        spdlog::error("Cannot start node: {}", e.what());
        return 1;
    }
    spdlog::info("{} ready on port {}", config.username, node.listen_port());

    Console console(io, node, std::cout);
    std::thread loop([&io] { io.run(); });

    console.run(std::cin);

    asio::post(io, [&node] { node.stop(); });
    work.reset();
    loop.join();
    return 0;
}
