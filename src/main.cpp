#include "CLI.hpp"
#include "Dispatcher.hpp"
#include "Logger.hpp"
#include "Options.hpp"
#include "Persistence.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    Config config;

    if (!applyEnvironment(config)) {
        return 1;
    }
    if (!parseArgs(argc, argv, config)) {
        return 1;
    }

    std::cout << "========================================\n"
              << "        Elevator Dispatch Service       \n"
              << "========================================\n"
              << "Configuration:\n"
              << "  Floors:     " << config.numFloors << "\n"
              << "  Elevators:  " << config.numElevators << "\n"
              << "  Transit:    " << config.floorTransitMs << " ms/floor\n"
              << "  Door:       " << config.doorMs << " ms/phase\n"
              << "  Key TTL:    " << config.idempotencyTtlMs / 1000 << " s\n"
              << "========================================\n";

    try {
        Logger logger(std::cerr, config.verbose);
        InMemoryGateway gateway;
        SleepingMotionControl motion(config.floorTransitMs, config.doorMs);

        Dispatcher dispatcher(config, createFleet(config, motion, gateway, logger),
                              gateway, logger);
        CLI cli(dispatcher, gateway);

        cli.run();
        dispatcher.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Dispatcher ended.\n";
    return 0;
}
