#include "Options.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace {

bool parseInt(const std::string& text, int& value) {
    try {
        std::size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseSecondsAsMs(const std::string& text, int& ms) {
    try {
        std::size_t used = 0;
        double seconds = std::stod(text, &used);
        if (used != text.size() || seconds < 0 || seconds > 3600) {
            return false;
        }
        ms = static_cast<int>(std::lround(seconds * 1000.0));
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool inRange(int value, int low, int high) {
    return value >= low && value <= high;
}

} // namespace

bool applyEnvironment(Config& config, std::ostream& err, const EnvLookup& lookup) {
    auto get = [&lookup](const char* name) -> const char* {
        return lookup ? lookup(name) : std::getenv(name);
    };
    bool ok = true;

    if (const char* v = get("NUM_FLOORS")) {
        int floors;
        if (parseInt(v, floors) && inRange(floors, 2, 200)) {
            config.numFloors = floors;
        } else {
            err << "Error: NUM_FLOORS must be an integer 2-200, got '" << v << "'\n";
            ok = false;
        }
    }
    if (const char* v = get("NUM_ELEVATORS")) {
        int elevators;
        if (parseInt(v, elevators) && inRange(elevators, 1, 64)) {
            config.numElevators = elevators;
        } else {
            err << "Error: NUM_ELEVATORS must be an integer 1-64, got '" << v << "'\n";
            ok = false;
        }
    }
    if (const char* v = get("FLOOR_MOVE_TIME")) {
        if (!parseSecondsAsMs(v, config.floorTransitMs)) {
            err << "Error: FLOOR_MOVE_TIME must be seconds 0-3600, got '" << v << "'\n";
            ok = false;
        }
    }
    if (const char* v = get("DOOR_TIME")) {
        if (!parseSecondsAsMs(v, config.doorMs)) {
            err << "Error: DOOR_TIME must be seconds 0-3600, got '" << v << "'\n";
            ok = false;
        }
    }
    return ok;
}

void printUsage(const char* progName, std::ostream& out) {
    out << "Usage: " << progName << " [options]\n"
        << "\nOptions:\n"
        << "  -f, --floors <n>      Number of floors (2-200, default: 10)\n"
        << "  -e, --elevators <n>   Number of elevators (1-64, default: 5)\n"
        << "  -t, --transit <ms>    Time to travel one floor (0-60000, default: 5000)\n"
        << "  -d, --door <ms>       Time per door phase (0-60000, default: 2000)\n"
        << "      --ttl <s>         Idempotency key lifetime (1-86400, default: 600)\n"
        << "  -q, --quiet           Disable the activity log\n"
        << "  -h, --help            Show this help\n"
        << "\nEnvironment: NUM_FLOORS, NUM_ELEVATORS, FLOOR_MOVE_TIME, DOOR_TIME\n"
        << "\nExample:\n"
        << "  " << progName << " -f 12 -e 3 -t 500 -d 200\n";
}

bool parseArgs(int argc, const char* const argv[], Config& config,
               std::ostream& out, std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        int value = 0;

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0], out);
            return false;
        }
        else if (arg == "-q" || arg == "--quiet") {
            config.verbose = false;
        }
        else if ((arg == "-f" || arg == "--floors") && i + 1 < argc) {
            if (!parseInt(argv[++i], value) || !inRange(value, 2, 200)) {
                err << "Error: floors must be 2-200\n";
                return false;
            }
            config.numFloors = value;
        }
        else if ((arg == "-e" || arg == "--elevators") && i + 1 < argc) {
            if (!parseInt(argv[++i], value) || !inRange(value, 1, 64)) {
                err << "Error: elevators must be 1-64\n";
                return false;
            }
            config.numElevators = value;
        }
        else if ((arg == "-t" || arg == "--transit") && i + 1 < argc) {
            if (!parseInt(argv[++i], value) || !inRange(value, 0, 60000)) {
                err << "Error: transit must be 0-60000 ms\n";
                return false;
            }
            config.floorTransitMs = value;
        }
        else if ((arg == "-d" || arg == "--door") && i + 1 < argc) {
            if (!parseInt(argv[++i], value) || !inRange(value, 0, 60000)) {
                err << "Error: door must be 0-60000 ms\n";
                return false;
            }
            config.doorMs = value;
        }
        else if (arg == "--ttl" && i + 1 < argc) {
            if (!parseInt(argv[++i], value) || !inRange(value, 1, 86400)) {
                err << "Error: ttl must be 1-86400 s\n";
                return false;
            }
            config.idempotencyTtlMs = value * 1000;
        }
        else {
            err << "Unknown option: " << arg << "\n";
            printUsage(argv[0], err);
            return false;
        }
    }
    return true;
}
