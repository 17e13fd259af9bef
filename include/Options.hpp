#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "Types.hpp"
#include <functional>
#include <iostream>
#include <string>

// ============== Configuration Loading ==============
// Defaults, then environment, then command line.

using EnvLookup = std::function<const char*(const char*)>;

// NUM_FLOORS, NUM_ELEVATORS, FLOOR_MOVE_TIME (s), DOOR_TIME (s).
// Returns false and reports on err when a variable is malformed.
bool applyEnvironment(Config& config, std::ostream& err = std::cerr,
                      const EnvLookup& lookup = nullptr);

// Returns false when the program should exit (help or bad option)
bool parseArgs(int argc, const char* const argv[], Config& config,
               std::ostream& out = std::cout, std::ostream& err = std::cerr);

void printUsage(const char* progName, std::ostream& out = std::cout);

#endif // OPTIONS_HPP
