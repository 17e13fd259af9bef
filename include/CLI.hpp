#ifndef CLI_HPP
#define CLI_HPP

#include "Dispatcher.hpp"
#include "Persistence.hpp"
#include <atomic>
#include <iostream>
#include <string>

// ============== CLI Helper ==============

class CLI {
private:
    Dispatcher& dispatcher_;
    const InMemoryGateway& gateway_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{true};

public:
    CLI(Dispatcher& dispatcher, const InMemoryGateway& gateway,
        std::istream& in = std::cin, std::ostream& out = std::cout);

    void run();
    void stop();

    // Returns false once the session should end
    bool processCommand(const std::string& line);

private:
    void printHelp();
    void printStatus();
    bool parseCall(const std::string& args);
    bool parseTask(const std::string& args);
    bool parseLogs(const std::string& args);
    bool parseMaintenance(const std::string& args);
};

#endif // CLI_HPP
