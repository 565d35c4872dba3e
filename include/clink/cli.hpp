#ifndef CLINK_CLI_HPP
#define CLINK_CLI_HPP

#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "parser.hpp"
#include "printer.hpp"
#include "registry.hpp"
#include "status.hpp"
#include "transport.hpp"

namespace clink {

// Invocation entry point: match, parse, execute and print one command line.
class Cli {
public:
    struct Options {
        // Used when neither --format nor CLINK_FORMAT names one.
        std::string defaultFormat{"human"};
        Parser::Options parser{};
    };

    Cli(Registry& registry, Transport& transport, std::ostream& out = std::cout)
        : Cli(registry, transport, Options{}, out) {}
    Cli(Registry& registry, Transport& transport, Options options, std::ostream& out = std::cout)
        : registry_(registry),
          options_(std::move(options)),
          printer_(registry, transport, out) {}

    // `argv` as split by the shell, script name first. Returns the process exit status.
    int run(const std::vector<std::string>& argv);
    int run(int argc, const char* const* argv);

    int print(const Result& result, const std::vector<std::string>& path, const std::string& format = "human");
    int print(Usage, const std::vector<std::string>& path);
    int printUsage(const std::vector<std::string>& path) { return printer_.printUsage(path); }


private:
    [[nodiscard]] std::string defaultFormat() const;

    Registry& registry_;
    Options options_;
    Printer printer_;
};

} // namespace clink

#endif // CLINK_CLI_HPP
