#ifndef CLINK_PRINTER_HPP
#define CLINK_PRINTER_HPP

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "error.hpp"
#include "registry.hpp"
#include "status.hpp"
#include "transport.hpp"

namespace clink {

// Renders a Result and delivers it: stdout text to the local stream, stderr text to the
// error stream of the node that issued the command.
class Printer {
public:
    Printer(const Registry& registry, Transport& transport, std::ostream& out = std::cout)
        : registry_(registry),
          transport_(transport),
          out_(&out) {}

    // Returns the exit code.
    int print(const Result& result, const std::vector<std::string>& path, const std::string& format = "human");
    int print(Usage, const std::vector<std::string>& path, const std::string& format = "human");
    int printUsage(const std::vector<std::string>& path);

    // The alert an error renders as. Unknown commands carry `usage` when there is one.
    static Status formatError(const Error& error, const std::optional<std::string>& usage = std::nullopt);

private:
    int render(const Status& status, const std::string& format, int exitCode);
    void deliver(const Output& output);
    void writeErr(const std::string& text);

    const Registry& registry_;
    Transport& transport_;
    std::ostream* out_;
};

} // namespace clink

#endif // CLINK_PRINTER_HPP
