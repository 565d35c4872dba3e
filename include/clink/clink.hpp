#ifndef CLINK_CLINK_HPP
#define CLINK_CLINK_HPP

#include <optional>
#include <string>
#include <vector>

#include "cli.hpp"
#include "config.hpp"
#include "dispatch.hpp"
#include "error.hpp"
#include "flag.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "parser.hpp"
#include "pattern.hpp"
#include "printer.hpp"
#include "registry.hpp"
#include "status.hpp"
#include "transport.hpp"
#include "writer.hpp"

// Process-wide API: the functions below work on Registry::global() and the current transport.
namespace clink {

Registry& registry();

// Starts out as an in-process LocalTransport. `t` must outlive every later call.
Transport& transport();
void setTransport(Transport& t);

int run(const std::vector<std::string>& argv);
int run(int argc, const char* const* argv);
int print(const Result& result, const std::vector<std::string>& path, const std::string& format = "human");
int print(Usage, const std::vector<std::string>& path);

std::optional<Error> registerCommand(const std::vector<std::string>& pattern, KeySpec keys, FlagSpec flags, Handler handler);
std::optional<Error> unregisterCommand(const std::vector<std::string>& pattern);
void registerUsage(std::vector<std::string> path, UsageSource usage);
void unregisterUsage(const std::vector<std::string>& path);
void registerWriter(std::string format, Writer writer);
void unregisterWriter(const std::string& format);
void registerConfig(std::string key, ConfigCallback callback);
void unregisterConfig(const std::string& key);
void registerFormatter(std::string key, Formatter formatter);
void unregisterFormatter(const std::string& key);
std::optional<Error> registerConfigWhitelist(const std::vector<std::string>& keys, const std::string& app);
std::optional<Error> unregisterConfigWhitelist(const std::vector<std::string>& keys, const std::string& app);
void registerNodeFinder(NodeFinder finder);
void unregisterNodeFinder();

} // namespace clink

#endif // CLINK_CLINK_HPP
