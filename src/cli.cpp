#include "clink/cli.hpp"

#include <cstdlib>
#include <variant>

#include "clink/dispatch.hpp"
#include "clink/log.hpp"
#include "clink/matcher.hpp"
#include "clink/utils.hpp"

namespace clink {

namespace {

const Flag* lookupFlag(const std::string& name, const FlagSpec* declared) {
    if (declared != nullptr) {
        if (const auto* f = declared->find(name)) return f;
    }
    for (const auto& g : globalFlagSpec()) {
        if (g.matches(name)) return &g;
    }
    return nullptr;
}

// --help / -h before "--", unless the command declares that flag for itself.
// The token after a valued flag is that flag's value, never a help request.
bool helpRequested(const std::vector<std::string>& tokens, const FlagSpec* declared) {
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (t == "--") return false;
        if (!utils::isFlagToken(t)) continue;
        const auto eq = t.find('=');
        const auto name = t.substr(0, eq);
        const Flag* flag = lookupFlag(name, declared);
        if (flag == nullptr) continue;
        if (flag->longName() == "--help" && (declared == nullptr || declared->find(name) == nullptr)) return true;
        if (flag->kind() != Kind::Boolean && eq == std::string::npos) ++i;
    }
    return false;
}

} // namespace

std::string Cli::defaultFormat() const {
    if (const char* env = std::getenv("CLINK_FORMAT"); env != nullptr && *env != '\0') return env;
    return options_.defaultFormat;
}

int Cli::run(const std::vector<std::string>& argv) {
    const auto path = commandPath(argv);
    log::logger()->debug("run '{}'", utils::join(argv, " "));

    auto matched = match(registry_, argv);
    if (auto* err = std::get_if<Error>(&matched)) {
        if (helpRequested(argv, nullptr)) return printer_.printUsage(path);
        return printer_.print(*err, path);
    }
    const auto& m = std::get<Match>(matched);

    if (helpRequested(m.remaining, &m.entry.flags)) return printer_.printUsage(path);

    Parser parser(m.entry.keys, m.entry.flags, options_.parser);
    auto parsed = parser.run(m.remaining);
    if (auto* err = std::get_if<Error>(&parsed)) return printer_.print(*err, path);
    const auto& args = std::get<ParsedArgs>(parsed);

    // A TaggedStatus without a format renders in the requested one.
    return printer_.print(execute(m, args), path, args.globals().format.value_or(defaultFormat()));
}

int Cli::run(int argc, const char* const* argv) {
    std::vector<std::string> args;
    if (argc <= 0 || argv == nullptr) return run(args);
    args.reserve(static_cast<std::size_t>(argc));
    args.push_back(utils::baseName(argv[0]));
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args);
}

int Cli::print(const Result& result, const std::vector<std::string>& path, const std::string& format) {
    return printer_.print(result, path, format);
}

int Cli::print(Usage, const std::vector<std::string>& path) {
    return printer_.printUsage(path);
}

} // namespace clink
