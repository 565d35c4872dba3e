#ifndef CLINK_PARSER_HPP
#define CLINK_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"
#include "flag.hpp"

namespace clink {

// Flags every command accepts whether or not it declares them.
struct GlobalFlags {
    bool all{false};                   // --all, -a
    std::optional<std::string> node;   // --node, -n
    std::optional<std::string> format; // --format
    bool help{false};                  // --help, -h
};

const std::vector<Flag>& globalFlagSpec();

class ParsedArgs {
public:
    using ValueMap = std::unordered_map<std::string, FlagValue>;

    ParsedArgs() = default;
    ParsedArgs(ValueMap keys, ValueMap flags, std::vector<std::string> overflow, GlobalFlags globals)
        : keys_(std::move(keys)),
          flags_(std::move(flags)),
          overflow_(std::move(overflow)),
          globals_(std::move(globals)) {}

    [[nodiscard]] bool hasKey(const std::string& name) const { return keys_.find(name) != keys_.end(); }
    [[nodiscard]] bool hasFlag(const std::string& longName) const { return flags_.find(longName) != flags_.end(); }

    template <typename T>
    [[nodiscard]] T getKey(const std::string& name, T defaultValue = T()) const {
        return lookup<T>(keys_, name, std::move(defaultValue));
    }

    template <typename T>
    [[nodiscard]] T getFlag(const std::string& longName, T defaultValue = T()) const {
        return lookup<T>(flags_, longName, std::move(defaultValue));
    }

    [[nodiscard]] const ValueMap& keys() const { return keys_; }
    [[nodiscard]] const ValueMap& flags() const { return flags_; }
    // Positionals beyond the declared keys; only a wildcard key spec produces these.
    [[nodiscard]] const std::vector<std::string>& overflow() const { return overflow_; }
    [[nodiscard]] const GlobalFlags& globals() const { return globals_; }

private:
    template <typename T>
    static T lookup(const ValueMap& values, const std::string& name, T defaultValue) {
        static_assert(std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::string>,
                      "argument values are bool, std::int64_t or std::string");
        const auto it = values.find(name);
        if (it == values.end()) return defaultValue;
        if (const auto* v = std::get_if<T>(&it->second)) return *v;
        return defaultValue;
    }

    ValueMap keys_;
    ValueMap flags_;
    std::vector<std::string> overflow_;
    GlobalFlags globals_;
};

// Turns the argv remainder left by the matcher into ParsedArgs, in three steps:
// parse() splits tokens into positionals and raw flags, extractGlobalFlags() pulls out
// the global set, validate() binds keys and type-checks flags against the command's specs.
// Each step is a no-op once an earlier one failed.
class Parser {
public:
    struct Options {
        bool suggestFlags{true};
        std::size_t suggestionsMinimumDistance{2};
        // Accept `name=value` positionals for declared keys.
        bool allowKeyAssignments{true};
    };

    struct RawFlag {
        std::string token;                // as typed, without any "=value"
        std::string name;                 // canonical long name when known, else the token
        std::optional<std::string> value;
    };

    Parser(KeySpec keys, FlagSpec flags) : Parser(std::move(keys), std::move(flags), Options{}) {}
    Parser(KeySpec keys, FlagSpec flags, Options options)
        : keys_(std::move(keys)),
          flags_(std::move(flags)),
          options_(options) {}

    Parser& parse(const std::vector<std::string>& args);
    Parser& extractGlobalFlags();
    std::optional<ParsedArgs> validate();

    // All three steps.
    std::variant<ParsedArgs, Error> run(const std::vector<std::string>& args);

    [[nodiscard]] bool ok() const { return !error_.has_value(); }
    [[nodiscard]] const std::optional<Error>& error() const { return error_; }
    [[nodiscard]] const std::vector<std::string>& positionals() const { return positionals_; }
    [[nodiscard]] const std::vector<RawFlag>& rawFlags() const { return rawFlags_; }
    [[nodiscard]] const GlobalFlags& globals() const { return globals_; }

private:
    // Declared flags first, then the global set.
    const Flag* findFlag(const std::string& token) const;
    std::optional<std::string> bindKeys(ParsedArgs::ValueMap& keys, std::vector<std::string>& overflow) const;
    std::optional<std::string> bindFlags(ParsedArgs::ValueMap& flags) const;
    std::optional<std::string> checkRequiredFlags(const ParsedArgs::ValueMap& flags) const;
    void failUnknownFlag(const std::string& token);
    void fail(std::string message);

    KeySpec keys_;
    FlagSpec flags_;
    Options options_;
    std::vector<std::string> positionals_;
    std::vector<RawFlag> rawFlags_;
    GlobalFlags globals_;
    std::optional<Error> error_;
    bool parsed_{false};
    bool globalsExtracted_{false};
};

} // namespace clink

#endif // CLINK_PARSER_HPP
