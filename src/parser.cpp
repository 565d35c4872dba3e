#include "clink/parser.hpp"

#include <stdexcept>

#include "clink/log.hpp"
#include "clink/utils.hpp"

namespace clink {

namespace {

std::string invalidValue(const std::string& raw, const std::string& what, Kind kind) {
    return "invalid value \"" + raw + "\" for " + what + ": expected " + std::string(kindName(kind));
}

} // namespace

const std::vector<Flag>& globalFlagSpec() {
    static const std::vector<Flag> flags{
        Flag("--all", "-a", "Run the command on every cluster node"),
        Flag("--node", "-n", "Run the command on the given node", Kind::String),
        Flag("--format", "", "Output format (human, json, csv)", Kind::String),
        Flag("--help", "-h", "Show usage for the command"),
    };
    return flags;
}

const Flag* Parser::findFlag(const std::string& token) const {
    if (const auto* f = flags_.find(token)) return f;
    for (const auto& g : globalFlagSpec()) {
        if (g.matches(token)) return &g;
    }
    return nullptr;
}

void Parser::fail(std::string message) {
    if (error_) return;
    log::logger()->debug("argument validation failed: {}", message);
    error_ = Error::validation(std::move(message));
}

void Parser::failUnknownFlag(const std::string& token) {
    if (error_) return;
    std::vector<std::string> suggestions;
    if (options_.suggestFlags) {
        std::vector<std::string> known;
        for (const auto& f : flags_.entries()) {
            known.push_back(f.longName());
            if (!f.shortName().empty()) known.push_back(f.shortName());
        }
        for (const auto& g : globalFlagSpec()) known.push_back(g.longName());
        suggestions = utils::suggest(token, known, /*maxResults=*/3, options_.suggestionsMinimumDistance);
    }
    log::logger()->debug("unknown flag {}", token);
    error_ = Error::validation("unknown flag: " + token, std::move(suggestions));
}

Parser& Parser::parse(const std::vector<std::string>& args) {
    positionals_.clear();
    rawFlags_.clear();
    globals_ = GlobalFlags{};
    error_.reset();
    parsed_ = true;
    globalsExtracted_ = false;

    bool positionalOnly = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (!positionalOnly && arg == "--") {
            positionalOnly = true;
            continue;
        }
        if (positionalOnly || !utils::isFlagToken(arg)) {
            positionals_.push_back(arg);
            continue;
        }

        RawFlag raw;
        raw.token = arg;
        const auto eq = arg.find('=');
        if (eq != std::string::npos) {
            raw.token = arg.substr(0, eq);
            raw.value = arg.substr(eq + 1);
        }

        const Flag* flag = findFlag(raw.token);
        if (flag == nullptr && !flags_.wildcard()) {
            failUnknownFlag(raw.token);
            return *this;
        }
        raw.name = flag ? flag->longName() : raw.token;

        if (!raw.value) {
            if (flag != nullptr && flag->kind() != Kind::Boolean) {
                if (i + 1 >= args.size()) {
                    fail("flag needs an argument: " + raw.token);
                    return *this;
                }
                raw.value = args[++i];
            } else if (flag == nullptr && i + 1 < args.size() && !utils::isFlagToken(args[i + 1]) && args[i + 1] != "--") {
                // Undeclared flag under a wildcard spec: take the next token as its value.
                raw.value = args[++i];
            }
        }
        rawFlags_.push_back(std::move(raw));
    }
    return *this;
}

Parser& Parser::extractGlobalFlags() {
    if (!parsed_ || !ok() || globalsExtracted_) return *this;
    globalsExtracted_ = true;

    std::vector<RawFlag> kept;
    kept.reserve(rawFlags_.size());
    for (auto& raw : rawFlags_) {
        const Flag* global = nullptr;
        for (const auto& g : globalFlagSpec()) {
            if (g.longName() == raw.name) global = &g;
        }
        if (global == nullptr) {
            kept.push_back(std::move(raw));
            continue;
        }

        // A command declaring the same long name keeps its copy and owns its validation.
        const bool declared = flags_.find(raw.name) != nullptr;

        FlagValue value = true;
        if (global->kind() == Kind::Boolean) {
            if (raw.value) {
                try {
                    value = parseValue(Kind::Boolean, *raw.value);
                } catch (const std::invalid_argument&) {
                    if (!declared) {
                        fail(invalidValue(*raw.value, "flag " + global->longName(), Kind::Boolean));
                        return *this;
                    }
                    kept.push_back(std::move(raw));
                    continue;
                }
            }
        } else {
            if (!raw.value) {
                if (!declared) {
                    fail("flag needs an argument: " + raw.token);
                    return *this;
                }
                kept.push_back(std::move(raw));
                continue;
            }
            value = *raw.value;
        }

        if (global->longName() == "--all") {
            globals_.all = std::get<bool>(value);
        } else if (global->longName() == "--help") {
            globals_.help = std::get<bool>(value);
        } else if (global->longName() == "--node") {
            globals_.node = std::get<std::string>(value);
        } else if (global->longName() == "--format") {
            globals_.format = std::get<std::string>(value);
        }
        if (declared) kept.push_back(std::move(raw));
    }
    rawFlags_ = std::move(kept);
    return *this;
}

std::optional<std::string> Parser::bindKeys(ParsedArgs::ValueMap& keys, std::vector<std::string>& overflow) const {
    if (keys_.wildcard()) {
        for (const auto& p : positionals_) {
            const auto eq = p.find('=');
            if (options_.allowKeyAssignments && eq != std::string::npos && eq > 0) {
                keys[p.substr(0, eq)] = p.substr(eq + 1);
            } else {
                overflow.push_back(p);
            }
        }
        return std::nullopt;
    }

    auto bind = [&keys](const Key& key, const std::string& raw) -> std::optional<std::string> {
        try {
            keys[key.name()] = parseValue(key.kind(), raw);
        } catch (const std::invalid_argument&) {
            return invalidValue(raw, "key " + key.name(), key.kind());
        }
        return std::nullopt;
    };

    std::vector<std::string> unassigned;
    for (const auto& p : positionals_) {
        const auto eq = p.find('=');
        if (options_.allowKeyAssignments && eq != std::string::npos && eq > 0) {
            const auto name = p.substr(0, eq);
            if (const auto* key = keys_.find(name)) {
                if (keys.find(name) != keys.end()) return "duplicate key: " + name;
                if (auto err = bind(*key, p.substr(eq + 1))) return err;
                continue;
            }
        }
        unassigned.push_back(p);
    }

    const auto& declared = keys_.entries();
    std::size_t next = 0;
    std::vector<std::string> excess;
    for (const auto& p : unassigned) {
        while (next < declared.size() && keys.find(declared[next].name()) != keys.end()) ++next;
        if (next >= declared.size()) {
            excess.push_back(p);
            continue;
        }
        if (auto err = bind(declared[next], p)) return err;
        ++next;
    }
    if (!excess.empty()) return "too many arguments: " + utils::join(excess, " ");

    std::vector<std::string> missing;
    for (const auto& k : declared) {
        if (k.required() && keys.find(k.name()) == keys.end()) missing.push_back(k.name());
    }
    if (!missing.empty()) return "missing required key(s): " + utils::join(missing, ", ");
    return std::nullopt;
}

std::optional<std::string> Parser::bindFlags(ParsedArgs::ValueMap& flags) const {
    for (const auto& raw : rawFlags_) {
        const Flag* flag = flags_.find(raw.name);
        if (flag == nullptr) {
            // Only reachable under a wildcard flag spec; values stay untyped.
            flags[raw.name] = raw.value ? FlagValue(*raw.value) : FlagValue(true);
            continue;
        }
        if (flag->kind() == Kind::Boolean && !raw.value) {
            flags[flag->longName()] = true;
            continue;
        }
        if (!raw.value) return "flag needs an argument: " + raw.token;
        try {
            flags[flag->longName()] = parseValue(flag->kind(), *raw.value);
        } catch (const std::invalid_argument&) {
            return invalidValue(*raw.value, "flag " + flag->longName(), flag->kind());
        }
    }
    return std::nullopt;
}

std::optional<std::string> Parser::checkRequiredFlags(const ParsedArgs::ValueMap& flags) const {
    std::vector<std::string> missing;
    for (const auto& f : flags_.entries()) {
        if (f.required() && flags.find(f.longName()) == flags.end()) missing.push_back(f.longName());
    }
    if (missing.empty()) return std::nullopt;
    return "required flag(s) " + utils::join(missing, ", ") + " not set";
}

std::optional<ParsedArgs> Parser::validate() {
    if (!parsed_) {
        fail("validate() called before parse()");
        return std::nullopt;
    }
    extractGlobalFlags();
    if (!ok()) return std::nullopt;

    ParsedArgs::ValueMap keys;
    std::vector<std::string> overflow;
    if (auto err = bindKeys(keys, overflow)) {
        fail(std::move(*err));
        return std::nullopt;
    }

    ParsedArgs::ValueMap flags;
    if (auto err = bindFlags(flags)) {
        fail(std::move(*err));
        return std::nullopt;
    }
    if (auto err = checkRequiredFlags(flags)) {
        fail(std::move(*err));
        return std::nullopt;
    }
    return ParsedArgs(std::move(keys), std::move(flags), std::move(overflow), globals_);
}

std::variant<ParsedArgs, Error> Parser::run(const std::vector<std::string>& args) {
    parse(args).extractGlobalFlags();
    auto parsed = validate();
    if (!parsed) return *error_;
    return std::move(*parsed);
}

} // namespace clink
