#include "clink/flag.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>

#include "clink/utils.hpp"

namespace {

static bool tryParseBool(std::string_view s, bool& out) {
    const auto t = clink::utils::trimWs(s);
    if (t.empty()) return false;
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

// Base 10 only, so "010" stays ten. No sign other than '-' and no surrounding blanks.
static bool tryParseInteger(std::string_view s, std::int64_t& out) {
    if (s.empty()) return false;
    if (s.front() != '-' && !std::isdigit(static_cast<unsigned char>(s.front()))) return false;
    if (!std::isdigit(static_cast<unsigned char>(s.back()))) return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

} // namespace

namespace clink {

std::string_view kindName(Kind kind) {
    switch (kind) {
        case Kind::String: return "string";
        case Kind::Integer: return "integer";
        case Kind::Boolean: return "boolean";
    }
    return "string";
}

FlagValue parseValue(Kind kind, const std::string& raw) {
    switch (kind) {
        case Kind::Boolean: {
            bool out = false;
            if (!tryParseBool(raw, out)) throw std::invalid_argument("invalid boolean");
            return out;
        }
        case Kind::Integer: {
            std::int64_t out = 0;
            if (!tryParseInteger(raw, out)) throw std::invalid_argument("invalid integer");
            return out;
        }
        case Kind::String: return raw;
    }
    return raw;
}

std::string toString(const FlagValue& value) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(x);
            } else {
                return x;
            }
        },
        value);
}

} // namespace clink
