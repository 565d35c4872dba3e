#ifndef CLINK_FLAG_HPP
#define CLINK_FLAG_HPP

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace clink {

using FlagValue = std::variant<bool, std::int64_t, std::string>;

enum class Kind {
    String,
    Integer,
    Boolean,
};

std::string_view kindName(Kind kind);

// Coerces one raw token into `kind`. Throws std::invalid_argument when the token does not fit.
FlagValue parseValue(Kind kind, const std::string& raw);

std::string toString(const FlagValue& value);

// A positional argument a command accepts, either in declaration order or as `name=value`.
class Key {
public:
    explicit Key(std::string name, Kind kind = Kind::String, std::string description = {})
        : name_(std::move(name)),
          description_(std::move(description)),
          kind_(kind) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool required() const { return required_; }

    Key& setRequired(bool v) {
        required_ = v;
        return *this;
    }

    [[nodiscard]] bool matches(std::string_view name) const { return name == name_; }

private:
    std::string name_;
    std::string description_;
    Kind kind_;
    bool required_{true};
};

class Flag {
public:
    explicit Flag(std::string longName, std::string shortName, std::string description, Kind kind = Kind::Boolean)
        : longName_(std::move(longName)),
          shortName_(std::move(shortName)),
          description_(std::move(description)),
          kind_(kind) {}

    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] const std::string& shortName() const { return shortName_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool required() const { return required_; }

    Flag& setRequired(bool v) {
        required_ = v;
        return *this;
    }

    [[nodiscard]] bool matches(std::string_view name) const {
        return name == longName_ || (!shortName_.empty() && name == shortName_);
    }

private:
    std::string longName_;   // --node
    std::string shortName_;  // -n
    std::string description_;
    Kind kind_;
    bool required_{false};
};

// Declared keys or flags of a command. `any()` accepts everything and leaves checking to the handler.
template <typename T>
class Spec {
public:
    Spec() = default;
    Spec(std::initializer_list<T> entries) : entries_(entries) {}

    static Spec any() {
        Spec s;
        s.wildcard_ = true;
        return s;
    }

    Spec& add(T entry) {
        entries_.push_back(std::move(entry));
        return *this;
    }

    [[nodiscard]] bool wildcard() const { return wildcard_; }
    [[nodiscard]] const std::vector<T>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] const T* find(std::string_view name) const {
        for (const auto& e : entries_) {
            if (e.matches(name)) return &e;
        }
        return nullptr;
    }

private:
    std::vector<T> entries_;
    bool wildcard_{false};
};

using KeySpec = Spec<Key>;
using FlagSpec = Spec<Flag>;

} // namespace clink

#endif // CLINK_FLAG_HPP
