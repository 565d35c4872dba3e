#ifndef CLINK_STATUS_HPP
#define CLINK_STATUS_HPP

#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace clink {

struct Text {
    std::string text;
};

struct List {
    std::string title;
    std::vector<std::string> values;
};

// One table row: ordered (column, cell) pairs. The first row fixes the column order.
using Row = std::vector<std::pair<std::string, std::string>>;

struct Table {
    std::vector<Row> rows;
};

using Content = std::variant<Text, List, Table>;

// Content a writer must send to the error stream.
struct Alert {
    std::vector<Content> content;
};

using Element = std::variant<Text, List, Table, Alert>;

// Structured command output. What the elements mean is between the handler and the writer.
class Status {
public:
    Status() = default;
    Status(std::initializer_list<Element> elements) : elements_(elements) {}

    Status& text(std::string t) {
        elements_.emplace_back(Text{std::move(t)});
        return *this;
    }

    Status& list(std::string title, std::vector<std::string> values) {
        elements_.emplace_back(List{std::move(title), std::move(values)});
        return *this;
    }

    Status& table(std::vector<Row> rows) {
        elements_.emplace_back(Table{std::move(rows)});
        return *this;
    }

    Status& alert(std::vector<Content> content) {
        elements_.emplace_back(Alert{std::move(content)});
        return *this;
    }

    Status& append(const Status& other) {
        elements_.insert(elements_.end(), other.elements_.begin(), other.elements_.end());
        return *this;
    }

    [[nodiscard]] const std::vector<Element>& elements() const { return elements_; }
    [[nodiscard]] bool empty() const { return elements_.empty(); }

private:
    std::vector<Element> elements_;
};

// A status with an explicit exit code. An empty format means "whatever the caller asked for".
struct TaggedStatus {
    Status status;
    int exitCode{0};
    std::string format;
};

// Print request for the usage text of a command path.
struct Usage {};

using Result = std::variant<Status, TaggedStatus, Error>;

inline Result exitStatus(int exitCode, Status status, std::string format = {}) {
    return TaggedStatus{std::move(status), exitCode, std::move(format)};
}

} // namespace clink

#endif // CLINK_STATUS_HPP
