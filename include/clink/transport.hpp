#ifndef CLINK_TRANSPORT_HPP
#define CLINK_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace clink {

// Identifies the node a command was issued from, for the current thread.
// A transport serving a request from another node opens a Scope naming that node;
// without one the local node is the caller.
class CallContext {
public:
    class Scope {
    public:
        explicit Scope(std::string callingNode);
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        std::optional<std::string> previous_;
    };

    static std::optional<std::string> callingNode();
};

// Handle to a node's standard error stream, as returned by whereisStandardError().
struct ErrorStream {
    std::string node;
    std::uint64_t id{0};
};

using RemoteResult = std::variant<std::vector<std::string>, Error>;
using RemoteFunction = std::function<RemoteResult(const std::vector<std::string>& args)>;

class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::string localNode() const = 0;

    // Step one of stderr forwarding: locate `node`'s error stream. Empty if the node cannot be reached.
    virtual std::optional<ErrorStream> whereisStandardError(const std::string& node) = 0;
    // Step two: write to a stream located by step one.
    virtual bool write(const ErrorStream& stream, std::string_view text) = 0;

    // Blocking call of a named function on `node`. Timeouts are the transport's business.
    virtual RemoteResult call(const std::string& node, const std::string& function, const std::vector<std::string>& args) = 0;
};

// Single-process transport: the only reachable node is itself.
class LocalTransport : public Transport {
public:
    explicit LocalTransport(std::string nodeName = "local", std::ostream& err = std::cerr)
        : node_(std::move(nodeName)),
          err_(&err) {}

    [[nodiscard]] std::string localNode() const override { return node_; }

    std::optional<ErrorStream> whereisStandardError(const std::string& node) override;
    bool write(const ErrorStream& stream, std::string_view text) override;
    RemoteResult call(const std::string& node, const std::string& function, const std::vector<std::string>& args) override;

    // Makes `function` callable through call().
    void expose(std::string function, RemoteFunction fn);

private:
    std::string node_;
    std::ostream* err_;
    std::mutex mutex_;
    std::unordered_map<std::string, RemoteFunction> functions_;
};

} // namespace clink

#endif // CLINK_TRANSPORT_HPP
