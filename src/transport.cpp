#include "clink/transport.hpp"

#include "clink/log.hpp"

namespace clink {

namespace {

thread_local std::optional<std::string> tCallingNode;

} // namespace

CallContext::Scope::Scope(std::string callingNode) : previous_(tCallingNode) {
    tCallingNode = std::move(callingNode);
}

CallContext::Scope::~Scope() {
    tCallingNode = std::move(previous_);
}

std::optional<std::string> CallContext::callingNode() {
    return tCallingNode;
}

std::optional<ErrorStream> LocalTransport::whereisStandardError(const std::string& node) {
    if (node != node_) return std::nullopt;
    return ErrorStream{node_, 2};
}

bool LocalTransport::write(const ErrorStream& stream, std::string_view text) {
    if (stream.node != node_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    *err_ << text;
    err_->flush();
    return static_cast<bool>(*err_);
}

RemoteResult LocalTransport::call(const std::string& node, const std::string& function, const std::vector<std::string>& args) {
    if (node != node_) {
        log::logger()->warn("cannot reach node {} from {}", node, node_);
        return Error::handler("Node " + node + " is unreachable");
    }
    RemoteFunction fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = functions_.find(function);
        if (it != functions_.end()) fn = it->second;
    }
    if (!fn) return Error::handler("undefined remote function " + function + " on " + node);
    const auto caller = CallContext::callingNode().value_or(node_);
    CallContext::Scope scope(caller);
    return fn(args);
}

void LocalTransport::expose(std::string function, RemoteFunction fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    functions_[std::move(function)] = std::move(fn);
}

} // namespace clink
