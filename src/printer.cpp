#include "clink/printer.hpp"

#include <exception>
#include <variant>

#include "clink/log.hpp"
#include "clink/writer.hpp"

namespace clink {

namespace {

constexpr const char* kUsageNotFound = "Error: Usage information not found for the given command.\n";

std::string withNewline(std::string s) {
    if (s.empty() || s.back() != '\n') s.push_back('\n');
    return s;
}

} // namespace

Status Printer::formatError(const Error& error, const std::optional<std::string>& usage) {
    std::vector<Content> content;
    content.emplace_back(Text{"Error: " + error.message});
    // Details of other kinds repeat what the message already names.
    const bool suggestions = error.kind == ErrorKind::UnknownCommand || error.kind == ErrorKind::Validation;
    if (suggestions && !error.details.empty()) {
        std::string text = "Did you mean this?\n";
        for (const auto& d : error.details) text += "  " + d + "\n";
        content.emplace_back(Text{std::move(text)});
    }
    if (error.kind == ErrorKind::UnknownCommand && usage) content.emplace_back(Text{withNewline(*usage)});
    Status s;
    s.alert(std::move(content));
    return s;
}

int Printer::print(const Result& result, const std::vector<std::string>& path, const std::string& format) {
    if (const auto* error = std::get_if<Error>(&result)) {
        log::logger()->debug("{} error: {}", errorKindName(error->kind), error->message);
        std::optional<std::string> usage;
        if (error->kind == ErrorKind::UnknownCommand) usage = registry_.findUsage(path);
        // Errors are always legible, whatever format was asked for.
        return render(formatError(*error, usage), "human", 1);
    }
    if (const auto* tagged = std::get_if<TaggedStatus>(&result)) {
        return render(tagged->status, tagged->format.empty() ? format : tagged->format, tagged->exitCode);
    }
    return render(std::get<Status>(result), format, 0);
}

int Printer::print(Usage, const std::vector<std::string>& path, const std::string&) {
    return printUsage(path);
}

int Printer::printUsage(const std::vector<std::string>& path) {
    if (const auto usage = registry_.findUsage(path)) {
        *out_ << withNewline(*usage);
    } else {
        *out_ << kUsageNotFound;
    }
    out_->flush();
    return 0;
}

int Printer::render(const Status& status, const std::string& format, int exitCode) {
    const auto writer = registry_.findWriter(format);
    if (!writer) {
        log::logger()->warn("no writer registered for format '{}'", format);
        Status alert;
        alert.alert({Text{"Invalid output format: " + format}});
        deliver(humanWriter(alert));
        return 1;
    }

    Output output;
    try {
        output = (*writer)(status);
    } catch (const std::exception& e) {
        log::logger()->warn("writer '{}' failed: {}", format, e.what());
        deliver(humanWriter(formatError(Error::rendering("Failed to render output as " + format + ": " + e.what()))));
        return 1;
    } catch (...) {
        log::logger()->warn("writer '{}' threw a non-standard exception", format);
        deliver(humanWriter(formatError(Error::rendering("Failed to render output as " + format))));
        return 1;
    }
    deliver(output);
    return exitCode;
}

void Printer::deliver(const Output& output) {
    if (!output.out.empty()) {
        *out_ << output.out;
        out_->flush();
    }
    if (!output.err.empty()) writeErr(output.err);
}

void Printer::writeErr(const std::string& text) {
    const auto local = transport_.localNode();
    const auto caller = CallContext::callingNode().value_or(local);

    auto stream = transport_.whereisStandardError(caller);
    if (!stream && caller != local) {
        log::logger()->warn("standard error of {} is unreachable, writing on {}", caller, local);
        stream = transport_.whereisStandardError(local);
    }
    if (!stream) {
        log::logger()->error("no standard error stream on {}: {}", caller, text);
        return;
    }
    if (!transport_.write(*stream, text)) log::logger()->error("write to standard error of {} failed", stream->node);
}

} // namespace clink
