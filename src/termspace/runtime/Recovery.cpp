#include <termspace/platform/Platform.hpp>
#include <termspace/runtime/Recovery.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <version>
#if defined(__cpp_lib_stacktrace)
#include <stacktrace>
#endif
#include <unistd.h>

namespace TS {

namespace {

auto formatTime(std::chrono::system_clock::time_point tp) -> std::string {
    auto const time = std::chrono::system_clock::to_time_t(tp);
    std::tm    tm{};
    ::localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

auto captureEnvironment() -> std::vector<std::pair<std::string, std::string>> {
    std::vector<std::pair<std::string, std::string>> env;
    env.emplace_back("pid", std::to_string(::getpid()));
    for (char const* name : {"TERM", "COLORTERM", "LANG", "TERMSPACE_LOG"}) {
        if (char const* value = std::getenv(name))
            env.emplace_back(name, value);
    }
    return env;
}

auto captureStack() -> std::string {
#if defined(__cpp_lib_stacktrace)
    return std::to_string(std::stacktrace::current(2));
#else
    return {};
#endif
}

} // namespace

LoggingPanicHandler::LoggingPanicHandler(Sink sink)
    : sink(std::move(sink)) {}

auto LoggingPanicHandler::handlePanic(PanicReport const& report) -> void {
    auto line = this->prefix + report.where + ": " + report.value;
    if (this->sink)
        this->sink(line);
    else
        std::cerr << line << std::endl;
}

MetricsPanicHandler::MetricsPanicHandler(std::size_t maxRecords)
    : maxRecords(maxRecords) {}

auto MetricsPanicHandler::handlePanic(PanicReport const& report) -> void {
    std::lock_guard lock(this->mutex);
    ++this->count;
    if (this->maxRecords == 0)
        return;
    if (this->recent.size() >= this->maxRecords)
        this->recent.pop_front();
    this->recent.push_back(report);
}

auto MetricsPanicHandler::panicCount() const -> std::size_t {
    std::lock_guard lock(this->mutex);
    return this->count;
}

auto MetricsPanicHandler::records() const -> std::vector<PanicReport> {
    std::lock_guard lock(this->mutex);
    return {this->recent.begin(), this->recent.end()};
}

auto MetricsPanicHandler::reset() -> void {
    std::lock_guard lock(this->mutex);
    this->count = 0;
    this->recent.clear();
}

Recovery::Recovery()
    : Recovery(Options{}) {}

Recovery::Recovery(Options options)
    : options(std::move(options)) {}

auto Recovery::setPlatform(Platform* platform) -> void {
    std::lock_guard lock(this->mutex);
    this->platform = platform;
}

auto Recovery::addHandler(std::shared_ptr<PanicHandler> handler) -> void {
    std::lock_guard lock(this->mutex);
    this->handlers.push_back(std::move(handler));
}

auto Recovery::describe(std::exception_ptr fault) -> std::string {
    if (!fault)
        return "unknown fault";
    try {
        std::rethrow_exception(fault);
    } catch (std::exception const& e) {
        return e.what();
    } catch (std::string const& s) {
        return s;
    } catch (char const* s) {
        return s;
    } catch (...) {
        return "non-standard exception";
    }
}

auto Recovery::formatReport(PanicReport const& report) -> std::string {
    std::ostringstream oss;
    oss << "\n\n=== PANIC ===\n";
    oss << "Time: " << formatTime(report.time) << "\n";
    oss << "Where: " << report.where << "\n";
    oss << "Value: " << report.value << "\n";
    oss << "\nEnvironment:\n";
    for (auto const& [key, value] : report.environment)
        oss << "  " << key << "=" << value << "\n";
    if (!report.stack.empty()) {
        oss << "\nStack:\n" << report.stack;
        if (report.stack.back() != '\n')
            oss << "\n";
    }
    oss << "\n";
    return oss.str();
}

auto Recovery::handle(std::exception_ptr fault, std::string const& where) -> Error {
    this->restoreTerminal();

    PanicReport report{std::chrono::system_clock::now(), where, describe(fault), captureEnvironment(), captureStack()};
    auto const  text = formatReport(report);

    std::vector<std::shared_ptr<PanicHandler>> toRun;
    {
        std::lock_guard lock(this->mutex);
        ++this->panics;
        toRun = this->handlers;
    }

    if (this->options.writeStderr)
        std::cerr << text << std::flush;
    if (!this->options.panicLogPath.empty()) {
        std::ofstream log(this->options.panicLogPath, std::ios::app);
        if (log) {
            log << text;
            log.flush();
        } else {
            std::cerr << "failed to open panic log " << this->options.panicLogPath << std::endl;
        }
    }
    ts_log("Recovered fault in " + where + ": " + report.value, "Recovery");

    for (auto const& handler : toRun)
        handler->handlePanic(report);

    return Error{Error::Code::ActionFailed, "panic in " + where + ": " + report.value};
}

auto Recovery::panicCount() const -> std::size_t {
    std::lock_guard lock(this->mutex);
    return this->panics;
}

auto Recovery::restoreTerminal() noexcept -> void {
    Platform* target = nullptr;
    {
        std::lock_guard lock(this->mutex);
        target = this->platform;
    }
    if (target != nullptr)
        target->restoreTerminal();
}

} // namespace TS
