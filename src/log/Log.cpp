#include "ddplink/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace ddplink::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler warningHandler = makeDefaultErrorSink();
LogHandler errorHandler = makeDefaultErrorSink();

void dispatch(const LogHandler& slot, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = slot;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setWarningLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    warningHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newWarning, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    warningHandler = newWarning ? std::move(newWarning) : makeDefaultErrorSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    warningHandler = makeDefaultErrorSink();
    errorHandler = makeDefaultErrorSink();
}

// The handler is copied out under the lock so a sink may itself log or swap
// handlers without deadlocking.
void logInfo(std::string_view message) {
    dispatch(infoHandler, message);
}

void logWarning(std::string_view message) {
    dispatch(warningHandler, message);
}

void logError(std::string_view message) {
    dispatch(errorHandler, message);
}

struct ScopedLogCapture::Buffer {
    mutable std::mutex m;
    std::string text;
};

ScopedLogCapture::ScopedLogCapture()
: buffer_(std::make_shared<Buffer>()) {
    auto sink = [buffer = buffer_](std::string_view message) {
        std::lock_guard lock(buffer->m);
        buffer->text.append(message.data(), message.size());
    };
    setLogHandlers(sink, sink, sink);
}

ScopedLogCapture::~ScopedLogCapture() {
    resetLogHandlers();
}

std::string ScopedLogCapture::text() const {
    std::lock_guard lock(buffer_->m);
    return buffer_->text;
}

bool ScopedLogCapture::contains(std::string_view needle) const {
    std::lock_guard lock(buffer_->m);
    return buffer_->text.find(needle) != std::string::npos;
}

} // namespace ddplink::log
