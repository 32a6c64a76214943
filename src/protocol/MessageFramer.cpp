#include "protocol/MessageFramer.h"
#include <algorithm>
#include <regex>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

// ---------------------------------------------------------------------------
// FdChannel
// ---------------------------------------------------------------------------

FdChannel::FdChannel(int readFd, int writeFd, bool ownsFds)
    : readFd(readFd), writeFd(writeFd), ownsFds(ownsFds) {
    if (pipe(wakePipe) == 0) {
        fcntl(wakePipe[0], F_SETFD, FD_CLOEXEC);
        fcntl(wakePipe[1], F_SETFD, FD_CLOEXEC);
    } else {
        wakePipe[0] = wakePipe[1] = -1;
    }
}

FdChannel::~FdChannel() {
    closeWrite();
    if (ownsFds && readFd >= 0) close(readFd);
    if (wakePipe[0] >= 0) close(wakePipe[0]);
    if (wakePipe[1] >= 0) close(wakePipe[1]);
}

long FdChannel::readSome(char* buffer, size_t capacity) {
    if (readFd < 0) return -1;
    while (true) {
        pollfd fds[2];
        fds[0] = {readFd, POLLIN, 0};
        fds[1] = {wakePipe[0], POLLIN, 0};
        int nfds = wakePipe[0] >= 0 ? 2 : 1;
        int rc = poll(fds, nfds, idleCheck ? idleIntervalMs : -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (rc == 0) {
            if (idleCheck()) return 0;
            continue;
        }
        if (nfds == 2 && (fds[1].revents & POLLIN)) {
            return -1;
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read(readFd, buffer, capacity);
            if (n < 0 && errno == EINTR) continue;
            return static_cast<long>(n);
        }
    }
}

bool FdChannel::writeAll(const std::string& data) {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (writeFd < 0) return false;
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = write(writeFd, data.data() + total, data.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

void FdChannel::closeWrite() {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (writeFd >= 0) {
        if (ownsFds) close(writeFd);
        writeFd = -1;
    }
}

void FdChannel::setIdleCheck(int intervalMs, std::function<bool()> check) {
    idleIntervalMs = intervalMs;
    idleCheck = std::move(check);
}

void FdChannel::interrupt() {
    if (wakePipe[1] >= 0) {
        char byte = 1;
        ssize_t ignored = write(wakePipe[1], &byte, 1);
        (void)ignored;
    }
}

// ---------------------------------------------------------------------------
// StreamChannel
// ---------------------------------------------------------------------------

StreamChannel::StreamChannel(std::istream& in, std::ostream& out) : in(in), out(out) {}

long StreamChannel::readSome(char* buffer, size_t capacity) {
    if (pending.empty()) {
        std::string line;
        if (!std::getline(in, line)) {
            return 0;
        }
        pending = line;
        if (!in.eof()) pending += '\n';
        if (pending.empty()) return readSome(buffer, capacity);
    }
    size_t n = std::min(capacity, pending.size());
    pending.copy(buffer, n);
    pending.erase(0, n);
    return static_cast<long>(n);
}

bool StreamChannel::writeAll(const std::string& data) {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (writeClosed) return false;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    return static_cast<bool>(out);
}

void StreamChannel::closeWrite() {
    std::lock_guard<std::mutex> lock(writeMtx);
    writeClosed = true;
    out.flush();
}

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------

FrameDecoder::FrameDecoder(size_t maxLineBytes) : maxLineBytes(maxLineBytes) {}

void FrameDecoder::feed(const char* data, size_t size) {
    buffer.append(data, size);
}

bool FrameDecoder::next(FrameEvent& event) {
    while (true) {
        size_t newline = buffer.find('\n');
        if (newline == std::string::npos) {
            if (!discarding && buffer.size() > maxLineBytes) {
                // Drop the oversized prefix and everything up to the next terminator.
                discarding = true;
                buffer.clear();
                event = FrameEvent();
                event.type = FrameEvent::Type::Invalid;
                event.errorCode = RpcErrorCode::ParseError;
                event.error = "Line exceeds " + std::to_string(maxLineBytes) + " bytes";
                return true;
            }
            if (discarding) buffer.clear();
            return false;
        }

        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);

        if (discarding) {
            discarding = false;
            continue;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (line.size() > maxLineBytes) {
            event = FrameEvent();
            event.type = FrameEvent::Type::Invalid;
            event.errorCode = RpcErrorCode::ParseError;
            event.error = "Line exceeds " + std::to_string(maxLineBytes) + " bytes";
            return true;
        }

        event = decodeLine(line);
        return true;
    }
}

void FrameDecoder::finish() {
    if (!buffer.empty() && buffer.back() != '\n') {
        buffer.push_back('\n');
    }
}

FrameEvent FrameDecoder::decodeLine(const std::string& line) const {
    FrameEvent event;
    event.raw = line;

    nlohmann::json parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        event.type = FrameEvent::Type::Invalid;
        event.errorCode = RpcErrorCode::ParseError;
        event.error = "Parse error";
        event.recoveredId = recoverId(line);
        return event;
    }

    try {
        event.message = RpcMessage::fromJson(parsed);
        event.type = FrameEvent::Type::Message;
    } catch (const RpcError& e) {
        event.type = FrameEvent::Type::Invalid;
        event.errorCode = RpcErrorCode::InvalidRequest;
        event.error = e.what();
        if (parsed.is_object() && parsed.contains("id") &&
            (parsed["id"].is_number_integer() || parsed["id"].is_string())) {
            event.recoveredId = parsed["id"];
        }
    }
    return event;
}

std::optional<nlohmann::json> FrameDecoder::recoverId(const std::string& raw) {
    static const std::regex idPattern(R"re("id"\s*:\s*(-?[0-9]+|"(?:[^"\\]|\\.)*"))re");
    std::smatch match;
    if (!std::regex_search(raw, match, idPattern)) {
        return std::nullopt;
    }
    nlohmann::json id = nlohmann::json::parse(match[1].str(), nullptr, false);
    if (id.is_discarded()) return std::nullopt;
    return id;
}

// ---------------------------------------------------------------------------
// MessageFramer
// ---------------------------------------------------------------------------

MessageFramer::MessageFramer(ByteChannel& channel, size_t maxLineBytes)
    : channel(channel), decoder(maxLineBytes) {}

std::string MessageFramer::encode(const RpcMessage& message) {
    return message.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

FrameEvent MessageFramer::readMessage() {
    FrameEvent event;
    char chunk[4096];
    while (true) {
        if (decoder.next(event)) return event;
        if (endOfStream) {
            decoder.finish();
            if (decoder.next(event)) return event;
            return FrameEvent();
        }
        long n = channel.readSome(chunk, sizeof(chunk));
        if (n <= 0) {
            endOfStream = true;
            continue;
        }
        decoder.feed(chunk, static_cast<size_t>(n));
    }
}

bool MessageFramer::writeMessage(const RpcMessage& message) {
    std::string line = encode(message);
    std::lock_guard<std::mutex> lock(writeMtx);
    return channel.writeAll(line);
}
