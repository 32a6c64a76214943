#pragma once
#include <string>
#include <functional>
#include <optional>
#include <mutex>
#include <istream>
#include <ostream>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "protocol/JsonRpc.h"

/**
 * @brief Duplex byte channel: the only capability the framer needs from a
 * stream, a pipe pair or a test buffer.
 */
class ByteChannel {
public:
    virtual ~ByteChannel() = default;

    // Bytes read; 0 on end-of-stream, negative on error or interrupt.
    virtual long readSome(char* buffer, size_t capacity) = 0;

    virtual bool writeAll(const std::string& data) = 0;

    // Signals end-of-stream to the peer. Further writes fail.
    virtual void closeWrite() = 0;
};

/**
 * @brief Channel over a pair of POSIX file descriptors.
 *
 * Reads poll a private wake pipe alongside the read fd so that interrupt()
 * can release a reader blocked on a peer that never closes its end.
 * The channel does not own the fds unless ownsFds is set.
 */
class FdChannel : public ByteChannel {
public:
    FdChannel(int readFd, int writeFd, bool ownsFds = false);
    ~FdChannel() override;

    FdChannel(const FdChannel&) = delete;
    FdChannel& operator=(const FdChannel&) = delete;

    long readSome(char* buffer, size_t capacity) override;
    bool writeAll(const std::string& data) override;
    void closeWrite() override;

    void interrupt();

    // Runs check after intervalMs without input; a true result ends the stream.
    // Must be set before the first read.
    void setIdleCheck(int intervalMs, std::function<bool()> check);

private:
    int readFd;
    int writeFd;
    bool ownsFds;
    int idleIntervalMs = -1;
    std::function<bool()> idleCheck;
    int wakePipe[2] = {-1, -1};
    std::mutex writeMtx;
};

// Channel over iostreams; reads are line-buffered so interactive input does not block on a full buffer.
class StreamChannel : public ByteChannel {
public:
    StreamChannel(std::istream& in, std::ostream& out);

    long readSome(char* buffer, size_t capacity) override;
    bool writeAll(const std::string& data) override;
    void closeWrite() override;

private:
    std::istream& in;
    std::ostream& out;
    std::string pending;
    bool writeClosed = false;
    std::mutex writeMtx;
};

struct FrameEvent {
    enum class Type {
        Message,
        Invalid,      // bad line; errorCode is ParseError or InvalidRequest
        EndOfStream
    };

    Type type = Type::EndOfStream;
    RpcMessage message;
    std::string raw;
    RpcErrorCode errorCode = RpcErrorCode::ParseError;
    std::string error;
    std::optional<nlohmann::json> recoveredId;
};

/**
 * @brief Incremental newline-delimited decoder. Tolerates arbitrary chunking.
 */
class FrameDecoder {
public:
    static constexpr size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

    explicit FrameDecoder(size_t maxLineBytes = kDefaultMaxLineBytes);

    void feed(const char* data, size_t size);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Pops the next decoded event. Returns false when more bytes are needed.
    bool next(FrameEvent& event);

    // End of input: a trailing unterminated line is decoded as if terminated.
    void finish();

    size_t bufferedBytes() const { return buffer.size(); }

    // Best-effort scan of an unparsable line for its "id" member.
    static std::optional<nlohmann::json> recoverId(const std::string& raw);

private:
    std::string buffer;
    size_t maxLineBytes;
    bool discarding = false;

    FrameEvent decodeLine(const std::string& line) const;
};

/**
 * @brief Message framer bound to one channel: blocking reads of whole messages
 * and writes that never interleave with another writer on the same channel.
 */
class MessageFramer {
public:
    explicit MessageFramer(ByteChannel& channel, size_t maxLineBytes = FrameDecoder::kDefaultMaxLineBytes);

    static std::string encode(const RpcMessage& message);

    // Blocks until a message, an invalid line, or end-of-stream.
    FrameEvent readMessage();

    bool writeMessage(const RpcMessage& message);

private:
    ByteChannel& channel;
    FrameDecoder decoder;
    bool endOfStream = false;
    std::mutex writeMtx;
};
