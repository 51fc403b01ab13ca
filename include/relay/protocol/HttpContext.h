#pragma once

#include "relay/protocol/HttpRequest.h"

#include <chrono>
#include <cstddef>
#include <functional>

namespace relay {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x request parser. The head is kept, the body is handed
// out piece by piece and never accumulated. Parsing stops at the end of one
// message so pipelined bytes stay in the buffer.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
        kError,
    };

    enum BodyFraming {
        kNoBody,
        kContentLength,
        kChunked,
    };

    using HeadersCallback = std::function<void(const HttpRequest&)>;
    using BodyCallback = std::function<void(const char* data, size_t len)>;

    static const size_t kMaxHeaderBytes = 64 * 1024;

    HttpContext();

    void setHeadersCallback(const HeadersCallback& cb) { headersCallback_ = cb; }
    void setBodyCallback(const BodyCallback& cb) { bodyCallback_ = cb; }

    // return false if the request is malformed
    bool parseRequest(relay::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    bool headersDone() const { return state_ == kExpectBody || state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    // The error was an oversized request head rather than bad syntax.
    bool headerTooLarge() const { return headerTooLarge_; }
    HttpRequestParseState state() const { return state_; }
    BodyFraming framing() const { return framing_; }
    size_t contentLength() const { return contentLength_; }
    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeaderLine(const char* begin, const char* end);
    bool processHeadersEnd();
    bool processBody(relay::network::Buffer* buf);
    bool processChunked(relay::network::Buffer* buf);
    void emitBody(const char* data, size_t len);
    bool fail();

    enum ChunkState {
        kChunkSize,
        kChunkData,
        kChunkDataCrlf,
        kChunkTrailer,
    };

    HttpRequestParseState state_;
    HttpRequest request_;
    HeadersCallback headersCallback_;
    BodyCallback bodyCallback_;
    std::chrono::system_clock::time_point receiveTime_;

    size_t headerBytes_;
    bool headerTooLarge_;
    BodyFraming framing_;
    size_t contentLength_;
    size_t bodyRemaining_;
    ChunkState chunkState_;
    size_t chunkRemaining_;
};

} // namespace protocol
} // namespace relay
