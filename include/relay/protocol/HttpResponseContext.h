#pragma once

#include "relay/protocol/HttpResponse.h"

#include <cstddef>
#include <functional>

namespace relay {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x response parser for the relay path.
// - Content-Length, chunked and read-until-close bodies.
// - No body for 1xx/204/304 and for responses to HEAD.
// - Interim 1xx responses (except 101) are reported separately and parsing
//   continues with the final response.
// Body bytes are handed to the callback as they arrive, never accumulated.
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kExpectBody, kGotAll, kError };
    enum BodyFraming { kNoBody, kContentLength, kChunked, kUntilClose };

    using HeadCallback = std::function<void(const HttpResponse&)>;
    using BodyCallback = std::function<void(const char* data, size_t len)>;

    static const size_t kMaxHeaderBytes = 64 * 1024;

    HttpResponseContext();

    void setInterimCallback(const HeadCallback& cb) { interimCallback_ = cb; }
    void setHeadCallback(const HeadCallback& cb) { headCallback_ = cb; }
    void setBodyCallback(const BodyCallback& cb) { bodyCallback_ = cb; }
    // Responses to HEAD carry no body whatever their framing headers say.
    void setRequestWasHead(bool on) { requestWasHead_ = on; }

    // Consumes what it can from buf. Returns false on a malformed response.
    bool feed(relay::network::Buffer* buf);
    // The origin closed the stream. True if that legitimately completes the
    // response (read-until-close body), false if the response is truncated.
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    bool headReceived() const { return state_ == kExpectBody || state_ == kGotAll; }
    ParseState state() const { return state_; }
    BodyFraming framing() const { return framing_; }
    size_t contentLength() const { return contentLength_; }
    const HttpResponse& response() const { return response_; }

    void reset();

private:
    bool processStatusLine(const char* begin, const char* end);
    bool processHeaderLine(const char* begin, const char* end);
    bool processHeadersEnd();
    bool consumeChunked(relay::network::Buffer* buf);
    void emitBody(const char* data, size_t len);
    bool fail();

    enum ChunkState {
        kChunkSize,
        kChunkData,
        kChunkDataCrlf,
        kChunkTrailer,
    };

    ParseState state_;
    HttpResponse response_;
    HeadCallback interimCallback_;
    HeadCallback headCallback_;
    BodyCallback bodyCallback_;
    bool requestWasHead_;

    size_t headerBytes_;
    BodyFraming framing_;
    size_t contentLength_;
    size_t bodyRemaining_;
    ChunkState chunkState_;
    size_t chunkRemaining_;
};

} // namespace protocol
} // namespace relay
