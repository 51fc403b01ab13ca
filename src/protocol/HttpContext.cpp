#include "relay/protocol/HttpContext.h"
#include "relay/network/Buffer.h"
#include "relay/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace relay {
namespace protocol {

const size_t HttpContext::kMaxHeaderBytes;

namespace {

bool IsOws(char c) {
    return c == ' ' || c == '\t';
}

// Digits only, no sign or whitespace; false on overflow.
bool ParseDecimal(const std::string& s, size_t* out) {
    if (s.empty() || s.size() > 18) return false;
    size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<size_t>(c - '0');
    }
    *out = v;
    return true;
}

bool ParseChunkSize(const char* begin, const char* end, size_t* out) {
    const char* semi = std::find(begin, end, ';');
    while (semi > begin && IsOws(*(semi - 1))) --semi;
    if (semi == begin || semi - begin > 15) return false;
    size_t v = 0;
    for (const char* p = begin; p != semi; ++p) {
        const int c = std::tolower(static_cast<unsigned char>(*p));
        if (c >= '0' && c <= '9') v = v * 16 + static_cast<size_t>(c - '0');
        else if (c >= 'a' && c <= 'f') v = v * 16 + static_cast<size_t>(c - 'a' + 10);
        else return false;
    }
    *out = v;
    return true;
}

} // namespace

HttpContext::HttpContext() {
    reset();
}

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headerBytes_ = 0;
    headerTooLarge_ = false;
    framing_ = kNoBody;
    contentLength_ = 0;
    bodyRemaining_ = 0;
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;
}

bool HttpContext::fail() {
    state_ = kError;
    return false;
}

void HttpContext::emitBody(const char* data, size_t len) {
    if (len > 0 && bodyCallback_) bodyCallback_(data, len);
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* space = std::find(begin, end, ' ');
    if (space == end || !request_.setMethod(begin, space)) return false;

    const char* start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || space == start) return false;
    // A bare CR or LF here would split the line differently downstream.
    for (const char* p = start; p != space; ++p) {
        const unsigned char c = static_cast<unsigned char>(*p);
        if (c <= 0x20 || c == 0x7f) return false;
    }
    request_.setTarget(start, space);

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    if (*(end - 1) == '1') {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (*(end - 1) == '0') {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::processHeaderLine(const char* begin, const char* end) {
    // Name must be a token (no obs-fold, no whitespace before the colon);
    // value must be free of CR, LF, NUL and other controls.
    const char* colon = std::find(begin, end, ':');
    if (colon == end || !HttpHeaders::IsToken(begin, colon)) return false;

    const char* v = colon + 1;
    const char* ve = end;
    while (v < ve && IsOws(*v)) ++v;
    while (ve > v && IsOws(*(ve - 1))) --ve;
    if (!HttpHeaders::IsFieldValue(v, ve)) return false;
    request_.addHeader(std::string(begin, colon), std::string(v, ve));
    return true;
}

bool HttpContext::processHeadersEnd() {
    const HttpHeaders& headers = request_.headers();
    framing_ = kNoBody;
    contentLength_ = 0;

    const std::vector<std::string> te = headers.GetAll("Transfer-Encoding");
    if (!te.empty()) {
        std::vector<std::string> codings;
        for (const auto& v : te) {
            for (auto& c : HttpHeaders::SplitTokens(v)) codings.push_back(std::move(c));
        }
        // chunked must be the final coding or the length is unknowable.
        if (codings.empty() || !HttpHeaders::IEquals(codings.back(), "chunked")) return false;
        framing_ = kChunked;
    } else {
        const std::vector<std::string> cl = headers.GetAll("Content-Length");
        for (const auto& v : cl) {
            size_t n = 0;
            if (!ParseDecimal(v, &n)) return false;
            if (framing_ == kContentLength && n != contentLength_) return false;
            framing_ = kContentLength;
            contentLength_ = n;
        }
    }

    bodyRemaining_ = contentLength_;
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;

    const bool hasBody = framing_ == kChunked || (framing_ == kContentLength && contentLength_ > 0);
    state_ = hasBody ? kExpectBody : kGotAll;
    if (headersCallback_) headersCallback_(request_);
    return true;
}

bool HttpContext::processChunked(relay::network::Buffer* buf) {
    while (state_ == kExpectBody) {
        if (chunkState_ == kChunkData) {
            const size_t n = std::min(chunkRemaining_, buf->ReadableBytes());
            if (n == 0) return true;
            const char* data = buf->Peek();
            chunkRemaining_ -= n;
            if (chunkRemaining_ == 0) chunkState_ = kChunkDataCrlf;
            emitBody(data, n);
            buf->Retrieve(n);
            continue;
        }

        if (chunkState_ == kChunkDataCrlf) {
            if (buf->ReadableBytes() < 2) return true;
            const char* p = buf->Peek();
            if (p[0] != '\r' || p[1] != '\n') return false;
            buf->Retrieve(2);
            chunkState_ = kChunkSize;
            continue;
        }

        const char* crlf = buf->FindCRLF();
        if (!crlf) {
            return buf->ReadableBytes() <= kMaxHeaderBytes;
        }

        if (chunkState_ == kChunkSize) {
            size_t size = 0;
            if (!ParseChunkSize(buf->Peek(), crlf, &size)) return false;
            buf->RetrieveUntil(crlf + 2);
            if (size == 0) {
                chunkState_ = kChunkTrailer;
            } else {
                chunkRemaining_ = size;
                chunkState_ = kChunkData;
            }
        } else {
            // Trailer fields are not relayed; the empty line ends the message.
            const bool last = crlf == buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            if (last) state_ = kGotAll;
        }
    }
    return true;
}

bool HttpContext::processBody(relay::network::Buffer* buf) {
    if (framing_ == kChunked) {
        return processChunked(buf);
    }
    const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
    if (n > 0) {
        const char* data = buf->Peek();
        bodyRemaining_ -= n;
        if (bodyRemaining_ == 0) state_ = kGotAll;
        emitBody(data, n);
        buf->Retrieve(n);
    }
    return true;
}

bool HttpContext::parseRequest(relay::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    if (state_ == kError) return false;

    while (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
        const char* crlf = buf->FindCRLF();
        if (!crlf) {
            if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                LOG_DEBUG << "HttpContext: request head exceeds " << kMaxHeaderBytes << " bytes";
                headerTooLarge_ = true;
                return fail();
            }
            return true;
        }
        const size_t lineBytes = static_cast<size_t>(crlf - buf->Peek()) + 2;
        headerBytes_ += lineBytes;
        if (headerBytes_ > kMaxHeaderBytes) {
            headerTooLarge_ = true;
            return fail();
        }

        if (state_ == kExpectRequestLine) {
            // Tolerate empty lines before the request line (RFC 7230 3.5).
            if (crlf != buf->Peek()) {
                if (!processRequestLine(buf->Peek(), crlf)) return fail();
                receiveTime_ = receiveTime;
                state_ = kExpectHeaders;
            } else {
                headerBytes_ -= lineBytes;
            }
            buf->RetrieveUntil(crlf + 2);
        } else if (crlf == buf->Peek()) {
            buf->RetrieveUntil(crlf + 2);
            if (!processHeadersEnd()) return fail();
        } else {
            if (!processHeaderLine(buf->Peek(), crlf)) return fail();
            buf->RetrieveUntil(crlf + 2);
        }
    }

    if (state_ == kExpectBody && !processBody(buf)) {
        return fail();
    }
    return true;
}

} // namespace protocol
} // namespace relay
