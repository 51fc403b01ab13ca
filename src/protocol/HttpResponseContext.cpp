#include "relay/protocol/HttpResponseContext.h"
#include "relay/network/Buffer.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace relay {
namespace protocol {

const size_t HttpResponseContext::kMaxHeaderBytes;

static bool isOws(char c) {
    return c == ' ' || c == '\t';
}

static bool parseContentLength(const std::string& s, size_t* out) {
    if (s.empty() || s.size() > 18) return false;
    size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<size_t>(c - '0');
    }
    *out = v;
    return true;
}

static bool parseChunkSizeLine(const char* begin, const char* end, size_t* out) {
    const char* semi = std::find(begin, end, ';');
    while (semi > begin && isOws(*(semi - 1))) --semi;
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

HttpResponseContext::HttpResponseContext()
    : requestWasHead_(false) {
    reset();
}

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    HttpResponse dummy;
    response_.swap(dummy);
    headerBytes_ = 0;
    framing_ = kNoBody;
    contentLength_ = 0;
    bodyRemaining_ = 0;
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;
}

bool HttpResponseContext::fail() {
    state_ = kError;
    return false;
}

void HttpResponseContext::emitBody(const char* data, size_t len) {
    if (len > 0 && bodyCallback_) bodyCallback_(data, len);
}

bool HttpResponseContext::processStatusLine(const char* begin, const char* end) {
    // HTTP/1.x SP 3DIGIT SP reason
    if (end - begin < 12 || !std::equal(begin, begin + 7, "HTTP/1.")) return false;
    const char minor = begin[7];
    if (minor != '0' && minor != '1') return false;
    if (begin[8] != ' ') return false;

    int code = 0;
    for (const char* p = begin + 9; p != begin + 12; ++p) {
        if (*p < '0' || *p > '9') return false;
        code = code * 10 + (*p - '0');
    }
    if (code < 100) return false;

    const char* reason = begin + 12;
    if (reason != end) {
        if (*reason != ' ') return false;
        ++reason;
    }
    if (!HttpHeaders::IsFieldValue(reason, end)) return false;
    response_.setVersionMinor(minor - '0');
    response_.setStatusCode(code);
    response_.setStatusMessage(std::string(reason, end));
    return true;
}

bool HttpResponseContext::processHeaderLine(const char* begin, const char* end) {
    const char* colon = std::find(begin, end, ':');
    if (colon == end || !HttpHeaders::IsToken(begin, colon)) return false;
    const char* v = colon + 1;
    const char* ve = end;
    while (v < ve && isOws(*v)) ++v;
    while (ve > v && isOws(*(ve - 1))) --ve;
    if (!HttpHeaders::IsFieldValue(v, ve)) return false;
    response_.addHeader(std::string(begin, colon), std::string(v, ve));
    return true;
}

bool HttpResponseContext::processHeadersEnd() {
    const int code = response_.statusCode();

    // 101 would switch protocols; the relay never asks for an upgrade.
    if (code == 101) return false;
    if (code < 200) {
        if (interimCallback_) interimCallback_(response_);
        HttpResponse dummy;
        response_.swap(dummy);
        headerBytes_ = 0;
        state_ = kExpectStatusLine;
        return true;
    }

    const HttpHeaders& headers = response_.headers();
    framing_ = kUntilClose;
    contentLength_ = 0;

    const std::vector<std::string> te = headers.GetAll("Transfer-Encoding");
    if (!te.empty()) {
        std::vector<std::string> codings;
        for (const auto& v : te) {
            for (auto& c : HttpHeaders::SplitTokens(v)) codings.push_back(std::move(c));
        }
        if (!codings.empty() && HttpHeaders::IEquals(codings.back(), "chunked")) {
            framing_ = kChunked;
        }
    } else {
        for (const auto& v : headers.GetAll("Content-Length")) {
            size_t n = 0;
            if (!parseContentLength(v, &n)) return false;
            if (framing_ == kContentLength && n != contentLength_) return false;
            framing_ = kContentLength;
            contentLength_ = n;
        }
    }

    bool hasBody = true;
    if (requestWasHead_ || code == 204 || code == 304) {
        hasBody = false;
    } else if (framing_ == kContentLength && contentLength_ == 0) {
        hasBody = false;
    }
    if (!hasBody && framing_ != kContentLength) {
        framing_ = kNoBody;
    }

    bodyRemaining_ = contentLength_;
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;
    state_ = hasBody ? kExpectBody : kGotAll;

    if (headCallback_) headCallback_(response_);
    return true;
}

bool HttpResponseContext::consumeChunked(relay::network::Buffer* buf) {
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
        if (!crlf) return buf->ReadableBytes() <= kMaxHeaderBytes;

        if (chunkState_ == kChunkSize) {
            size_t size = 0;
            if (!parseChunkSizeLine(buf->Peek(), crlf, &size)) return false;
            buf->RetrieveUntil(crlf + 2);
            if (size == 0) {
                chunkState_ = kChunkTrailer;
            } else {
                chunkRemaining_ = size;
                chunkState_ = kChunkData;
            }
        } else {
            const bool last = crlf == buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            if (last) state_ = kGotAll;
        }
    }
    return true;
}

bool HttpResponseContext::feed(relay::network::Buffer* buf) {
    if (state_ == kError) return false;

    while (state_ == kExpectStatusLine || state_ == kExpectHeaders) {
        const char* crlf = buf->FindCRLF();
        if (!crlf) {
            if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) return fail();
            return true;
        }
        headerBytes_ += static_cast<size_t>(crlf - buf->Peek()) + 2;
        if (headerBytes_ > kMaxHeaderBytes) return fail();

        if (state_ == kExpectStatusLine) {
            if (!processStatusLine(buf->Peek(), crlf)) return fail();
            state_ = kExpectHeaders;
            buf->RetrieveUntil(crlf + 2);
        } else if (crlf == buf->Peek()) {
            buf->RetrieveUntil(crlf + 2);
            if (!processHeadersEnd()) return fail();
        } else {
            if (!processHeaderLine(buf->Peek(), crlf)) return fail();
            buf->RetrieveUntil(crlf + 2);
        }
    }

    if (state_ != kExpectBody) return true;

    if (framing_ == kChunked) {
        return consumeChunked(buf) || fail();
    }
    if (framing_ == kUntilClose) {
        const size_t n = buf->ReadableBytes();
        if (n > 0) {
            emitBody(buf->Peek(), n);
            buf->RetrieveAll();
        }
        return true;
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

bool HttpResponseContext::finishOnClose() {
    if (state_ == kGotAll) return true;
    if (state_ == kExpectBody && framing_ == kUntilClose) {
        state_ = kGotAll;
        return true;
    }
    return false;
}

} // namespace protocol
} // namespace relay
