#include "relay/protocol/HttpResponseContext.h"
#include "relay/network/Buffer.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace relay::protocol;
using namespace relay::network;
using namespace relay::common;

namespace {

struct Sink {
    int heads = 0;
    std::vector<int> interim;
    std::string body;

    void attach(HttpResponseContext* ctx) {
        ctx->setHeadCallback([this](const HttpResponse&) { ++heads; });
        ctx->setInterimCallback([this](const HttpResponse& r) { interim.push_back(r.statusCode()); });
        ctx->setBodyCallback([this](const char* data, size_t len) { body.append(data, len); });
    }
};

} // namespace

void testContentLength() {
    HttpResponseContext ctx;
    Sink sink;
    sink.attach(&ctx);
    Buffer buf;

    buf.Append("HTTP/1.1 201 Created\r\nX-Origin: ok\r\nContent-Length: 5\r\n\r\nhe");
    assert(ctx.feed(&buf));
    assert(ctx.headReceived());
    assert(sink.heads == 1);
    assert(ctx.response().statusCode() == 201);
    assert(ctx.response().statusMessage() == "Created");
    assert(ctx.response().headers().Get("x-origin") == "ok");
    assert(ctx.framing() == HttpResponseContext::kContentLength);
    assert(sink.body == "he");
    assert(!ctx.gotAll());

    buf.Append("llo");
    assert(ctx.feed(&buf));
    assert(ctx.gotAll());
    assert(sink.body == "hello");
    LOG_INFO << "Content-Length response PASS";
}

void testChunkedByteByByte() {
    const std::string input =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5;name=v\r\nfirst\r\n"
        "6\r\nsecond\r\n"
        "0\r\n"
        "X-Checksum: 1\r\n"
        "\r\n";
    HttpResponseContext ctx;
    Sink sink;
    sink.attach(&ctx);
    Buffer buf;
    for (char c : input) {
        buf.Append(&c, 1);
        assert(ctx.feed(&buf));
    }
    assert(ctx.gotAll());
    assert(ctx.framing() == HttpResponseContext::kChunked);
    assert(sink.body == "firstsecond");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Chunked response byte-by-byte PASS";
}

void testUntilClose() {
    HttpResponseContext ctx;
    Sink sink;
    sink.attach(&ctx);
    Buffer buf;

    buf.Append("HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nstream");
    assert(ctx.feed(&buf));
    assert(ctx.framing() == HttpResponseContext::kUntilClose);
    assert(ctx.response().versionMinor() == 0);
    buf.Append("ing body");
    assert(ctx.feed(&buf));
    assert(!ctx.gotAll());
    assert(ctx.finishOnClose());
    assert(ctx.gotAll());
    assert(sink.body == "streaming body");
    LOG_INFO << "Read-until-close response PASS";
}

void testNoBodyResponses() {
    {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append("HTTP/1.1 204 No Content\r\nX-A: 1\r\n\r\n");
        assert(ctx.feed(&buf));
        assert(ctx.gotAll());
        assert(ctx.framing() == HttpResponseContext::kNoBody);
    }
    {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append("HTTP/1.1 304 Not Modified\r\nETag: \"x\"\r\n\r\n");
        assert(ctx.feed(&buf));
        assert(ctx.gotAll());
    }
    {
        // The declared length describes the entity the GET would have had.
        HttpResponseContext ctx;
        Sink sink;
        sink.attach(&ctx);
        ctx.setRequestWasHead(true);
        Buffer buf;
        buf.Append("HTTP/1.1 200 OK\r\nContent-Length: 42\r\n\r\n");
        assert(ctx.feed(&buf));
        assert(ctx.gotAll());
        assert(ctx.contentLength() == 42);
        assert(sink.body.empty());
    }
    {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
        assert(ctx.feed(&buf));
        assert(ctx.gotAll());
    }
    LOG_INFO << "No-body responses PASS";
}

void testInterimResponses() {
    HttpResponseContext ctx;
    Sink sink;
    sink.attach(&ctx);
    Buffer buf;
    buf.Append("HTTP/1.1 100 Continue\r\n\r\n"
               "HTTP/1.1 103 Early Hints\r\nLink: </a.css>\r\n\r\n"
               "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    assert(ctx.feed(&buf));
    assert(sink.interim.size() == 2);
    assert(sink.interim[0] == 100);
    assert(sink.interim[1] == 103);
    assert(sink.heads == 1);
    assert(ctx.response().statusCode() == 200);
    assert(!ctx.response().headers().Contains("Link"));
    assert(ctx.gotAll());
    assert(sink.body == "ok");
    LOG_INFO << "Interim responses PASS";
}

void testMalformed() {
    const char* bad[] = {
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\n",
        "garbage\r\n\r\n",
        "HTTP/2 200 OK\r\n\r\n",
        "HTTP/1.1 2x0 OK\r\n\r\n",
        "HTTP/1.1 200 OK\r\nBroken Header: v\r\n\r\n",
        "HTTP/1.1 200 OK\r\nX-A: 1\nContent-Length: 0\r\nContent-Length: 3\r\n\r\nabc",
        "HTTP/1.1 200 O\nK\r\n\r\n",
        "HTTP/1.1 200 OK\r\nSet\x01" "Cookie: a\r\n\r\n",
        "HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n",
        "HTTP/1.1 200 OK\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n",
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nxyz\r\n",
    };
    for (const char* input : bad) {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append(input);
        assert(!ctx.feed(&buf));
        assert(ctx.hasError());
    }
    LOG_INFO << "Malformed responses PASS";
}

void testTruncated() {
    {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nonly ten b");
        assert(ctx.feed(&buf));
        assert(!ctx.finishOnClose());
    }
    {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nab");
        assert(ctx.feed(&buf));
        assert(!ctx.finishOnClose());
    }
    {
        HttpResponseContext ctx;
        Buffer buf;
        buf.Append("HTTP/1.1 200 O");
        assert(ctx.feed(&buf));
        assert(!ctx.headReceived());
        assert(!ctx.finishOnClose());
    }
    LOG_INFO << "Truncated responses PASS";
}

void testHeaderLimit() {
    HttpResponseContext ctx;
    Buffer buf;
    buf.Append("HTTP/1.1 200 OK\r\nX-Big: ");
    buf.Append(std::string(HttpResponseContext::kMaxHeaderBytes, 'b'));
    assert(!ctx.feed(&buf));
    LOG_INFO << "Response header limit PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testContentLength();
    testChunkedByteByByte();
    testUntilClose();
    testNoBodyResponses();
    testInterimResponses();
    testMalformed();
    testTruncated();
    testHeaderLimit();
    LOG_INFO << "All response parser tests PASS";
    return 0;
}
