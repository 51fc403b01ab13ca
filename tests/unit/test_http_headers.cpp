#include "relay/protocol/HttpHeaders.h"
#include "relay/protocol/HopByHop.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace relay::protocol;
using namespace relay::common;

void testLookupIsCaseInsensitive() {
    HttpHeaders h;
    h.Add("Content-Type", "text/plain");
    h.Add("X-Trace", "abc");

    assert(h.Get("content-type") == "text/plain");
    assert(h.Get("CONTENT-TYPE") == "text/plain");
    assert(h.Contains("x-trace"));
    assert(!h.Contains("X-Missing"));
    assert(h.Get("X-Missing").empty());
    assert(h.size() == 2);
    LOG_INFO << "Case-insensitive lookup PASS";
}

void testRepeatedFieldsKeepOrder() {
    HttpHeaders h;
    h.Add("Set-Cookie", "a=1");
    h.Add("X-Other", "x");
    h.Add("set-cookie", "b=2");

    const std::vector<std::string> all = h.GetAll("Set-Cookie");
    assert(all.size() == 2);
    assert(all[0] == "a=1");
    assert(all[1] == "b=2");
    assert(h.Get("Set-Cookie") == "a=1");

    // Iteration follows arrival order and keeps the original name case.
    std::vector<std::string> names;
    for (const auto& f : h) names.push_back(f.first);
    assert(names.size() == 3);
    assert(names[0] == "Set-Cookie");
    assert(names[1] == "X-Other");
    assert(names[2] == "set-cookie");
    LOG_INFO << "Repeated fields order PASS";
}

void testSetAndRemove() {
    HttpHeaders h;
    h.Add("A", "1");
    h.Add("B", "2");
    h.Add("a", "3");

    h.Set("A", "9");
    assert(h.GetAll("a").size() == 1);
    assert(h.Get("a") == "9");
    assert(h.begin()->first == "A");

    assert(h.Remove("b") == 1);
    assert(!h.Contains("B"));
    assert(h.Remove("nope") == 0);
    assert(h.size() == 1);

    h.Set("New", "v");
    assert(h.size() == 2);
    LOG_INFO << "Set/Remove PASS";
}

void testTokens() {
    HttpHeaders h;
    h.Add("Connection", "keep-alive, X-Foo");
    h.Add("connection", " Upgrade ");

    assert(h.HasToken("Connection", "x-foo"));
    assert(h.HasToken("Connection", "upgrade"));
    assert(!h.HasToken("Connection", "close"));

    const auto tokens = HttpHeaders::SplitTokens(" a , ,b,c  ");
    assert(tokens.size() == 3);
    assert(tokens[0] == "a");
    assert(tokens[1] == "b");
    assert(tokens[2] == "c");
    LOG_INFO << "Token parsing PASS";
}

void testHopByHopFilter() {
    HttpHeaders h;
    h.Add("Host", "example.test");
    h.Add("Connection", "keep-alive, X-Session-Hint");
    h.Add("Keep-Alive", "timeout=5");
    h.Add("X-Session-Hint", "abc");
    h.Add("Proxy-Connection", "keep-alive");
    h.Add("Proxy-Authorization", "Basic Zm9vOmJhcg==");
    h.Add("Proxy-Authenticate", "Basic");
    h.Add("TE", "trailers");
    h.Add("Trailer", "X-Checksum");
    h.Add("Transfer-Encoding", "chunked");
    h.Add("Upgrade", "websocket");
    h.Add("X-Forwarded-For", "10.0.0.1");
    h.Add("Content-Length", "12");
    h.Add("authorization", "Bearer t");

    const HttpHeaders out = FilterHopByHop(h);
    assert(out.size() == 4);
    auto it = out.begin();
    assert(it->first == "Host");
    ++it;
    assert(it->first == "X-Forwarded-For");
    ++it;
    assert(it->first == "Content-Length");
    ++it;
    assert(it->first == "authorization" && it->second == "Bearer t");

    assert(IsHopByHopHeader("keep-alive"));
    assert(IsHopByHopHeader("TRANSFER-ENCODING"));
    assert(!IsHopByHopHeader("Authorization"));
    assert(!IsHopByHopHeader("Content-Length"));
    LOG_INFO << "Hop-by-hop filter PASS";
}

void testFilterWithoutConnectionHeader() {
    HttpHeaders h;
    h.Add("X-A", "1");
    h.Add("X-A", "2");
    const HttpHeaders out = FilterHopByHop(h);
    assert(out.size() == 2);
    assert(out.GetAll("x-a")[1] == "2");
    LOG_INFO << "Filter passthrough PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testLookupIsCaseInsensitive();
    testRepeatedFieldsKeepOrder();
    testSetAndRemove();
    testTokens();
    testHopByHopFilter();
    testFilterWithoutConnectionHeader();
    LOG_INFO << "All HttpHeaders tests PASS";
    return 0;
}
