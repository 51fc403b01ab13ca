#pragma once

#include "relay/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace relay {
namespace network {

// OpenSSL server context for TLS termination at the edge listener.
class TlsContext : relay::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);
    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

    // Text of the most recent OpenSSL error on this thread, or empty.
    static std::string LastError();

private:
    ssl_ctx_st* ctx_{nullptr};
};

} // namespace network
} // namespace relay
