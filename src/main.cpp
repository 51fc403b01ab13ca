#include "relay/ForwarderConfig.h"
#include "relay/RelayServer.h"
#include "relay/common/Config.h"
#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"

#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

std::string JoinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

void Usage(const char* prog) {
    printf("Usage: %s [-c config_file] [-C] [-h]\n", prog);
    printf("  -c  config file (default ../config/relay.conf)\n");
    printf("  -C  check config, resolve the origin and exit\n");
    printf("  -h  this help\n");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace relay;

    std::string configFile = "../config/relay.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                Usage(argv[0]);
                return 0;
            default:
                Usage(argv[0]);
                return 2;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }
    common::Logger::Instance().SetLevel(
        common::Logger::ParseLevel(conf.GetString("global", "log_level", "INFO")));

    ForwarderConfig fwdConfig;
    if (!ForwarderConfig::FromConfig(conf, &fwdConfig)) {
        return 1;
    }
    if (!fwdConfig.Resolve()) {
        LOG_ERROR << "Origin " << fwdConfig.origin.toString() << " does not resolve";
        return 1;
    }

    const int port = conf.GetInt("global", "listen_port", 8080);
    if (port < 0 || port > 65535) {
        LOG_ERROR << "[global] listen_port out of range: " << port;
        return 1;
    }
    const int threads = conf.GetInt("global", "threads", 4);
    const int maxConnections = conf.GetInt("global", "max_connections", 0);
    const double idleTimeoutSec = conf.GetDouble("global", "idle_timeout_sec", 0.0);
    const bool reusePort = conf.GetBool("global", "reuse_port", false);
    const bool tlsEnable = conf.GetBool("tls", "enable", false);
    const std::string tlsCertPath = conf.GetString("tls", "cert_path", "");
    const std::string tlsKeyPath = conf.GetString("tls", "key_path", "");

    if (checkOnly) {
        printf("OK origin=%s (%s)\n", fwdConfig.origin.toString().c_str(),
               fwdConfig.originAddr.toIpPort().c_str());
        return 0;
    }

    LOG_INFO << "edge-relay placement: regions=" << JoinList(fwdConfig.regions)
             << " mode=" << fwdConfig.mode;
    LOG_INFO << "Origin " << fwdConfig.origin.toString() << " connect_timeout_ms="
             << fwdConfig.connectTimeoutMs << " request_timeout_ms=" << fwdConfig.requestTimeoutMs;

    // Block termination signals before any thread starts; they arrive on a signalfd.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);
    signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    RelayServer server(&loop, network::InetAddress(static_cast<uint16_t>(port)), fwdConfig,
                       "RelayServer", reusePort);
    server.SetThreadNum(threads);
    server.SetMaxConnections(maxConnections);
    server.SetIdleTimeout(idleTimeoutSec);
    if (tlsEnable) {
        if (!server.EnableTls(tlsCertPath, tlsKeyPath)) {
            LOG_ERROR << "TLS enable failed (cert=" << tlsCertPath << ", key=" << tlsKeyPath << ")";
            return 1;
        }
        LOG_INFO << "TLS termination enabled";
    }

    const int sigfd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sigfd < 0) {
        LOG_ERROR << "signalfd failed";
        return 1;
    }
    network::Channel signalChannel(&loop, sigfd);
    signalChannel.SetReadCallback([&loop, sigfd](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        if (::read(sigfd, &info, sizeof info) == static_cast<ssize_t>(sizeof info)) {
            LOG_INFO << "Signal " << info.ssi_signo << " received, shutting down";
            loop.Quit();
        }
    });
    signalChannel.EnableReading();

    if (!server.Start()) {
        signalChannel.DisableAll();
        signalChannel.Remove();
        ::close(sigfd);
        return 1;
    }

    loop.Loop();

    signalChannel.DisableAll();
    signalChannel.Remove();
    ::close(sigfd);
    LOG_INFO << "Stats: " << monitor::Stats::Instance().Summary();
    return 0;
}
