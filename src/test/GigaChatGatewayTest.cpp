#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <httplib.h>

#include "domain/AuditErrors.hpp"
#include "infrastructure/GigaChatGateway.hpp"

using namespace invoiceauditor;
using infrastructure::GigaChatGateway;
using std::chrono::milliseconds;

namespace {

enum class Failure { None, Timeout, Transport };

Failure PostAndClassify(GigaChatGateway& gateway) {
    try {
        gateway.postCompletion("token", "{}");
    } catch (const domain::TimeoutError&) {
        return Failure::Timeout;
    } catch (const domain::TransportError&) {
        return Failure::Transport;
    }
    return Failure::None;
}

GigaChatGateway LocalGateway(int port, int timeoutSeconds) {
    const std::string origin = "http://127.0.0.1:" + std::to_string(port);
    GigaChatGateway::Endpoints endpoints;
    endpoints.authUrl = origin + "/api/v2/oauth";
    endpoints.apiUrl = origin + "/api/v1/chat/completions";
    endpoints.authTimeoutSeconds = timeoutSeconds;
    endpoints.completionTimeoutSeconds = timeoutSeconds;
    return GigaChatGateway(endpoints);
}

} // namespace

int main() {
    std::cout << "[Test] Starting GigaChatGateway Test..." << std::endl;

    std::string origin;
    std::string path;
    assert(GigaChatGateway::SplitUrl("https://ngw.devices.sberbank.ru:9443/api/v2/oauth", origin, path));
    assert(origin == "https://ngw.devices.sberbank.ru:9443");
    assert(path == "/api/v2/oauth");

    assert(GigaChatGateway::SplitUrl("http://localhost:8080", origin, path));
    assert(origin == "http://localhost:8080" && path == "/");

    assert(!GigaChatGateway::SplitUrl("gigachat/api", origin, path));
    assert(!GigaChatGateway::SplitUrl("https://", origin, path));
    assert(!GigaChatGateway::SplitUrl("https:///path", origin, path));
    std::cout << "[PASS] URLs split into origin and path." << std::endl;

    GigaChatGateway::Endpoints endpoints;
    endpoints.authUrl = "not a url";
    endpoints.apiUrl = "https://example.invalid/v1/chat";
    bool rejected = false;
    try {
        GigaChatGateway gateway(endpoints);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    // Nothing listens on port 1: the failure surfaces as a transport error.
    endpoints.authUrl = "http://127.0.0.1:1/api/v2/oauth";
    endpoints.apiUrl = "http://127.0.0.1:1/api/v1/chat/completions";
    endpoints.authTimeoutSeconds = 2;
    endpoints.completionTimeoutSeconds = 2;
    GigaChatGateway gateway(endpoints);
    bool transportFailed = false;
    try {
        gateway.postCompletion("token", "{}");
    } catch (const domain::TransportError&) {
        transportFailed = true;
    }
    assert(transportFailed);
    std::cout << "[PASS] Unreachable endpoint raises TransportError." << std::endl;

    assert(GigaChatGateway::IsTimeout(true, false, milliseconds(0), 30));
    assert(GigaChatGateway::IsTimeout(false, true, milliseconds(30000), 30));
    assert(!GigaChatGateway::IsTimeout(false, true, milliseconds(5), 30));
    assert(!GigaChatGateway::IsTimeout(false, false, milliseconds(60000), 30));
    std::cout << "[PASS] Read failures classified by elapsed time." << std::endl;

    // Server that answers slower than the read timeout
    {
        httplib::Server server;
        server.Post("/api/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            res.set_content("{}", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        assert(port > 0);
        std::thread listener([&server] { server.listen_after_bind(); });
        while (!server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        GigaChatGateway slow = LocalGateway(port, 1);
        assert(PostAndClassify(slow) == Failure::Timeout);

        server.stop();
        listener.join();
        std::cout << "[PASS] Slow endpoint raises TimeoutError." << std::endl;
    }

    // Server that drops the connection without answering
    {
        const int listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(listenFd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        const int bound = ::bind(listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(bound == 0);
        const int listening = ::listen(listenFd, 1);
        assert(listening == 0);
        socklen_t len = sizeof(addr);
        const int named = ::getsockname(listenFd, reinterpret_cast<sockaddr*>(&addr), &len);
        assert(named == 0);
        const int port = ntohs(addr.sin_port);

        std::thread dropper([listenFd] {
            const int client = ::accept(listenFd, nullptr, nullptr);
            if (client >= 0) ::close(client);
        });

        GigaChatGateway dropping = LocalGateway(port, 30);
        assert(PostAndClassify(dropping) == Failure::Transport);

        dropper.join();
        ::close(listenFd);
        std::cout << "[PASS] Dropped connection raises TransportError, not TimeoutError." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
