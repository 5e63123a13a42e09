#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <future>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

#include <httplib.h>

#include "authorizer.hpp"
#include "errors.hpp"
#include "fakes.hpp"

using namespace cen;
using namespace cen::testing;

namespace {

// Plain listening socket on 127.0.0.1 holding a port for the test's lifetime.
class PortHolder {
public:
    PortHolder() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            ::listen(fd_, 1);
            socklen_t len = sizeof(addr);
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
            port_ = ntohs(addr.sin_port);
        }
    }
    ~PortHolder() { release(); }

    void release() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }
    int port() const { return port_; }

private:
    int fd_{-1};
    int port_{0};
};

int free_port() {
    PortHolder h;
    return h.port();
}

int port_of(const std::string& redirect_uri) {
    auto colon = redirect_uri.rfind(':');
    return std::stoi(redirect_uri.substr(colon + 1));
}

std::string wait_for_redirect(const FakeOAuth& oauth) {
    for (int i = 0; i < 500; ++i) {
        if (auto uri = oauth.redirect_uri()) return *uri;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return "";
}

AuthOptions console_options(std::chrono::seconds timeout = std::chrono::seconds(10)) {
    AuthOptions opts;
    opts.mode = AuthMode::kConsole;
    opts.timeout = timeout;
    return opts;
}

}  // namespace

TEST(Authorizer, AllCandidatePortsBusyIsConfigError) {
    PortHolder a, b;
    ASSERT_GT(a.port(), 0);
    ASSERT_GT(b.port(), 0);

    FakeOAuth oauth;
    Authorizer auth(oauth, [] { return false; });
    AuthOptions opts;
    opts.mode = AuthMode::kLocalServer;
    opts.open_browser = false;
    opts.candidate_ports = {a.port(), b.port()};

    try {
        auth.authorize(opts);
        FAIL() << "expected NoPortAvailableError";
    } catch (const NoPortAvailableError& e) {
        EXPECT_NE(std::string(e.what()).find("--console"), std::string::npos);
    }
    EXPECT_FALSE(oauth.redirect_uri().has_value());
}

TEST(Authorizer, NoPortAvailableIsAConfigError) {
    PortHolder a;
    EXPECT_THROW(bind_first_available({a.port()}, "127.0.0.1", "s"), ConfigError);
}

TEST(Authorizer, FirstFreeCandidateWins) {
    PortHolder busy;
    int open = free_port();
    auto listener = bind_first_available({busy.port(), open}, "127.0.0.1", "s");
    ASSERT_TRUE(listener);
    EXPECT_EQ(listener->port(), open);
}

TEST(Authorizer, ConsoleFlowExchangesCallbackCode) {
    FakeOAuth oauth;
    Authorizer auth(oauth, [] { return false; });
    AuthOptions opts = console_options();
    opts.login_hint = std::string("me@example.com");

    auto pending = std::async(std::launch::async, [&] { return auth.authorize(opts); });

    std::string redirect = wait_for_redirect(oauth);
    ASSERT_FALSE(redirect.empty());
    EXPECT_EQ(redirect.rfind("http://localhost:", 0), 0u);

    httplib::Client cli("127.0.0.1", port_of(redirect));
    auto wrong = cli.Get("/?code=stolen&state=not-the-state");
    ASSERT_TRUE(wrong);
    EXPECT_EQ(wrong->status, 400);

    std::string state;
    {
        std::lock_guard<std::mutex> lock(oauth.mu);
        state = oauth.last_state;
    }
    auto ok = cli.Get("/?code=abc&state=" + state);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);

    Credential c = pending.get();
    EXPECT_EQ(c.token, "access-abc");
    EXPECT_EQ(oauth.exchanged_redirect, redirect);
    ASSERT_TRUE(oauth.last_login_hint.has_value());
    EXPECT_EQ(*oauth.last_login_hint, "me@example.com");

    // Listener is gone once the flow returns.
    httplib::Client after("127.0.0.1", port_of(redirect));
    after.set_connection_timeout(1);
    EXPECT_FALSE(after.Get("/?code=late"));
}

TEST(Authorizer, TimesOutWithoutCallback) {
    FakeOAuth oauth;
    Authorizer auth(oauth, [] { return false; });
    EXPECT_THROW(auth.authorize(console_options(std::chrono::seconds(1))), AuthTimeoutError);
    EXPECT_TRUE(oauth.exchanged_code.empty());
}

TEST(Authorizer, InterruptCancelsWait) {
    FakeOAuth oauth;
    Authorizer auth(oauth, [] { return true; });
    try {
        auth.authorize(console_options());
        FAIL() << "expected AuthError";
    } catch (const AuthTimeoutError&) {
        FAIL() << "cancellation must not be reported as a timeout";
    } catch (const AuthError& e) {
        EXPECT_NE(std::string(e.what()).find("cancelled"), std::string::npos);
    }
}

TEST(Authorizer, DeniedConsentFails) {
    FakeOAuth oauth;
    Authorizer auth(oauth, [] { return false; });
    auto pending = std::async(std::launch::async, [&] { return auth.authorize(console_options()); });

    std::string redirect = wait_for_redirect(oauth);
    ASSERT_FALSE(redirect.empty());
    httplib::Client cli("127.0.0.1", port_of(redirect));
    auto res = cli.Get("/?error=access_denied");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    EXPECT_THROW(pending.get(), AuthError);
    EXPECT_TRUE(oauth.exchanged_code.empty());
}

TEST(CallbackListener, AcceptsExactlyOneCode) {
    CallbackListener listener("st");
    ASSERT_GT(listener.bind_any("127.0.0.1"), 0);
    listener.start();

    httplib::Client cli("127.0.0.1", listener.port());
    auto missing = cli.Get("/");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);

    auto first = cli.Get("/?code=one&state=st");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->status, 200);
    auto second = cli.Get("/?code=two&state=st");
    ASSERT_TRUE(second);
    EXPECT_EQ(second->status, 400);

    std::string code;
    EXPECT_EQ(listener.wait(std::chrono::milliseconds(100), [] { return false; }, code),
              CallbackListener::WaitResult::kCode);
    EXPECT_EQ(code, "one");
}
