#pragma once

#include <cstdint>
#include <memory>

#include "authorizer.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "motion_sampler.hpp"
#include "notification_dispatcher.hpp"
#include "oauth_client.hpp"
#include "secret_store.hpp"

namespace cen {

struct LoopStats {
    std::uint64_t events{0};
    std::uint64_t sent{0};
    std::uint64_t suppressed{0};
    std::uint64_t failed{0};
};

// Foreground pipeline: pull events and dispatch each one fully before the
// next frame. A failed send is logged and the loop continues.
LoopStats run_monitor_loop(MotionSampler& sampler, NotificationDispatcher& dispatcher);

class App {
public:
    explicit App(const AppConfig& cfg);

    // Process exit code. ConfigError and AuthError propagate.
    int run();

private:
    int login();
    int export_token();
    int test_email();
    int monitor();

    Backend backend() const;
    AuthOptions auth_options() const;
    Credential ensure_credential();

    AppConfig cfg_;
    GoogleOAuthClient oauth_;
    SecretToolStore keyring_;
    CredentialStore store_;
    Authorizer authorizer_;
};

}  // namespace cen
