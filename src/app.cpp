#include "app.hpp"

#include <iostream>

#include "errors.hpp"
#include "running_stats.hpp"
#include "summary_scheduler.hpp"

namespace cen {

namespace {

OAuthClientConfig oauth_config(const AppConfig& cfg) {
    OAuthClientConfig oc;
    oc.client_id = cfg.client_id;
    oc.client_secret = cfg.client_secret;
    oc.scopes = cfg.scopes;
    return oc;
}

CredentialStoreOptions store_options(const AppConfig& cfg) {
    CredentialStoreOptions so;
    so.token_path = cfg.token_path;
    so.scopes = cfg.scopes;
    return so;
}

}  // namespace

LoopStats run_monitor_loop(MotionSampler& sampler, NotificationDispatcher& dispatcher) {
    LoopStats st;
    while (auto ev = sampler.next()) {
        st.events++;
        try {
            if (dispatcher.on_event(*ev) == DispatchResult::kSuppressed) {
                st.suppressed++;
                continue;
            }
        } catch (const SendError& e) {
            st.failed++;
            std::cerr << "[WARN] " << e.what() << std::endl;
            continue;
        }
        st.sent++;
        std::cout << "[INFO] Notification sent (area " << ev->motion_area << ", contours " << ev->num_contours
                  << ")" << std::endl;
    }
    return st;
}

App::App(const AppConfig& cfg)
    : cfg_(cfg),
      oauth_(oauth_config(cfg)),
      store_(oauth_, keyring_, store_options(cfg)),
      authorizer_(oauth_) {}

Backend App::backend() const {
    return backend_from_string(cfg_.storage).value_or(Backend::kKeyring);
}

AuthOptions App::auth_options() const {
    AuthOptions opts;
    opts.mode = cfg_.console ? AuthMode::kConsole : AuthMode::kLocalServer;
    opts.open_browser = cfg_.open_browser;
    opts.login_hint = cfg_.login_hint;
    return opts;
}

Credential App::ensure_credential() {
    return store_.ensure_valid(backend(), [this] { return authorizer_.authorize(auth_options()); });
}

int App::run() {
    switch (cfg_.command) {
        case Command::kLogin: return login();
        case Command::kExportToken: return export_token();
        case Command::kTestEmail: return test_email();
        case Command::kMonitor: return monitor();
    }
    return 1;
}

int App::login() {
    store_.login(backend(), [this] { return authorizer_.authorize(auth_options()); }, cfg_.force);
    std::cout << "Login completed and credentials stored." << std::endl;
    return 0;
}

int App::export_token() {
    std::cout << ensure_credential().to_json() << std::endl;
    return 0;
}

int App::test_email() {
    ensure_credential();
    GmailTransport mail([this] { return ensure_credential().token; });

    MailMessage msg;
    msg.to = cfg_.to;
    msg.from = cfg_.sender;
    msg.subject = cfg_.subject;
    msg.body = cfg_.body;
    std::string id = mail.send(msg);
    std::cout << "Test email sent." << (id.empty() ? "" : " (id " + id + ")") << std::endl;
    return 0;
}

int App::monitor() {
    ensure_credential();
    GmailTransport mail([this] { return ensure_credential().token; });

    SamplerConfig sc;
    sc.sensitivity = cfg_.sensitivity;
    MotionSampler sampler(std::make_unique<CameraSource>(cfg_.device), sc);

    RunningStats stats;
    DispatchConfig dc;
    dc.to = cfg_.to;
    dc.sender = cfg_.sender;
    dc.subject = cfg_.subject;
    dc.body = cfg_.body;
    dc.attach_snapshot = cfg_.snapshot;
    dc.min_interval_seconds = cfg_.min_interval_seconds;
    dc.anomaly_threshold = cfg_.anomaly_threshold;
    NotificationDispatcher dispatcher(dc, mail, stats);

    SummaryConfig sum;
    sum.enabled = cfg_.hourly_summary;
    sum.period = std::chrono::seconds(cfg_.summary_period_seconds);
    sum.to = cfg_.to;
    sum.sender = cfg_.sender;
    SummaryScheduler scheduler(stats, mail, sum);
    scheduler.start();

    std::cout << "[INFO] Starting motion detection on device " << cfg_.device << ". Press Ctrl+C to stop."
              << std::endl;
    LoopStats st = run_monitor_loop(sampler, dispatcher);

    std::cout << "[INFO] Stopping monitor..." << std::endl;
    sampler.close();
    scheduler.stop();
    std::cout << "[INFO] Stopped: " << st.events << " events, " << st.sent << " sent, " << st.suppressed
              << " suppressed, " << st.failed << " failed" << std::endl;
    return 0;
}

}  // namespace cen
