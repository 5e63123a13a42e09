#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

#include "credential_store.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace cen {

namespace {

bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

int to_int(const char* flag, const char* value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (value[used] != '\0') throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("Invalid integer for ") + flag + ": " + value);
    }
}

int non_negative(const char* flag, int v) {
    if (v < 0) throw ConfigError(std::string(flag) + " must not be negative");
    return v;
}

Command parse_command(const std::string& s) {
    if (s == "login") return Command::kLogin;
    if (s == "export-token") return Command::kExportToken;
    if (s == "test-email") return Command::kTestEmail;
    if (s == "monitor") return Command::kMonitor;
    throw ConfigError("Unknown command: " + s + "\n" + usage());
}

}  // namespace

std::string usage() {
    return "Usage: cen <login|export-token|test-email|monitor> [options]\n"
           "  common:   --client-id <id> --client-secret <secret> [--scopes <a,b>]\n"
           "            [--storage keyring|file] [--token-path <file>]\n"
           "  login:    [--force] [--console] [--open-browser|--no-open-browser] [--login-hint <email>]\n"
           "  mail:     --to <email> [--sender <email>] [--subject <s>] [--body <s>]\n"
           "  monitor:  [--device-index <n|url>] [--sensitivity <area>] [--min-interval-seconds <n>]\n"
           "            [--snapshot] [--hourly-summary|--no-hourly-summary]\n"
           "            [--summary-period-seconds <n>] [--anomaly-threshold <contours>]\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* v = std::getenv("GOOGLE_CLIENT_ID")) cfg.client_id = v;
    if (const char* v = std::getenv("GOOGLE_CLIENT_SECRET")) cfg.client_secret = v;
    if (const char* v = std::getenv("CEN_TOKEN_STORAGE")) cfg.storage = v;
    if (const char* v = std::getenv("CEN_TOKEN_PATH")) cfg.token_path = v;
    if (const char* v = std::getenv("GMAIL_LOGIN_HINT"); v && *v) cfg.login_hint = std::string(v);
    if (const char* v = std::getenv("GMAIL_SENDER")) cfg.sender = v;
    if (const char* v = std::getenv("CEN_DEVICE")) cfg.device = v;

    bool have_command = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 < argc) return argv[++i];
            throw ConfigError(std::string("Missing value for ") + arg);
        };

        if (arg_eq(arg, "--help") || arg_eq(arg, "-h")) {
            std::cout << usage();
            std::exit(0);
        } else if (arg_eq(arg, "--client-id")) {
            cfg.client_id = next();
        } else if (arg_eq(arg, "--client-secret")) {
            cfg.client_secret = next();
        } else if (arg_eq(arg, "--scopes")) {
            cfg.scopes = split_list(next(), ',');
        } else if (arg_eq(arg, "--storage")) {
            cfg.storage = next();
        } else if (arg_eq(arg, "--token-path")) {
            cfg.token_path = next();
        } else if (arg_eq(arg, "--force")) {
            cfg.force = true;
        } else if (arg_eq(arg, "--console")) {
            cfg.console = true;
        } else if (arg_eq(arg, "--open-browser")) {
            cfg.open_browser = true;
        } else if (arg_eq(arg, "--no-open-browser")) {
            cfg.open_browser = false;
        } else if (arg_eq(arg, "--login-hint")) {
            cfg.login_hint = std::string(next());
        } else if (arg_eq(arg, "--to")) {
            cfg.to = next();
        } else if (arg_eq(arg, "--sender")) {
            cfg.sender = next();
        } else if (arg_eq(arg, "--subject")) {
            cfg.subject = next();
        } else if (arg_eq(arg, "--body")) {
            cfg.body = next();
        } else if (arg_eq(arg, "--device-index")) {
            cfg.device = next();
        } else if (arg_eq(arg, "--sensitivity")) {
            cfg.sensitivity = non_negative(arg, to_int(arg, next()));
        } else if (arg_eq(arg, "--min-interval-seconds")) {
            cfg.min_interval_seconds = non_negative(arg, to_int(arg, next()));
        } else if (arg_eq(arg, "--snapshot")) {
            cfg.snapshot = true;
        } else if (arg_eq(arg, "--hourly-summary")) {
            cfg.hourly_summary = true;
        } else if (arg_eq(arg, "--no-hourly-summary")) {
            cfg.hourly_summary = false;
        } else if (arg_eq(arg, "--summary-period-seconds")) {
            cfg.summary_period_seconds = to_int(arg, next());
            if (cfg.summary_period_seconds <= 0) throw ConfigError("--summary-period-seconds must be positive");
        } else if (arg_eq(arg, "--anomaly-threshold")) {
            cfg.anomaly_threshold = non_negative(arg, to_int(arg, next()));
        } else if (arg[0] != '-' && !have_command) {
            cfg.command = parse_command(arg);
            have_command = true;
        } else {
            throw ConfigError(std::string("Unknown option: ") + arg + "\n" + usage());
        }
    }

    if (!have_command) throw ConfigError("No command given\n" + usage());
    if (cfg.client_id.empty()) throw ConfigError("Missing client id (--client-id or GOOGLE_CLIENT_ID)");
    if (cfg.client_secret.empty()) {
        throw ConfigError("Missing client secret (--client-secret or GOOGLE_CLIENT_SECRET)");
    }
    if (!backend_from_string(cfg.storage)) {
        throw ConfigError("Invalid storage backend '" + cfg.storage + "' (expected keyring or file)");
    }
    if (cfg.scopes.empty()) throw ConfigError("At least one OAuth scope is required");
    if ((cfg.command == Command::kTestEmail || cfg.command == Command::kMonitor) && cfg.to.empty()) {
        throw ConfigError("Missing recipient (--to)");
    }

    if (cfg.subject.empty()) {
        cfg.subject = cfg.command == Command::kTestEmail ? "CEN test email" : "CEN motion detected";
    }
    if (cfg.body.empty()) {
        cfg.body = cfg.command == Command::kTestEmail ? "Hello from CEN" : "Motion was detected by your camera.";
    }
    return cfg;
}

}  // namespace cen
