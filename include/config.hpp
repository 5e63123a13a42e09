#pragma once

#include <optional>
#include <string>
#include <vector>

#include "credential.hpp"

namespace cen {

enum class Command { kLogin, kExportToken, kTestEmail, kMonitor };

struct AppConfig {
    Command command{Command::kMonitor};

    // OAuth / token storage
    std::string client_id;
    std::string client_secret;
    std::vector<std::string> scopes{kGmailSendScope};
    std::string storage{"keyring"};   // keyring | file
    std::string token_path{"token.json"};
    bool force{false};
    bool console{false};
    bool open_browser{true};
    std::optional<std::string> login_hint;

    // Mail
    std::string to;
    std::string sender;
    std::string subject;              // per-command default when empty
    std::string body;

    // Monitoring
    std::string device{"0"};          // camera index as string or stream URL
    int sensitivity{500};
    int min_interval_seconds{60};
    bool snapshot{false};
    bool hourly_summary{true};
    int summary_period_seconds{3600};
    int anomaly_threshold{5};
};

// Environment first, then flags. Throws ConfigError on missing or malformed
// values; --help prints usage and exits.
AppConfig parse_args(int argc, char** argv);

std::string usage();

}  // namespace cen
