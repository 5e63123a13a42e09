#include "secret_store.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace cen {

namespace {

// Single-quote for /bin/sh.
std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

}  // namespace

SecretToolStore::SecretToolStore(std::string tool) : tool_(std::move(tool)) {}

std::optional<std::string> SecretToolStore::get(const std::string& service, const std::string& account) {
    std::string cmd = tool_ + " lookup service " + shell_quote(service) + " username " + shell_quote(account) +
                      " 2>/dev/null";
    FILE* p = popen(cmd.c_str(), "r");
    if (!p) return std::nullopt;
    std::array<char, 4096> buf{};
    std::string out;
    while (fgets(buf.data(), static_cast<int>(buf.size()), p)) {
        out += buf.data();
    }
    int rc = pclose(p);
    if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) return std::nullopt;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    if (out.empty()) return std::nullopt;
    return out;
}

Status SecretToolStore::set(const std::string& service, const std::string& account, const std::string& secret) {
    std::string cmd = tool_ + " store --label=" + shell_quote(service) + " service " + shell_quote(service) +
                      " username " + shell_quote(account) + " >/dev/null 2>&1";
    FILE* p = popen(cmd.c_str(), "w");
    if (!p) return Status::unavailable("cannot start " + tool_);
    size_t written = fwrite(secret.data(), 1, secret.size(), p);
    int rc = pclose(p);
    if (written != secret.size()) return Status::io_error("short write to " + tool_);
    if (rc == -1 || !WIFEXITED(rc)) return Status::unavailable(tool_ + " terminated abnormally");
    if (WEXITSTATUS(rc) != 0) {
        return Status::unavailable(tool_ + " exited with status " + std::to_string(WEXITSTATUS(rc)));
    }
    return Status::ok_status();
}

}  // namespace cen
