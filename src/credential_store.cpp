#include "credential_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"

namespace cen {

const char* backend_to_string(Backend b) {
    switch (b) {
        case Backend::kKeyring: return "keyring";
        case Backend::kFile: return "file";
    }
    return "file";
}

std::optional<Backend> backend_from_string(const std::string& s) {
    if (s == "keyring") return Backend::kKeyring;
    if (s == "file") return Backend::kFile;
    return std::nullopt;
}

CredentialStore::CredentialStore(OAuthProvider& oauth, SecretStore& keyring, CredentialStoreOptions opts)
    : oauth_(oauth), keyring_(keyring), opts_(std::move(opts)) {}

std::optional<std::string> CredentialStore::read_raw(Backend backend) {
    if (backend == Backend::kKeyring) {
        auto secret = keyring_.get(kKeyringService, kKeyringAccount);
        if (secret && !secret->empty()) return secret;
        // save() lands in the file when the keyring is unavailable.
    }
    std::ifstream f(opts_.token_path);
    if (!f) return std::nullopt;
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::optional<Credential> CredentialStore::try_refresh(const Credential& cred, const std::string& origin) {
    try {
        return oauth_.refresh(cred);
    } catch (const AuthError& e) {
        std::cerr << "[WARN] Token refresh failed for " << origin << " credential: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<Credential> CredentialStore::materialize(const std::string& raw, const std::string& origin,
                                                     bool* refreshed) {
    if (refreshed) *refreshed = false;
    Credential cred;
    Status st = credential_from_json(raw, opts_.scopes, cred);
    if (!st.ok()) {
        std::cerr << "[WARN] Ignoring " << origin << " credential: " << st.message() << std::endl;
        return std::nullopt;
    }
    if (cred.valid()) return cred;
    if (!cred.can_refresh()) return std::nullopt;
    auto renewed = try_refresh(cred, origin);
    if (renewed && refreshed) *refreshed = true;
    return renewed;
}

std::optional<Credential> CredentialStore::load(Backend backend) {
    auto raw = read_raw(backend);
    if (!raw || raw->empty()) return std::nullopt;

    bool refreshed = false;
    auto cred = materialize(*raw, backend_to_string(backend), &refreshed);
    if (refreshed) {
        Status st = save(backend, *cred);
        if (!st.ok()) {
            std::cerr << "[WARN] Could not persist refreshed credential: " << st.message() << std::endl;
        }
    }
    return cred;
}

std::optional<Credential> CredentialStore::load_from_env() {
    for (const auto& name : opts_.env_vars) {
        const char* raw = std::getenv(name.c_str());
        if (raw && *raw) return materialize(raw, name);
    }
    return std::nullopt;
}

Status CredentialStore::write_file(const Credential& cred) {
    const std::string path = opts_.token_path;
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) return Status::io_error("cannot open " + path + " for writing: " + std::strerror(errno));

    // The mode above only applies to new files; tighten an existing one first.
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        Status st = Status::io_error("cannot restrict permissions on " + path + ": " + std::strerror(errno));
        ::close(fd);
        return st;
    }

    const std::string json = cred.to_json();
    size_t off = 0;
    while (off < json.size()) {
        ssize_t n = ::write(fd, json.data() + off, json.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            Status st = Status::io_error("failed writing " + path + ": " + std::strerror(errno));
            ::close(fd);
            return st;
        }
        off += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) return Status::io_error("failed closing " + path + ": " + std::strerror(errno));
    return Status::ok_status();
}

Status CredentialStore::save(Backend backend, const Credential& cred) {
    if (backend == Backend::kFile) return write_file(cred);

    Status st = keyring_.set(kKeyringService, kKeyringAccount, cred.to_json());
    if (st.ok()) return st;

    std::cerr << "[WARN] Keyring unavailable (" << st.message() << "), storing credential in "
              << opts_.token_path << std::endl;
    return write_file(cred);
}

Credential CredentialStore::authorize_and_save(Backend backend, const ReauthorizeFn& reauthorize) {
    Credential fresh = reauthorize();
    if (!fresh.valid()) throw AuthError("authorization produced an unusable credential");
    Status st = save(backend, fresh);
    if (!st.ok()) {
        std::cerr << "[WARN] Credential obtained but not persisted: " << st.message() << std::endl;
    }
    return fresh;
}

Credential CredentialStore::ensure_valid(Backend backend, const ReauthorizeFn& reauthorize, bool force) {
    std::lock_guard<std::mutex> lock(cache_mu_);

    if (!force && cached_) {
        if (cached_->valid()) return *cached_;
        std::optional<Credential> renewed;
        if (cached_->can_refresh()) renewed = try_refresh(*cached_, "cached");
        cached_.reset();
        if (renewed) {
            cached_ = renewed;
            return *cached_;
        }
    }

    std::optional<Credential> cred;
    if (!force) {
        cred = load_from_env();
        if (!cred) cred = load(backend);
    }
    if (!cred) cred = authorize_and_save(backend, reauthorize);

    cached_ = cred;
    return *cached_;
}

Credential CredentialStore::login(Backend backend, const ReauthorizeFn& reauthorize, bool force) {
    std::lock_guard<std::mutex> lock(cache_mu_);

    std::optional<Credential> cred;
    if (!force) cred = load(backend);
    if (!cred) cred = authorize_and_save(backend, reauthorize);

    cached_ = cred;
    return *cached_;
}

}  // namespace cen
