#include "libssh2_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <optional>
#include <vector>

constexpr int EAGAIN_SLEEP_MS = 10;

// Retry a libssh2 call until it stops answering EAGAIN.
template <typename Fn>
static long retry_eagain(Fn fn) {
    long rc;
    while ((rc = static_cast<long>(fn())) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
    return rc;
}

static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return msg ? std::string(msg, static_cast<std::size_t>(len)) : "unknown libssh2 error";
}

// Session + socket shared by the client and everything opened from it.
struct Libssh2Handle {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHFAKE_INVALID_SOCKET;
    bool active = false;

    ~Libssh2Handle() { shutdown(); }

    void shutdown() {
        active = false;
        if (session) {
            retry_eagain([&] { return libssh2_session_disconnect(session, "Normal disconnection"); });
            libssh2_session_free(session);
            session = nullptr;
        }
        if (sock != SSHFAKE_INVALID_SOCKET) {
            platform::close_socket(sock);
            sock = SSHFAKE_INVALID_SOCKET;
        }
    }
};

// ── Channel ────────────────────────────────────────────────────

class Libssh2Channel : public Channel {
public:
    Libssh2Channel(std::shared_ptr<Libssh2Handle> handle, LIBSSH2_CHANNEL* channel)
        : handle_(std::move(handle)), channel_(channel) {}

    ~Libssh2Channel() override { close(); }

    Result<void> exec_command(const std::string& command) override {
        if (!channel_) return Result<void>::Err("Channel is closed");
        long rc = retry_eagain([&] { return libssh2_channel_exec(channel_, command.c_str()); });
        if (rc != 0) return Result<void>::Err(last_error(handle_->session));
        return Result<void>::Ok();
    }

    std::string recv(std::size_t n) override { return read(n, 0); }
    std::string recv_stderr(std::size_t n) override { return read(n, SSH_EXTENDED_DATA_STDERR); }

    std::size_t sendall(const std::string& data) override {
        std::size_t sent = 0;
        while (channel_ && sent < data.size()) {
            ssize_t w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
            if (w == LIBSSH2_ERROR_EAGAIN) {
                platform::sleep_ms(EAGAIN_SLEEP_MS);
                continue;
            }
            if (w < 0) break;
            sent += static_cast<std::size_t>(w);
        }
        return sent;
    }

    void send_eof() override {
        if (!channel_) return;
        retry_eagain([&] { return libssh2_channel_send_eof(channel_); });
    }

    bool exit_status_ready() override {
        return !channel_ || libssh2_channel_eof(channel_) != 0;
    }

    int recv_exit_status() override {
        if (exit_status_) return *exit_status_;
        if (!channel_) return -1;
        long rc = retry_eagain([&] { return libssh2_channel_close(channel_); });
        if (rc == 0) {
            retry_eagain([&] { return libssh2_channel_wait_closed(channel_); });
            exit_status_ = libssh2_channel_get_exit_status(channel_);
        } else {
            exit_status_ = -1;
        }
        return *exit_status_;
    }

    void close() override {
        if (!channel_) return;
        retry_eagain([&] { return libssh2_channel_free(channel_); });
        channel_ = nullptr;
    }

private:
    std::shared_ptr<Libssh2Handle> handle_;
    LIBSSH2_CHANNEL* channel_;
    std::optional<int> exit_status_;

    std::string read(std::size_t n, int stream_id) {
        if (!channel_ || n == 0) return "";
        std::vector<char> buf(n);
        ssize_t got = libssh2_channel_read_ex(channel_, stream_id, buf.data(), buf.size());
        if (got <= 0) return "";
        return std::string(buf.data(), static_cast<std::size_t>(got));
    }
};

// ── Transport ──────────────────────────────────────────────────

class Libssh2Transport : public Transport {
public:
    explicit Libssh2Transport(std::shared_ptr<Libssh2Handle> handle)
        : handle_(std::move(handle)) {}

    bool is_active() override {
        return handle_->active && handle_->session != nullptr;
    }

    std::shared_ptr<Channel> open_session() override {
        if (!is_active()) return nullptr;
        LIBSSH2_CHANNEL* ch = nullptr;
        while ((ch = libssh2_channel_open_session(handle_->session)) == nullptr) {
            if (libssh2_session_last_errno(handle_->session) != LIBSSH2_ERROR_EAGAIN) {
                sshfake_log(fmt::format("libssh2: open_session failed: {}", last_error(handle_->session)));
                return nullptr;
            }
            platform::sleep_ms(EAGAIN_SLEEP_MS);
        }
        return std::make_shared<Libssh2Channel>(handle_, ch);
    }

private:
    std::shared_ptr<Libssh2Handle> handle_;
};

// ── SFTP ───────────────────────────────────────────────────────

class Libssh2SFTP : public SFTPClient {
public:
    Libssh2SFTP(std::shared_ptr<Libssh2Handle> handle, LIBSSH2_SFTP* sftp)
        : handle_(std::move(handle)), sftp_(sftp) {}

    ~Libssh2SFTP() override {
        retry_eagain([&] { return libssh2_sftp_shutdown(sftp_); });
    }

    std::string getcwd() override {
        char buf[1024];
        long n = retry_eagain([&] {
            return libssh2_sftp_realpath(sftp_, ".", buf, static_cast<unsigned int>(sizeof(buf)));
        });
        if (n <= 0) return "";
        return std::string(buf, static_cast<std::size_t>(n));
    }

    Result<SFTPAttributes> stat(const std::string& path) override {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        long rc = retry_eagain([&] { return libssh2_sftp_stat(sftp_, path.c_str(), &attrs); });
        if (rc != 0) {
            return Result<SFTPAttributes>::Err(fmt::format("stat {} failed: {}", path, last_error(handle_->session)));
        }
        SFTPAttributes out;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
            out.mode = static_cast<std::uint32_t>(attrs.permissions);
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            out.size = static_cast<std::uint64_t>(attrs.filesize);
        return Result<SFTPAttributes>::Ok(out);
    }

    Result<void> get(const std::string& remote, const std::string& local) override {
        LIBSSH2_SFTP_HANDLE* fh = open_remote(remote, LIBSSH2_FXF_READ, 0);
        if (!fh) return Result<void>::Err(fmt::format("Cannot open remote {}: {}", remote, last_error(handle_->session)));

        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        if (!out) {
            retry_eagain([&] { return libssh2_sftp_close(fh); });
            return Result<void>::Err("Cannot write local file: " + local);
        }

        std::vector<char> buf(SFTP_COPY_BUF_SIZE);
        while (true) {
            long n = retry_eagain([&] { return libssh2_sftp_read(fh, buf.data(), buf.size()); });
            if (n == 0) break;
            if (n < 0) {
                retry_eagain([&] { return libssh2_sftp_close(fh); });
                return Result<void>::Err(fmt::format("Read error on {}", remote));
            }
            out.write(buf.data(), n);
        }
        retry_eagain([&] { return libssh2_sftp_close(fh); });
        return Result<void>::Ok();
    }

    Result<void> put(const std::string& local, const std::string& remote) override {
        std::ifstream in(local, std::ios::binary);
        if (!in) return Result<void>::Err("Cannot read local file: " + local);

        LIBSSH2_SFTP_HANDLE* fh = open_remote(
            remote, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644);
        if (!fh) return Result<void>::Err(fmt::format("Cannot open remote {}: {}", remote, last_error(handle_->session)));

        std::vector<char> buf(SFTP_COPY_BUF_SIZE);
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            std::size_t len = static_cast<std::size_t>(in.gcount());
            std::size_t sent = 0;
            while (sent < len) {
                long w = retry_eagain([&] { return libssh2_sftp_write(fh, buf.data() + sent, len - sent); });
                if (w < 0) {
                    retry_eagain([&] { return libssh2_sftp_close(fh); });
                    return Result<void>::Err(fmt::format("Write error on {}", remote));
                }
                sent += static_cast<std::size_t>(w);
            }
        }
        retry_eagain([&] { return libssh2_sftp_close(fh); });
        return Result<void>::Ok();
    }

    Result<void> chmod(const std::string& path, std::uint32_t mode) override {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
        attrs.permissions = mode;
        long rc = retry_eagain([&] { return libssh2_sftp_setstat(sftp_, path.c_str(), &attrs); });
        if (rc != 0) return Result<void>::Err(fmt::format("chmod {} failed: {}", path, last_error(handle_->session)));
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<Libssh2Handle> handle_;
    LIBSSH2_SFTP* sftp_;

    LIBSSH2_SFTP_HANDLE* open_remote(const std::string& path, unsigned long flags, long mode) {
        LIBSSH2_SFTP_HANDLE* fh = nullptr;
        while ((fh = libssh2_sftp_open(sftp_, path.c_str(), flags, mode)) == nullptr) {
            if (libssh2_session_last_errno(handle_->session) != LIBSSH2_ERROR_EAGAIN) return nullptr;
            platform::sleep_ms(EAGAIN_SLEEP_MS);
        }
        return fh;
    }
};

// ── Client ─────────────────────────────────────────────────────

Libssh2Client::Libssh2Client() : handle_(std::make_shared<Libssh2Handle>()) {
    static bool initialized = false;
    if (!initialized) {
        libssh2_init(0);
        initialized = true;
    }
}

Libssh2Client::~Libssh2Client() {
    transport_.reset();
    handle_->active = false;
    handle_.reset();
}

Result<void> Libssh2Client::connect(const ConnectTarget& target) {
    if (handle_->active) return Result<void>::Ok();

    auto sock = platform::connect_tcp(target.host, target.port, target.timeout);
    if (sock.is_err()) return Result<void>::Err(sock.error);
    handle_->sock = sock.value;

    handle_->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!handle_->session) {
        handle_->shutdown();
        return Result<void>::Err("Failed to create SSH session");
    }
    libssh2_session_set_blocking(handle_->session, 0);

    long rc = retry_eagain([&] { return libssh2_session_handshake(handle_->session, handle_->sock); });
    if (rc != 0) {
        std::string err = "SSH handshake failed: " + last_error(handle_->session);
        handle_->shutdown();
        return Result<void>::Err(err);
    }

    auto auth = authenticate(target);
    if (auth.is_err()) {
        handle_->shutdown();
        return auth;
    }

    handle_->active = true;
    transport_ = std::make_shared<Libssh2Transport>(handle_);
    sshfake_log(fmt::format("libssh2: connected to {}@{}:{}", target.user, target.host, target.port));
    return Result<void>::Ok();
}

Result<void> Libssh2Client::authenticate(const ConnectTarget& target) {
    LIBSSH2_SESSION* session = handle_->session;
    const char* user = target.user.c_str();

    if (target.key_path) {
        const char* passphrase = target.password ? target.password->c_str() : nullptr;
        long rc = retry_eagain([&] {
            return libssh2_userauth_publickey_fromfile(session, user, nullptr,
                                                       target.key_path->c_str(), passphrase);
        });
        if (rc == 0) return Result<void>::Ok();
        sshfake_log(fmt::format("libssh2: key auth failed: {}", last_error(session)));
    }

    if (target.password) {
        long rc = retry_eagain([&] {
            return libssh2_userauth_password(session, user, target.password->c_str());
        });
        if (rc == 0) return Result<void>::Ok();
        sshfake_log(fmt::format("libssh2: password auth failed: {}", last_error(session)));
    }

    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (agent) {
        bool ok = false;
        if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (!ok && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                long rc = retry_eagain([&] { return libssh2_agent_userauth(agent, user, identity); });
                ok = (rc == 0);
                prev = identity;
            }
            libssh2_agent_disconnect(agent);
        }
        libssh2_agent_free(agent);
        if (ok) return Result<void>::Ok();
    }

    return Result<void>::Err(fmt::format("Authentication failed for {}@{}", target.user, target.host));
}

std::shared_ptr<Transport> Libssh2Client::get_transport() {
    return transport_;
}

std::shared_ptr<SFTPClient> Libssh2Client::open_sftp() {
    if (!handle_->active) return nullptr;
    LIBSSH2_SFTP* sftp = nullptr;
    while ((sftp = libssh2_sftp_init(handle_->session)) == nullptr) {
        if (libssh2_session_last_errno(handle_->session) != LIBSSH2_ERROR_EAGAIN) {
            sshfake_log(fmt::format("libssh2: sftp init failed: {}", last_error(handle_->session)));
            return nullptr;
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
    return std::make_shared<Libssh2SFTP>(handle_, sftp);
}

// Channels and SFTP sessions hold the old handle; it shuts down once the last of them is gone.
void Libssh2Client::close() {
    transport_.reset();
    handle_->active = false;
    handle_ = std::make_shared<Libssh2Handle>();
}

ClientFactory make_libssh2_client_factory() {
    return []() -> std::shared_ptr<SSHClient> {
        return std::make_shared<Libssh2Client>();
    };
}
