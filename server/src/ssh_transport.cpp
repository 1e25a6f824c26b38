#include "sftpbridge/server/ssh_transport.hpp"

#include <asio/connect.hpp>
#include <asio/post.hpp>
#include <asio/socket_base.hpp>

#include <array>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#if defined(__linux__) || defined(__APPLE__)
#include <netinet/in.h>
#include <netinet/tcp.h>
#endif

namespace sftpbridge::server
{

    namespace
    {

        constexpr const char *kHostKeyMethods =
            "ssh-ed25519,ecdsa-sha2-nistp256,ecdsa-sha2-nistp384,ecdsa-sha2-nistp521,rsa-sha2-512,rsa-sha2-256";
        constexpr const char *kCipherMethods =
            "aes128-gcm@openssh.com,aes256-gcm@openssh.com,aes128-ctr,aes192-ctr,aes256-ctr";

        constexpr std::size_t kCommandReadChunk = 16 * 1024;
        constexpr long kDirectoryMode = 0755;
        constexpr long kFileMode = 0644;

        void ensure_libssh2_init()
        {
            static std::once_flag once;
            std::call_once(once, []
                           {
                if (libssh2_init(0) != 0)
                {
                    throw std::runtime_error("libssh2 initialization failed");
                } });
        }

        bool is_socket_failure(long rc) noexcept
        {
            return rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV ||
                   rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT;
        }

        bool is_remote_close(long rc) noexcept
        {
            return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_RECV;
        }

        std::string_view sftp_status_text(unsigned long status) noexcept
        {
            switch (status)
            {
            case LIBSSH2_FX_EOF:
                return "End of file";
            case LIBSSH2_FX_NO_SUCH_FILE:
                return "No such file";
            case LIBSSH2_FX_PERMISSION_DENIED:
                return "Permission denied";
            case LIBSSH2_FX_FAILURE:
                return "Failure";
            case LIBSSH2_FX_BAD_MESSAGE:
                return "Bad message";
            case LIBSSH2_FX_NO_CONNECTION:
                return "No connection";
            case LIBSSH2_FX_CONNECTION_LOST:
                return "Connection lost";
            case LIBSSH2_FX_OP_UNSUPPORTED:
                return "Operation not supported";
            case LIBSSH2_FX_INVALID_HANDLE:
                return "Invalid handle";
            case LIBSSH2_FX_NO_SUCH_PATH:
                return "No such path";
            case LIBSSH2_FX_FILE_ALREADY_EXISTS:
                return "File already exists";
            case LIBSSH2_FX_WRITE_PROTECT:
                return "Write protected";
            case LIBSSH2_FX_NO_MEDIA:
                return "No media";
            case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
                return "No space left on filesystem";
            case LIBSSH2_FX_QUOTA_EXCEEDED:
                return "Quota exceeded";
            case LIBSSH2_FX_UNKNOWN_PRINCIPAL:
                return "Unknown principal";
            case LIBSSH2_FX_LOCK_CONFLICT:
                return "Lock conflict";
            case LIBSSH2_FX_DIR_NOT_EMPTY:
                return "Directory not empty";
            case LIBSSH2_FX_NOT_A_DIRECTORY:
                return "Not a directory";
            case LIBSSH2_FX_INVALID_FILENAME:
                return "Invalid filename";
            case LIBSSH2_FX_LINK_LOOP:
                return "Too many symbolic links";
            default:
                return "Unknown SFTP status";
            }
        }

        RemoteAttributes to_attributes(const LIBSSH2_SFTP_ATTRIBUTES &attrs)
        {
            RemoteAttributes result{};
            if ((attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) != 0)
            {
                result.size = attrs.filesize;
            }
            if ((attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) != 0)
            {
                result.modified_time = attrs.mtime;
            }
            if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) != 0)
            {
                result.permissions = static_cast<std::uint32_t>(attrs.permissions);
            }
            return result;
        }

        unsigned int path_length(const std::string &path)
        {
            return static_cast<unsigned int>(path.size());
        }

        // Owns a libssh2 session after its transport has let go of it and closes it without
        // blocking the loop. sftp_shutdown, disconnect and free are retried on EAGAIN like any
        // other operation. When the deadline passes first, the socket is shut down so the
        // remaining calls fail at once instead of waiting on the peer.
        class SessionShutdown : public std::enable_shared_from_this<SessionShutdown>
        {
        public:
            SessionShutdown(asio::ip::tcp::socket socket, LIBSSH2_SESSION *session, LIBSSH2_SFTP *sftp,
                            bool graceful)
                : socket_(std::move(socket)),
                  deadline_(socket_.get_executor()),
                  session_(session),
                  sftp_(sftp),
                  graceful_(graceful) {}

            ~SessionShutdown()
            {
                force();
            }

            SessionShutdown(const SessionShutdown &) = delete;
            SessionShutdown &operator=(const SessionShutdown &) = delete;

            void start(std::chrono::milliseconds timeout)
            {
                deadline_.expires_after(timeout);
                deadline_.async_wait([self = shared_from_this()](const std::error_code &ec)
                                     {
                    if (!ec && self->session_ != nullptr)
                    {
                        spdlog::debug("SSH shutdown timed out, dropping the session");
                        self->force();
                    } });
                advance();
            }

        private:
            long step()
            {
                if (sftp_ != nullptr)
                {
                    const auto rc = libssh2_sftp_shutdown(sftp_);
                    if (rc == LIBSSH2_ERROR_EAGAIN)
                    {
                        return rc;
                    }
                    sftp_ = nullptr;
                }
                if (graceful_)
                {
                    const auto rc = libssh2_session_disconnect(session_, "Normal Shutdown");
                    if (rc == LIBSSH2_ERROR_EAGAIN)
                    {
                        return rc;
                    }
                    graceful_ = false;
                }
                const auto rc = libssh2_session_free(session_);
                if (rc != LIBSSH2_ERROR_EAGAIN)
                {
                    session_ = nullptr;
                }
                return rc;
            }

            void advance()
            {
                if (session_ == nullptr)
                {
                    return;
                }
                if (step() == LIBSSH2_ERROR_EAGAIN)
                {
                    wait();
                    return;
                }
                finish();
            }

            void wait()
            {
                const int directions = libssh2_session_block_directions(session_);
                auto fired = std::make_shared<bool>(false);
                auto resume = [self = shared_from_this(), fired](const std::error_code &ec)
                {
                    if (*fired || self->session_ == nullptr)
                    {
                        return;
                    }
                    *fired = true;
                    std::error_code ignored;
                    self->socket_.cancel(ignored);
                    if (ec && ec != asio::error::operation_aborted)
                    {
                        self->force();
                        return;
                    }
                    self->advance();
                };
                const bool outbound = (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) != 0;
                if ((directions & LIBSSH2_SESSION_BLOCK_INBOUND) != 0 || !outbound)
                {
                    socket_.async_wait(asio::ip::tcp::socket::wait_read, resume);
                }
                if (outbound)
                {
                    socket_.async_wait(asio::ip::tcp::socket::wait_write, resume);
                }
            }

            void force()
            {
                if (session_ != nullptr)
                {
                    std::error_code ignored;
                    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                    libssh2_session_set_blocking(session_, 1);
                    if (sftp_ != nullptr)
                    {
                        libssh2_sftp_shutdown(sftp_);
                        sftp_ = nullptr;
                    }
                    libssh2_session_free(session_);
                    session_ = nullptr;
                }
                finish();
            }

            void finish()
            {
                std::error_code ignored;
                deadline_.cancel();
                socket_.close(ignored);
            }

            asio::ip::tcp::socket socket_;
            asio::steady_timer deadline_;
            LIBSSH2_SESSION *session_;
            LIBSSH2_SFTP *sftp_;
            bool graceful_;
        };

    } // namespace

    std::error_code configure_keepalive(asio::ip::tcp::socket &socket, const TransportSettings &settings)
    {
        std::error_code ec;
        if (settings.keepalive_interval.count() <= 0)
        {
            return ec;
        }
        socket.set_option(asio::socket_base::keep_alive(true), ec);
        if (ec)
        {
            return ec;
        }
        const auto interval = static_cast<int>(settings.keepalive_interval.count());
        const auto count = settings.keepalive_count_max > 0 ? settings.keepalive_count_max : 1;
#if defined(__linux__)
        socket.set_option(asio::detail::socket_option::integer<IPPROTO_TCP, TCP_KEEPIDLE>(interval), ec);
        if (!ec)
        {
            socket.set_option(asio::detail::socket_option::integer<IPPROTO_TCP, TCP_KEEPINTVL>(interval), ec);
        }
        if (!ec)
        {
            socket.set_option(asio::detail::socket_option::integer<IPPROTO_TCP, TCP_KEEPCNT>(count), ec);
        }
        if (!ec)
        {
            // Unacknowledged keep-alive packets also drop the link after the same window.
            socket.set_option(
                asio::detail::socket_option::integer<IPPROTO_TCP, TCP_USER_TIMEOUT>(interval * count * 1000), ec);
        }
#elif defined(__APPLE__)
        socket.set_option(asio::detail::socket_option::integer<IPPROTO_TCP, TCP_KEEPALIVE>(interval), ec);
#endif
        return ec;
    }

    struct CommandRun
    {
        std::string command;
        ExecHandlers handlers;
        LIBSSH2_CHANNEL *channel{nullptr};
        std::array<char, kCommandReadChunk> buffer{};
        bool from_stderr{false};
        bool finished{false};
        int exit_code{-1};
    };

    class SshRemoteFile : public RemoteFile
    {
    public:
        SshRemoteFile(std::weak_ptr<SshTransport> transport, asio::any_io_executor executor,
                      LIBSSH2_SFTP_HANDLE *handle)
            : transport_(std::move(transport)), executor_(std::move(executor)), handle_(handle) {}

        ~SshRemoteFile() override
        {
            if (handle_ == nullptr)
            {
                return;
            }
            if (auto transport = transport_.lock(); transport && !transport->closed_)
            {
                transport->submit([handle = handle_]
                                  { return static_cast<long>(libssh2_sftp_close_handle(handle)); },
                                  {});
            }
        }

        void read(std::span<std::byte> buffer, ResultHandler<std::size_t> handler) override
        {
            auto transport = transport_.lock();
            if (!transport || handle_ == nullptr)
            {
                asio::post(executor_, [handler = std::move(handler)]
                           { handler(Status::failure(ErrorCode::TransferStreamError, "Remote file is closed"), 0); });
                return;
            }
            transport->submit(
                [handle = handle_, buffer]
                {
                    return static_cast<long>(
                        libssh2_sftp_read(handle, reinterpret_cast<char *>(buffer.data()), buffer.size()));
                },
                [handler = std::move(handler)](long rc, const std::string &error)
                {
                    if (rc < 0)
                    {
                        handler(Status::failure(ErrorCode::TransferStreamError, "Read failed: " + error), 0);
                        return;
                    }
                    handler(Status{}, static_cast<std::size_t>(rc));
                });
        }

        void write(std::span<const std::byte> data, ResultHandler<std::size_t> handler) override
        {
            auto transport = transport_.lock();
            if (!transport || handle_ == nullptr)
            {
                asio::post(executor_, [handler = std::move(handler)]
                           { handler(Status::failure(ErrorCode::TransferStreamError, "Remote file is closed"), 0); });
                return;
            }
            transport->submit(
                [handle = handle_, data]
                {
                    return static_cast<long>(
                        libssh2_sftp_write(handle, reinterpret_cast<const char *>(data.data()), data.size()));
                },
                [handler = std::move(handler)](long rc, const std::string &error)
                {
                    if (rc < 0)
                    {
                        handler(Status::failure(ErrorCode::TransferStreamError, "Write failed: " + error), 0);
                        return;
                    }
                    handler(Status{}, static_cast<std::size_t>(rc));
                });
        }

        void close(StatusHandler handler) override
        {
            auto handle = std::exchange(handle_, nullptr);
            auto transport = transport_.lock();
            if (handle == nullptr || !transport)
            {
                const bool already_closed = handle == nullptr;
                asio::post(executor_, [handler = std::move(handler), already_closed]
                           { handler(already_closed ? Status{}
                                                    : Status::failure(ErrorCode::TransferStreamError,
                                                                      "Connection closed before the file was closed")); });
                return;
            }
            transport->submit([handle]
                              { return static_cast<long>(libssh2_sftp_close_handle(handle)); },
                              [handler = std::move(handler)](long rc, const std::string &error)
                              {
                                  if (rc < 0)
                                  {
                                      handler(Status::failure(ErrorCode::TransferStreamError, "Close failed: " + error));
                                      return;
                                  }
                                  handler(Status{});
                              });
        }

    private:
        std::weak_ptr<SshTransport> transport_;
        asio::any_io_executor executor_;
        LIBSSH2_SFTP_HANDLE *handle_;
    };

    SshTransport::SshTransport(asio::any_io_executor executor, TransportSettings settings)
        : executor_(executor),
          settings_(settings),
          resolver_(executor),
          socket_(executor),
          connect_timer_(executor),
          keepalive_timer_(executor) {}

    SshTransport::~SshTransport()
    {
        teardown("Transport released", false);
    }

    void SshTransport::connect(const ConnectOptions &options, TransportEvents events)
    {
        ensure_libssh2_init();
        options_ = options;
        events_ = std::move(events);

        std::weak_ptr<SshTransport> weak = weak_from_this();
        connect_timer_.expires_after(settings_.connect_timeout);
        connect_timer_.async_wait([weak](const std::error_code &ec)
                                  {
            auto self = weak.lock();
            if (ec || !self || self->ready_ || self->closed_)
            {
                return;
            }
            self->fail(ErrorCode::SshConnectFailed, "Timed out while connecting", false); });

        spdlog::debug("Resolving {}:{}", options_.host, options_.port);
        auto self = shared_from_this();
        resolver_.async_resolve(
            options_.host, std::to_string(options_.port),
            [self](const std::error_code &ec, asio::ip::tcp::resolver::results_type results)
            {
                if (self->closed_)
                {
                    return;
                }
                if (ec)
                {
                    self->fail(ErrorCode::SshConnectFailed, "Failed to resolve " + self->options_.host + ": " + ec.message(),
                               false);
                    return;
                }
                asio::async_connect(self->socket_, results,
                                    [self](const std::error_code &connect_ec, const asio::ip::tcp::endpoint &endpoint)
                                    {
                                        if (self->closed_)
                                        {
                                            return;
                                        }
                                        if (connect_ec)
                                        {
                                            self->fail(ErrorCode::SshConnectFailed,
                                                       "Failed to connect: " + connect_ec.message(), false);
                                            return;
                                        }
                                        spdlog::debug("TCP connection established to {}:{}",
                                                      endpoint.address().to_string(), endpoint.port());
                                        if (const auto keepalive_ec = configure_keepalive(self->socket_, self->settings_))
                                        {
                                            spdlog::warn("TCP keep-alive not enabled: {}", keepalive_ec.message());
                                        }
                                        self->start_handshake();
                                    });
            });
    }

    void SshTransport::disconnect()
    {
        events_ = TransportEvents{};
        if (closed_)
        {
            return;
        }
        spdlog::debug("Disconnecting from {}@{}", options_.username, options_.host);
        teardown("Disconnected", true);
    }

    std::shared_ptr<SftpChannel> SshTransport::sftp()
    {
        if (!ready_ || closed_ || sftp_ == nullptr)
        {
            return nullptr;
        }
        return std::static_pointer_cast<SftpChannel>(shared_from_this());
    }

    void SshTransport::start_handshake()
    {
        session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, this);
        if (session_ == nullptr)
        {
            fail(ErrorCode::SshConnectFailed, "Failed to allocate SSH session", false);
            return;
        }
        libssh2_session_set_blocking(session_, 0);

        if (libssh2_session_method_pref(session_, LIBSSH2_METHOD_HOSTKEY, kHostKeyMethods) != 0 ||
            libssh2_session_method_pref(session_, LIBSSH2_METHOD_CRYPT_CS, kCipherMethods) != 0 ||
            libssh2_session_method_pref(session_, LIBSSH2_METHOD_CRYPT_SC, kCipherMethods) != 0)
        {
            fail(ErrorCode::SshConnectFailed, "Failed to restrict algorithms: " + describe_error(last_errno_or(0)),
                 false);
            return;
        }
        libssh2_keepalive_config(session_, 1, static_cast<unsigned int>(settings_.keepalive_interval.count()));

        std::error_code ec;
        socket_.native_non_blocking(true, ec);
        if (ec)
        {
            fail(ErrorCode::SshConnectFailed, "Failed to configure socket: " + ec.message(), false);
            return;
        }

        auto self = shared_from_this();
        const auto fd = socket_.native_handle();
        submit([this, fd]
               { return static_cast<long>(libssh2_session_handshake(session_, fd)); },
               [self](long rc, const std::string &error)
               {
                   if (rc < 0)
                   {
                       self->fail(ErrorCode::SshConnectFailed, "SSH handshake failed: " + error, false);
                       return;
                   }
                   self->authenticate();
               });
    }

    void SshTransport::authenticate()
    {
        auto self = shared_from_this();
        submit(
            [this]
            {
                const char *passphrase = options_.passphrase ? options_.passphrase->c_str() : nullptr;
                return static_cast<long>(libssh2_userauth_publickey_frommemory(
                    session_, options_.username.data(), options_.username.size(), nullptr, 0,
                    options_.private_key.data(), options_.private_key.size(), passphrase));
            },
            [self](long rc, const std::string &error)
            {
                if (rc == 0)
                {
                    self->post_event([](const TransportEvents &events)
                                     {
                        auto handler = events.on_authenticated;
                        if (handler)
                        {
                            handler();
                        } });
                    self->init_sftp();
                    return;
                }
                if (is_socket_failure(rc))
                {
                    self->fail(ErrorCode::SshConnectFailed, "Authentication failed: " + error, is_remote_close(rc));
                    return;
                }
                self->try_keyboard_interactive(error);
            });
    }

    void SshTransport::try_keyboard_interactive(const std::string &key_error)
    {
        auto self = shared_from_this();
        submit(
            [this]
            {
                const char *methods = libssh2_userauth_list(session_, options_.username.data(),
                                                            static_cast<unsigned int>(options_.username.size()));
                if (methods != nullptr)
                {
                    auth_methods_ = methods;
                    return 0L;
                }
                if (libssh2_userauth_authenticated(session_) != 0)
                {
                    auth_methods_.clear();
                    return 0L;
                }
                return last_errno_or(LIBSSH2_ERROR_AUTHENTICATION_FAILED);
            },
            [self, key_error](long rc, const std::string & /*error*/)
            {
                if (rc < 0 || self->auth_methods_.find("keyboard-interactive") == std::string::npos)
                {
                    self->fail(ErrorCode::SshConnectFailed, "Authentication failed: " + key_error, false);
                    return;
                }
                self->submit(
                    [raw = self.get()]
                    {
                        return static_cast<long>(libssh2_userauth_keyboard_interactive_ex(
                            raw->session_, raw->options_.username.data(),
                            static_cast<unsigned int>(raw->options_.username.size()),
                            &SshTransport::answer_keyboard_interactive));
                    },
                    [self, key_error](long kbd_rc, const std::string & /*kbd_error*/)
                    {
                        if (kbd_rc < 0)
                        {
                            self->fail(ErrorCode::SshConnectFailed, "Authentication failed: " + key_error, false);
                            return;
                        }
                        self->post_event([](const TransportEvents &events)
                                         {
                            auto handler = events.on_authenticated;
                            if (handler)
                            {
                                handler();
                            } });
                        self->init_sftp();
                    });
            });
    }

    void SshTransport::answer_keyboard_interactive(const char * /*name*/, int /*name_len*/, const char *instruction,
                                                   int instruction_len, int num_prompts,
                                                   const LIBSSH2_USERAUTH_KBDINT_PROMPT * /*prompts*/,
                                                   LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses, void **abstract)
    {
        for (int i = 0; i < num_prompts; ++i)
        {
            responses[i].text = nullptr;
            responses[i].length = 0;
        }
        if (abstract == nullptr || *abstract == nullptr)
        {
            return;
        }
        auto *transport = static_cast<SshTransport *>(*abstract);
        std::string text = instruction != nullptr && instruction_len > 0
                               ? std::string(instruction, static_cast<std::size_t>(instruction_len))
                               : std::string{};
        const auto prompt_count = static_cast<std::size_t>(num_prompts < 0 ? 0 : num_prompts);
        transport->post_event([text = std::move(text), prompt_count](const TransportEvents &events)
                              {
            auto handler = events.on_auth_challenge;
            if (handler)
            {
                handler(text, prompt_count);
            } });
    }

    void SshTransport::init_sftp()
    {
        auto self = shared_from_this();
        submit(
            [this]
            {
                sftp_ = libssh2_sftp_init(session_);
                return sftp_ != nullptr ? 0L : last_errno_or(LIBSSH2_ERROR_SFTP_PROTOCOL);
            },
            [self](long rc, const std::string &error)
            {
                if (rc < 0)
                {
                    self->fail(ErrorCode::SftpInitFailed, "Failed to start SFTP subsystem: " + error, false);
                    return;
                }
                self->ready_ = true;
                self->connect_timer_.cancel();
                spdlog::info("SSH transport ready for {}@{}:{}", self->options_.username, self->options_.host,
                             self->options_.port);
                self->schedule_keepalive();
                self->post_event([](const TransportEvents &events)
                                 {
                    auto handler = events.on_ready;
                    if (handler)
                    {
                        handler();
                    } });
            });
    }

    void SshTransport::schedule_keepalive()
    {
        if (settings_.keepalive_interval.count() <= 0)
        {
            return;
        }
        std::weak_ptr<SshTransport> weak = weak_from_this();
        keepalive_timer_.expires_after(settings_.keepalive_interval);
        keepalive_timer_.async_wait(
            [weak](const std::error_code &ec)
            {
                auto self = weak.lock();
                if (ec || !self || self->closed_)
                {
                    return;
                }
                self->submit(
                    [raw = self.get()]
                    {
                        int next_seconds = 0;
                        return static_cast<long>(libssh2_keepalive_send(raw->session_, &next_seconds));
                    },
                    [weak](long rc, const std::string &error)
                    {
                        auto transport = weak.lock();
                        if (!transport || transport->closed_)
                        {
                            return;
                        }
                        if (rc < 0)
                        {
                            transport->fail(ErrorCode::SshConnectFailed, "Keep-alive failed: " + error, false);
                            return;
                        }
                        transport->schedule_keepalive();
                    });
            });
    }

    void SshTransport::exec(const std::string &command, ExecHandlers handlers)
    {
        auto run = std::make_shared<CommandRun>();
        run->command = command;
        run->handlers = std::move(handlers);

        if (!ready_ || closed_)
        {
            asio::post(executor_, [run]
                       {
                if (run->handlers.on_error)
                {
                    run->handlers.on_error(Status::failure(ErrorCode::NotConnected, "Not connected"));
                } });
            return;
        }

        auto self = shared_from_this();
        submit(
            [this, run]
            {
                run->channel = libssh2_channel_open_session(session_);
                return run->channel != nullptr ? 0L : last_errno_or(LIBSSH2_ERROR_CHANNEL_FAILURE);
            },
            [self, run](long rc, const std::string &error)
            {
                if (rc < 0)
                {
                    if (run->handlers.on_error)
                    {
                        run->handlers.on_error(
                            Status::failure(ErrorCode::CommandExecFailed, "Failed to open channel: " + error));
                    }
                    return;
                }
                self->submit([run]
                             { return static_cast<long>(libssh2_channel_exec(run->channel, run->command.c_str())); },
                             [self, run](long exec_rc, const std::string &exec_error)
                             {
                                 if (exec_rc < 0)
                                 {
                                     if (run->handlers.on_error)
                                     {
                                         run->handlers.on_error(Status::failure(
                                             ErrorCode::CommandExecFailed, "Failed to start command: " + exec_error));
                                     }
                                     self->finish_command(run);
                                     return;
                                 }
                                 self->read_command_output(run);
                             });
            });
    }

    void SshTransport::read_command_output(const std::shared_ptr<CommandRun> &run)
    {
        auto self = shared_from_this();
        submit(
            [run]
            {
                auto count = libssh2_channel_read(run->channel, run->buffer.data(), run->buffer.size());
                if (count > 0)
                {
                    run->from_stderr = false;
                    return static_cast<long>(count);
                }
                if (count < 0 && count != LIBSSH2_ERROR_EAGAIN)
                {
                    return static_cast<long>(count);
                }
                count = libssh2_channel_read_stderr(run->channel, run->buffer.data(), run->buffer.size());
                if (count > 0)
                {
                    run->from_stderr = true;
                    return static_cast<long>(count);
                }
                if (count < 0 && count != LIBSSH2_ERROR_EAGAIN)
                {
                    return static_cast<long>(count);
                }
                if (libssh2_channel_eof(run->channel) != 0)
                {
                    run->finished = true;
                    return 0L;
                }
                return static_cast<long>(LIBSSH2_ERROR_EAGAIN);
            },
            [self, run](long rc, const std::string &error)
            {
                if (rc < 0)
                {
                    if (run->handlers.on_error)
                    {
                        run->handlers.on_error(
                            Status::failure(ErrorCode::CommandExecFailed, "Failed to read command output: " + error));
                    }
                    self->finish_command(run);
                    return;
                }
                if (run->finished)
                {
                    self->finish_command(run);
                    return;
                }
                std::string chunk(run->buffer.data(), static_cast<std::size_t>(rc));
                const auto &sink = run->from_stderr ? run->handlers.on_stderr : run->handlers.on_stdout;
                if (sink)
                {
                    sink(std::move(chunk));
                }
                self->read_command_output(run);
            },
            true);
    }

    // Closes and frees the channel. on_exit fires only when the command ran to completion.
    void SshTransport::finish_command(const std::shared_ptr<CommandRun> &run)
    {
        auto self = shared_from_this();
        submit([run]
               { return static_cast<long>(libssh2_channel_close(run->channel)); },
               {});
        submit(
            [run]
            {
                const auto rc = libssh2_channel_wait_closed(run->channel);
                if (rc == 0)
                {
                    run->exit_code = libssh2_channel_get_exit_status(run->channel);
                }
                return static_cast<long>(rc);
            },
            {}, true);
        submit([run]
               {
                   const auto rc = libssh2_channel_free(run->channel);
                   if (rc == 0)
                   {
                       run->channel = nullptr;
                   }
                   return static_cast<long>(rc);
               },
               [run](long /*rc*/, const std::string & /*error*/)
               {
                   if (run->finished && run->handlers.on_exit)
                   {
                       run->handlers.on_exit(run->exit_code);
                   }
               });
    }

    void SshTransport::stat(const std::string &path, ResultHandler<RemoteAttributes> handler)
    {
        auto attrs = std::make_shared<LIBSSH2_SFTP_ATTRIBUTES>();
        submit_sftp(
            [this, path, attrs]
            {
                return static_cast<long>(
                    libssh2_sftp_stat_ex(sftp_, path.c_str(), path_length(path), LIBSSH2_SFTP_STAT, attrs.get()));
            },
            [handler = std::move(handler), attrs](long rc, const std::string &error)
            {
                if (rc < 0)
                {
                    handler(Status::failure(ErrorCode::RemoteFileNotFound, error), RemoteAttributes{});
                    return;
                }
                handler(Status{}, to_attributes(*attrs));
            });
    }

    void SshTransport::read_directory(const std::string &path, ResultHandler<std::vector<RemoteDirEntry>> handler)
    {
        struct DirectoryRead
        {
            LIBSSH2_SFTP_HANDLE *handle{nullptr};
            std::vector<RemoteDirEntry> entries;
            std::array<char, 512> filename{};
            std::array<char, 1024> longname{};
            Status status{};
        };
        auto state = std::make_shared<DirectoryRead>();
        auto self = shared_from_this();

        submit_sftp(
            [this, path, state]
            {
                state->handle = libssh2_sftp_open_ex(sftp_, path.c_str(), path_length(path), 0, 0,
                                                     LIBSSH2_SFTP_OPENDIR);
                return state->handle != nullptr ? 0L : last_errno_or(LIBSSH2_ERROR_SFTP_PROTOCOL);
            },
            [self, state, handler](long rc, const std::string &error)
            {
                if (rc < 0)
                {
                    handler(Status::failure(ErrorCode::RemoteListingFailed, "Failed to open directory: " + error), {});
                    return;
                }
                self->submit(
                    [state]
                    {
                        for (;;)
                        {
                            LIBSSH2_SFTP_ATTRIBUTES attrs{};
                            const auto count = libssh2_sftp_readdir_ex(state->handle, state->filename.data(),
                                                                       state->filename.size(), state->longname.data(),
                                                                       state->longname.size(), &attrs);
                            if (count <= 0)
                            {
                                return static_cast<long>(count);
                            }
                            RemoteDirEntry entry{};
                            entry.filename.assign(state->filename.data(), static_cast<std::size_t>(count));
                            entry.longname = state->longname.data();
                            entry.attributes = to_attributes(attrs);
                            state->entries.push_back(std::move(entry));
                        }
                    },
                    [self, state, handler](long read_rc, const std::string &read_error)
                    {
                        if (read_rc < 0)
                        {
                            state->status =
                                Status::failure(ErrorCode::RemoteListingFailed, "Failed to read directory: " + read_error);
                        }
                        self->submit([state]
                                     { return static_cast<long>(libssh2_sftp_close_handle(state->handle)); },
                                     [state, handler](long /*close_rc*/, const std::string & /*close_error*/)
                                     {
                                         state->handle = nullptr;
                                         if (!state->status)
                                         {
                                             handler(state->status, {});
                                             return;
                                         }
                                         handler(Status{}, std::move(state->entries));
                                     });
                    });
            });
    }

    void SshTransport::open(const std::string &path, OpenMode mode, ResultHandler<std::shared_ptr<RemoteFile>> handler)
    {
        auto slot = std::make_shared<LIBSSH2_SFTP_HANDLE *>(nullptr);
        const unsigned long flags = mode == OpenMode::Read
                                        ? LIBSSH2_FXF_READ
                                        : (LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC);
        const long permissions = mode == OpenMode::Read ? 0 : kFileMode;
        auto self = shared_from_this();
        submit_sftp(
            [this, path, slot, flags, permissions]
            {
                *slot = libssh2_sftp_open_ex(sftp_, path.c_str(), path_length(path), flags, permissions,
                                             LIBSSH2_SFTP_OPENFILE);
                return *slot != nullptr ? 0L : last_errno_or(LIBSSH2_ERROR_SFTP_PROTOCOL);
            },
            [self, slot, handler = std::move(handler), mode](long rc, const std::string &error)
            {
                if (rc < 0)
                {
                    const auto code =
                        mode == OpenMode::Read ? ErrorCode::RemoteFileNotFound : ErrorCode::TransferStreamError;
                    handler(Status::failure(code, "Failed to open remote file: " + error), nullptr);
                    return;
                }
                handler(Status{},
                        std::make_shared<SshRemoteFile>(std::weak_ptr<SshTransport>(self), self->executor_, *slot));
            });
    }

    void SshTransport::make_directory(const std::string &path, StatusHandler handler)
    {
        submit_sftp([this, path]
                    { return static_cast<long>(libssh2_sftp_mkdir_ex(sftp_, path.c_str(), path_length(path),
                                                                     kDirectoryMode)); },
                    [handler = std::move(handler)](long rc, const std::string &error)
                    {
                        handler(rc < 0 ? Status::failure(ErrorCode::MutationFailed, error) : Status{});
                    });
    }

    void SshTransport::remove_directory(const std::string &path, StatusHandler handler)
    {
        submit_sftp([this, path]
                    { return static_cast<long>(libssh2_sftp_rmdir_ex(sftp_, path.c_str(), path_length(path))); },
                    [handler = std::move(handler)](long rc, const std::string &error)
                    {
                        handler(rc < 0 ? Status::failure(ErrorCode::MutationFailed, error) : Status{});
                    });
    }

    void SshTransport::remove_file(const std::string &path, StatusHandler handler)
    {
        submit_sftp([this, path]
                    { return static_cast<long>(libssh2_sftp_unlink_ex(sftp_, path.c_str(), path_length(path))); },
                    [handler = std::move(handler)](long rc, const std::string &error)
                    {
                        handler(rc < 0 ? Status::failure(ErrorCode::MutationFailed, error) : Status{});
                    });
    }

    void SshTransport::submit(Step step, Completion done, bool yieldable)
    {
        if (closed_ || session_ == nullptr)
        {
            if (done)
            {
                asio::post(executor_, [done = std::move(done)]
                           { done(LIBSSH2_ERROR_SOCKET_DISCONNECT, "Connection closed"); });
            }
            return;
        }
        operations_.push_back(Operation{std::move(step), std::move(done), yieldable});
        if (waiting_)
        {
            // Wake the pending socket wait so the new operation gets a turn.
            std::error_code ignored;
            socket_.cancel(ignored);
            return;
        }
        pump();
    }

    void SshTransport::submit_sftp(Step step, Completion done)
    {
        if (!ready_ || sftp_ == nullptr)
        {
            asio::post(executor_, [done = std::move(done)]
                       { done(LIBSSH2_ERROR_SOCKET_DISCONNECT, "Not connected"); });
            return;
        }
        submit(std::move(step), std::move(done));
    }

    void SshTransport::pump()
    {
        std::size_t yielded = 0;
        while (!closed_ && !waiting_ && !operations_.empty())
        {
            auto &operation = operations_.front();
            const long rc = operation.step();
            if (rc == LIBSSH2_ERROR_EAGAIN)
            {
                if (operation.yieldable && ++yielded < operations_.size())
                {
                    auto rotated = std::move(operations_.front());
                    operations_.pop_front();
                    operations_.push_back(std::move(rotated));
                    continue;
                }
                wait_for_socket();
                return;
            }
            yielded = 0;

            auto done = std::move(operation.done);
            operations_.pop_front();
            std::string error = rc < 0 ? describe_error(rc) : std::string{};
            if (done)
            {
                asio::post(executor_, [done = std::move(done), rc, error]
                           { done(rc, error); });
            }
            if (rc < 0 && ready_ && is_socket_failure(rc))
            {
                fail(ErrorCode::SshConnectFailed, "Connection lost: " + error, is_remote_close(rc));
                return;
            }
        }
    }

    void SshTransport::wait_for_socket()
    {
        waiting_ = true;
        const int directions = libssh2_session_block_directions(session_);
        auto fired = std::make_shared<bool>(false);
        auto self = shared_from_this();
        auto resume = [self, fired](const std::error_code &ec)
        {
            if (*fired || self->closed_)
            {
                return;
            }
            *fired = true;
            self->waiting_ = false;
            std::error_code ignored;
            self->socket_.cancel(ignored);
            if (ec && ec != asio::error::operation_aborted)
            {
                self->fail(ErrorCode::SshConnectFailed, "Socket error: " + ec.message(), true);
                return;
            }
            self->pump();
        };

        const bool outbound = (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) != 0;
        const bool inbound = (directions & LIBSSH2_SESSION_BLOCK_INBOUND) != 0 || !outbound;
        if (inbound)
        {
            socket_.async_wait(asio::ip::tcp::socket::wait_read, resume);
        }
        if (outbound)
        {
            socket_.async_wait(asio::ip::tcp::socket::wait_write, resume);
        }
    }

    void SshTransport::post_event(std::function<void(const TransportEvents &)> fire)
    {
        std::weak_ptr<SshTransport> weak = weak_from_this();
        asio::post(executor_, [weak, fire = std::move(fire)]
                   {
            auto self = weak.lock();
            if (self)
            {
                fire(self->events_);
            } });
    }

    void SshTransport::fail(ErrorCode code, std::string message, bool remote_closed)
    {
        if (closed_)
        {
            return;
        }
        const bool was_ready = ready_;
        spdlog::warn("SSH transport {}@{} failed: {}", options_.username, options_.host, message);
        teardown(message, false);

        if (was_ready && remote_closed)
        {
            post_event([](const TransportEvents &events)
                       {
                auto handler = events.on_end;
                if (handler)
                {
                    handler();
                } });
            return;
        }
        post_event([status = Status::failure(code, std::move(message))](const TransportEvents &events)
                   {
            auto handler = events.on_error;
            if (handler)
            {
                handler(status);
            } });
    }

    void SshTransport::teardown(const std::string &reason, bool graceful)
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        ready_ = false;
        waiting_ = false;

        std::error_code ec;
        connect_timer_.cancel();
        keepalive_timer_.cancel();
        resolver_.cancel();
        socket_.cancel(ec);

        if (session_ != nullptr)
        {
            // Nothing may call back into this transport once the session outlives it.
            *libssh2_session_abstract(session_) = nullptr;
            auto closer = std::make_shared<SessionShutdown>(std::move(socket_), std::exchange(session_, nullptr),
                                                            std::exchange(sftp_, nullptr), graceful);
            closer->start(settings_.shutdown_timeout);
        }
        else
        {
            socket_.close(ec);
        }

        auto pending = std::move(operations_);
        operations_.clear();
        for (auto &operation : pending)
        {
            if (operation.done)
            {
                asio::post(executor_, [done = std::move(operation.done), reason]
                           { done(LIBSSH2_ERROR_SOCKET_DISCONNECT, reason); });
            }
        }
    }

    long SshTransport::last_errno_or(long fallback) const
    {
        if (session_ == nullptr)
        {
            return fallback;
        }
        const int code = libssh2_session_last_errno(session_);
        return code != 0 ? static_cast<long>(code) : fallback;
    }

    std::string SshTransport::describe_error(long rc) const
    {
        if (session_ == nullptr)
        {
            return "libssh2 error " + std::to_string(rc);
        }
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_ != nullptr)
        {
            const auto status = libssh2_sftp_last_error(sftp_);
            if (status != LIBSSH2_FX_OK)
            {
                return std::string(sftp_status_text(status));
            }
        }
        char *message = nullptr;
        int length = 0;
        libssh2_session_last_error(session_, &message, &length, 0);
        if (message != nullptr && length > 0)
        {
            return std::string(message, static_cast<std::size_t>(length));
        }
        return "libssh2 error " + std::to_string(rc);
    }

    TransportFactory make_ssh_transport_factory(asio::any_io_executor executor, TransportSettings settings)
    {
        return [executor, settings]()
        { return std::static_pointer_cast<RemoteTransport>(std::make_shared<SshTransport>(executor, settings)); };
    }

} // namespace sftpbridge::server
