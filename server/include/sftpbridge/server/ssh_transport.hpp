#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include "sftpbridge/server/config.hpp"
#include "sftpbridge/server/remote_transport.hpp"

namespace sftpbridge::server
{

    class SshRemoteFile;
    struct CommandRun;

    // libssh2 session in non-blocking mode driven by an asio socket.
    //
    // Every libssh2 call is queued as an operation and retried until it stops returning
    // LIBSSH2_ERROR_EAGAIN, waiting on the socket in the direction libssh2 reports as blocked.
    // Only one libssh2 call runs at a time. Yieldable operations (polling reads of command
    // output) rotate to the back of the queue instead of holding it.
    class SshTransport : public RemoteTransport,
                         public SftpChannel,
                         public std::enable_shared_from_this<SshTransport>
    {
    public:
        SshTransport(asio::any_io_executor executor, TransportSettings settings);
        ~SshTransport() override;

        SshTransport(const SshTransport &) = delete;
        SshTransport &operator=(const SshTransport &) = delete;

        void connect(const ConnectOptions &options, TransportEvents events) override;
        void disconnect() override;
        std::shared_ptr<SftpChannel> sftp() override;
        void exec(const std::string &command, ExecHandlers handlers) override;

        void stat(const std::string &path, ResultHandler<RemoteAttributes> handler) override;
        void read_directory(const std::string &path, ResultHandler<std::vector<RemoteDirEntry>> handler) override;
        void open(const std::string &path, OpenMode mode, ResultHandler<std::shared_ptr<RemoteFile>> handler) override;
        void make_directory(const std::string &path, StatusHandler handler) override;
        void remove_directory(const std::string &path, StatusHandler handler) override;
        void remove_file(const std::string &path, StatusHandler handler) override;

    private:
        friend class SshRemoteFile;

        using Step = std::function<long()>;
        using Completion = std::function<void(long rc, const std::string &error)>;

        struct Operation
        {
            Step step;
            Completion done;
            bool yieldable{};
        };

        void submit(Step step, Completion done, bool yieldable = false);
        void submit_sftp(Step step, Completion done);
        void pump();
        void wait_for_socket();

        void start_handshake();
        void authenticate();
        void try_keyboard_interactive(const std::string &key_error);
        void init_sftp();
        void schedule_keepalive();
        void read_command_output(const std::shared_ptr<CommandRun> &run);
        void finish_command(const std::shared_ptr<CommandRun> &run);

        void post_event(std::function<void(const TransportEvents &)> fire);
        void fail(sftpbridge::ErrorCode code, std::string message, bool remote_closed);
        void teardown(const std::string &reason, bool graceful);
        long last_errno_or(long fallback) const;
        std::string describe_error(long rc) const;

        static void answer_keyboard_interactive(const char *name, int name_len, const char *instruction,
                                                int instruction_len, int num_prompts,
                                                const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                                                LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses, void **abstract);

        asio::any_io_executor executor_;
        TransportSettings settings_;
        asio::ip::tcp::resolver resolver_;
        asio::ip::tcp::socket socket_;
        asio::steady_timer connect_timer_;
        asio::steady_timer keepalive_timer_;

        LIBSSH2_SESSION *session_{nullptr};
        LIBSSH2_SFTP *sftp_{nullptr};

        ConnectOptions options_;
        TransportEvents events_;
        std::string auth_methods_;
        std::deque<Operation> operations_;
        bool waiting_{false};
        bool ready_{false};
        bool closed_{false};
    };

    // Enables TCP keep-alive on a connected socket so a peer that vanishes without a
    // reset is detected after keepalive_interval * keepalive_count_max of silence.
    std::error_code configure_keepalive(asio::ip::tcp::socket &socket, const TransportSettings &settings);

    TransportFactory make_ssh_transport_factory(asio::any_io_executor executor, TransportSettings settings);

} // namespace sftpbridge::server
