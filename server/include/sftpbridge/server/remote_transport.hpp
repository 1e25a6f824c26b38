#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "sftpbridge/error_codes.hpp"

namespace sftpbridge::server
{

    using StatusHandler = std::function<void(const sftpbridge::Status &)>;

    template <typename T>
    using ResultHandler = std::function<void(const sftpbridge::Status &, T)>;

    struct RemoteAttributes
    {
        std::uint64_t size{};
        std::uint64_t modified_time{};
        std::uint32_t permissions{};
    };

    // Raw readdir record of the file-transfer subsystem. `longname` is the ls -l style line.
    struct RemoteDirEntry
    {
        std::string filename;
        std::string longname;
        RemoteAttributes attributes;
    };

    enum class OpenMode
    {
        Read,
        Write // create or truncate
    };

    // An open handle on the remote side. Every handle must be closed on every exit path.
    class RemoteFile
    {
    public:
        virtual ~RemoteFile() = default;

        // Completes with the number of bytes read; 0 means end of file.
        virtual void read(std::span<std::byte> buffer, ResultHandler<std::size_t> handler) = 0;

        // May complete with fewer bytes than requested; callers continue with the remainder.
        virtual void write(std::span<const std::byte> data, ResultHandler<std::size_t> handler) = 0;

        virtual void close(StatusHandler handler) = 0;
    };

    // File-transfer subsystem of an authenticated transport.
    class SftpChannel
    {
    public:
        virtual ~SftpChannel() = default;

        virtual void stat(const std::string &path, ResultHandler<RemoteAttributes> handler) = 0;
        virtual void read_directory(const std::string &path, ResultHandler<std::vector<RemoteDirEntry>> handler) = 0;
        virtual void open(const std::string &path, OpenMode mode,
                          ResultHandler<std::shared_ptr<RemoteFile>> handler) = 0;
        virtual void make_directory(const std::string &path, StatusHandler handler) = 0;
        virtual void remove_directory(const std::string &path, StatusHandler handler) = 0;
        virtual void remove_file(const std::string &path, StatusHandler handler) = 0;
    };

    struct ConnectOptions
    {
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::string private_key;
        std::optional<std::string> passphrase{};
    };

    // Lifecycle notifications of one transport. They are always delivered from the
    // event loop, never from inside a transport call.
    struct TransportEvents
    {
        std::function<void()> on_authenticated;
        std::function<void()> on_ready;
        std::function<void(const sftpbridge::Status &)> on_error;
        std::function<void()> on_end;
        std::function<void(const std::string &instruction, std::size_t prompt_count)> on_auth_challenge;
    };

    struct ExecHandlers
    {
        std::function<void(std::string chunk)> on_stdout;
        std::function<void(std::string chunk)> on_stderr;
        std::function<void(int exit_code)> on_exit;
        std::function<void(const sftpbridge::Status &)> on_error;
    };

    class RemoteTransport
    {
    public:
        virtual ~RemoteTransport() = default;

        // Exactly one of on_ready / on_error follows; on_end or on_error may follow a ready transport.
        virtual void connect(const ConnectOptions &options, TransportEvents events) = 0;

        // Idempotent. Pending operations complete with an error and no event handler fires afterwards.
        virtual void disconnect() = 0;

        // Null until the file-transfer subsystem is initialized.
        virtual std::shared_ptr<SftpChannel> sftp() = 0;

        virtual void exec(const std::string &command, ExecHandlers handlers) = 0;
    };

    using TransportFactory = std::function<std::shared_ptr<RemoteTransport>()>;

} // namespace sftpbridge::server
