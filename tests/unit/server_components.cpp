#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sftpbridge/server/connection_state.hpp"
#include "sftpbridge/server/directory_listing.hpp"
#include "sftpbridge/server/filesystem.hpp"
#include "sftpbridge/server/log_buffer.hpp"
#include "sftpbridge/server/remote_path.hpp"
#include "sftpbridge/server/staging.hpp"
#include "sftpbridge/server/transfer.hpp"

using namespace sftpbridge;
using namespace sftpbridge::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void touch(const std::filesystem::path &path, const std::string &content = "x")
    {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    bool has_entry(const protocol::DirectoryListing &listing, const std::string &name)
    {
        for (const auto &entry : listing.entries)
        {
            if (entry.name == name)
            {
                return true;
            }
        }
        return false;
    }

    void test_remote_paths()
    {
        assert(remote_path::normalize("/home//alice/./docs/") == "/home/alice/docs");
        assert(remote_path::normalize("/home/alice/../bob") == "/home/bob");
        assert(remote_path::normalize("/..") == "/");
        assert(remote_path::normalize("") == ".");
        assert(remote_path::join("/tmp", "a.txt") == "/tmp/a.txt");
        assert(remote_path::join("/", "etc") == "/etc");
        assert(remote_path::parent("/tmp/a.txt") == "/tmp");
        assert(remote_path::parent("/tmp") == "/");
        assert(remote_path::parent("/") == "/");
        assert(remote_path::basename("/var/log/syslog") == "syslog");
    }

    void test_local_listing_filters_hidden()
    {
        const auto root = std::filesystem::temp_directory_path() / "sftpbridge_listing_test";
        cleanup_path(root);
        std::filesystem::create_directories(root / "docs");
        touch(root / "visible.txt", "hello");
        touch(root / ".hidden");
        touch(root / "$recycle");

        LocalFilesystem fs(root);
        DirectoryListingUnifier unifier(fs);
        const auto result = unifier.list_local(root.string() + "/");
        assert(result.warnings.empty());
        assert(result.listing.origin == protocol::Origin::Local);
        assert(result.listing.path == root.string());
        assert(result.listing.parent == root.parent_path().string());
        assert(result.listing.entries.size() == 2);
        assert(has_entry(result.listing, "docs"));
        assert(has_entry(result.listing, "visible.txt"));
        for (const auto &entry : result.listing.entries)
        {
            if (entry.name == "docs")
            {
                assert(entry.type == protocol::EntryType::Directory);
            }
            else
            {
                assert(entry.size == 5);
                assert(entry.path == (root / "visible.txt").string());
            }
        }

        cleanup_path(root);
    }

    void test_local_listing_fallback()
    {
        const auto root = std::filesystem::temp_directory_path() / "sftpbridge_fallback_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);
        touch(root / "only.txt");

        LocalFilesystem fs(root);
        DirectoryListingUnifier unifier(fs);

        const auto missing = unifier.list_local((root / "does-not-exist").string());
        assert(missing.listing.path == root.string());
        assert(missing.warnings.size() == 1);
        assert(missing.warnings.front().find("Path not found") == 0);
        assert(has_entry(missing.listing, "only.txt"));

        const auto empty_request = unifier.list_local("");
        assert(empty_request.listing.path == root.string());
        assert(empty_request.warnings.empty());

        // A regular file is not listable, so the default path is used instead.
        const auto not_a_directory = unifier.list_local((root / "only.txt").string());
        assert(not_a_directory.listing.path == root.string());
        assert(not_a_directory.warnings.size() == 1);

        LocalFilesystem broken(root / "gone");
        DirectoryListingUnifier broken_unifier(broken);
        bool failed = false;
        try
        {
            (void)broken_unifier.list_local("");
        }
        catch (const FilesystemError &error)
        {
            failed = error.code() == ErrorCode::LocalListingFailed;
        }
        assert(failed);

        cleanup_path(root);
    }

    void test_remote_entries()
    {
        const std::vector<RemoteDirEntry> records = {
            {.filename = ".", .longname = "drwxr-xr-x 2 u u 4096 .", .attributes = {}},
            {.filename = "..", .longname = "drwxr-xr-x 2 u u 4096 ..", .attributes = {}},
            {.filename = "src", .longname = "drwxr-xr-x 2 u u 4096 src",
             .attributes = {.size = 4096, .modified_time = 10, .permissions = 040755}},
            {.filename = "main.c", .longname = "-rw-r--r-- 1 u u 99 main.c",
             .attributes = {.size = 99, .modified_time = 20, .permissions = 0100644}},
        };
        const auto entries = DirectoryListingUnifier::to_entries("/home/alice/", records);
        assert(entries.size() == 2);
        assert(entries[0].name == "src");
        assert(entries[0].type == protocol::EntryType::Directory);
        assert(entries[0].permissions == 0755);
        assert(entries[0].path == "/home/alice/src");
        assert(entries[1].type == protocol::EntryType::File);
        assert(entries[1].size == 99);
        assert(entries[1].permissions == 0644);
    }

    void test_local_mutations()
    {
        const auto root = std::filesystem::temp_directory_path() / "sftpbridge_mutation_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);
        LocalFilesystem fs(root);

        fs.create_directory(root / "a" / "b");
        assert(std::filesystem::is_directory(root / "a" / "b"));
        touch(root / "a" / "b" / "file.txt");

        bool wrong_type = false;
        try
        {
            fs.remove(root / "a", protocol::EntryType::File);
        }
        catch (const FilesystemError &error)
        {
            wrong_type = error.code() == ErrorCode::MutationFailed;
        }
        assert(wrong_type);

        fs.remove(root / "a" / "b" / "file.txt", protocol::EntryType::File);
        assert(!std::filesystem::exists(root / "a" / "b" / "file.txt"));
        fs.remove(root / "a", protocol::EntryType::Directory);
        assert(!std::filesystem::exists(root / "a"));

        bool missing = false;
        try
        {
            fs.remove(root / "ghost.txt", protocol::EntryType::File);
        }
        catch (const FilesystemError &)
        {
            missing = true;
        }
        assert(missing);

        cleanup_path(root);
    }

    void test_log_buffer_capacity()
    {
        LogBuffer buffer(3);
        for (int i = 0; i < 5; ++i)
        {
            buffer.append(protocol::LogLevel::Info, "line " + std::to_string(i));
        }
        assert(buffer.size() == 3);
        const auto entries = buffer.entries();
        assert(entries.front().message == "line 2");
        assert(entries.back().message == "line 4");
        assert(!entries.back().timestamp.empty());
        assert(entries.back().timestamp.back() == 'Z');

        buffer.clear();
        assert(buffer.size() == 0);
        assert(buffer.capacity() == 3);
    }

    void test_connection_state_machine()
    {
        ConnectionStateMachine machine;
        assert(machine.state() == ConnectionState::Disconnected);
        assert(!machine.apply(ConnectionEvent::Ready));
        assert(!machine.apply(ConnectionEvent::DisconnectRequested));

        assert(machine.apply(ConnectionEvent::ConnectRequested));
        assert(!machine.apply(ConnectionEvent::ConnectRequested));
        assert(machine.apply(ConnectionEvent::Authenticated));
        assert(!machine.permits_remote_operations());
        assert(machine.apply(ConnectionEvent::Ready));
        assert(machine.permits_remote_operations());

        assert(machine.apply(ConnectionEvent::DisconnectRequested));
        assert(machine.state() == ConnectionState::Disconnecting);
        assert(!machine.apply(ConnectionEvent::End));
        assert(machine.apply(ConnectionEvent::Closed));
        assert(machine.state() == ConnectionState::Disconnected);

        assert(next_state(ConnectionState::Connecting, ConnectionEvent::Error) == ConnectionState::Disconnected);
        assert(next_state(ConnectionState::Connected, ConnectionEvent::End) == ConnectionState::Disconnected);
        assert(!next_state(ConnectionState::Connected, ConnectionEvent::Ready).has_value());
        assert(to_string(ConnectionState::Connecting) == "connecting");
    }

    void test_staging_area()
    {
        const auto root = std::filesystem::temp_directory_path() / "sftpbridge_staging_test";
        cleanup_path(root);
        StagingArea staging(root);
        assert(std::filesystem::is_directory(root));

        const auto first = staging.unique_path("report.pdf");
        const auto second = staging.unique_path("report.pdf");
        assert(first != second);
        assert(first.parent_path() == root);
        assert(first.filename().string().ends_with("-report.pdf"));
        assert(staging.unique_path("../../etc/passwd").filename().string().ends_with("-passwd"));

        const std::vector<std::byte> content = {std::byte{'o'}, std::byte{'k'}};
        std::filesystem::path staged_path;
        {
            auto staged = staging.stage("ok.txt", content);
            staged_path = staged.path();
            assert(std::filesystem::file_size(staged_path) == 2);

            StagedFile moved = std::move(staged);
            assert(staged.empty());
            assert(moved.path() == staged_path);
        }
        assert(!std::filesystem::exists(staged_path));

        cleanup_path(root);
    }

    void test_progress_tracker()
    {
        assert(ProgressTracker::percent_of(0, 1000) == 0);
        assert(ProgressTracker::percent_of(5, 1000) == 1);
        assert(ProgressTracker::percent_of(4, 1000) == 0);
        assert(ProgressTracker::percent_of(995, 1000) == 100);
        assert(ProgressTracker::percent_of(0, 0) == 0);
        assert(ProgressTracker::percent_of(10, 0) == 100);

        ProgressTracker tracker(1000);
        assert(tracker.advance(1) == 0u);
        assert(!tracker.advance(1).has_value());
        assert(tracker.advance(500) == 50u);
        assert(tracker.advance(496) == 99u);
        assert(!tracker.advance(2).has_value());
        assert(tracker.transferred() == 1000);
        assert(tracker.complete() == 100);

        ProgressTracker unknown_size(0);
        assert(unknown_size.advance(64) == 99u);
        assert(!unknown_size.advance(64).has_value());
    }

} // namespace

void run_server_component_tests()
{
    test_remote_paths();
    test_local_listing_filters_hidden();
    test_local_listing_fallback();
    test_remote_entries();
    test_local_mutations();
    test_log_buffer_capacity();
    test_connection_state_machine();
    test_staging_area();
    test_progress_tracker();
}
