#include <cassert>
#include <cctype>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "test_support.hpp"
#include "uplift/state_store.hpp"
#include "uplift/worker/config.hpp"
#include "uplift/worker/http_client.hpp"
#include "uplift/worker/storage_backend.hpp"
#include "uplift/worker/upload_error.hpp"
#include "uplift/worker/upload_worker.hpp"

using namespace uplift;
using namespace uplift::testing;
using namespace uplift::worker;

namespace
{

    std::string seed_session(StateStore &store, const std::string &source, SourceKind kind)
    {
        const std::string id = "upload_" + std::string(kind == SourceKind::File ? "f" : "u") + "0000000_1700000000";
        UploadSession session;
        session.source = source;
        session.source_kind = kind;
        session.created_at = Clock::now();
        store.put(id, session);
        return id;
    }

    WorkerOptions quick_options(const std::filesystem::path &temp_directory)
    {
        WorkerOptions options;
        options.retry.base_delay = std::chrono::milliseconds{0};
        options.heartbeat_interval = std::chrono::milliseconds{0};
        options.temp_directory = temp_directory;
        return options;
    }

    ErrorKind failure_kind(HttpClient &client, const HttpRequest &request)
    {
        try
        {
            (void)client.send(request);
        }
        catch (const UploadError &ex)
        {
            return ex.kind();
        }
        assert(false && "expected the request to fail");
        return ErrorKind::Unknown;
    }

    void test_http_client_failures()
    {
        HttpClient client({.timeout = std::chrono::seconds{1}});

        HttpRequest unsupported;
        unsupported.url = "ftp://example.com/file";
        assert(failure_kind(client, unsupported) == ErrorKind::Unknown);

        HttpRequest refused;
        refused.url = "http://127.0.0.1:1/";
        assert(failure_kind(client, refused) == ErrorKind::Network);

        // A peer that accepts and then stays silent runs into the inactivity deadline.
        LoopbackServer silent({[](const CapturedRequest &)
                               {
                                   std::this_thread::sleep_for(std::chrono::milliseconds{2500});
                                   return http_response(200, "OK", "late");
                               }});
        HttpRequest slow;
        slow.url = silent.base_url() + "/slow";
        assert(failure_kind(client, slow) == ErrorKind::Timeout);
    }

    void test_http_client_stops_when_cancelled()
    {
        LoopbackServer server({[](const CapturedRequest &)
                               {
                                   std::this_thread::sleep_for(std::chrono::milliseconds{1500});
                                   return http_response(200, "OK", "late");
                               }});
        const auto started = std::chrono::steady_clock::now();
        HttpClient client({.timeout = std::chrono::seconds{10}}, [&]
                          { return std::chrono::steady_clock::now() - started > std::chrono::milliseconds{200}; });
        HttpRequest request;
        request.url = server.base_url() + "/hold";

        bool interrupted = false;
        try
        {
            (void)client.send(request);
        }
        catch (const UploadInterrupted &)
        {
            interrupted = true;
        }
        assert(interrupted);
        assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds{1200});
    }

    void test_error_classification()
    {
        assert(classify_error(UploadError(ErrorKind::FileTooLarge, "whatever")) == ErrorKind::FileTooLarge);
        assert(classify_error(std::system_error(std::make_error_code(std::errc::timed_out))) == ErrorKind::Timeout);
        assert(classify_error(std::system_error(std::make_error_code(std::errc::connection_refused))) ==
               ErrorKind::Network);
        assert(classify_error(std::filesystem::filesystem_error(
                   "open", "/missing", std::make_error_code(std::errc::no_such_file_or_directory))) ==
               ErrorKind::FileNotFound);
        assert(classify_error(std::runtime_error("Request timed out")) == ErrorKind::Timeout);
        assert(classify_error(std::runtime_error("HTTP 504 Gateway")) == ErrorKind::Timeout);
        assert(classify_error(std::runtime_error("Connection reset by peer")) == ErrorKind::Network);
        assert(classify_error(std::runtime_error("file not found: x")) == ErrorKind::FileNotFound);
        assert(classify_error(std::runtime_error("payload too large")) == ErrorKind::FileTooLarge);
        assert(classify_error(std::runtime_error("something odd")) == ErrorKind::Unknown);
    }

    void test_content_types()
    {
        assert(guess_content_type("photo.PNG") == "image/png");
        assert(guess_content_type("clip.mp4") == "video/mp4");
        assert(guess_content_type("weights.bin") == "application/octet-stream");
    }

    void test_worker_arguments()
    {
        std::vector<std::string> words = {"uplift-worker", "--session-id", "upload_0a1b2c3d_1", "--source",
                                          "https://example.com/a.png", "--kind", "url", "--state-dir",
                                          "/tmp/uplift-state", "--timeout", "15", "--log-level", "debug"};
        std::vector<char *> argv;
        for (auto &word : words)
        {
            argv.push_back(word.data());
        }
        const auto config = parse_arguments(static_cast<int>(argv.size()), argv.data());
        assert(config.session_id == "upload_0a1b2c3d_1");
        assert(config.kind == SourceKind::Url);
        assert(config.state_dir == "/tmp/uplift-state");
        assert(config.request_timeout == std::chrono::seconds{15});
        assert(config.log_level == spdlog::level::debug);

        std::vector<std::string> bad = {"uplift-worker", "--session-id", "x", "--kind", "ftp"};
        std::vector<char *> bad_argv;
        for (auto &word : bad)
        {
            bad_argv.push_back(word.data());
        }
        bool caught = false;
        try
        {
            (void)parse_arguments(static_cast<int>(bad_argv.size()), bad_argv.data());
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_storage_backend_upload()
    {
        TempDir dir("backend_upload");
        const auto file = dir.path() / "pic.png";
        write_file(file, "PNGDATA-0123456789");

        LoopbackServer server({
            [](const CapturedRequest &request)
            {
                const nlohmann::json reply = {
                    {"upload_url", "http://" + request.headers.at("host") + "/put/abc"},
                    {"file_url", "https://cdn.example/pic.png"},
                };
                return http_response(200, "OK", reply.dump(), "Content-Type: application/json\r\n");
            },
            [](const CapturedRequest &)
            { return http_response(200, "OK", ""); },
        });

        HttpStorageOptions options;
        options.initiate_url = server.base_url() + "/storage/upload/initiate?storage_type=test";
        options.api_key = "k-123";
        options.http.timeout = std::chrono::seconds{5};
        HttpStorageBackend backend(options);

        const auto url = backend.upload(file, [] { return false; });
        assert(url == "https://cdn.example/pic.png");

        const auto &requests = server.requests();
        assert(requests.size() == 2);
        assert(requests[0].method == "POST");
        assert(requests[0].target == "/storage/upload/initiate?storage_type=test");
        assert(requests[0].headers.at("authorization") == "Key k-123");
        const auto initiate = nlohmann::json::parse(requests[0].body);
        assert(initiate.at("content_type") == "image/png");
        assert(initiate.at("file_name") == "pic.png");

        assert(requests[1].method == "PUT");
        assert(requests[1].target == "/put/abc");
        assert(requests[1].headers.at("content-type") == "image/png");
        assert(requests[1].body == "PNGDATA-0123456789");
    }

    void test_storage_backend_status_mapping()
    {
        TempDir dir("backend_status");
        const auto file = dir.path() / "big.bin";
        write_file(file, "x");

        const auto upload_with_status = [&](int status, const std::string &reason)
        {
            LoopbackServer server({[=](const CapturedRequest &)
                                   { return http_response(status, reason, "nope"); }});
            HttpStorageOptions options;
            options.initiate_url = server.base_url() + "/initiate";
            options.api_key = "k";
            options.http.timeout = std::chrono::seconds{5};
            HttpStorageBackend backend(options);
            try
            {
                (void)backend.upload(file, [] { return false; });
            }
            catch (const UploadError &ex)
            {
                assert(std::string(ex.what()).find(std::to_string(status)) != std::string::npos);
                return ex.kind();
            }
            assert(false && "expected the upload to fail");
            return ErrorKind::Unknown;
        };

        assert(upload_with_status(413, "Payload Too Large") == ErrorKind::FileTooLarge);
        assert(upload_with_status(504, "Gateway Timeout") == ErrorKind::Timeout);
        assert(upload_with_status(408, "Request Timeout") == ErrorKind::Timeout);
        assert(upload_with_status(500, "Internal Server Error") == ErrorKind::Unknown);
    }

    void test_storage_backend_fetch()
    {
        TempDir dir("backend_fetch");
        LoopbackServer server({
            [](const CapturedRequest &)
            { return http_response(302, "Found", "", "Location: /final\r\n"); },
            [](const CapturedRequest &)
            {
                return std::string("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
                                   "6\r\nhello \r\n5\r\nworld\r\n0\r\n\r\n");
            },
            [](const CapturedRequest &)
            { return http_response(200, "OK", "0123456789"); },
        });

        HttpStorageOptions options;
        options.http.timeout = std::chrono::seconds{5};
        HttpStorageBackend backend(options);

        const auto chunked = dir.path() / "chunked.txt";
        backend.fetch(server.base_url() + "/start", chunked, {}, [] { return false; });
        assert(read_file(chunked) == "hello world");
        assert(server.requests()[1].target == "/final");

        const auto sized = dir.path() / "sized.txt";
        std::uint64_t last_received = 0;
        std::optional<std::uint64_t> last_total;
        backend.fetch(
            server.base_url() + "/sized", sized,
            [&](std::uint64_t received, std::optional<std::uint64_t> total)
            {
                last_received = received;
                last_total = total;
            },
            [] { return false; });
        assert(read_file(sized) == "0123456789");
        assert(last_received == 10);
        assert(last_total == 10u);
    }

    void test_worker_uploads_file()
    {
        TempDir dir("worker_file");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.png";
        write_file(file, "image-bytes");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        FakeBackend backend;
        UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store, backend,
                            quick_options(dir.path()));
        assert(worker.run() == UploadStatus::Completed);

        const auto session = store.get(id);
        assert(session->status == UploadStatus::Completed);
        assert(session->progress == 1.0);
        assert(session->result_url == "https://cdn.example/input.png");
        assert(session->size_bytes == 11);
        assert(session->content_hash && session->content_hash->size() == 64);
        assert(!session->error);
        assert(session->retry_count == 0);
        assert(backend.upload_calls == 1);
    }

    void test_worker_retries_then_fails()
    {
        TempDir dir("worker_retry_fail");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.bin";
        write_file(file, "data");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        FakeBackend backend;
        backend.on_upload = [](const std::filesystem::path &, const CancelCheck &) -> std::string
        { throw UploadError(ErrorKind::Network, "Connection refused by storage"); };

        UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store, backend,
                            quick_options(dir.path()));
        assert(worker.run() == UploadStatus::Failed);

        const auto session = store.get(id);
        assert(backend.upload_calls == 3);
        assert(session->retry_count == 3);
        assert(session->error == "Connection refused by storage");
        assert(session->error_kind == ErrorKind::Network);
        assert(session->last_error && session->last_error->find("attempt 3") != std::string::npos);
        assert(!session->result_url);
    }

    void test_worker_recovers_after_transient_failure()
    {
        TempDir dir("worker_retry_ok");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.bin";
        write_file(file, "data");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        FakeBackend backend;
        backend.on_upload = [&backend](const std::filesystem::path &, const CancelCheck &) -> std::string
        {
            if (backend.upload_calls == 1)
            {
                throw std::runtime_error("Request timed out");
            }
            return "https://cdn.example/second-try";
        };

        UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store, backend,
                            quick_options(dir.path()));
        assert(worker.run() == UploadStatus::Completed);
        const auto session = store.get(id);
        assert(session->retry_count == 1);
        assert(session->result_url == "https://cdn.example/second-try");
        assert(!session->error);
    }

    void test_worker_missing_and_oversized_files()
    {
        TempDir dir("worker_file_errors");
        StateStore store(dir.path() / "state");
        FakeBackend backend;

        const auto missing = dir.path() / "gone.png";
        auto id = seed_session(store, missing.string(), SourceKind::File);
        UploadWorker missing_worker({.session_id = id, .source = missing.string(), .kind = SourceKind::File},
                                    store, backend, quick_options(dir.path()));
        assert(missing_worker.run() == UploadStatus::Failed);
        assert(store.get(id)->error_kind == ErrorKind::FileNotFound);

        const auto huge = dir.path() / "huge.bin";
        make_file_of_size(huge, kMaxUploadBytes + 1);
        store.remove(id);
        id = seed_session(store, huge.string(), SourceKind::File);
        UploadWorker huge_worker({.session_id = id, .source = huge.string(), .kind = SourceKind::File}, store,
                                 backend, quick_options(dir.path()));
        assert(huge_worker.run() == UploadStatus::Failed);
        assert(store.get(id)->error_kind == ErrorKind::FileTooLarge);
        assert(backend.upload_calls == 0);
    }

    void test_worker_stop_request()
    {
        TempDir dir("worker_stop");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.bin";
        write_file(file, "data");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        FakeBackend backend;
        UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store, backend,
                            quick_options(dir.path()));
        worker.request_stop();
        assert(worker.run() == UploadStatus::Cancelled);
        const auto session = store.get(id);
        assert(session->error_kind == ErrorKind::Cancelled);
        assert(session->error == "upload stopped on request");
        assert(backend.upload_calls == 0);
    }

    void test_worker_signal_interrupts_upload()
    {
        TempDir dir("worker_signal");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.bin";
        write_file(file, "data");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        // The stop flag set by the handler is process-wide, so the worker runs in a child.
        const pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0)
        {
            int code = 1;
            try
            {
                UploadWorker::install_signal_handlers();
                FakeBackend backend;
                backend.on_upload = [](const std::filesystem::path &, const CancelCheck &cancelled) -> std::string
                {
                    while (!cancelled())
                    {
                        std::this_thread::sleep_for(std::chrono::milliseconds{10});
                    }
                    throw UploadInterrupted("stop requested mid-transfer");
                };
                UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store,
                                    backend, quick_options(dir.path()));
                code = worker.run() == UploadStatus::Cancelled ? 0 : 1;
            }
            catch (const std::exception &ex)
            {
                std::cerr << "signalled worker: " << ex.what() << '\n';
            }
            ::_exit(code);
        }

        assert(wait_until([&]
                          {
            const auto session = store.get(id);
            return session && session->status == UploadStatus::Uploading; }));
        ::kill(pid, SIGTERM);
        reap(pid);

        const auto session = store.get(id);
        assert(session->status == UploadStatus::Cancelled);
        assert(session->error == "upload interrupted by signal");
        assert(session->error_kind == ErrorKind::Cancelled);
        assert(!session->result_url);
    }

    void test_worker_stops_when_cancelled_mid_upload()
    {
        TempDir dir("worker_cancel_mid");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.bin";
        write_file(file, "data");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        // Another process cancels the session while the bytes are in flight.
        FakeBackend backend;
        backend.on_upload = [&](const std::filesystem::path &, const CancelCheck &) -> std::string
        {
            StateStore other(store.directory());
            other.update(id, [](UploadSession &session)
                         { mark_cancelled(session, "cancelled by caller"); });
            return "https://cdn.example/too-late";
        };

        UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store, backend,
                            quick_options(dir.path()));
        assert(worker.run() == UploadStatus::Cancelled);
        const auto session = store.get(id);
        assert(session->error == "cancelled by caller");
        assert(!session->result_url);
    }

    void test_worker_downloads_url_source()
    {
        TempDir dir("worker_url");
        StateStore store(dir.path() / "state");
        const auto temp = dir.path() / "tmp";
        const std::string url = "https://example.com/media/clip.mp4?sig=abc";
        const auto id = seed_session(store, url, SourceKind::Url);

        FakeBackend backend;
        std::vector<UploadStatus> seen_during_fetch;
        backend.on_fetch = [&](const std::string &source, const std::filesystem::path &destination,
                               const FetchProgress &progress, const CancelCheck &)
        {
            assert(source == url);
            seen_during_fetch.push_back(store.get(id)->status);
            write_file(destination, std::string(1000, 'v'));
            progress(500, 1000);
            progress(1000, 1000);
        };
        std::filesystem::path uploaded_from;
        backend.on_upload = [&](const std::filesystem::path &file, const CancelCheck &) -> std::string
        {
            uploaded_from = file;
            assert(std::filesystem::exists(file));
            assert(store.get(id)->status == UploadStatus::Uploading);
            assert(std::abs(store.get(id)->progress - 0.5) < 1e-9);
            return "https://cdn.example/clip.mp4";
        };

        UploadWorker worker({.session_id = id, .source = url, .kind = SourceKind::Url}, store, backend,
                            quick_options(temp));
        assert(worker.run() == UploadStatus::Completed);

        assert(seen_during_fetch.size() == 1 && seen_during_fetch.front() == UploadStatus::Downloading);
        assert(uploaded_from.extension() == ".mp4");
        assert(uploaded_from.parent_path() == temp);
        assert(!std::filesystem::exists(uploaded_from));

        const auto session = store.get(id);
        assert(session->size_bytes == 1000);
        assert(session->result_url == "https://cdn.example/clip.mp4");
    }

    void test_worker_heartbeat_refreshes_record()
    {
        TempDir dir("worker_heartbeat");
        StateStore store(dir.path() / "state");
        const auto file = dir.path() / "input.bin";
        write_file(file, "data");
        const auto id = seed_session(store, file.string(), SourceKind::File);

        FakeBackend backend;
        backend.on_upload = [&](const std::filesystem::path &, const CancelCheck &) -> std::string
        {
            const auto before = store.get(id)->updated_at;
            std::this_thread::sleep_for(std::chrono::milliseconds{300});
            assert(store.get(id)->updated_at > before);
            return "https://cdn.example/slow";
        };

        auto options = quick_options(dir.path());
        options.heartbeat_interval = std::chrono::milliseconds{50};
        UploadWorker worker({.session_id = id, .source = file.string(), .kind = SourceKind::File}, store, backend,
                            options);
        assert(worker.run() == UploadStatus::Completed);
    }

} // namespace

void run_worker_component_tests()
{
    test_http_client_failures();
    test_http_client_stops_when_cancelled();
    test_error_classification();
    test_content_types();
    test_worker_arguments();
    test_storage_backend_upload();
    test_storage_backend_status_mapping();
    test_storage_backend_fetch();
    test_worker_uploads_file();
    test_worker_retries_then_fails();
    test_worker_recovers_after_transient_failure();
    test_worker_missing_and_oversized_files();
    test_worker_stop_request();
    test_worker_signal_interrupts_upload();
    test_worker_stops_when_cancelled_mid_upload();
    test_worker_downloads_url_source();
    test_worker_heartbeat_refreshes_record();
    std::cout << "worker component tests passed\n";
}
