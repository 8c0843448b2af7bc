#include "uplift/worker/http_client.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "uplift/worker/upload_error.hpp"

namespace uplift::worker
{

    namespace
    {
        constexpr auto kWaitSlice = std::chrono::milliseconds{100};
        constexpr std::size_t kMaxErrorBody = 4 * 1024;

        struct EasyDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct MultiDeleter
        {
            void operator()(CURLM *handle) const noexcept { curl_multi_cleanup(handle); }
        };

        struct HeaderListDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
        using MultiHandle = std::unique_ptr<CURLM, MultiDeleter>;
        using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

        // Keeps an easy handle attached to a multi handle for the lifetime of one transfer.
        class Attachment
        {
        public:
            Attachment(CURLM *multi, CURL *easy)
                : multi_(multi),
                  easy_(easy)
            {
                if (const auto rc = curl_multi_add_handle(multi_, easy_); rc != CURLM_OK)
                {
                    throw UploadError(ErrorKind::Unknown, std::string("curl_multi_add_handle: ") + curl_multi_strerror(rc));
                }
            }

            ~Attachment()
            {
                curl_multi_remove_handle(multi_, easy_);
            }

            Attachment(const Attachment &) = delete;
            Attachment &operator=(const Attachment &) = delete;

        private:
            CURLM *multi_;
            CURL *easy_;
        };

        void init_curl()
        {
            static std::once_flag flag;
            std::call_once(flag, []
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw std::runtime_error("libcurl initialization failed");
                } });
        }

        template <typename Value>
        void set_option(CURL *easy, CURLoption option, Value value)
        {
            if (const auto rc = curl_easy_setopt(easy, option, value); rc != CURLE_OK)
            {
                throw UploadError(ErrorKind::Unknown, std::string("curl_easy_setopt: ") + curl_easy_strerror(rc));
            }
        }

        ErrorKind kind_of(CURLcode code) noexcept
        {
            switch (code)
            {
            case CURLE_OPERATION_TIMEDOUT:
                return ErrorKind::Timeout;
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_SSL_CONNECT_ERROR:
                return ErrorKind::Network;
            default:
                return ErrorKind::Unknown;
            }
        }

        struct Transfer
        {
            CURL *easy{};
            const BodySink *sink{};
            std::ifstream *upload{};
            HttpResponse response{};
            std::exception_ptr failure{};
        };

        void capture_head(Transfer &transfer)
        {
            curl_easy_getinfo(transfer.easy, CURLINFO_RESPONSE_CODE, &transfer.response.status);
            curl_off_t length = -1;
            if (curl_easy_getinfo(transfer.easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
                length >= 0)
            {
                transfer.response.content_length = static_cast<std::uint64_t>(length);
            }
        }

        std::size_t on_body(char *data, std::size_t size, std::size_t count, void *user)
        {
            auto &transfer = *static_cast<Transfer *>(user);
            const auto bytes = size * count;
            const std::string_view chunk(data, bytes);
            capture_head(transfer);
            auto &body = transfer.response.body;

            if (!transfer.response.ok())
            {
                if (body.size() < kMaxErrorBody)
                {
                    body.append(chunk.substr(0, kMaxErrorBody - body.size()));
                }
                return bytes;
            }
            if (transfer.sink == nullptr)
            {
                body.append(chunk);
                return bytes;
            }
            try
            {
                (*transfer.sink)(chunk, transfer.response);
            }
            catch (...)
            {
                // Rethrown once curl has unwound; a short count aborts the transfer.
                transfer.failure = std::current_exception();
                return 0;
            }
            return bytes;
        }

        std::size_t on_upload(char *buffer, std::size_t size, std::size_t count, void *user)
        {
            auto &transfer = *static_cast<Transfer *>(user);
            transfer.upload->read(buffer, static_cast<std::streamsize>(size * count));
            if (transfer.upload->bad())
            {
                return CURL_READFUNC_ABORT;
            }
            return static_cast<std::size_t>(transfer.upload->gcount());
        }

    } // namespace

    HttpClient::HttpClient(Options options, CancelCheck cancelled)
        : options_(std::move(options)),
          cancelled_(std::move(cancelled))
    {
    }

    HttpResponse HttpClient::send(const HttpRequest &request)
    {
        return perform(request, nullptr);
    }

    HttpResponse HttpClient::send(const HttpRequest &request, const BodySink &sink)
    {
        return perform(request, &sink);
    }

    HttpResponse HttpClient::perform(const HttpRequest &request, const BodySink *sink)
    {
        init_curl();
        char error_buffer[CURL_ERROR_SIZE] = {};
        EasyHandle easy(curl_easy_init());
        MultiHandle multi(curl_multi_init());
        if (!easy || !multi)
        {
            throw UploadError(ErrorKind::Unknown, "Failed to initialize libcurl handles");
        }

        Transfer transfer;
        transfer.easy = easy.get();
        transfer.sink = sink;

        const auto timeout_ms = static_cast<long>(options_.timeout.count());
        set_option(easy.get(), CURLOPT_URL, request.url.c_str());
        set_option(easy.get(), CURLOPT_ERRORBUFFER, error_buffer);
        set_option(easy.get(), CURLOPT_NOSIGNAL, 1L);
        set_option(easy.get(), CURLOPT_PROTOCOLS_STR, "http,https");
        set_option(easy.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
        set_option(easy.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        set_option(easy.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
        // Any stretch of the timeout without a single byte moving aborts with CURLE_OPERATION_TIMEDOUT.
        set_option(easy.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        set_option(easy.get(), CURLOPT_LOW_SPEED_TIME, std::max(1L, timeout_ms / 1000));
        set_option(easy.get(), CURLOPT_WRITEFUNCTION, &on_body);
        set_option(easy.get(), CURLOPT_WRITEDATA, static_cast<void *>(&transfer));

        HeaderList headers;
        const auto append_header = [&headers](const std::string &line)
        {
            auto *extended = curl_slist_append(headers.get(), line.c_str());
            if (extended == nullptr)
            {
                throw UploadError(ErrorKind::Unknown, "Failed to build request headers");
            }
            headers.release();
            headers.reset(extended);
        };
        for (const auto &[name, value] : request.headers)
        {
            append_header(name + ": " + value);
        }
        // Bodies go out immediately instead of waiting on a 100-continue.
        append_header("Expect:");
        set_option(easy.get(), CURLOPT_HTTPHEADER, headers.get());

        std::ifstream upload;
        if (request.body_file)
        {
            upload.open(*request.body_file, std::ios::binary);
            if (!upload)
            {
                throw std::filesystem::filesystem_error("open", *request.body_file,
                                                        std::make_error_code(std::errc::no_such_file_or_directory));
            }
            transfer.upload = &upload;
            set_option(easy.get(), CURLOPT_UPLOAD, 1L);
            set_option(easy.get(), CURLOPT_READFUNCTION, &on_upload);
            set_option(easy.get(), CURLOPT_READDATA, static_cast<void *>(&transfer));
            set_option(easy.get(), CURLOPT_INFILESIZE_LARGE,
                       static_cast<curl_off_t>(std::filesystem::file_size(*request.body_file)));
            if (request.method != "PUT")
            {
                set_option(easy.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
        }
        else if (request.method == "GET")
        {
            set_option(easy.get(), CURLOPT_HTTPGET, 1L);
            set_option(easy.get(), CURLOPT_FOLLOWLOCATION, 1L);
            set_option(easy.get(), CURLOPT_MAXREDIRS, options_.max_redirects);
        }
        else
        {
            set_option(easy.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            set_option(easy.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            if (request.method != "POST")
            {
                set_option(easy.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
        }

        CURLcode result = CURLE_OK;
        {
            const Attachment attachment(multi.get(), easy.get());
            int running = 1;
            while (running > 0)
            {
                if (const auto rc = curl_multi_perform(multi.get(), &running); rc != CURLM_OK)
                {
                    throw UploadError(ErrorKind::Unknown, std::string("curl_multi_perform: ") + curl_multi_strerror(rc));
                }
                if (running == 0)
                {
                    break;
                }
                if (cancelled_ && cancelled_())
                {
                    throw UploadInterrupted("stop requested during " + request.method + " " + request.url);
                }
                if (const auto rc = curl_multi_poll(multi.get(), nullptr, 0, static_cast<int>(kWaitSlice.count()), nullptr);
                    rc != CURLM_OK)
                {
                    throw UploadError(ErrorKind::Unknown, std::string("curl_multi_poll: ") + curl_multi_strerror(rc));
                }
            }
            int queued = 0;
            while (const CURLMsg *message = curl_multi_info_read(multi.get(), &queued))
            {
                if (message->msg == CURLMSG_DONE && message->easy_handle == easy.get())
                {
                    result = message->data.result;
                }
            }
        }

        if (transfer.failure)
        {
            std::rethrow_exception(transfer.failure);
        }
        if (result != CURLE_OK)
        {
            const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);
            throw UploadError(kind_of(result), request.method + " " + request.url + " failed: " + detail);
        }

        auto response = std::move(transfer.response);
        curl_easy_getinfo(easy.get(), CURLINFO_RESPONSE_CODE, &response.status);
        const char *final_url = nullptr;
        if (curl_easy_getinfo(easy.get(), CURLINFO_EFFECTIVE_URL, &final_url) == CURLE_OK && final_url != nullptr)
        {
            response.final_url = final_url;
        }
        else
        {
            response.final_url = request.url;
        }
        spdlog::debug("{} {} -> {}", request.method, response.final_url, response.status);
        return response;
    }

} // namespace uplift::worker
