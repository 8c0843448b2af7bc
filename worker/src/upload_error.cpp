#include "uplift/worker/upload_error.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace uplift::worker
{

    namespace
    {

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        bool is_network_errc(const std::error_code &code)
        {
            static constexpr std::errc kNetworkErrors[] = {
                std::errc::connection_refused,
                std::errc::connection_reset,
                std::errc::connection_aborted,
                std::errc::host_unreachable,
                std::errc::network_unreachable,
                std::errc::network_down,
                std::errc::network_reset,
                std::errc::not_connected,
                std::errc::broken_pipe,
            };
            return std::any_of(std::begin(kNetworkErrors), std::end(kNetworkErrors), [&](std::errc errc)
                               { return code == errc; });
        }

        ErrorKind classify_message(std::string_view message)
        {
            const auto lower = to_lower(std::string(message));
            const auto contains = [&](std::string_view needle)
            { return lower.find(needle) != std::string::npos; };

            if (contains("timeout") || contains("timed out") || contains("504"))
            {
                return ErrorKind::Timeout;
            }
            if (contains("connection") || contains("network"))
            {
                return ErrorKind::Network;
            }
            if (contains("file") && contains("not found"))
            {
                return ErrorKind::FileNotFound;
            }
            if (contains("too large"))
            {
                return ErrorKind::FileTooLarge;
            }
            return ErrorKind::Unknown;
        }

    } // namespace

    ErrorKind classify_error(const std::exception &error) noexcept
    {
        try
        {
            if (const auto *upload = dynamic_cast<const UploadError *>(&error))
            {
                return upload->kind();
            }
            if (const auto *fs = dynamic_cast<const std::filesystem::filesystem_error *>(&error))
            {
                if (fs->code() == std::errc::no_such_file_or_directory)
                {
                    return ErrorKind::FileNotFound;
                }
                return classify_message(fs->what());
            }
            if (const auto *system = dynamic_cast<const std::system_error *>(&error))
            {
                if (system->code() == std::errc::timed_out)
                {
                    return ErrorKind::Timeout;
                }
                if (is_network_errc(system->code()))
                {
                    return ErrorKind::Network;
                }
            }
            return classify_message(error.what());
        }
        catch (const std::bad_alloc &)
        {
            return ErrorKind::Unknown;
        }
    }

} // namespace uplift::worker
