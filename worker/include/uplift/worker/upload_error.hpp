#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "uplift/upload_session.hpp"

namespace uplift::worker
{

    // A failure whose kind is already known at the throw site.
    class UploadError : public std::runtime_error
    {
    public:
        UploadError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message),
              kind_(kind)
        {
        }

        ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    // Thrown from a checkpoint once the worker has been asked to stop.
    class UploadInterrupted : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    ErrorKind classify_error(const std::exception &error) noexcept;

} // namespace uplift::worker
