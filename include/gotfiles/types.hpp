#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace gotfiles
{

    /**
     * Error categories for gotfiles operations
     */
    enum class ErrorCode
    {
        ConfigError,
        IOError,
        NotFound,
        ProcessError,
        InvalidInput,
        InternalError
    };

    /**
     * gotfiles error with code and message
     */
    class GotfilesError : public std::runtime_error
    {
    public:
        ErrorCode code;

        GotfilesError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static GotfilesError config(const std::string &msg)
        {
            return GotfilesError(ErrorCode::ConfigError, msg);
        }

        static GotfilesError io(const std::string &msg)
        {
            return GotfilesError(ErrorCode::IOError, msg);
        }

        static GotfilesError not_found(const std::string &msg)
        {
            return GotfilesError(ErrorCode::NotFound, msg);
        }

        static GotfilesError process(const std::string &msg)
        {
            return GotfilesError(ErrorCode::ProcessError, msg);
        }

        static GotfilesError invalid_input(const std::string &msg)
        {
            return GotfilesError(ErrorCode::InvalidInput, msg);
        }

        static GotfilesError internal(const std::string &msg)
        {
            return GotfilesError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, GotfilesError>;

} // namespace gotfiles
