/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exception base carrying its throw site

**************************************************/

#ifndef JSV_ERROR_EXCEPTION_HPP
#define JSV_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "jsv/macro.hpp"

namespace jsv::error {

/**
 * @brief Base exception recording where it was thrown.
 *
 * The message is assembled from every trailing constructor argument with
 * operator<<, so callers can pass strings and numbers directly.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception.
     * @param file File in which the exception was thrown.
     * @param line Line at which the exception was thrown.
     * @param func Function that threw.
     * @param args Message fragments.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file), line_(line), func_(func) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
        thread_id_ = std::this_thread::get_id();
    }

    /**
     * @brief The message followed by the throw site, on one line, e.g.
     *        "bad input [parse() at parser.cpp:12]".
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

}  // namespace jsv::error

#define THROW_EXCEPTION(...)                                              \
    throw jsv::error::Exception(JSV_FILE_NAME, JSV_FILE_LINE, JSV_FUNC_NAME, \
                                __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                   \
    throw jsv::error::InvalidArgument(JSV_FILE_NAME, JSV_FILE_LINE,   \
                                      JSV_FUNC_NAME, __VA_ARGS__)

#endif  // JSV_ERROR_EXCEPTION_HPP
