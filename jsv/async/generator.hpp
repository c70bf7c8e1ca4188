/*
 * generator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-24

Description: C++20 coroutine-based generator used for lazy error streams

**************************************************/

#ifndef JSV_ASYNC_GENERATOR_HPP
#define JSV_ASYNC_GENERATOR_HPP

#include <concepts>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <iterator>
#include <type_traits>
#include <utility>

namespace jsv::async {

/**
 * @brief A generator class using C++20 coroutines
 *
 * Values are produced on demand: the coroutine body runs only while the
 * consumer advances an iterator, so abandoning the iteration early stops
 * all further work. An exception escaping the body is rethrown to the
 * consumer from begin() or operator++.
 *
 * @tparam T The type of values yielded by the generator
 */
template <typename T>
class Generator {
public:
    struct promise_type;

    /**
     * @brief Input iterator over the yielded values
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = std::remove_reference_t<T>;
        using pointer = value_type*;
        using reference = value_type&;

        explicit iterator(std::coroutine_handle<promise_type> handle = nullptr)
            : handle_(handle) {}

        iterator& operator++() {
            if (!handle_ || handle_.done()) {
                handle_ = nullptr;
                return *this;
            }
            handle_.resume();
            if (handle_.done()) {
                auto handle = std::exchange(handle_, nullptr);
                handle.promise().rethrowIfFailed();
            }
            return *this;
        }

        void operator++(int) { ++(*this); }

        bool operator==(const iterator& other) const {
            return handle_ == other.handle_;
        }

        bool operator!=(const iterator& other) const {
            return !(*this == other);
        }

        // The yielded value may be moved out by the consumer.
        T& operator*() const { return handle_.promise().value_; }

        T* operator->() const { return &handle_.promise().value_; }

    private:
        std::coroutine_handle<promise_type> handle_;
    };

    /**
     * @brief Promise type for the generator coroutine
     */
    struct promise_type {
        T value_{};
        std::exception_ptr exception_;

        Generator get_return_object() {
            return Generator{
                std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        template <std::convertible_to<T> From>
        std::suspend_always yield_value(From&& from) {
            value_ = std::forward<From>(from);
            return {};
        }

        void unhandled_exception() { exception_ = std::current_exception(); }

        void return_void() {}

        void rethrowIfFailed() const {
            if (exception_) {
                std::rethrow_exception(exception_);
            }
        }
    };

    explicit Generator(std::coroutine_handle<promise_type> handle)
        : handle_(handle) {}

    ~Generator() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    Generator(Generator&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)) {}

    Generator& operator=(Generator&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    /**
     * @brief Starts the coroutine and returns an iterator to the first value
     *
     * @throws Any exception thrown by the coroutine body before its first
     * yield.
     */
    iterator begin() {
        if (handle_) {
            handle_.resume();
            if (handle_.done()) {
                handle_.promise().rethrowIfFailed();
                return end();
            }
        }
        return iterator{handle_};
    }

    iterator end() { return iterator{nullptr}; }

private:
    std::coroutine_handle<promise_type> handle_;
};

}  // namespace jsv::async

#endif  // JSV_ASYNC_GENERATOR_HPP
