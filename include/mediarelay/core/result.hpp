// MediaRelay - WebRTC SFU Signaling Server
// Result type for error propagation without exceptions

#ifndef MEDIARELAY_CORE_RESULT_HPP
#define MEDIARELAY_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace mediarelay {
namespace core {

/**
 * @brief Holds either a success value or an error value.
 *
 * Every fallible operation in MediaRelay returns a Result. Accessing the
 * wrong alternative throws std::logic_error, which is a programming error
 * and never part of normal control flow.
 *
 * @tparam T Success value type
 * @tparam E Error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    [[nodiscard]] T& value() & {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireSuccess();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Success value, or the given fallback on error.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : std::move(fallback);
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : std::move(fallback);
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : storage_(tag, std::forward<V>(v)) {}

    void requireSuccess() const {
        if (isError()) {
            throw std::logic_error("Result: value() called on error result");
        }
    }

    void requireError() const {
        if (isSuccess()) {
            throw std::logic_error("Result: error() called on success result");
        }
    }

    // Index 0 holds the value, index 1 the error; T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that only report success or an error.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        Result r;
        r.failed_ = true;
        r.error_ = std::move(err);
        return r;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return !failed_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return failed_;
    }

    [[nodiscard]] E& error() & {
        if (!failed_) {
            throw std::logic_error("Result: error() called on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (!failed_) {
            throw std::logic_error("Result: error() called on success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() : error_{}, failed_(false) {}

    E error_;
    bool failed_;
};

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_RESULT_HPP
