#pragma once
#include <variant>
#include <utility>
#include <functional>
#include <type_traits>
#include <stdexcept>
#include <optional>
namespace blackipher::protocol {
template<typename T, typename E>
class Result;
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
template<typename T, typename E>
class Result {
private:
    std::variant<T, E> value_;
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    static Result FromOptional(std::optional<T> opt, E error_if_none) {
        if (opt.has_value()) {
            return Ok(std::move(*opt));
        }
        return Err(std::move(error_if_none));
    }
    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }
    [[nodiscard]] T& Unwrap() & {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
        return std::get<1>(std::move(value_));
    }
    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return fallback;
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsErr()) {
            return Result<T, U>::Err(std::forward<F>(func)(std::get<1>(std::move(value_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsOk()) {
            return std::forward<F>(func)(std::get<0>(std::move(value_)));
        }
        return ResultType::Err(std::get<1>(std::move(value_)));
    }
    [[nodiscard]] std::optional<T> Ok() && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return std::nullopt;
    }
    using value_type = T;
    using error_type = E;
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}
};

}
