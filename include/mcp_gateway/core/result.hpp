#pragma once

#include <mcp_gateway/core/error.hpp>

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// Result<T, E>: a value or an error, never both. Expected failures travel
// as Result; nothing on those paths throws.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

public:
    using ValueType = T;
    using ErrorType = E;

    static Result Ok(T value) { return Result(std::in_place_index<kValue>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<kError>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return data_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return data_.index() == kError; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() on an error Result");
        return std::get<kValue>(data_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() on an error Result");
        return std::get<kValue>(std::move(data_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an ok Result");
        return std::get<kError>(data_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an ok Result");
        return std::get<kError>(std::move(data_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<kValue>(data_) : std::move(fallback);
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) return Next::Err(Error());
        return std::forward<Fn>(fn)(Value());
    }
    template <typename Fn>
    auto AndThen(Fn&& fn) && {
        using Next = std::invoke_result_t<Fn, T&&>;
        if (IsErr()) return Next::Err(std::move(*this).Error());
        return std::forward<Fn>(fn)(std::move(*this).Value());
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& {
        using Next = Result<std::invoke_result_t<Fn, const T&>, E>;
        if (IsErr()) return Next::Err(Error());
        return Next::Ok(std::forward<Fn>(fn)(Value()));
    }
    template <typename Fn>
    auto Map(Fn&& fn) && {
        using Next = Result<std::invoke_result_t<Fn, T&&>, E>;
        if (IsErr()) return Next::Err(std::move(*this).Error());
        return Next::Ok(std::forward<Fn>(fn)(std::move(*this).Value()));
    }

    // fn: E -> E
    template <typename Fn>
    Result MapError(Fn&& fn) && {
        if (IsOk()) return std::move(*this);
        return Err(std::forward<Fn>(fn)(std::move(*this).Error()));
    }

private:
    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> tag, Arg&& arg) : data_(tag, std::forward<Arg>(arg)) {}

    std::variant<T, E> data_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: success carries nothing.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    using ErrorType = E;

    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an ok Result");
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an ok Result");
        return std::move(*error_);
    }

    // fn: E -> E
    template <typename Fn>
    Result MapError(Fn&& fn) && {
        if (IsOk()) return std::move(*this);
        return Err(std::forward<Fn>(fn)(std::move(*error_)));
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace mcp_gateway
