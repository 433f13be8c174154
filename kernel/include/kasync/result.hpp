/**
 * @file result.hpp
 * @brief Tagged success-or-error value
 *
 * The runtime never throws. Operations that can fail in a way the caller is
 * expected to handle (I/O, timeouts, channel closure) return a Result.
 * Accessing the wrong alternative is a logic error and asserts.
 */

#ifndef KASYNC_RESULT_HPP
#define KASYNC_RESULT_HPP

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace kasync
{

template<typename T, typename E>
class [[nodiscard]] Result
{
   static_assert(!std::is_same_v<T, E>, "Result alternatives must be distinct types");

public:
   Result(T value) : storage(std::in_place_index<0>, std::move(value)) {}
   Result(E error) : storage(std::in_place_index<1>, std::move(error)) {}

   static Result ok(T value)  { return Result(std::move(value)); }
   static Result err(E error) { return Result(std::move(error)); }

   [[nodiscard]] bool is_ok()  const noexcept { return storage.index() == 0; }
   [[nodiscard]] bool is_err() const noexcept { return storage.index() == 1; }
   explicit operator bool()    const noexcept { return is_ok(); }

   T& value() &
   {
      assert(is_ok() && "Result holds an error");
      return std::get<0>(storage);
   }
   T const& value() const&
   {
      assert(is_ok() && "Result holds an error");
      return std::get<0>(storage);
   }
   T&& value() &&
   {
      assert(is_ok() && "Result holds an error");
      return std::get<0>(std::move(storage));
   }

   E& error() &
   {
      assert(is_err() && "Result holds a value");
      return std::get<1>(storage);
   }
   E const& error() const&
   {
      assert(is_err() && "Result holds a value");
      return std::get<1>(storage);
   }
   E&& error() &&
   {
      assert(is_err() && "Result holds a value");
      return std::get<1>(std::move(storage));
   }

   T value_or(T fallback) const&
   {
      return is_ok() ? std::get<0>(storage) : std::move(fallback);
   }

private:
   std::variant<T, E> storage;
};

/**
 * @brief Result specialization for operations that produce nothing on success
 */
template<typename E>
class [[nodiscard]] Result<void, E>
{
public:
   Result() = default;
   Result(E error) : failure(std::move(error)) {}

   static Result ok()         { return Result(); }
   static Result err(E error) { return Result(std::move(error)); }

   [[nodiscard]] bool is_ok()  const noexcept { return !failure.has_value(); }
   [[nodiscard]] bool is_err() const noexcept { return failure.has_value(); }
   explicit operator bool()    const noexcept { return is_ok(); }

   E& error() &
   {
      assert(is_err() && "Result holds no error");
      return *failure;
   }
   E const& error() const&
   {
      assert(is_err() && "Result holds no error");
      return *failure;
   }
   E&& error() &&
   {
      assert(is_err() && "Result holds no error");
      return std::move(*failure);
   }

private:
   std::optional<E> failure;
};

} // namespace kasync

#endif // KASYNC_RESULT_HPP
