#pragma once

#include "vnb/defines.h"
#include "vnb/pch.h"

namespace vnb {

struct ValueTag {};
struct ErrorTag {};

// Value-or-error return type used across the codec. Holds exactly one of R or
// E; accessing the other alternative throws std::logic_error.
template <typename R, typename E> class Result {
public:
  using value_type = R;
  using error_type = E;

  Result(ValueTag, const R &value) : hasValue_(true) {
    new (&storage_.value) R(value);
  }

  Result(ValueTag, R &&value) : hasValue_(true) {
    new (&storage_.value) R(std::move(value));
  }

  Result(ErrorTag, const E &error) : hasValue_(false) {
    new (&storage_.error) E(error);
  }

  Result(ErrorTag, E &&error) : hasValue_(false) {
    new (&storage_.error) E(std::move(error));
  }

  Result(const Result &other) : hasValue_(other.hasValue_) {
    constructFrom(other);
  }

  Result(Result &&other) noexcept(std::is_nothrow_move_constructible_v<R> &&
                                  std::is_nothrow_move_constructible_v<E>)
      : hasValue_(other.hasValue_) {
    constructFrom(std::move(other));
  }

  Result &operator=(const Result &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      constructFrom(other);
    }
    return *this;
  }

  Result &
  operator=(Result &&other) noexcept(std::is_nothrow_move_constructible_v<R> &&
                                     std::is_nothrow_move_constructible_v<E>) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      constructFrom(std::move(other));
    }
    return *this;
  }

  ~Result() { destroy(); }

  [[nodiscard]] bool hasValue() const noexcept { return hasValue_; }
  [[nodiscard]] bool hasError() const noexcept { return !hasValue_; }
  [[nodiscard]] explicit operator bool() const noexcept { return hasValue_; }

  [[nodiscard]] R &value() & {
    requireValue();
    return storage_.value;
  }

  [[nodiscard]] const R &value() const & {
    requireValue();
    return storage_.value;
  }

  [[nodiscard]] R &&value() && {
    requireValue();
    return std::move(storage_.value);
  }

  [[nodiscard]] E &error() & {
    requireError();
    return storage_.error;
  }

  [[nodiscard]] const E &error() const & {
    requireError();
    return storage_.error;
  }

  [[nodiscard]] E &&error() && {
    requireError();
    return std::move(storage_.error);
  }

  [[nodiscard]] R valueOr(R fallback) const & {
    return hasValue_ ? storage_.value : std::move(fallback);
  }

  [[nodiscard]] R &operator*() & { return value(); }
  [[nodiscard]] const R &operator*() const & { return value(); }
  [[nodiscard]] R &&operator*() && { return std::move(value()); }
  [[nodiscard]] R *operator->() { return &value(); }
  [[nodiscard]] const R *operator->() const { return &value(); }

  // Re-wraps the held error for a caller returning a different value type.
  template <typename U> [[nodiscard]] Result<U, E> forwardError() const & {
    return Result<U, E>::makeError(error());
  }

  template <typename U> [[nodiscard]] Result<U, E> forwardError() && {
    return Result<U, E>::makeError(std::move(*this).error());
  }

  [[nodiscard]] static inline Result<R, E> makeResult(const R &value) {
    return Result<R, E>(ValueTag{}, value);
  }

  [[nodiscard]] static inline Result<R, E> makeResult(R &&value) {
    return Result<R, E>(ValueTag{}, std::move(value));
  }

  [[nodiscard]] static inline Result<R, E> makeError(const E &error) {
    return Result<R, E>(ErrorTag{}, error);
  }

  [[nodiscard]] static inline Result<R, E> makeError(E &&error) {
    return Result<R, E>(ErrorTag{}, std::move(error));
  }

private:
  void requireValue() const {
    if (!hasValue_) {
      throw std::logic_error("Result does not contain a value");
    }
  }

  void requireError() const {
    if (hasValue_) {
      throw std::logic_error("Result does not contain an error");
    }
  }

  void constructFrom(const Result &other) {
    if (hasValue_) {
      new (&storage_.value) R(other.storage_.value);
    } else {
      new (&storage_.error) E(other.storage_.error);
    }
  }

  void constructFrom(Result &&other) {
    if (hasValue_) {
      new (&storage_.value) R(std::move(other.storage_.value));
    } else {
      new (&storage_.error) E(std::move(other.storage_.error));
    }
  }

  void destroy() {
    if (hasValue_) {
      storage_.value.~R();
    } else {
      storage_.error.~E();
    }
  }

  union Storage {
    R value;
    E error;

    Storage() {}
    ~Storage() {}
  };

  Storage storage_;
  bool hasValue_;
};

} // namespace vnb
