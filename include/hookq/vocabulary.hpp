/**
 * @file vocabulary.hpp
 * @brief Error-carrying result types and small fixed-capacity helpers.
 *
 * - expected<V, E>: value or error code, no exceptions.
 * - optional<T>: value or nothing.
 * - FixedString<N>: inline, truncating string for names and labels.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef HOOKQ_VOCABULARY_HPP_
#define HOOKQ_VOCABULARY_HPP_

#include "hookq/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace hookq {

// ============================================================================
// Shared error codes
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

// ============================================================================
// expected<V, E>
// ============================================================================

namespace detail {
struct ValueTag {};
struct ErrorTag {};
}  // namespace detail

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the success()/error() factories. Accessing value() on
 * an error (or get_error() on a value) trips HOOKQ_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(detail::ValueTag{}, val); }
  static expected success(V&& val) { return expected(detail::ValueTag{}, std::move(val)); }
  static expected error(E err) noexcept { return expected(detail::ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) V(other.val_);
    } else {
      ::new (static_cast<void*>(&err_)) E(other.err_);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) V(std::move(other.val_));
    } else {
      ::new (static_cast<void*>(&err_)) E(other.err_);
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&val_)) V(other.val_);
      } else {
        ::new (static_cast<void*>(&err_)) E(other.err_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&val_)) V(std::move(other.val_));
      } else {
        ::new (static_cast<void*>(&err_)) E(other.err_);
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    HOOKQ_ASSERT(has_value_);
    return val_;
  }

  const V& value() const& noexcept {
    HOOKQ_ASSERT(has_value_);
    return val_;
  }

  V&& value() && noexcept {
    HOOKQ_ASSERT(has_value_);
    return std::move(val_);
  }

  E get_error() const noexcept {
    HOOKQ_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? val_ : fallback; }

 private:
  template <typename U>
  expected(detail::ValueTag, U&& val) : has_value_(true) {
    ::new (static_cast<void*>(&val_)) V(std::forward<U>(val));
  }

  expected(detail::ErrorTag, E err) noexcept : has_value_(false) {
    ::new (static_cast<void*>(&err_)) E(err);
  }

  void Destroy() noexcept {
    if (has_value_) {
      val_.~V();
    }
  }

  union {
    V val_;
    E err_;
  };
  bool has_value_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    HOOKQ_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : err_(err), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false), dummy_(0) {}

  optional(const T& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&val_)) T(val);
  }

  optional(T&& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&val_)) T(std::move(val));
  }

  optional(const optional& other) : has_value_(other.has_value_), dummy_(0) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) T(other.val_);
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_), dummy_(0) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) T(std::move(other.val_));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&val_)) T(other.val_);
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&val_)) T(std::move(other.val_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    HOOKQ_ASSERT(has_value_);
    return val_;
  }

  const T& value() const noexcept {
    HOOKQ_ASSERT(has_value_);
    return val_;
  }

  T value_or(const T& fallback) const { return has_value_ ? val_ : fallback; }

  void reset() noexcept {
    if (has_value_) {
      val_.~T();
      has_value_ = false;
    }
  }

 private:
  bool has_value_;
  union {
    T val_;
    uint8_t dummy_;
  };
};

// ============================================================================
// FixedString<N>
// ============================================================================

/// @brief Tag selecting the truncating FixedString constructor.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of N characters.
 *
 * Inputs longer than N are truncated; no heap allocation.
 */
template <uint32_t N>
class FixedString {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  FixedString(const char* str) noexcept { assign(str); }  // NOLINT(google-explicit-constructor)

  FixedString(TruncateToCapacity_t, const char* str) noexcept { assign(str); }

  void assign(const char* str) noexcept {
    uint32_t i = 0;
    if (str != nullptr) {
      for (; i < N && str[i] != '\0'; ++i) {
        buf_[i] = str[i];
      }
    }
    buf_[i] = '\0';
    size_ = i;
  }

  void clear() noexcept {
    buf_[0] = '\0';
    size_ = 0;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return N; }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }

 private:
  char buf_[N + 1];
  uint32_t size_{0};
};

}  // namespace hookq

#endif  // HOOKQ_VOCABULARY_HPP_
