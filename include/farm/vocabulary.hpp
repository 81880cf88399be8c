/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, function_ref, NewType, ScopeGuard, error enums.
 *
 * All types are header-only and compatible with -fno-exceptions -fno-rtti.
 * Fallible operations across the library return expected<V, E> instead of
 * throwing.
 */

#ifndef FARM_VOCABULARY_HPP_
#define FARM_VOCABULARY_HPP_

#include "farm/platform.hpp"

#include <cstdint>

#include <new>
#include <type_traits>
#include <utility>

namespace farm {

// ============================================================================
// Error Enums
// ============================================================================

/// @brief Failure taxonomy of a farm run.
enum class FarmError : uint8_t {
  kTransportFailure = 0,  ///< send / receive / barrier cannot complete
  kProtocolViolation,     ///< broken protocol invariant, never transient
  kGenerationFailure,     ///< the value-producing function failed
  kSinkFailure,           ///< the sink rejected a batch
  kInvalidArgument,       ///< run preconditions not met
  kAborted                ///< run interrupted or abort signal received
};

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue
};

inline const char* FarmErrorName(FarmError e) noexcept {
  switch (e) {
    case FarmError::kTransportFailure:
      return "TransportFailure";
    case FarmError::kProtocolViolation:
      return "ProtocolViolation";
    case FarmError::kGenerationFailure:
      return "GenerationFailure";
    case FarmError::kSinkFailure:
      return "SinkFailure";
    case FarmError::kInvalidArgument:
      return "InvalidArgument";
    case FarmError::kAborted:
      return "Aborted";
  }
  return "Unknown";
}

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:
      return "FileNotFound";
    case ConfigError::kParseError:
      return "ParseError";
    case ConfigError::kFormatNotSupported:
      return "FormatNotSupported";
    case ConfigError::kBufferFull:
      return "BufferFull";
    case ConfigError::kInvalidValue:
      return "InvalidValue";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * Constructed only through the success() / error() factories. Accessing
 * value() on an error (or get_error() on a value) is a programming error
 * caught by FARM_ASSERT in debug builds.
 *
 * @tparam V Value type.
 * @tparam E Error type (usually a scoped enum).
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(ValueTag{}, val); }
  static expected success(V&& val) { return expected(ValueTag{}, std::move(val)); }
  static expected error(E err) noexcept { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    FARM_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& noexcept {
    FARM_ASSERT(has_value_);
    return value_;
  }
  V&& value() && noexcept {
    FARM_ASSERT(has_value_);
    return std::move(value_);
  }

  E get_error() const noexcept {
    FARM_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const { return has_value_ ? value_ : fallback; }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(ValueTag, U&& val) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(std::forward<U>(val));
  }

  expected(ErrorTag, E err) noexcept : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(err);
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    }
  }

  union {
    V value_;
    E error_;
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
    FARM_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E err) noexcept : error_(err), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

/**
 * @brief Chain a fallible step after a successful result.
 *
 * F must return expected<U, E>. An error in @p r is propagated unchanged.
 */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Result = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Result::error(r.get_error());
  }
  return fn(r.value());
}

/// @brief Invoke @p fn with the error if @p r holds one.
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// function_ref
// ============================================================================

template <typename Signature>
class function_ref;

/**
 * @brief Non-owning reference to a callable.
 *
 * The referenced callable must outlive the function_ref. Two words, no heap.
 */
template <typename R, typename... Args>
class function_ref<R(Args...)> final {
 public:
  template <typename F,
            typename = typename std::enable_if<
                !std::is_same<typename std::decay<F>::type, function_ref>::value>::type>
  function_ref(F&& fn) noexcept  // NOLINT(google-explicit-constructor)
      : obj_(const_cast<void*>(static_cast<const void*>(std::addressof(fn)))),
        call_(&Invoke<typename std::remove_reference<F>::type>) {}

  function_ref(R (*fn)(Args...)) noexcept  // NOLINT(google-explicit-constructor)
      : obj_(reinterpret_cast<void*>(fn)), call_(&InvokeFnPtr) {}

  R operator()(Args... args) const { return call_(obj_, std::forward<Args>(args)...); }

 private:
  template <typename F>
  static R Invoke(void* obj, Args... args) {
    return (*static_cast<F*>(obj))(std::forward<Args>(args)...);
  }

  static R InvokeFnPtr(void* obj, Args... args) {
    return reinterpret_cast<R (*)(Args...)>(obj)(std::forward<Args>(args)...);
  }

  void* obj_;
  R (*call_)(void*, Args...);
};

// ============================================================================
// NewType - strong typedef
// ============================================================================

/**
 * @brief Wraps T in a distinct type so that ids of different kinds cannot mix.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : value_{} {}
  constexpr explicit NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(NewType o) const noexcept { return value_ == o.value_; }
  constexpr bool operator!=(NewType o) const noexcept { return value_ != o.value_; }
  constexpr bool operator<(NewType o) const noexcept { return value_ < o.value_; }

 private:
  T value_;
};

struct WorkerIdTag {};

/// @brief Identity of one worker participant, dense in [0, worker_count).
using WorkerId = NewType<uint32_t, WorkerIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable on scope exit unless released.
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) noexcept {
  return ScopeGuard<F>(std::move(fn));
}

#define FARM_SCOPE_EXIT(code) \
  auto FARM_CONCAT(farm_scope_exit_, __LINE__) = ::farm::MakeScopeGuard([&]() { code; })

}  // namespace farm

#endif  // FARM_VOCABULARY_HPP_
