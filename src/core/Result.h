#pragma once

#include <cstdint>
#include <utility>

namespace folio {

enum class Error : uint8_t {
  Ok = 0,
  IOError,
  InvalidFormat,
  InvalidState,
  InvalidOperation,
  ParseFailed,
  NotPrepared,  // book exists but has not been parsed into chapters yet
  NetworkError,
  OutOfRange,
  UnsupportedVersion,
  Cancelled,
  Timeout,
};

const char* errorToString(Error err);

template <typename T>
struct Result {
  T value{};
  Error err = Error::Ok;

  bool ok() const { return err == Error::Ok; }
  explicit operator bool() const { return ok(); }
};

template <>
struct Result<void> {
  Error err = Error::Ok;

  bool ok() const { return err == Error::Ok; }
  explicit operator bool() const { return ok(); }
};

template <typename T>
inline Result<T> Ok(T value) {
  Result<T> r;
  r.value = std::move(value);
  return r;
}

inline Result<void> Ok() { return Result<void>{}; }

template <typename T>
inline Result<T> Err(Error e) {
  Result<T> r;
  r.err = e;
  return r;
}

inline Result<void> ErrVoid(Error e) {
  Result<void> r;
  r.err = e;
  return r;
}

// Propagate a failed Result<void>-returning call from a Result<void> function
#define TRY(expr)                             \
  do {                                        \
    const auto _res = (expr);                 \
    if (!_res.ok()) return ErrVoid(_res.err); \
  } while (0)

}  // namespace folio
