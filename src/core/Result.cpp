#include "Result.h"

namespace folio {

const char* errorToString(const Error err) {
  switch (err) {
    case Error::Ok:
      return "OK";
    case Error::IOError:
      return "I/O error";
    case Error::InvalidFormat:
      return "Invalid format";
    case Error::InvalidState:
      return "Invalid state";
    case Error::InvalidOperation:
      return "Invalid operation";
    case Error::ParseFailed:
      return "Parse failed";
    case Error::NotPrepared:
      return "Book not prepared";
    case Error::NetworkError:
      return "Network error";
    case Error::OutOfRange:
      return "Out of range";
    case Error::UnsupportedVersion:
      return "Unsupported version";
    case Error::Cancelled:
      return "Cancelled";
    case Error::Timeout:
      return "Timeout";
  }
  return "Unknown error";
}

}  // namespace folio
