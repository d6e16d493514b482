#include "smblite/Error.hpp"
#include <utility>

namespace smblite {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:             return "None";
    case ErrorKind::Connection:       return "ConnectionError";
    case ErrorKind::Authentication:   return "AuthenticationError";
    case ErrorKind::ShareUnavailable: return "ShareUnavailableError";
    case ErrorKind::NotFound:         return "NotFoundError";
    case ErrorKind::AlreadyExists:    return "AlreadyExistsError";
    case ErrorKind::Integrity:        return "IntegrityError";
    case ErrorKind::Transfer:         return "TransferError";
    case ErrorKind::Cancelled:        return "CancelledError";
    case ErrorKind::InvalidArgument:  return "InvalidArgumentError";
    case ErrorKind::LocalIo:          return "LocalIoError";
    case ErrorKind::Protocol:         return "ProtocolError";
    }
    return "UnknownError";
}

void Error::clear() {
    kind = ErrorKind::None;
    message.clear();
    cause.clear();
}

void Error::set(ErrorKind k, std::string msg) {
    kind = k;
    message = std::move(msg);
    cause.clear();
}

std::string Error::describe() const {
    if (cause.empty()) return message;
    if (message.empty()) return cause;
    return message + ": " + cause;
}

Error Error::make(ErrorKind k, std::string msg) {
    Error e;
    e.set(k, std::move(msg));
    return e;
}

Error Error::wrap(ErrorKind k, std::string msg, const Error& inner) {
    Error e;
    e.kind = k;
    e.message = std::move(msg);
    e.cause = inner.describe();
    return e;
}

} // namespace smblite
