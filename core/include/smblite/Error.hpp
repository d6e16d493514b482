// Typed error value returned through every fallible operation of the core.
#pragma once
#include <string>

namespace smblite {

enum class ErrorKind {
    None,
    Connection,        // server unreachable
    Authentication,    // credentials rejected
    ShareUnavailable,  // share cannot be attached
    NotFound,
    AlreadyExists,
    Integrity,         // byte count mismatch after a copy
    Transfer,          // retries exhausted
    Cancelled,
    InvalidArgument,
    LocalIo,
    Protocol           // any other failure reported by the server or a callback
};

const char* errorKindName(ErrorKind kind);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;
    std::string cause;     // rendered chain of the wrapped error, if any

    bool ok() const { return kind == ErrorKind::None; }
    void clear();
    void set(ErrorKind k, std::string msg);

    // "message: cause"
    std::string describe() const;

    static Error make(ErrorKind k, std::string msg);
    // New error of kind k whose cause chain is inner.
    static Error wrap(ErrorKind k, std::string msg, const Error& inner);
};

} // namespace smblite
