#pragma once
#include <string>
#include <utility>

namespace blockflow {

enum class ErrorKind : int {
    None = 0,
    Open,
    Read,
    Write,
    Source,
    Cancelled,
    Config,
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:      return "none";
        case ErrorKind::Open:      return "open";
        case ErrorKind::Read:      return "read";
        case ErrorKind::Write:     return "write";
        case ErrorKind::Source:    return "source";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Config:    return "config";
    }
    return "unknown";
}

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = k};
    }
};

// Tags an untagged failure with the stage it surfaced in.
inline Result WithKind(Result r, ErrorKind fallback) {
    if (!r.ok && r.kind == ErrorKind::None) {
        r.kind = fallback;
    }
    return r;
}

} // namespace blockflow
