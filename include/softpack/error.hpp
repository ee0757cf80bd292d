#pragma once

#include <string>

namespace softpack {

struct SoftpackError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        Network,
        Timeout,
        NotFound,
        Duplicate,
        InvalidArg,
        InvalidPath,
        FileExists,
        NoChanges,
        NothingToCommit,
        ConcurrentModification,
        PushRejected,
        RepositoryUnavailable,
        Builder
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SoftpackError() = default;
    SoftpackError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SoftpackError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SoftpackError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // True for failures that may succeed when the caller re-reads and retries
    bool is_retryable() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace softpack
