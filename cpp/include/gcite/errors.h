#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace gcite {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    InvalidFormat,
    InvalidArgs,
    CorpusMissing,
    CorpusNotReady,
    DimensionMismatch,
};

struct Error {
    ErrorCode code{ErrorCode::Ok};
    std::string message;
};

const char* error_code_name(ErrorCode code);

class GciteException : public std::runtime_error {
public:
    GciteException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Malformed or missing corpus files. Nothing is installed when this is thrown.
class CorpusLoadError : public GciteException {
public:
    CorpusLoadError(ErrorCode code, const std::string& msg) : GciteException(code, msg) {}
};

class CorpusNotReadyError : public GciteException {
public:
    explicit CorpusNotReadyError(const std::string& msg)
        : GciteException(ErrorCode::CorpusNotReady, msg) {}
};

class EmbeddingDimensionMismatchError : public GciteException {
public:
    EmbeddingDimensionMismatchError(size_t expected, size_t got)
        : GciteException(ErrorCode::DimensionMismatch,
                         "embedding dimension mismatch: corpus=" + std::to_string(expected) +
                         " query=" + std::to_string(got)),
          expected_(expected), got_(got) {}

    size_t expected() const noexcept { return expected_; }
    size_t got() const noexcept { return got_; }

private:
    size_t expected_;
    size_t got_;
};

} // namespace gcite
