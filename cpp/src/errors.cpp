#include "gcite/errors.h"

namespace gcite {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                return "ok";
        case ErrorCode::IoError:           return "io_error";
        case ErrorCode::ParseError:        return "parse_error";
        case ErrorCode::InvalidFormat:     return "invalid_format";
        case ErrorCode::InvalidArgs:       return "invalid_args";
        case ErrorCode::CorpusMissing:     return "corpus_missing";
        case ErrorCode::CorpusNotReady:    return "corpus_not_ready";
        case ErrorCode::DimensionMismatch: return "dimension_mismatch";
    }
    return "unknown";
}

} // namespace gcite
