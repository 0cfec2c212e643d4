// SEEDORDER - Recovery Errors
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/errors.h"

namespace seedorder {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::WrongWordCount:       return "WrongWordCount";
        case ErrorCode::InvalidAddress:       return "InvalidAddress";
        case ErrorCode::WrongNetwork:         return "WrongNetwork";
        case ErrorCode::AmbiguousScheme:      return "AmbiguousScheme";
        case ErrorCode::ConflictingSchemes:   return "ConflictingSchemes";
        case ErrorCode::InvalidPath:          return "InvalidPath";
        case ErrorCode::UnknownLanguage:      return "UnknownLanguage";
        case ErrorCode::WordlistUnavailable:  return "WordlistUnavailable";
        case ErrorCode::InvalidWordlist:      return "InvalidWordlist";
        case ErrorCode::InconclusiveLanguage: return "InconclusiveLanguage";
        case ErrorCode::InvalidOption:        return "InvalidOption";
    }
    return "Unknown";
}

} // namespace seedorder
