// SEEDORDER - Recovery Errors
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Fatal, pre-search errors. Per-ordering failures are not errors; they
// are reported as pipeline skips (see pipeline.h).

#ifndef SEEDORDER_RECOVERY_ERRORS_H
#define SEEDORDER_RECOVERY_ERRORS_H

#include <stdexcept>
#include <string>

namespace seedorder {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    WrongWordCount,         ///< Word count is not 12 or 24
    InvalidAddress,         ///< Target is not a parseable address
    WrongNetwork,           ///< Target is a testnet/regtest address
    AmbiguousScheme,        ///< No flag and no recognizable prefix
    ConflictingSchemes,     ///< More than one scheme flag
    InvalidPath,            ///< Derivation path does not parse
    UnknownLanguage,        ///< Language tag not recognized
    WordlistUnavailable,    ///< Requested wordlist not loaded
    InvalidWordlist,        ///< Wordlist file malformed
    InconclusiveLanguage,   ///< Detection failed in strict mode
    InvalidOption           ///< Bad option value or config file
};

/// Stable name for an error code ("WrongNetwork", ...)
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// RecoveryError
// ============================================================================

/// Raised for input problems that stop a run before enumeration starts
class RecoveryError : public std::runtime_error {
public:
    RecoveryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode Code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace seedorder

#endif // SEEDORDER_RECOVERY_ERRORS_H
