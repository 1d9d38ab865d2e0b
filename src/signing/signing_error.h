// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SIGNING_SIGNING_ERROR_H
#define ZSIGHASH_SIGNING_SIGNING_ERROR_H

#include <stdexcept>
#include <string>

/** Failure codes reported back to the requester of a signing operation. */
enum class FailureType {
    UnexpectedMessage = 1,
    ButtonExpected = 2,
    DataError = 3,
    ActionCancelled = 4,
    PinExpected = 5,
    PinCancelled = 6,
    PinInvalid = 7,
    InvalidSignature = 8,
    ProcessError = 9,
    NotEnoughFunds = 10,
    NotInitialized = 11,
    PinMismatch = 12,
    FirmwareError = 99,
};

std::string FailureTypeToString(FailureType type);

/**
 * A recoverable signing failure caused by the request data (for example an
 * unsupported transaction version or input script type). Aborts the current
 * signing operation without releasing a signature.
 */
class SigningError : public std::runtime_error
{
public:
    SigningError(FailureType typeIn, const std::string& message) :
        std::runtime_error(message), type(typeIn) {}

    FailureType GetType() const { return type; }

private:
    FailureType type;
};

/**
 * Check a precondition the driving signing flow must guarantee. A failure is
 * a programming error, not bad request data, and throws std::logic_error.
 */
inline void ensure(bool fCondition, const char* pszMessage = "ensure failed")
{
    if (!fCondition) {
        throw std::logic_error(pszMessage);
    }
}

#endif // ZSIGHASH_SIGNING_SIGNING_ERROR_H
