// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "signing/signing_error.h"

std::string FailureTypeToString(FailureType type)
{
    switch (type) {
    case FailureType::UnexpectedMessage: return "UnexpectedMessage";
    case FailureType::ButtonExpected:    return "ButtonExpected";
    case FailureType::DataError:         return "DataError";
    case FailureType::ActionCancelled:   return "ActionCancelled";
    case FailureType::PinExpected:       return "PinExpected";
    case FailureType::PinCancelled:      return "PinCancelled";
    case FailureType::PinInvalid:        return "PinInvalid";
    case FailureType::InvalidSignature:  return "InvalidSignature";
    case FailureType::ProcessError:      return "ProcessError";
    case FailureType::NotEnoughFunds:    return "NotEnoughFunds";
    case FailureType::NotInitialized:    return "NotInitialized";
    case FailureType::PinMismatch:       return "PinMismatch";
    case FailureType::FirmwareError:     return "FirmwareError";
    }
    return "Unknown";
}
