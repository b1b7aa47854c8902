#include "transfer_types.hpp"

std::string toString(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::ConnectionError:     return "ConnectionError";
        case TransferErrorKind::ProbeDegraded:       return "ProbeDegraded";
        case TransferErrorKind::PackError:           return "PackError";
        case TransferErrorKind::RetrievalError:      return "RetrievalError";
        case TransferErrorKind::ExtractError:        return "ExtractError";
        case TransferErrorKind::VerificationDeficit: return "VerificationDeficit";
        case TransferErrorKind::RecoveryIncomplete:  return "RecoveryIncomplete";
        case TransferErrorKind::CleanupWarning:      return "CleanupWarning";
        case TransferErrorKind::Cancelled:           return "Cancelled";
    }
    return "UnknownError";
}

std::string TransferError::describe() const {
    return toString(kind) + ": " + message;
}

std::string toString(TransferState state) {
    switch (state) {
        case TransferState::Init:       return "Init";
        case TransferState::Connecting: return "Connecting";
        case TransferState::Probing:    return "Probing";
        case TransferState::Archiving:  return "Archiving";
        case TransferState::Retrieving: return "Retrieving";
        case TransferState::Extracting: return "Extracting";
        case TransferState::Verifying:  return "Verifying";
        case TransferState::Recovering: return "Recovering";
        case TransferState::CleaningUp: return "CleaningUp";
        case TransferState::Completed:  return "Completed";
        case TransferState::Failed:     return "Failed";
    }
    return "Unknown";
}
