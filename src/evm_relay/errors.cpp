#include "evm_relay/errors.hpp"

#include <fmt/format.h>

namespace evm_relay {
    std::string_view errorKindName(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::InvalidInput:
                return "InvalidInput";
            case ErrorKind::InvalidPublicKey:
                return "InvalidPublicKey";
            case ErrorKind::InvalidSignatureEncoding:
                return "InvalidSignatureEncoding";
            case ErrorKind::InvalidAddress:
                return "InvalidAddress";
            case ErrorKind::InvalidAmount:
                return "InvalidAmount";
            case ErrorKind::UnknownChain:
                return "UnknownChain";
            case ErrorKind::SigningFailed:
                return "SigningFailed";
            case ErrorKind::SignatureRecoveryFailed:
                return "SignatureRecoveryFailed";
            case ErrorKind::NonceFetchFailed:
                return "NonceFetchFailed";
            case ErrorKind::NonceInconsistent:
                return "NonceInconsistent";
            case ErrorKind::NonceTooLow:
                return "NonceTooLow";
            case ErrorKind::NonceTooHigh:
                return "NonceTooHigh";
            case ErrorKind::InsufficientFunds:
                return "InsufficientFunds";
            case ErrorKind::SubmissionAcknowledgedWithoutHash:
                return "SubmissionAcknowledgedWithoutHash";
            case ErrorKind::RpcError:
                return "RpcError";
            case ErrorKind::InconsistentSubmissionResult:
                return "InconsistentSubmissionResult";
            case ErrorKind::EventFetchFailed:
                return "EventFetchFailed";
        }
        return "Unknown";
    }

    bool isInputError(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::InvalidInput:
            case ErrorKind::InvalidPublicKey:
            case ErrorKind::InvalidSignatureEncoding:
            case ErrorKind::InvalidAddress:
            case ErrorKind::InvalidAmount:
                return true;
            default:
                return false;
        }
    }

    bool isSubmissionRejection(const ErrorKind kind) noexcept {
        return kind == ErrorKind::NonceTooLow || kind == ErrorKind::NonceTooHigh || kind == ErrorKind::InsufficientFunds;
    }

    RelayException::RelayException(const ErrorKind kind, std::string detail) :
        kind_(kind), detail_(std::move(detail)), message_(fmt::format("{}: {}", errorKindName(kind), detail_)) {}
} // namespace evm_relay
