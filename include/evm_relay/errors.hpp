#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace evm_relay {
    enum class ErrorKind {
        InvalidInput,
        InvalidPublicKey,
        InvalidSignatureEncoding,
        InvalidAddress,
        InvalidAmount,
        UnknownChain,
        SigningFailed,
        SignatureRecoveryFailed,
        NonceFetchFailed,
        NonceInconsistent,
        NonceTooLow,
        NonceTooHigh,
        InsufficientFunds,
        SubmissionAcknowledgedWithoutHash,
        RpcError,
        InconsistentSubmissionResult,
        EventFetchFailed,
    };

    [[nodiscard]] std::string_view errorKindName(ErrorKind kind) noexcept;

    /// Caller errors: malformed address, amount, public key or signature bytes.
    [[nodiscard]] bool isInputError(ErrorKind kind) noexcept;

    /// Node rejections that need a fresh build-and-sign cycle before any retry.
    [[nodiscard]] bool isSubmissionRejection(ErrorKind kind) noexcept;

    class RelayException : public std::exception {
        ErrorKind kind_;
        std::string detail_;
        std::string message_;

    public:
        RelayException(ErrorKind kind, std::string detail);
        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
        [[nodiscard]] const std::string &detail() const noexcept { return detail_; }
        [[nodiscard]] const char *what() const noexcept override { return message_.c_str(); }
    };
} // namespace evm_relay
