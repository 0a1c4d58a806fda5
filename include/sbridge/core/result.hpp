#pragma once

#include <optional>
#include <string>
#include <variant>

namespace sbridge {

/**
 * @brief Failure categories surfaced by the link, codec and engines
 */
enum class ErrorCode {
    LinkOpenFailure,       ///< Device missing, busy or not permitted
    LinkClosed,            ///< Link lost while reading or writing
    HandshakeTimeout,      ///< No "OK" after the header retry budget
    ChunkTransferFailure,  ///< One chunk exhausted its retry budget
    ChecksumMismatch,
    ShortRead,
    UnexpectedReply,       ///< Reply tag or sequence other than the one awaited
    OutOfSequence,         ///< Chunk sequence neither expected nor a duplicate
    TransferStalled,       ///< Receiver saw no bytes for the stall timeout
    Cancelled,
    FileError,
    InvalidArgument,
    ConfigError
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::LinkOpenFailure: return "LinkOpenFailure";
        case ErrorCode::LinkClosed: return "LinkClosed";
        case ErrorCode::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorCode::ChunkTransferFailure: return "ChunkTransferFailure";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::ShortRead: return "ShortRead";
        case ErrorCode::UnexpectedReply: return "UnexpectedReply";
        case ErrorCode::OutOfSequence: return "OutOfSequence";
        case ErrorCode::TransferStalled: return "TransferStalled";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::FileError: return "FileError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

// Wrappers keep the constructors unambiguous when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T, typename E = Error>
Result<T, E> Ok(T value) { return Result<T, E>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace sbridge
