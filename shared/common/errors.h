#ifndef SCANLINK_ERRORS_H
#define SCANLINK_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace scanlink {

/**
 * @brief Base class for all errors raised by ScanLink components
 */
class ScanLinkError : public std::runtime_error
{
public:
    explicit ScanLinkError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Missing, malformed or unknown device identity, or wrong credential
 */
class AuthenticationError : public ScanLinkError
{
public:
    explicit AuthenticationError(const std::string& message) : ScanLinkError(message) {}
};

/**
 * @brief Requested device state change is not in the transition table
 */
class InvalidStateTransition : public ScanLinkError
{
public:
    InvalidStateTransition(const std::string& from, const std::string& to)
        : ScanLinkError("Invalid state transition from " + from + " to " + to),
          from_(from), to_(to) {}

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

private:
    std::string from_;
    std::string to_;
};

/**
 * @brief Received byte count differs from the declared size
 */
class IncompleteTransferError : public ScanLinkError
{
public:
    IncompleteTransferError(uint64_t received, uint64_t expected)
        : ScanLinkError("Incomplete file received (" + std::to_string(received) + "/" +
                        std::to_string(expected) + " bytes)."),
          received_(received), expected_(expected) {}

    uint64_t received() const { return received_; }
    uint64_t expected() const { return expected_; }

private:
    uint64_t received_;
    uint64_t expected_;
};

class ChecksumMismatchError : public ScanLinkError
{
public:
    ChecksumMismatchError() : ScanLinkError("Checksum mismatch for uploaded file.") {}
};

/**
 * @brief All upload attempts for a file failed
 */
class UploadExhaustedError : public ScanLinkError
{
public:
    explicit UploadExhaustedError(int attempts)
        : ScanLinkError("File upload failed after " + std::to_string(attempts) + " attempts."),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

/**
 * @brief Transient network failure (connection drop, failed write)
 */
class TransportError : public ScanLinkError
{
public:
    explicit TransportError(const std::string& message) : ScanLinkError(message) {}
};

/**
 * @brief Inbound frame could not be decoded into a known message shape
 */
class ProtocolError : public ScanLinkError
{
public:
    explicit ProtocolError(const std::string& message) : ScanLinkError(message) {}
};

/**
 * @brief An external collaborator (device records, exam manager) failed
 */
class CollaboratorError : public ScanLinkError
{
public:
    explicit CollaboratorError(const std::string& message, int status_code = 0)
        : ScanLinkError(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

} // namespace scanlink

#endif // SCANLINK_ERRORS_H
