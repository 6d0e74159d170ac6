#ifndef DRTP_ERROR_H
#define DRTP_ERROR_H

#include <stddef.h>
#include <stdexcept>
#include <string>

enum class ErrorKind
{
    MALFORMED_HEADER,
    PAYLOAD_TOO_LARGE,
    SOURCE_UNAVAILABLE,
    SINK_UNAVAILABLE,
    SOCKET_ERROR,
    CONFIG_INVALID
};

// How a connection attempt ended, on either side
enum class TransferStatus
{
    OK,
    HANDSHAKE_FAILED,
    SOURCE_UNAVAILABLE,
    SOURCE_TOO_LARGE,
    CONNECTION_LOST,
    TEARDOWN_FAILED
};

class DrtpError : public std::runtime_error
{
public:
    DrtpError(ErrorKind kind, const std::string &what);

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};

// Datagram too short to carry a header
class MalformedHeader : public DrtpError
{
public:
    explicit MalformedHeader(size_t length);

    size_t length() const { return datagramLength; }

private:
    size_t datagramLength;
};

const char *errorKindName(ErrorKind kind);
const char *statusName(TransferStatus status);

#endif
