#include "common/drtpError.hpp"
#include "common/packet.hpp"

DrtpError::DrtpError(ErrorKind kind, const std::string &what) : std::runtime_error(what), errorKind(kind)
{
}

MalformedHeader::MalformedHeader(size_t length)
    : DrtpError(ErrorKind::MALFORMED_HEADER,
                "datagram of " + std::to_string(length) + " bytes is shorter than the " + std::to_string(DRTP_HEADER_SIZE) + " byte header"),
      datagramLength(length)
{
}

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::MALFORMED_HEADER:
        return "MalformedHeader";
    case ErrorKind::PAYLOAD_TOO_LARGE:
        return "PayloadTooLarge";
    case ErrorKind::SOURCE_UNAVAILABLE:
        return "SourceUnavailable";
    case ErrorKind::SINK_UNAVAILABLE:
        return "SinkUnavailable";
    case ErrorKind::SOCKET_ERROR:
        return "SocketError";
    case ErrorKind::CONFIG_INVALID:
        return "ConfigInvalid";
    }
    return "Unknown";
}

const char *statusName(TransferStatus status)
{
    switch (status)
    {
    case TransferStatus::OK:
        return "OK";
    case TransferStatus::HANDSHAKE_FAILED:
        return "HandshakeFailed";
    case TransferStatus::SOURCE_UNAVAILABLE:
        return "SourceUnavailable";
    case TransferStatus::SOURCE_TOO_LARGE:
        return "SourceTooLarge";
    case TransferStatus::CONNECTION_LOST:
        return "TimeoutExceeded";
    case TransferStatus::TEARDOWN_FAILED:
        return "TeardownFailed";
    }
    return "Unknown";
}
