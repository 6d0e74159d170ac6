#ifndef DRTP_PACKET_H
#define DRTP_PACKET_H

#include <stdint.h>
#include <stddef.h>
#include <vector>

#define DRTP_HEADER_SIZE 6
#define DRTP_CHUNK_SIZE 994
#define DRTP_MAX_DATAGRAM (DRTP_HEADER_SIZE + DRTP_CHUNK_SIZE)
#define DRTP_RECV_BUFFER 1024
#define DRTP_MAX_CHUNKS 65535

// Flag bits, the rest of the flags field is reserved.
#define FIN_FLAG 0x1
#define ACK_FLAG 0x2
#define SYN_FLAG 0x4
#define DRTP_FLAG_MASK (FIN_FLAG | ACK_FLAG | SYN_FLAG)

typedef std::vector<uint8_t> Datagram;

// The flag combinations the protocol actually puts on the wire
enum class PacketKind
{
    DATA,
    SYN,
    SYN_ACK,
    ACK,
    FIN,
    FIN_ACK,
    OTHER
};

/* Decoded DRTP header, 6 bytes on the wire in network byte order:
 *   [seqno : u16][ackno : u16][flags : u16]
 */
struct header
{
    uint16_t seqno;
    uint16_t ackno;
    uint16_t flags;

    bool isFIN() const { return (flags & FIN_FLAG) != 0; }
    bool isACK() const { return (flags & ACK_FLAG) != 0; }
    bool isSYN() const { return (flags & SYN_FLAG) != 0; }

    PacketKind kind() const;
};

// A decoded datagram, header plus whatever followed it
struct packet
{
    struct header hdr;
    std::vector<uint8_t> data;
};

/**
 * @brief Write the 6 byte header for the given fields into out.
 */
void encodeHeader(uint16_t seqno, uint16_t ackno, uint16_t flags, uint8_t out[DRTP_HEADER_SIZE]);

/**
 * @brief Read a header from the first 6 bytes of buf. Reserved flag bits are dropped.
 * @throws MalformedHeader if len is smaller than the header.
 */
struct header decodeHeader(const uint8_t *buf, size_t len);

/**
 * @brief Split a full datagram into its header and payload.
 * @throws MalformedHeader if the datagram can't hold a header.
 */
struct packet parsePacket(const uint8_t *buf, size_t len);

const char *kindName(PacketKind kind);

#endif
