#ifndef DRTP_PACKET_BUILDER_H
#define DRTP_PACKET_BUILDER_H

#include <stdint.h>
#include <stddef.h>

#include "common/packet.hpp"

/**
 * @brief Assembles outgoing datagrams, one at a time.
 *
 * Usage: builder.initPacket(seq)->setAck(n)->markAsACK()->build()
 */
class PacketBuilder
{
public:
    PacketBuilder();

    // Start a fresh packet with seq as its sequence number, dropping any unfinished one
    PacketBuilder *initPacket(uint16_t seq);

    PacketBuilder *setAck(uint16_t ackno);

    // Attach a payload, at most DRTP_CHUNK_SIZE bytes
    PacketBuilder *addDataToPacket(const uint8_t *data, size_t len);

    PacketBuilder *markAsFIN();
    PacketBuilder *markAsACK();
    PacketBuilder *markAsSYN();

    // Hand out the wire form of the current packet and reset the builder
    Datagram build();

    // Control packets carry no payload
    Datagram getControlPacket(uint16_t seq, uint16_t ackno, uint16_t flags);
    Datagram getAckPacket(uint16_t ackno);

private:
    uint16_t seqno;
    uint16_t ackno;
    uint16_t flags;
    Datagram payload;
};

#endif
