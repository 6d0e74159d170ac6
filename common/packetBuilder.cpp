#include <string.h>
#include <arpa/inet.h>

#include "common/packet.hpp"
#include "common/packetBuilder.hpp"
#include "common/drtpError.hpp"

void encodeHeader(uint16_t seqno, uint16_t ackno, uint16_t flags, uint8_t out[DRTP_HEADER_SIZE])
{
    uint16_t fields[3] = {htons(seqno), htons(ackno), htons(flags)};
    memcpy(out, fields, DRTP_HEADER_SIZE);
}

struct header decodeHeader(const uint8_t *buf, size_t len)
{
    if (len < DRTP_HEADER_SIZE)
    {
        throw MalformedHeader(len);
    }

    uint16_t fields[3];
    memcpy(fields, buf, DRTP_HEADER_SIZE);

    struct header hdr;
    hdr.seqno = ntohs(fields[0]);
    hdr.ackno = ntohs(fields[1]);
    // reserved bits are ignored on receive
    hdr.flags = ntohs(fields[2]) & DRTP_FLAG_MASK;
    return hdr;
}

struct packet parsePacket(const uint8_t *buf, size_t len)
{
    struct packet pkt;
    pkt.hdr = decodeHeader(buf, len);
    pkt.data.assign(buf + DRTP_HEADER_SIZE, buf + len);
    return pkt;
}

PacketKind header::kind() const
{
    switch (flags)
    {
    case 0:
        return PacketKind::DATA;
    case SYN_FLAG:
        return PacketKind::SYN;
    case SYN_FLAG | ACK_FLAG:
        return PacketKind::SYN_ACK;
    case ACK_FLAG:
        return PacketKind::ACK;
    case FIN_FLAG:
        return PacketKind::FIN;
    case FIN_FLAG | ACK_FLAG:
        return PacketKind::FIN_ACK;
    default:
        return PacketKind::OTHER;
    }
}

const char *kindName(PacketKind kind)
{
    switch (kind)
    {
    case PacketKind::DATA:
        return "DATA";
    case PacketKind::SYN:
        return "SYN";
    case PacketKind::SYN_ACK:
        return "SYN-ACK";
    case PacketKind::ACK:
        return "ACK";
    case PacketKind::FIN:
        return "FIN";
    case PacketKind::FIN_ACK:
        return "FIN-ACK";
    default:
        return "OTHER";
    }
}

PacketBuilder::PacketBuilder() : seqno(0), ackno(0), flags(0)
{
}

PacketBuilder *PacketBuilder::initPacket(uint16_t seq)
{
    // Whatever was being built before is thrown away
    this->seqno = seq;
    this->ackno = 0;
    this->flags = 0;
    this->payload.clear();
    return this;
}

PacketBuilder *PacketBuilder::setAck(uint16_t ackno)
{
    this->ackno = ackno;
    return this;
}

// Function to set the payload of the current packet with the passed data
PacketBuilder *PacketBuilder::addDataToPacket(const uint8_t *data, size_t len)
{
    if (len > DRTP_CHUNK_SIZE)
    {
        throw DrtpError(ErrorKind::PAYLOAD_TOO_LARGE, "payload of " + std::to_string(len) + " bytes exceeds the chunk size");
    }
    this->payload.assign(data, data + len);
    return this;
}

// To mark the current packet as the end of the connection
PacketBuilder *PacketBuilder::markAsFIN()
{
    this->flags |= FIN_FLAG;
    return this;
}

PacketBuilder *PacketBuilder::markAsACK()
{
    this->flags |= ACK_FLAG;
    return this;
}

// To initiate the connection
PacketBuilder *PacketBuilder::markAsSYN()
{
    this->flags |= SYN_FLAG;
    return this;
}

Datagram PacketBuilder::build()
{
    Datagram datagram(DRTP_HEADER_SIZE + this->payload.size());
    encodeHeader(this->seqno, this->ackno, this->flags, datagram.data());
    if (!this->payload.empty())
    {
        memcpy(datagram.data() + DRTP_HEADER_SIZE, this->payload.data(), this->payload.size());
    }
    this->initPacket(0);
    return datagram;
}

Datagram PacketBuilder::getControlPacket(uint16_t seq, uint16_t ackno, uint16_t flags)
{
    this->initPacket(seq)->setAck(ackno);
    this->flags = flags & DRTP_FLAG_MASK;
    return this->build();
}

// Function to create a data ack, seq is always 0 on those
Datagram PacketBuilder::getAckPacket(uint16_t ackno)
{
    return this->initPacket(0)->setAck(ackno)->markAsACK()->build();
}
