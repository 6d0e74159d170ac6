#include <sstream>

#include "client/Reliable-Sender.hpp"

Reliable_Sender::Reliable_Sender(Transport &transport, ChunkSource &source, Logger &log, const SenderConfig &config)
    : transport(transport), source(source), log(log), config(config),
      currentState(SenderState::IDLE), base(1), nextSeqNumber(1), totalChunks(0), timeouts(0), rounds(0),
      chunk(source.chunkSize())
{
    if (this->config.windowSize == 0)
    {
        this->config.windowSize = 1;
    }
}

void Reliable_Sender::sendPacket(const Datagram &datagram)
{
    this->transport.sendDatagram(datagram);
}

// Wait for the next well formed packet, too short datagrams are dropped here
bool Reliable_Sender::awaitPacket(struct packet &pkt)
{
    Datagram datagram;
    while (this->transport.receiveDatagram(datagram))
    {
        try
        {
            pkt = parsePacket(datagram.data(), datagram.size());
            return true;
        }
        catch (const MalformedHeader &e)
        {
            this->log.error() << "Dropping datagram: " << e.what();
        }
    }
    return false;
}

std::string Reliable_Sender::windowToString() const
{
    std::ostringstream out;
    out << '[';
    for (std::deque<uint16_t>::const_iterator it = this->window.begin(); it != this->window.end(); ++it)
    {
        if (it != this->window.begin())
            out << ", ";
        out << *it;
    }
    out << ']';
    return out.str();
}

bool Reliable_Sender::handshake()
{
    this->currentState = SenderState::HANDSHAKING;
    this->log.info("Connection Establishment Phase:");

    this->sendPacket(this->pcktBuilder.initPacket(1)->markAsSYN()->build());
    this->log.info("SYN packet is sent");

    struct packet synAck;
    if (!this->awaitPacket(synAck))
    {
        this->log.error("No answer to SYN, failed to establish connection");
        return false;
    }
    if (!synAck.hdr.isSYN())
    {
        this->log.error() << "Got " << kindName(synAck.hdr.kind()) << " instead of SYN-ACK, failed to establish connection";
        return false;
    }
    this->log.info("SYN-ACK packet is received");

    this->sendPacket(this->pcktBuilder.initPacket(0)->setAck(synAck.hdr.seqno + 1)->markAsACK()->build());
    this->log.info("ACK packet is sent");
    this->log.info("Connection established");
    return true;
}

// Tell the receiver how many chunks are coming and wait until it has heard it
bool Reliable_Sender::announceSize()
{
    uint16_t announced = static_cast<uint16_t>(this->totalChunks);
    Datagram announcement = this->pcktBuilder.getControlPacket(0, announced, ACK_FLAG);
    unsigned int missed = 0;

    this->sendPacket(announcement);
    this->log.info() << "Announced " << this->totalChunks << " chunks";

    struct packet ack;
    while (true)
    {
        if (!this->awaitPacket(ack))
        {
            if (++missed > this->config.maxRetransmissions)
            {
                this->log.error() << "Size announcement not acknowledged after " << missed << " timeouts";
                return false;
            }
            this->sendPacket(announcement);
            this->log.info("Timeout occurred. Announcing the size again");
            continue;
        }
        if (ack.hdr.kind() == PacketKind::ACK && ack.hdr.ackno == announced)
        {
            return true;
        }
    }
}

// Send new chunks until the window is full or there's nothing left to send
void Reliable_Sender::fillWindow()
{
    while (this->window.size() < this->config.windowSize && this->nextSeqNumber <= this->totalChunks)
    {
        uint16_t seqno = static_cast<uint16_t>(this->nextSeqNumber);
        size_t count = this->source.readChunk(this->nextSeqNumber, this->chunk.data());

        this->sendPacket(this->pcktBuilder.initPacket(seqno)->addDataToPacket(this->chunk.data(), count)->build());
        this->window.push_back(seqno);
        this->log.info() << "packet with seq = " << seqno << " is sent, sliding window = " << this->windowToString();
        this->nextSeqNumber++;
    }
}

/**
 * @brief Wait for one ack. Only the ack for the front of the window counts,
 * the rest are ignored. A timeout sends the whole window again.
 * @return false once too many timeouts happened in a row.
 */
bool Reliable_Sender::recvAck()
{
    struct packet ack;
    if (!this->awaitPacket(ack))
    {
        if (++this->timeouts > this->config.maxRetransmissions)
        {
            this->log.error() << "No ack after " << this->config.maxRetransmissions << " retransmissions, giving up";
            return false;
        }
        this->handleTimeOut();
        return true;
    }

    if (ack.hdr.kind() != PacketKind::ACK)
    {
        this->log.info() << "Ignoring " << kindName(ack.hdr.kind()) << " packet while waiting for an ack";
        return true;
    }

    if (this->window.empty() || ack.hdr.ackno != this->window.front())
    {
        this->log.info() << "ACK for packet = " << ack.hdr.ackno << " ignored, waiting for " << (this->window.empty() ? 0 : this->window.front());
        return true;
    }

    this->log.info() << "ACK for packet = " << ack.hdr.ackno << " is received";
    this->window.pop_front();
    this->base = static_cast<uint64_t>(ack.hdr.ackno) + 1;
    this->timeouts = 0;
    return true;
}

// Go back to base: forget what's in flight so fillWindow sends it all again
void Reliable_Sender::handleTimeOut()
{
    this->log.info("Timeout occurred. Retransmitting...");
    if (!this->window.empty())
    {
        this->log.info() << "packet with seq = " << this->window.front() << " is retransmitted";
    }
    this->window.clear();
    this->nextSeqNumber = this->base;
    this->rounds++;
}

TransferStatus Reliable_Sender::transferData()
{
    this->currentState = SenderState::TRANSFERRING;
    this->log.info("Data Transfer:");

    try
    {
        this->source.open();
    }
    catch (const DrtpError &e)
    {
        this->log.error(e.what());
        return TransferStatus::SOURCE_UNAVAILABLE;
    }

    this->totalChunks = ::totalChunks(this->source.size(), this->source.chunkSize());
    if (this->totalChunks > DRTP_MAX_CHUNKS)
    {
        // sequence numbers are 16 bits and never wrap
        this->log.error() << "Source of " << this->source.size() << " bytes needs " << this->totalChunks
                          << " chunks, more than the " << DRTP_MAX_CHUNKS << " a transfer can carry";
        return TransferStatus::SOURCE_TOO_LARGE;
    }

    if (!this->announceSize())
    {
        return TransferStatus::CONNECTION_LOST;
    }

    this->base = this->nextSeqNumber = 1;
    this->window.clear();
    this->timeouts = 0;

    try
    {
        while (this->base <= this->totalChunks)
        {
            this->fillWindow();
            if (!this->recvAck())
            {
                return TransferStatus::CONNECTION_LOST;
            }
        }
    }
    catch (const DrtpError &e)
    {
        if (e.kind() != ErrorKind::SOURCE_UNAVAILABLE)
            throw;
        this->log.error(e.what());
        return TransferStatus::SOURCE_UNAVAILABLE;
    }

    this->log.info("DATA Finished");
    return TransferStatus::OK;
}

bool Reliable_Sender::teardown()
{
    this->currentState = SenderState::TEARING_DOWN;
    this->log.info("Connection Teardown:");

    this->sendPacket(this->pcktBuilder.getControlPacket(0, 0, FIN_FLAG));
    this->log.info("FIN packet is sent");

    struct packet finAck;
    while (this->awaitPacket(finAck))
    {
        PacketKind kind = finAck.hdr.kind();
        if (kind == PacketKind::FIN_ACK)
        {
            this->log.info("FIN-ACK packet is received");
            this->sendPacket(this->pcktBuilder.getAckPacket(finAck.hdr.seqno + 1));
            this->log.info("Connection Closes");
            return true;
        }
        if (kind != PacketKind::ACK)
        {
            break;
        }
        // late data acks can still be on their way
    }

    this->log.error("Failed to close connection");
    return false;
}

TransferStatus Reliable_Sender::sendFile()
{
    TransferStatus status = TransferStatus::OK;
    this->transport.setTimeout(this->config.timeoutMs);

    try
    {
        if (!this->handshake())
        {
            status = TransferStatus::HANDSHAKE_FAILED;
        }
        else
        {
            status = this->transferData();
        }

        if (!this->teardown() && status == TransferStatus::OK)
        {
            status = TransferStatus::TEARDOWN_FAILED;
        }
    }
    catch (const DrtpError &)
    {
        // socket failures, the transport can't be used for a teardown anymore
        this->source.close();
        this->currentState = SenderState::CLOSED;
        throw;
    }

    this->source.close();
    this->currentState = SenderState::CLOSED;
    this->log.info() << "Transfer finished: " << statusName(status);
    return status;
}
