#include <stdio.h>

#include "server/Reliable-Receiver.hpp"

double computeThroughput(uint64_t bytes, double seconds)
{
    if (seconds <= 0)
        return 0;
    return (bytes * 8.0) / (seconds * 1024 * 1024);
}

std::string formatThroughput(double mbps)
{
    char buf[64];
    snprintf(buf, sizeof buf, "%.2f Mbps", mbps);
    return buf;
}

Reliable_Receiver::Reliable_Receiver(Transport &transport, ChunkSink &sink, Logger &log, const ReceiverConfig &config)
    : transport(transport), sink(sink), log(log), config(config),
      currentState(ReceiverState::CLOSED), previousSeqNumber(0), announced(0), receivedData(0), timing(false), lastThroughput(0)
{
}

// Block until someone asks for a connection, then answer with SYN-ACK
void Reliable_Receiver::listen()
{
    this->currentState = ReceiverState::LISTENING;
    this->transport.unlockPeer();
    this->transport.setTimeout(0);
    this->log.info("Server is listening...");

    Datagram datagram;
    while (true)
    {
        if (!this->transport.receiveDatagram(datagram))
            continue;

        struct header syn;
        try
        {
            syn = decodeHeader(datagram.data(), datagram.size());
        }
        catch (const MalformedHeader &e)
        {
            this->log.error() << "Error: " << e.what();
            continue;
        }

        if (!syn.isSYN())
        {
            this->log.info() << "Ignoring " << kindName(syn.kind()) << " packet, no connection yet";
            continue;
        }

        this->log.info("SYN packet is received");
        // the rest of the connection only listens to this client
        this->transport.lockPeer();
        this->transport.sendDatagram(this->pcktBuilder.getControlPacket(1, syn.seqno + 1, SYN_FLAG | ACK_FLAG));
        this->log.info("SYN-ACK packet is sent");
        return;
    }
}

bool Reliable_Receiver::awaitHandshakeAck()
{
    this->currentState = ReceiverState::HANDSHAKING;
    this->transport.setTimeout(this->config.handshakeTimeoutMs);

    Datagram datagram;
    if (!this->transport.receiveDatagram(datagram))
    {
        this->log.error("No ACK for SYN-ACK, failed to establish connection");
        return false;
    }

    struct header ack;
    try
    {
        ack = decodeHeader(datagram.data(), datagram.size());
    }
    catch (const MalformedHeader &e)
    {
        this->log.error() << "Failed to establish connection: " << e.what();
        return false;
    }

    if (!ack.isACK())
    {
        this->log.error("Failed to establish connection");
        return false;
    }

    this->log.info("ACK packet is received");
    this->log.info("Connection established");
    return true;
}

void Reliable_Receiver::handleData(const struct packet &pkt)
{
    uint16_t seqno = pkt.hdr.seqno;

    if (!this->timing)
    {
        this->timing = true;
        this->startTime = std::chrono::steady_clock::now();
    }

    this->log.info() << "packet " << seqno << " is received";

    // only the packet right after the last written one goes to the sink
    if (this->previousSeqNumber + 1 == seqno)
    {
        this->sink.write(pkt.data.data(), pkt.data.size());
        this->previousSeqNumber = seqno;
    }

    if (this->previousSeqNumber == seqno)
    {
        this->transport.sendDatagram(this->pcktBuilder.getAckPacket(seqno));
        this->log.info() << "ACK for packet = " << seqno << " is sent";
    }
    else
    {
        this->log.info() << "packet " << seqno << " is out of order, expecting " << this->previousSeqNumber + 1;
    }

    this->receivedData += pkt.data.size();
}

TransferStatus Reliable_Receiver::receiveData()
{
    this->currentState = ReceiverState::RECEIVING;
    this->transport.setTimeout(this->config.idleTimeoutMs);

    Datagram datagram;
    while (true)
    {
        if (!this->transport.receiveDatagram(datagram))
        {
            this->log.error("Timeout occurred, the client went silent");
            return TransferStatus::CONNECTION_LOST;
        }

        struct packet pkt;
        try
        {
            pkt = parsePacket(datagram.data(), datagram.size());
        }
        catch (const MalformedHeader &e)
        {
            this->log.error() << "Error: Data packet is too short (" << e.length() << " bytes)";
            continue;
        }

        if (pkt.hdr.seqno == 0)
        {
            if (pkt.hdr.isFIN())
            {
                this->log.info("FIN packet is received");
                if (this->previousSeqNumber != this->announced)
                {
                    this->log.error() << "Client closed after " << this->previousSeqNumber << " of " << this->announced << " chunks";
                }
                return TransferStatus::OK;
            }

            // size announcement, answered with the same count
            this->announced = pkt.hdr.ackno;
            this->transport.sendDatagram(this->pcktBuilder.getAckPacket(pkt.hdr.ackno));
            this->log.info() << "Client announced " << pkt.hdr.ackno << " chunks";
            continue;
        }

        if (pkt.hdr.kind() != PacketKind::DATA)
        {
            this->log.info() << "Ignoring " << kindName(pkt.hdr.kind()) << " packet during the transfer";
            continue;
        }

        if (this->config.discard.consume(pkt.hdr.seqno))
        {
            this->log.info() << "packet " << pkt.hdr.seqno << " is discarded";
            continue;
        }

        this->handleData(pkt);
    }
}

// Answer the FIN and report how fast it went
void Reliable_Receiver::finish()
{
    this->transport.sendDatagram(this->pcktBuilder.getControlPacket(1, 0, FIN_FLAG | ACK_FLAG));
    this->log.info("FIN ACK packet is sent");

    double seconds = 0;
    if (this->timing)
    {
        seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - this->startTime).count();
    }
    this->lastThroughput = computeThroughput(this->receivedData, seconds);
    this->log.info() << "The throughput is " << formatThroughput(this->lastThroughput);
    this->log.info("Connection Closes");
}

TransferStatus Reliable_Receiver::acceptOne()
{
    this->listen();
    if (!this->awaitHandshakeAck())
    {
        this->currentState = ReceiverState::CLOSED;
        return TransferStatus::HANDSHAKE_FAILED;
    }

    std::lock_guard<std::mutex> lg(this->transferLock);

    this->previousSeqNumber = 0;
    this->announced = 0;
    this->receivedData = 0;
    this->timing = false;
    this->lastThroughput = 0;

    TransferStatus status;
    try
    {
        this->sink.open();
        status = this->receiveData();
        if (status == TransferStatus::OK)
        {
            this->finish();
        }
    }
    catch (const DrtpError &)
    {
        this->sink.close();
        this->currentState = ReceiverState::CLOSED;
        throw;
    }

    this->sink.close();
    this->currentState = ReceiverState::CLOSED;
    return status;
}

unsigned int Reliable_Receiver::serve(unsigned int connections)
{
    unsigned int served = 0, succeeded = 0;
    while (connections == 0 || served < connections)
    {
        TransferStatus status = this->acceptOne();
        served++;
        if (status == TransferStatus::OK)
        {
            succeeded++;
        }
        else
        {
            this->log.error() << "Connection ended with " << statusName(status);
        }
    }
    return succeeded;
}
