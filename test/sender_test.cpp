#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "client/Reliable-Sender.hpp"
#include "support/scriptedTransport.hpp"

namespace
{

Datagram makeBytes(size_t n)
{
    Datagram bytes(n);
    for (size_t i = 0; i < n; i++)
        bytes[i] = static_cast<uint8_t>((i * 13 + 5) % 256);
    return bytes;
}

SenderConfig configWith(unsigned int window, unsigned int retries = DEFAULT_MAX_RETRANSMISSIONS)
{
    SenderConfig config;
    config.windowSize = window;
    config.timeoutMs = 50;
    config.maxRetransmissions = retries;
    return config;
}

// the receiver side of a successful handshake and size announcement
void acceptConnection(ScriptedTransport &transport, uint16_t chunks)
{
    transport.deliver(1, 2, SYN_FLAG | ACK_FLAG).deliver(0, chunks, ACK_FLAG);
}

void ack(ScriptedTransport &transport, uint16_t seqno)
{
    transport.deliver(0, seqno, ACK_FLAG);
}

void finAck(ScriptedTransport &transport)
{
    transport.deliver(1, 0, FIN_FLAG | ACK_FLAG);
}

// payloads of the data packets that were sent, in order
std::vector<Datagram> sentPayloads(const ScriptedTransport &transport)
{
    std::vector<Datagram> payloads;
    for (size_t i = 0; i < transport.sent.size(); i++)
    {
        struct packet pkt = parsePacket(transport.sent[i].data(), transport.sent[i].size());
        if (pkt.hdr.kind() == PacketKind::DATA && pkt.hdr.seqno != 0)
            payloads.push_back(pkt.data);
    }
    return payloads;
}

class SenderTest : public ::testing::Test
{
protected:
    SenderTest() : log(out, err) {}

    std::string logged()
    {
        log.stop();
        return out.str() + err.str();
    }

    std::ostringstream out, err;
    Logger log;
    ScriptedTransport transport;
};

/**
 * Checks the window at every receive: never larger than configured, and
 * always the consecutive numbers base .. next-1.
 */
class WindowCheckingTransport : public ScriptedTransport
{
public:
    WindowCheckingTransport() : sender(NULL), window(0), checks(0) {}

    bool receiveDatagram(Datagram &datagram)
    {
        if (sender != NULL && sender->state() == SenderState::TRANSFERRING)
        {
            std::vector<uint16_t> inFlight = sender->inFlight();
            EXPECT_LE(inFlight.size(), window);
            for (size_t i = 0; i < inFlight.size(); i++)
            {
                EXPECT_EQ(sender->getBase() + i, inFlight[i]);
            }
            if (!inFlight.empty())
            {
                EXPECT_EQ(sender->getNextSeqNumber() - 1, inFlight.back());
            }
            checks++;
        }
        return ScriptedTransport::receiveDatagram(datagram);
    }

    Reliable_Sender *sender;
    size_t window;
    size_t checks;
};

} // namespace

TEST_F(SenderTest, HappyPathSendsEveryChunkOnce)
{
    Datagram bytes = makeBytes(2000);
    MemoryChunkSource source(bytes);
    acceptConnection(transport, 3);
    ack(transport, 1);
    ack(transport, 2);
    ack(transport, 3);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
    EXPECT_EQ(SenderState::CLOSED, sender.state());
    EXPECT_EQ(3u, sender.getTotalChunks());
    EXPECT_EQ(4u, sender.getBase());
    EXPECT_EQ(0u, sender.retransmissionRounds());

    std::vector<struct header> sent = transport.sentHeaders();
    ASSERT_EQ(8u, sent.size());
    EXPECT_EQ(PacketKind::SYN, sent[0].kind());
    EXPECT_EQ(1, sent[0].seqno);
    EXPECT_EQ(0, sent[0].ackno);
    EXPECT_EQ(PacketKind::ACK, sent[1].kind());
    EXPECT_EQ(2, sent[1].ackno);
    EXPECT_EQ(PacketKind::ACK, sent[2].kind());
    EXPECT_EQ(0, sent[2].seqno);
    EXPECT_EQ(3, sent[2].ackno);
    EXPECT_EQ(PacketKind::FIN, sent[6].kind());
    EXPECT_EQ(0, sent[6].seqno);
    EXPECT_EQ(PacketKind::ACK, sent[7].kind());
    EXPECT_EQ(2, sent[7].ackno);

    EXPECT_EQ(std::vector<uint16_t>({1, 2, 3}), transport.sentDataSeqs());

    std::vector<Datagram> payloads = sentPayloads(transport);
    Datagram joined;
    for (size_t i = 0; i < payloads.size(); i++)
        joined.insert(joined.end(), payloads[i].begin(), payloads[i].end());
    EXPECT_EQ(bytes, joined);
    EXPECT_EQ(12u, payloads[2].size());
}

TEST_F(SenderTest, ShortDatagramsWhileWaitingAreDropped)
{
    const uint8_t shortBytes[] = {0, 1, 2};
    Datagram runt(shortBytes, shortBytes + 3);

    Datagram bytes = makeBytes(2000);
    MemoryChunkSource source(bytes);
    transport.deliver(runt);
    acceptConnection(transport, 3);
    transport.deliver(runt);
    ack(transport, 1);
    ack(transport, 2);
    ack(transport, 3);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
    EXPECT_EQ(0u, sender.retransmissionRounds());
    EXPECT_EQ(std::vector<uint16_t>({1, 2, 3}), transport.sentDataSeqs());
    EXPECT_EQ(0u, transport.pending());
    EXPECT_NE(std::string::npos, logged().find("Dropping datagram"));
}

TEST_F(SenderTest, UnansweredSynSendsNoDataButStillTearsDown)
{
    MemoryChunkSource source(makeBytes(2000));
    transport.timeout().timeout();

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::HANDSHAKE_FAILED, sender.sendFile());

    std::vector<struct header> sent = transport.sentHeaders();
    ASSERT_EQ(2u, sent.size());
    EXPECT_EQ(PacketKind::SYN, sent[0].kind());
    EXPECT_EQ(PacketKind::FIN, sent[1].kind());
    EXPECT_TRUE(transport.sentDataSeqs().empty());
    EXPECT_EQ(0u, source.reads());

    std::string text = logged();
    EXPECT_NE(std::string::npos, text.find("FIN packet is sent"));
    EXPECT_NE(std::string::npos, text.find("HandshakeFailed"));
}

TEST_F(SenderTest, ReplyWithoutSynFailsTheHandshake)
{
    MemoryChunkSource source(makeBytes(10));
    transport.deliver(0, 0, ACK_FLAG);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::HANDSHAKE_FAILED, sender.sendFile());
    EXPECT_TRUE(transport.sentDataSeqs().empty());
}

TEST_F(SenderTest, MissingSourceAbortsTransferButRunsTeardown)
{
    MemoryChunkSource missing;
    transport.deliver(1, 2, SYN_FLAG | ACK_FLAG);
    finAck(transport);

    Reliable_Sender sender(transport, missing, log, configWith(3));
    EXPECT_EQ(TransferStatus::SOURCE_UNAVAILABLE, sender.sendFile());
    EXPECT_EQ(SenderState::CLOSED, sender.state());

    std::vector<struct header> sent = transport.sentHeaders();
    ASSERT_EQ(4u, sent.size());
    EXPECT_EQ(PacketKind::FIN, sent[2].kind());
    EXPECT_EQ(PacketKind::ACK, sent[3].kind());
    EXPECT_TRUE(transport.sentDataSeqs().empty());
}

TEST_F(SenderTest, TimeoutsResendTheSameWindowEveryTime)
{
    Datagram bytes = makeBytes(4 * DRTP_CHUNK_SIZE + 10);
    MemoryChunkSource source(bytes);
    acceptConnection(transport, 5);
    transport.timeout().timeout().timeout();
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3, 2));
    EXPECT_EQ(TransferStatus::CONNECTION_LOST, sender.sendFile());
    EXPECT_EQ(2u, sender.retransmissionRounds());
    EXPECT_EQ(1u, sender.getBase());

    EXPECT_EQ(std::vector<uint16_t>({1, 2, 3, 1, 2, 3, 1, 2, 3}), transport.sentDataSeqs());

    std::vector<Datagram> payloads = sentPayloads(transport);
    ASSERT_EQ(9u, payloads.size());
    for (size_t i = 3; i < payloads.size(); i++)
    {
        EXPECT_EQ(payloads[i % 3], payloads[i]) << "packet " << i;
    }

    // the teardown still went out after giving up
    EXPECT_EQ(PacketKind::FIN, transport.sentHeaders()[transport.sent.size() - 2].kind());
}

TEST_F(SenderTest, AckForAnotherPacketThanTheHeadIsIgnored)
{
    MemoryChunkSource source(makeBytes(2000));
    acceptConnection(transport, 3);
    ack(transport, 2);
    transport.timeout();
    ack(transport, 1);
    ack(transport, 2);
    ack(transport, 3);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
    EXPECT_EQ(std::vector<uint16_t>({1, 2, 3, 1, 2, 3}), transport.sentDataSeqs());
    EXPECT_EQ(1u, sender.retransmissionRounds());
}

TEST_F(SenderTest, LostChunkIsResentFromTheOldestUnacked)
{
    MemoryChunkSource source(makeBytes(2000));
    acceptConnection(transport, 3);
    ack(transport, 1);
    transport.timeout();
    ack(transport, 2);
    ack(transport, 3);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
    EXPECT_EQ(std::vector<uint16_t>({1, 2, 3, 2, 3}), transport.sentDataSeqs());
}

TEST_F(SenderTest, EmptySourceOnlyHandshakesAndTearsDown)
{
    MemoryChunkSource source((Datagram()));
    acceptConnection(transport, 0);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
    EXPECT_EQ(0u, sender.getTotalChunks());
    EXPECT_TRUE(transport.sentDataSeqs().empty());

    std::vector<struct header> sent = transport.sentHeaders();
    ASSERT_EQ(5u, sent.size());
    EXPECT_EQ(0, sent[2].ackno);
    EXPECT_EQ(PacketKind::FIN, sent[3].kind());
}

TEST_F(SenderTest, AnnouncementIsRepeatedUntilAcked)
{
    MemoryChunkSource source(makeBytes(1500));
    transport.deliver(1, 2, SYN_FLAG | ACK_FLAG);
    transport.timeout();
    transport.deliver(0, 2, ACK_FLAG);
    ack(transport, 1);
    ack(transport, 2);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());

    std::vector<struct header> sent = transport.sentHeaders();
    EXPECT_EQ(PacketKind::ACK, sent[2].kind());
    EXPECT_EQ(2, sent[2].ackno);
    EXPECT_EQ(PacketKind::ACK, sent[3].kind());
    EXPECT_EQ(2, sent[3].ackno);
    EXPECT_EQ(std::vector<uint16_t>({1, 2}), transport.sentDataSeqs());
}

TEST_F(SenderTest, WindowStaysWithinItsSize)
{
    WindowCheckingTransport checking;
    checking.window = 2;
    MemoryChunkSource source(makeBytes(5 * DRTP_CHUNK_SIZE));
    acceptConnection(checking, 5);
    ack(checking, 1);
    ack(checking, 3);
    ack(checking, 2);
    checking.timeout();
    ack(checking, 3);
    ack(checking, 4);
    ack(checking, 5);
    finAck(checking);

    Reliable_Sender sender(checking, source, log, configWith(2));
    checking.sender = &sender;
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
    EXPECT_GT(checking.checks, 0u);
    EXPECT_EQ(std::vector<uint16_t>({1, 2, 3, 4, 3, 4, 5}), checking.sentDataSeqs());
}

TEST_F(SenderTest, LateAcksBeforeFinAckAreSkipped)
{
    MemoryChunkSource source(makeBytes(900));
    acceptConnection(transport, 1);
    ack(transport, 1);
    ack(transport, 1);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::OK, sender.sendFile());
}

TEST_F(SenderTest, MissingFinAckIsReportedAsTeardownFailure)
{
    MemoryChunkSource source(makeBytes(900));
    acceptConnection(transport, 1);
    ack(transport, 1);
    transport.timeout();

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::TEARDOWN_FAILED, sender.sendFile());
    EXPECT_EQ(SenderState::CLOSED, sender.state());
    EXPECT_NE(std::string::npos, logged().find("Failed to close connection"));
}

TEST_F(SenderTest, SourceBeyondSixteenBitSequenceNumbersIsRefused)
{
    // one byte chunks make 65536 chunks out of a small buffer
    MemoryChunkSource source(makeBytes(65536), 1);
    transport.deliver(1, 2, SYN_FLAG | ACK_FLAG);
    finAck(transport);

    Reliable_Sender sender(transport, source, log, configWith(3));
    EXPECT_EQ(TransferStatus::SOURCE_TOO_LARGE, sender.sendFile());
    EXPECT_TRUE(transport.sentDataSeqs().empty());
    EXPECT_EQ(PacketKind::FIN, transport.sentHeaders()[2].kind());
}
