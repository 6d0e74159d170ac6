#ifndef DRTP_RELIABLE_SENDER
#define DRTP_RELIABLE_SENDER

#include <stdint.h>
#include <deque>
#include <string>
#include <vector>

#include "common/packet.hpp"
#include "common/packetBuilder.hpp"
#include "common/chunkStream.hpp"
#include "common/transport.hpp"
#include "common/logger.hpp"
#include "common/drtpError.hpp"
#include "common/options.hpp"

enum class SenderState
{
    IDLE,
    HANDSHAKING,
    TRANSFERRING,
    TEARING_DOWN,
    CLOSED
};

struct SenderConfig
{
    unsigned int windowSize;
    int timeoutMs;
    unsigned int maxRetransmissions; // consecutive timeouts before the peer is given up

    SenderConfig() : windowSize(DEFAULT_WINDOW_SIZE), timeoutMs(DEFAULT_TIMEOUT_MS), maxRetransmissions(DEFAULT_MAX_RETRANSMISSIONS) {}
};

/**
 * @brief Client side of a DRTP transfer: handshake, Go-Back-N transfer, teardown.
 *
 * Only the ack for the oldest packet in the window moves it forward, any other
 * ack is ignored. A timeout throws the whole window away and sends it again
 * starting from base.
 */
class Reliable_Sender
{
public:
    Reliable_Sender(Transport &transport, ChunkSource &source, Logger &log, const SenderConfig &config = SenderConfig());

    /**
     * @brief Run one transfer from start to end. The teardown always runs,
     * whatever happened before it.
     * @return the first failure seen, or OK.
     */
    TransferStatus sendFile();

    SenderState state() const { return currentState; }
    uint64_t getBase() const { return base; }
    uint64_t getNextSeqNumber() const { return nextSeqNumber; }
    uint64_t getTotalChunks() const { return totalChunks; }
    std::vector<uint16_t> inFlight() const { return std::vector<uint16_t>(window.begin(), window.end()); }
    unsigned int retransmissionRounds() const { return rounds; }

private:
    bool handshake();
    TransferStatus transferData();
    bool announceSize();
    void fillWindow();
    bool recvAck();
    void handleTimeOut();
    bool teardown();

    void sendPacket(const Datagram &datagram);
    bool awaitPacket(struct packet &pkt);
    std::string windowToString() const;

    Transport &transport;
    ChunkSource &source;
    Logger &log;
    SenderConfig config;

    SenderState currentState;
    std::deque<uint16_t> window;   // sent but not acknowledged yet, oldest first
    uint64_t base;                 // oldest unacknowledged chunk
    uint64_t nextSeqNumber;        // next chunk to be sent
    uint64_t totalChunks;
    unsigned int timeouts;         // in a row, reset by any progress
    unsigned int rounds;

    std::vector<uint8_t> chunk;
    PacketBuilder pcktBuilder;
};

#endif
