#ifndef DRTP_RELIABLE_RECEIVER
#define DRTP_RELIABLE_RECEIVER

#include <stdint.h>
#include <chrono>
#include <mutex>
#include <string>

#include "common/packet.hpp"
#include "common/packetBuilder.hpp"
#include "common/chunkStream.hpp"
#include "common/transport.hpp"
#include "common/logger.hpp"
#include "common/drtpError.hpp"
#include "common/options.hpp"

enum class ReceiverState
{
    LISTENING,
    HANDSHAKING,
    RECEIVING,
    CLOSED
};

/**
 * @brief Fault injection hook: the first data packet carrying this sequence
 * number is dropped on arrival, as if the network had lost it.
 */
class DiscardToken
{
public:
    DiscardToken() : armed(false), seqno(0) {}
    explicit DiscardToken(uint16_t seqno) : armed(true), seqno(seqno) {}

    // true exactly once, for the first packet that matches
    bool consume(uint16_t seq)
    {
        if (!armed || seq != seqno)
            return false;
        armed = false;
        return true;
    }

    bool isArmed() const { return armed; }

private:
    bool armed;
    uint16_t seqno;
};

struct ReceiverConfig
{
    int handshakeTimeoutMs; // how long the client gets to answer SYN-ACK
    int idleTimeoutMs;      // a connection silent for this long is dead
    DiscardToken discard;

    ReceiverConfig() : handshakeTimeoutMs(DEFAULT_TIMEOUT_MS), idleTimeoutMs(DEFAULT_IDLE_TIMEOUT_MS) {}
};

// Mbps as the server reports it: bits / (seconds * 1024 * 1024), 0 if no time passed
double computeThroughput(uint64_t bytes, double seconds);
std::string formatThroughput(double mbps);

/**
 * @brief Server side of DRTP. Accepts one connection at a time, writes the
 * payloads that arrive in order and acks only those.
 */
class Reliable_Receiver
{
public:
    Reliable_Receiver(Transport &transport, ChunkSink &sink, Logger &log, const ReceiverConfig &config = ReceiverConfig());

    /**
     * @brief Listen for one connection and serve it until FIN or until it goes silent.
     * @throws DrtpError if the sink can't be opened or written.
     */
    TransferStatus acceptOne();

    /**
     * @brief Accept connections one after another.
     * @param connections how many, 0 to keep going forever.
     * @return the number of transfers that ended with OK.
     */
    unsigned int serve(unsigned int connections);

    ReceiverState state() const { return currentState; }
    uint64_t bytesReceived() const { return receivedData; }
    uint16_t lastAccepted() const { return previousSeqNumber; }
    uint16_t announcedChunks() const { return announced; }
    double throughput() const { return lastThroughput; }

private:
    void listen();
    bool awaitHandshakeAck();
    TransferStatus receiveData();
    void handleData(const struct packet &pkt);
    void finish();

    Transport &transport;
    ChunkSink &sink;
    Logger &log;
    ReceiverConfig config;

    ReceiverState currentState;
    uint16_t previousSeqNumber; // last chunk written, 0 before the first one
    uint16_t announced;
    uint64_t receivedData;
    bool timing;
    std::chrono::steady_clock::time_point startTime;
    double lastThroughput;

    std::mutex transferLock; // one writer on the sink at a time
    PacketBuilder pcktBuilder;
};

#endif
