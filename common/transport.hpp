#ifndef DRTP_TRANSPORT_H
#define DRTP_TRANSPORT_H

#include "common/packet.hpp"

/**
 * @brief Unreliable datagram channel between the two endpoints of a transfer.
 *
 * Sends are fire-and-forget. Only one receive is ever outstanding.
 */
class Transport
{
public:
    virtual ~Transport() {}

    virtual void sendDatagram(const Datagram &datagram) = 0;

    /**
     * @brief Wait for the next datagram, up to the current timeout.
     * @return false if the timeout expired first.
     */
    virtual bool receiveDatagram(Datagram &datagram) = 0;

    // Receive timeout in milliseconds, 0 waits forever
    virtual void setTimeout(int milliseconds) = 0;

    /**
     * @brief Stick to the peer of the last datagram received. Until unlockPeer()
     * datagrams from anyone else are dropped by receiveDatagram, and the
     * timeout still counts from the start of the call.
     */
    virtual void lockPeer() = 0;
    virtual void unlockPeer() = 0;
};

#endif
