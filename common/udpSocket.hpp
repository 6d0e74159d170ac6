#ifndef DRTP_UDP_SOCKET_H
#define DRTP_UDP_SOCKET_H

#include <stdint.h>
#include <string>
#include <sys/socket.h>

#include "common/transport.hpp"

/**
 * @brief Transport over a UDP socket, IPv4 or IPv6.
 *
 * A LISTENER binds to a local address and answers whoever sent it the last
 * datagram, unless the peer is locked. A CONNECTOR talks to one fixed peer
 * from an ephemeral port.
 * The socket is closed when the object goes away.
 */
class UdpSocket : public Transport
{
public:
    enum Role
    {
        LISTENER,
        CONNECTOR
    };

    // throws DrtpError(SOCKET_ERROR) if the address can't be resolved or bound
    UdpSocket(Role role, const std::string &host, const std::string &port);
    ~UdpSocket();

    void sendDatagram(const Datagram &datagram);
    bool receiveDatagram(Datagram &datagram);
    void setTimeout(int milliseconds);
    void lockPeer();
    void unlockPeer();

    // port the socket ended up bound to, useful when binding to port 0
    uint16_t localPort() const;

    // "ip:port" of the current peer
    std::string peerName() const;

private:
    UdpSocket(const UdpSocket &);
    UdpSocket &operator=(const UdpSocket &);

    void applyTimeout(int milliseconds);
    bool fromPeer(const struct sockaddr_storage &from) const;

    Role role;
    int sockfd;
    struct sockaddr_storage peer;
    socklen_t peerLen;
    bool hasPeer;
    bool peerLocked;
    int timeoutMs;
};

// Gets the ip address based on the family type of the socket
void *get_in_addr(struct sockaddr *sa);

// Get the port number in host order according to the ip family
uint16_t get_in_port(struct sockaddr *sa);

#endif
