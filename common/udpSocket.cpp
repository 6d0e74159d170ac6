#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include <chrono>
#include <sys/types.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>

#include "common/udpSocket.hpp"
#include "common/drtpError.hpp"

void *get_in_addr(struct sockaddr *sa)
{
    if (sa->sa_family == AF_INET)
    {
        return &((struct sockaddr_in *)sa)->sin_addr;
    }

    return &((struct sockaddr_in6 *)sa)->sin6_addr;
}

uint16_t get_in_port(struct sockaddr *sa)
{
    if (sa->sa_family == AF_INET)
    {
        return ntohs(((struct sockaddr_in *)sa)->sin_port);
    }

    return ntohs(((struct sockaddr_in6 *)sa)->sin6_port);
}

static std::string socketError(const std::string &what)
{
    return what + ": " + strerror(errno);
}

UdpSocket::UdpSocket(Role role, const std::string &host, const std::string &port)
    : role(role), sockfd(-1), peerLen(0), hasPeer(false), peerLocked(false), timeoutMs(0)
{
    struct addrinfo *serverinfo, hints;
    int status;

    memset(&this->peer, 0, sizeof this->peer);

    // setting hints to zero
    memset(&hints, 0, sizeof hints);

    hints.ai_family = AF_UNSPEC;     // we can use either IPv4 or IPv6
    hints.ai_socktype = SOCK_DGRAM;  // UDP used.
    hints.ai_protocol = IPPROTO_UDP; // to use the UDP protocol in the transmission
    if (role == LISTENER)
    {
        hints.ai_flags = AI_PASSIVE; // fill in the wildcard address when no host is given
    }

    const char *node = host.empty() ? NULL : host.c_str();
    if ((status = getaddrinfo(node, port.c_str(), &hints, &serverinfo)) != 0)
    {
        throw DrtpError(ErrorKind::SOCKET_ERROR, "Error occured while getting the address info of " + host + ":" + port + ": " + gai_strerror(status));
    }

    struct addrinfo *info = NULL;
    std::string lastError = "no usable address";
    for (info = serverinfo; info != NULL; info = info->ai_next)
    {
        if ((this->sockfd = socket(info->ai_family, info->ai_socktype, info->ai_protocol)) < 0)
        {
            lastError = socketError("Error occured while creating the socket");
            continue;
        }

        if (role == CONNECTOR)
        {
            // the peer is fixed for the whole transfer
            memcpy(&this->peer, info->ai_addr, info->ai_addrlen);
            this->peerLen = info->ai_addrlen;
            this->hasPeer = true;
            break;
        }

        // bind the socket to the port.
        if (bind(this->sockfd, info->ai_addr, info->ai_addrlen) < 0)
        {
            lastError = socketError("Error occured while binding the port");
            close(this->sockfd);
            this->sockfd = -1;
            continue;
        }
        break;
    }

    // We don't need it anymore.
    freeaddrinfo(serverinfo);

    if (info == NULL)
    {
        throw DrtpError(ErrorKind::SOCKET_ERROR, "Can't set up a socket for " + host + ":" + port + " (" + lastError + ")");
    }
}

UdpSocket::~UdpSocket()
{
    if (this->sockfd >= 0)
    {
        close(this->sockfd);
    }
}

void UdpSocket::sendDatagram(const Datagram &datagram)
{
    if (!this->hasPeer)
    {
        throw DrtpError(ErrorKind::SOCKET_ERROR, "No peer to send to yet");
    }

    if (sendto(this->sockfd, datagram.data(), datagram.size(), 0, (struct sockaddr *)&this->peer, this->peerLen) == -1)
    {
        throw DrtpError(ErrorKind::SOCKET_ERROR, socketError("Error with sending the packet"));
    }
}

// Same family, address and port as the current peer
bool UdpSocket::fromPeer(const struct sockaddr_storage &from) const
{
    if (!this->hasPeer || from.ss_family != this->peer.ss_family)
        return false;

    struct sockaddr_storage a = from, b = this->peer;
    size_t len = a.ss_family == AF_INET ? sizeof(struct in_addr) : sizeof(struct in6_addr);
    return get_in_port((struct sockaddr *)&a) == get_in_port((struct sockaddr *)&b) &&
           memcmp(get_in_addr((struct sockaddr *)&a), get_in_addr((struct sockaddr *)&b), len) == 0;
}

bool UdpSocket::receiveDatagram(Datagram &datagram)
{
    uint8_t buffer[DRTP_RECV_BUFFER];
    struct sockaddr_storage outside_sockets;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    bool shortened = false;
    bool received = false;

    while (true)
    {
        socklen_t size = sizeof(outside_sockets);
        ssize_t bytesRecved = recvfrom(this->sockfd, buffer, sizeof buffer, 0, (struct sockaddr *)&outside_sockets, &size);
        if (bytesRecved < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            throw DrtpError(ErrorKind::SOCKET_ERROR, socketError("Receiving failed"));
        }

        if (this->role == LISTENER && this->peerLocked && !this->fromPeer(outside_sockets))
        {
            // someone else while a connection is going on, wait on for the rest of the timeout
            if (this->timeoutMs > 0)
            {
                long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
                if (elapsed >= this->timeoutMs)
                    break;
                this->applyTimeout(static_cast<int>(this->timeoutMs - elapsed));
                shortened = true;
            }
            continue;
        }

        if (this->role == LISTENER)
        {
            // replies go back to whoever talked to us last
            memcpy(&this->peer, &outside_sockets, size);
            this->peerLen = size;
            this->hasPeer = true;
        }

        datagram.assign(buffer, buffer + bytesRecved);
        received = true;
        break;
    }

    if (shortened)
    {
        this->applyTimeout(this->timeoutMs);
    }
    return received;
}

void UdpSocket::setTimeout(int milliseconds)
{
    this->timeoutMs = milliseconds;
    this->applyTimeout(milliseconds);
}

void UdpSocket::applyTimeout(int milliseconds)
{
    // setting timeout for the socket, zero means block
    struct timeval socket_timeout;
    socket_timeout.tv_sec = milliseconds / 1000;
    socket_timeout.tv_usec = (milliseconds % 1000) * 1000;

    if (setsockopt(this->sockfd, SOL_SOCKET, SO_RCVTIMEO, &socket_timeout, sizeof socket_timeout) < 0)
    {
        throw DrtpError(ErrorKind::SOCKET_ERROR, socketError("Can't set the receive timeout"));
    }
}

void UdpSocket::lockPeer()
{
    // a CONNECTOR only ever has its one peer
    if (this->role == LISTENER)
        this->peerLocked = this->hasPeer;
}

void UdpSocket::unlockPeer()
{
    this->peerLocked = false;
}

uint16_t UdpSocket::localPort() const
{
    struct sockaddr_storage local;
    socklen_t size = sizeof(local);
    if (getsockname(this->sockfd, (struct sockaddr *)&local, &size) < 0)
    {
        throw DrtpError(ErrorKind::SOCKET_ERROR, socketError("getsockname failed"));
    }
    return get_in_port((struct sockaddr *)&local);
}

std::string UdpSocket::peerName() const
{
    if (!this->hasPeer)
        return "-";

    char ips[INET6_ADDRSTRLEN];
    struct sockaddr_storage copy = this->peer;
    inet_ntop(copy.ss_family, get_in_addr((struct sockaddr *)&copy), ips, sizeof ips);
    return std::string(ips) + ":" + std::to_string(get_in_port((struct sockaddr *)&copy));
}
