#include "client/client.hpp"
#include "client/Reliable-Sender.hpp"
#include "common/chunkStream.hpp"
#include "common/udpSocket.hpp"
#include "common/drtpError.hpp"

bool runClient(const Options &options, Logger &log)
{
    SenderConfig config;
    config.windowSize = options.windowSize;
    config.timeoutMs = options.timeoutMs;
    config.maxRetransmissions = options.maxRetransmissions;

    try
    {
        UdpSocket socket(UdpSocket::CONNECTOR, options.ip, options.port);
        FileChunkSource source(options.filename);

        log.info() << "Sending " << options.filename << " to " << socket.peerName() << " with window size " << config.windowSize;

        Reliable_Sender sender(socket, source, log, config);
        TransferStatus status = sender.sendFile();
        if (status != TransferStatus::OK)
        {
            log.error() << "Client: transfer of " << options.filename << " failed: " << statusName(status);
            return false;
        }
        return true;
    }
    catch (const DrtpError &e)
    {
        log.error() << "Client: " << errorKindName(e.kind()) << ": " << e.what();
        return false;
    }
}
