#include "server/server.hpp"
#include "server/Reliable-Receiver.hpp"
#include "common/chunkStream.hpp"
#include "common/drtpError.hpp"

bool runServer(const Options &options, Transport &transport, Logger &log)
{
    ReceiverConfig config;
    config.handshakeTimeoutMs = options.timeoutMs;
    config.idleTimeoutMs = options.idleTimeoutMs;
    if (options.hasDiscard)
    {
        config.discard = DiscardToken(options.discard);
        log.info() << "Packet " << options.discard << " will be discarded once";
    }

    FileChunkSink sink(options.output);
    Reliable_Receiver receiver(transport, sink, log, config);

    try
    {
        unsigned int succeeded = receiver.serve(options.connections);
        return succeeded == options.connections;
    }
    catch (const DrtpError &e)
    {
        log.error() << "Server: " << errorKindName(e.kind()) << ": " << e.what();
        return false;
    }
}
