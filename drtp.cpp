#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "common/options.hpp"
#include "common/logger.hpp"
#include "common/udpSocket.hpp"
#include "common/drtpError.hpp"
#include "client/client.hpp"
#include "server/server.hpp"

int main(int argc, char *argv[])
{
    Options options;
    bool help = false;
    try
    {
        options = parseOptions(argc, argv, help);
    }
    catch (const DrtpError &e)
    {
        std::cerr << e.what() << '\n'
                  << usage(argv[0]);
        return 1;
    }
    if (help)
    {
        std::cout << usage(argv[0]);
        return 0;
    }

    Logger log;
    bool runsServer = options.mode != RunMode::CLIENT;
    bool runsClient = options.mode != RunMode::SERVER;

    // bind before the client starts so its SYN has somewhere to go
    std::unique_ptr<UdpSocket> serverSocket;
    if (runsServer)
    {
        try
        {
            serverSocket.reset(new UdpSocket(UdpSocket::LISTENER, options.ip, options.port));
        }
        catch (const DrtpError &e)
        {
            log.error() << "Server: " << e.what();
            log.stop();
            return 1;
        }
        log.info() << "Starting the server with port : " << options.port << ", writing to " << options.output;
    }

    bool serverOk = true, clientOk = true;
    std::vector<std::thread> tasks;
    if (runsServer)
    {
        tasks.push_back(std::thread([&]
                                    { serverOk = runServer(options, *serverSocket, log); }));
    }
    if (runsClient)
    {
        tasks.push_back(std::thread([&]
                                    { clientOk = runClient(options, log); }));
    }

    for (size_t i = 0; i < tasks.size(); i++)
    {
        tasks[i].join();
    }

    log.info("QUIT");
    log.stop();
    return serverOk && clientOk ? 0 : 1;
}
