#ifndef DRTP_OPTIONS_H
#define DRTP_OPTIONS_H

#include <stdint.h>
#include <string>

#define DEFAULT_WINDOW_SIZE 3
#define DEFAULT_TIMEOUT_MS 500
#define DEFAULT_IDLE_TIMEOUT_MS 5000
#define DEFAULT_MAX_RETRANSMISSIONS 20
#define DRTP_MAX_WINDOW 65535

enum class RunMode
{
    SERVER,
    CLIENT,
    BOTH
};

struct Options
{
    RunMode mode;
    std::string filename;      // file to send, or to write in server mode
    std::string output;        // where the server writes
    std::string ip;
    std::string port;
    unsigned int windowSize;
    int timeoutMs;             // retransmission timeout
    int idleTimeoutMs;         // receiver gives up on a silent connection after this
    unsigned int maxRetransmissions;
    bool hasDiscard;
    uint16_t discard;          // sequence number the server drops once
    unsigned int connections;  // transfers the server accepts, 0 for no limit

    Options();
};

/**
 * @brief Parse the drtp command line.
 * @throws DrtpError(CONFIG_INVALID) on unknown options or bad values.
 * Sets help to true and returns defaults when -h is given.
 */
Options parseOptions(int argc, char *argv[], bool &help);

std::string usage(const char *program);

#endif
