#include <stdlib.h>
#include <errno.h>
#include <getopt.h>

#include "common/options.hpp"
#include "common/drtpError.hpp"

Options::Options()
    : mode(RunMode::BOTH),
      windowSize(DEFAULT_WINDOW_SIZE),
      timeoutMs(DEFAULT_TIMEOUT_MS),
      idleTimeoutMs(DEFAULT_IDLE_TIMEOUT_MS),
      maxRetransmissions(DEFAULT_MAX_RETRANSMISSIONS),
      hasDiscard(false),
      discard(0),
      connections(0)
{
}

// strict decimal parse, the whole argument has to be a number in [low, high]
static long parseNumber(const char *name, const char *text, long low, long high)
{
    char *end = NULL;
    errno = 0;
    long value = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < low || value > high)
    {
        throw DrtpError(ErrorKind::CONFIG_INVALID,
                        std::string("invalid ") + name + " '" + text + "', expected a number in [" + std::to_string(low) + ", " + std::to_string(high) + "]");
    }
    return value;
}

std::string usage(const char *program)
{
    return std::string("usage: ") + program +
           " [-s | -c] -f FILE -i IP -p PORT [-w WINDOW] [-d SEQ] [-o OUTPUT]\n"
           "            [-t MS] [-T MS] [-r N] [-n N]\n"
           "  -s, --server          run in server mode\n"
           "  -c, --client          run in client mode (neither: run both)\n"
           "  -f, --filename FILE   file to send, or to write in server mode\n"
           "  -o, --output FILE     server destination (default FILE, FILE.received when running both)\n"
           "  -i, --ip IP           server IP address\n"
           "  -p, --port PORT       server port number\n"
           "  -w, --window N        client window size (default 3)\n"
           "  -d, --discard SEQ     server drops packet SEQ once\n"
           "  -t, --timeout MS      retransmission timeout (default 500)\n"
           "  -T, --idle-timeout MS server gives up a silent connection after MS (default 5000)\n"
           "  -r, --retries N       client gives up after N timeouts in a row (default 20)\n"
           "  -n, --connections N   transfers the server accepts, 0 for no limit\n"
           "  -h, --help            show this help\n";
}

Options parseOptions(int argc, char *argv[], bool &help)
{
    static const struct option longOptions[] = {
        {"server", no_argument, NULL, 's'},
        {"client", no_argument, NULL, 'c'},
        {"filename", required_argument, NULL, 'f'},
        {"output", required_argument, NULL, 'o'},
        {"ip", required_argument, NULL, 'i'},
        {"port", required_argument, NULL, 'p'},
        {"window", required_argument, NULL, 'w'},
        {"discard", required_argument, NULL, 'd'},
        {"timeout", required_argument, NULL, 't'},
        {"idle-timeout", required_argument, NULL, 'T'},
        {"retries", required_argument, NULL, 'r'},
        {"connections", required_argument, NULL, 'n'},
        {"help", no_argument, NULL, 'h'},
        {NULL, 0, NULL, 0}};

    Options options;
    bool server = false, client = false, hasConnections = false;
    help = false;

    // getopt keeps global state, start over on every call
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":scf:o:i:p:w:d:t:T:r:n:h", longOptions, NULL)) != -1)
    {
        switch (opt)
        {
        case 's':
            server = true;
            break;
        case 'c':
            client = true;
            break;
        case 'f':
            options.filename = optarg;
            break;
        case 'o':
            options.output = optarg;
            break;
        case 'i':
            options.ip = optarg;
            break;
        case 'p':
            parseNumber("port", optarg, 1, 65535);
            options.port = optarg;
            break;
        case 'w':
            options.windowSize = parseNumber("window size", optarg, 1, DRTP_MAX_WINDOW);
            break;
        case 'd':
            options.discard = parseNumber("discard sequence number", optarg, 0, 65535);
            options.hasDiscard = true;
            break;
        case 't':
            options.timeoutMs = parseNumber("timeout", optarg, 1, 3600000);
            break;
        case 'T':
            options.idleTimeoutMs = parseNumber("idle timeout", optarg, 1, 3600000);
            break;
        case 'r':
            options.maxRetransmissions = parseNumber("retries", optarg, 1, 1000000);
            break;
        case 'n':
            options.connections = parseNumber("connections", optarg, 0, 1000000);
            hasConnections = true;
            break;
        case 'h':
            help = true;
            return options;
        case ':':
            throw DrtpError(ErrorKind::CONFIG_INVALID, std::string("option '") + argv[optind - 1] + "' needs a value");
        default:
            throw DrtpError(ErrorKind::CONFIG_INVALID, std::string("unknown option '") + argv[optind - 1] + "'");
        }
    }

    if (optind < argc)
    {
        throw DrtpError(ErrorKind::CONFIG_INVALID, std::string("unexpected argument '") + argv[optind] + "'");
    }
    if (server && client)
    {
        throw DrtpError(ErrorKind::CONFIG_INVALID, "-s and -c can't be used together");
    }
    if (options.filename.empty())
    {
        throw DrtpError(ErrorKind::CONFIG_INVALID, "a file name is required (-f)");
    }
    if (options.ip.empty())
    {
        throw DrtpError(ErrorKind::CONFIG_INVALID, "a server IP address is required (-i)");
    }
    if (options.port.empty())
    {
        throw DrtpError(ErrorKind::CONFIG_INVALID, "a port number is required (-p)");
    }

    options.mode = server ? RunMode::SERVER : client ? RunMode::CLIENT : RunMode::BOTH;

    if (options.output.empty())
    {
        // when running both ends the source must not be truncated by the server
        options.output = options.mode == RunMode::BOTH ? options.filename + ".received" : options.filename;
    }
    if (options.mode == RunMode::BOTH && !hasConnections)
    {
        options.connections = 1;
    }
    return options;
}
