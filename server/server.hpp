#ifndef DRTP_SERVER_H
#define DRTP_SERVER_H

#include "common/options.hpp"
#include "common/logger.hpp"
#include "common/transport.hpp"

/**
 * @brief Receive files into options.output on an already bound transport,
 * options.connections times (0 for ever).
 * @return true if every transfer ended with OK. Errors are logged, never thrown.
 */
bool runServer(const Options &options, Transport &transport, Logger &log);

#endif
