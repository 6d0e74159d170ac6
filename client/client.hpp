#ifndef DRTP_CLIENT_H
#define DRTP_CLIENT_H

#include "common/options.hpp"
#include "common/logger.hpp"

/**
 * @brief Send options.filename to options.ip:options.port.
 * @return true if the transfer ended with OK. Errors are logged, never thrown.
 */
bool runClient(const Options &options, Logger &log);

#endif
