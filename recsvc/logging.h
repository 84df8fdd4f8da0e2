/**
 * Process-wide logging setup. Library code logs through the spdlog default logger;
 * this only decides where the messages go.
 */
#ifndef __RECSVC_LOGGING_H
#define __RECSVC_LOGGING_H

#include <string>

namespace recsvc {
    /*
     * Install a default logger writing to stdout and, if `logFile` is not empty,
     * to that file as well. `level` is a spdlog level name ("debug", "info", ...).
     * Throws std::runtime_error if the level is unknown or the file cannot be opened.
     */
    void initLogging(const std::string &level, const std::string &logFile = "");
}

#endif
