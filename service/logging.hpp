#pragma once

#include <string>

/**
 * @brief Install the default "console" logger
 *
 * @param verbose 0 = info, 1 = debug, 2 and above = trace
 * @param log_file also append to this file when not empty
 */
void init_logger(int verbose, const std::string& log_file = "");
