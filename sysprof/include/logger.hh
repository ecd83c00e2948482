#pragma once

#include "include/utils.hh"

namespace SysProf {

/**
 * Initialize abseil logging for the process.
 *
 * @param log_dir directory to place sysprof.log in, must exist and be writable. Logs go to
 *        stderr when empty.
 * @return whether the initialization is successful
 */
bool loggerInitialize(const std::string &log_dir);
const fs::path &getLoggerFolder();
const fs::path &getLoggerFile();
void loggerDeinitialize();

}  // namespace SysProf
