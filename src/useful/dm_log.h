/******************************************************************************\
 * dm_log.h - Header file for the log interface.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _DM_LOG_H
#define _DM_LOG_H

#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE dm_log_t;

// if logging is enabled,
// create a new logfile in directory with format doorman.<filename>.<suffix>.log
// otherwise, returns NULL dm_log_t that can be passed to logging functions with no effect
dm_log_t* _dm_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _dm_close_log(dm_log_t* log_file);

// write the given formatted string to the log file (if nonnull)
int _dm_write_log(dm_log_t* log_file, const char *fmt, ...);

#ifdef __cplusplus
}

#include <string>
#include <memory>

namespace doorman {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<dm_log_t, int(*)(dm_log_t*)>;

private: // variables
    LogPtr logFile;

public: // interface
    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _dm_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_dm_create_log(dir, filename.c_str(), suffix), _dm_close_log};
        }
    }

    bool enabled() const { return static_cast<bool>(logFile); }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _dm_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }
};

// true when real, effective and saved IDs are not all the same (setuid / setgid)
bool hasSplitIdentity();

// process-wide logger, configured from DOORMAN_DEBUG / DOORMAN_LOG_DIR on first use.
// both are ignored when the process has a split identity
Logger& getLogger();

template <typename... Args>
inline void writeLog(char const* fmt, Args&&... args)
{
    getLogger().write(fmt, std::forward<Args>(args)...);
}

} /* namespace doorman */

#endif /* __cplusplus */

#endif /* _DM_LOG_H */
