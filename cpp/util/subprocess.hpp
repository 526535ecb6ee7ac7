#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <sys/types.h>
#include <string>
#include <vector>

namespace util {

// Starts args[0] (searched in $PATH) with the given arguments. The child's
// stdin is /dev/null, its stdout and stderr go to the given fds; a negative
// fd means /dev/null. The child gets its own process group.
bool SpawnProcess(const std::vector<std::string>& args, int stdout_fd,
                  int stderr_fd, pid_t* pid, std::string* error_msg);

// Runs a command to completion, collecting at most output_limit bytes of its
// combined stdout and stderr in output. The command is killed if it does not
// terminate within timeout_millis. Returns false, setting error_msg, if the
// command could not be run or timed out; otherwise the exit status is stored
// in exit_code (-signal for a command killed by a signal).
bool RunCommand(const std::vector<std::string>& args, std::string* output,
                int* exit_code, std::string* error_msg,
                int timeout_millis = 30000, size_t output_limit = 1 << 16);

}  // namespace util

#endif
