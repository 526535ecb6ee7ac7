#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool daemon;
  static std::string pidfile;
  static std::string temp_directory;
  static int32_t port;

  // Request validation
  static bool allow_direct;
  static int32_t max_timeout_seconds;
  static int32_t max_memory_mb;
  static uint32_t max_source_bytes;

  // Execution
  static uint32_t output_limit_bytes;
  static int32_t grace_period_millis;
  static int32_t max_processes;
  static int32_t scratch_size_mb;
  static int32_t max_executions;
  static std::string python_interpreter;

  // Isolation runtimes
  static std::string runtime;
  static std::string cgroup_root;
  static int32_t sandbox_uid;
  static int32_t sandbox_gid;
  static std::string docker_image;

  // Server-only flags
  static std::string listen_address;

  // Client-only flags
  static std::string server;
};

#endif
