#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::daemon = false;
std::string Flags::pidfile;
std::string Flags::temp_directory = "/tmp/fusional";
int32_t Flags::port = 7070;

bool Flags::allow_direct = false;
int32_t Flags::max_timeout_seconds = 300;
int32_t Flags::max_memory_mb = 2048;
uint32_t Flags::max_source_bytes = 1024 * 1024;

uint32_t Flags::output_limit_bytes = 1024 * 1024;
int32_t Flags::grace_period_millis = 2000;
int32_t Flags::max_processes = 64;
int32_t Flags::scratch_size_mb = 64;
int32_t Flags::max_executions = 0;
std::string Flags::python_interpreter = "python3";

std::string Flags::runtime = "auto";
std::string Flags::cgroup_root = "/sys/fs/cgroup/fusional";
int32_t Flags::sandbox_uid = 1000;
int32_t Flags::sandbox_gid = 1000;
std::string Flags::docker_image = "python:3.11-slim";

std::string Flags::listen_address = "127.0.0.1";

std::string Flags::server = "127.0.0.1";
