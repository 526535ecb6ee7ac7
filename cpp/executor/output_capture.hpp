#ifndef EXECUTOR_OUTPUT_CAPTURE_HPP
#define EXECUTOR_OUTPUT_CAPTURE_HPP

#include <cstddef>
#include <string>

namespace executor {

// Collects at most limit bytes of a stream. Whatever arrives past the limit
// is read and discarded, so that the writer never blocks on a full pipe.
class OutputCapture {
 public:
  explicit OutputCapture(size_t limit) : limit_(limit) {}

  void Append(const char* data, size_t size);

  // Reads everything currently available from a non-blocking fd. Returns
  // false once the fd reached end of file.
  bool ReadFrom(int fd);

  const std::string& Data() const { return data_; }
  bool Truncated() const { return truncated_; }
  std::string Take() { return std::move(data_); }

 private:
  size_t limit_;
  std::string data_;
  bool truncated_ = false;
};

// Reads the stdout and stderr of a program into two captures.
class OutputPump {
 public:
  OutputPump(int stdout_fd, OutputCapture* out, int stderr_fd,
             OutputCapture* err)
      : fds_{stdout_fd, stderr_fd}, captures_{out, err} {}

  // Waits at most timeout_millis for output, then reads whatever is
  // available.
  void Pump(int timeout_millis);

  // Both streams reached end of file.
  bool Done() const { return fds_[0] == -1 && fds_[1] == -1; }

 private:
  int fds_[2];
  OutputCapture* captures_[2];
};

}  // namespace executor

#endif
