#include "executor/output_capture.hpp"

#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

#include <kj/debug.h>

namespace executor {

void OutputCapture::Append(const char* data, size_t size) {
  size_t room = limit_ - std::min(limit_, data_.size());
  if (size > room) truncated_ = true;
  data_.append(data, std::min(size, room));
}

bool OutputCapture::ReadFrom(int fd) {
  char buf[64 * 1024];
  while (true) {
    ssize_t got = read(fd, buf, sizeof(buf));
    if (got > 0) {
      Append(buf, got);
      continue;
    }
    if (got == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    KJ_FAIL_SYSCALL("read", errno, fd);
  }
}

void OutputPump::Pump(int timeout_millis) {
  struct pollfd pfds[2] = {};
  size_t stream[2] = {};
  nfds_t nfds = 0;
  for (size_t i = 0; i < 2; i++) {
    if (fds_[i] == -1) continue;
    pfds[nfds].fd = fds_[i];
    pfds[nfds].events = POLLIN;
    stream[nfds++] = i;
  }
  if (nfds == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(timeout_millis));
    return;
  }
  int ready = poll(pfds, nfds, timeout_millis);
  if (ready == -1) {
    if (errno == EINTR) return;
    KJ_FAIL_SYSCALL("poll", errno);
  }
  for (nfds_t i = 0; i < nfds; i++) {
    if (pfds[i].revents == 0) continue;
    size_t s = stream[i];
    if (!captures_[s]->ReadFrom(fds_[s])) fds_[s] = -1;
  }
}

}  // namespace executor
