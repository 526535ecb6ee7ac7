#include "sandbox/sandbox.hpp"

#include <mutex>

#include <kj/debug.h>

#include "util/flags.hpp"

namespace sandbox {

namespace {
std::mutex boxes_mutex;
}  // namespace

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(execution::IsolationMode mode, const char* name,
                        Sandbox::create_t create, Sandbox::score_t score) {
  Boxes_()->push_back(
      Entry{mode, name, std::move(create), std::move(score), false, -1});
}

std::unique_ptr<Sandbox> Sandbox::Create(execution::IsolationMode mode,
                                         std::string* error_msg) {
  std::lock_guard<std::mutex> lck(boxes_mutex);
  std::string wanted = mode == execution::IsolationMode::SANDBOXED
                           ? Flags::runtime
                           : std::string("auto");
  Entry* best = nullptr;
  int best_score = 0;
  for (Entry& entry : *Boxes_()) {
    if (entry.mode != mode) continue;
    if (wanted != "auto" && entry.name != wanted) continue;
    // Probing a runtime can be slow (e.g. asking the docker daemon), so it
    // is only done once per process.
    if (!entry.scored) {
      entry.cached_score = entry.score();
      entry.scored = true;
      KJ_LOG(INFO, "Isolation runtime scored", entry.name, entry.cached_score);
    }
    if (entry.cached_score > best_score) {
      best_score = entry.cached_score;
      best = &entry;
    }
  }
  if (best == nullptr) {
    if (wanted != "auto") {
      *error_msg = "Isolation runtime '" + wanted + "' is not available";
    } else {
      *error_msg = std::string("No isolation runtime available for ") +
                   execution::IsolationModeName(mode) + " executions";
    }
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(best->create());
}

}  // namespace sandbox
