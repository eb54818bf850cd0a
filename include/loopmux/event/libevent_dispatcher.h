#ifndef LOOPMUX_EVENT_LIBEVENT_DISPATCHER_H
#define LOOPMUX_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "loopmux/event/event_loop.h"

struct event_base;
struct event;

namespace loopmux {
namespace event {

/**
 * Dispatcher over a libevent event_base with pthread locking enabled.
 *
 * Cross-thread posts activate a user event on the base; libevent's own
 * notification channel wakes the loop.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  LibeventDispatcher(const LibeventDispatcher&) = delete;
  LibeventDispatcher& operator=(const LibeventDispatcher&) = delete;

  const std::string& name() const override { return name_; }
  void post(PostCb callback) override;
  bool isThreadSafe() const override;
  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  void exit() override;
  void run(RunType type) override;

  event_base* base() { return base_; }

 private:
  static void onWakeup(int fd, short what, void* arg);
  void drainPosted();

  const std::string name_;
  event_base* base_{nullptr};
  struct ::event* wakeup_{nullptr};

  std::atomic<std::thread::id> loop_thread_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex posted_mutex_;
  std::vector<PostCb> posted_;
};

}  // namespace event
}  // namespace loopmux

#endif  // LOOPMUX_EVENT_LIBEVENT_DISPATCHER_H
