#define LOOPMUX_LOG_COMPONENT "event.dispatcher"

#include "loopmux/event/libevent_dispatcher.h"

#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>

#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace event {

namespace {

using LibeventEvent = struct ::event;

void useLibeventLocking() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (evthread_use_pthreads() != 0) {
      throw std::runtime_error("libevent pthread support unavailable");
    }
  });
}

class LibeventFileEvent : public FileEvent {
 public:
  LibeventFileEvent(event_base* base, int fd, FileReadyCb cb, uint32_t events)
      : base_(base), fd_(fd), cb_(std::move(cb)) {
    ev_ = event_new(base_, fd_, 0, &LibeventFileEvent::onReady, this);
    if (!ev_) {
      throw std::runtime_error("event_new failed for fd " +
                               std::to_string(fd_));
    }
    setEnabled(events);
  }

  ~LibeventFileEvent() override { event_free(ev_); }

  void setEnabled(uint32_t events) override {
    event_del(ev_);
    if (events == 0) {
      return;
    }
    short what = EV_PERSIST;
    if (events & FileReady::Read) {
      what |= EV_READ;
    }
    if (events & FileReady::Write) {
      what |= EV_WRITE;
    }
    event_assign(ev_, base_, fd_, what, &LibeventFileEvent::onReady, this);
    if (event_add(ev_, nullptr) != 0) {
      LOOPMUX_LOG(Error, "cannot watch fd {}", fd_);
    }
  }

 private:
  static void onReady(int, short what, void* arg) {
    uint32_t events = 0;
    if (what & EV_READ) {
      events |= FileReady::Read;
    }
    if (what & EV_WRITE) {
      events |= FileReady::Write;
    }
    // May delete this object
    static_cast<LibeventFileEvent*>(arg)->cb_(events);
  }

  event_base* base_;
  const int fd_;
  FileReadyCb cb_;
  LibeventEvent* ev_{nullptr};
};

class LibeventTimer : public Timer {
 public:
  LibeventTimer(event_base* base, TimerCb cb) : cb_(std::move(cb)) {
    ev_ = evtimer_new(base, &LibeventTimer::onExpired, this);
    if (!ev_) {
      throw std::runtime_error("evtimer_new failed");
    }
  }

  ~LibeventTimer() override { event_free(ev_); }

  void enableTimer(std::chrono::milliseconds duration) override {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
    evtimer_add(ev_, &tv);
  }

  void disableTimer() override { evtimer_del(ev_); }

  bool enabled() const override {
    return evtimer_pending(ev_, nullptr) != 0;
  }

 private:
  static void onExpired(int, short, void* arg) {
    static_cast<LibeventTimer*>(arg)->cb_();
  }

  TimerCb cb_;
  LibeventEvent* ev_{nullptr};
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override {
    return std::make_unique<LibeventDispatcher>(name);
  }
};

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  useLibeventLocking();

  event_config* config = event_config_new();
  if (!config) {
    throw std::runtime_error("event_config_new failed");
  }
  event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
  base_ = event_base_new_with_config(config);
  event_config_free(config);
  if (!base_) {
    throw std::runtime_error("Failed to create event base for " + name_);
  }

  wakeup_ = event_new(base_, -1, EV_PERSIST, &LibeventDispatcher::onWakeup,
                      this);
  if (!wakeup_) {
    event_base_free(base_);
    throw std::runtime_error("Failed to create wakeup event for " + name_);
  }

  LOOPMUX_LOG(Debug, "dispatcher '{}' on {}", name_,
              event_base_get_method(base_));
}

LibeventDispatcher::~LibeventDispatcher() {
  // Queued callbacks can own timers and file events on base_
  std::vector<PostCb> dropped;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    dropped.swap(posted_);
  }
  dropped.clear();

  event_free(wakeup_);
  event_base_free(base_);
}

void LibeventDispatcher::post(PostCb callback) {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    first = posted_.empty();
    posted_.push_back(std::move(callback));
  }
  if (first) {
    event_active(wakeup_, EV_READ, 0);
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  return loop_thread_.load() == std::this_thread::get_id();
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  return std::make_unique<LibeventFileEvent>(base_, fd, std::move(cb), events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<LibeventTimer>(base_, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  event_base_loopbreak(base_);
  // Covers an exit() that lands before the loop is entered
  event_active(wakeup_, EV_READ, 0);
}

void LibeventDispatcher::run(RunType type) {
  loop_thread_ = std::this_thread::get_id();
  drainPosted();

  if (type == RunType::NonBlock) {
    if (event_base_loop(base_, EVLOOP_NONBLOCK) < 0) {
      LOOPMUX_LOG(Error, "event loop '{}' failed", name_);
    }
    drainPosted();
  } else {
    while (!exit_requested_) {
      if (event_base_loop(base_, EVLOOP_ONCE | EVLOOP_NO_EXIT_ON_EMPTY) < 0) {
        LOOPMUX_LOG(Error, "event loop '{}' failed", name_);
        break;
      }
    }
    // A later run() starts fresh
    exit_requested_ = false;
  }

  loop_thread_ = std::thread::id();
}

void LibeventDispatcher::onWakeup(int, short, void* arg) {
  static_cast<LibeventDispatcher*>(arg)->drainPosted();
}

void LibeventDispatcher::drainPosted() {
  std::vector<PostCb> batch;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    batch.swap(posted_);
  }
  for (auto& callback : batch) {
    callback();
  }
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace loopmux
