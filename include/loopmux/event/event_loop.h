#ifndef LOOPMUX_EVENT_EVENT_LOOP_H
#define LOOPMUX_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace loopmux {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;

// Readiness bits passed to FileEvent::setEnabled and FileReadyCb
namespace FileReady {
constexpr uint32_t Read = 0x01;
constexpr uint32_t Write = 0x02;
}  // namespace FileReady

enum class RunType {
  // Handle whatever is ready now, then return
  NonBlock,
  // Block for events until exit()
  RunUntilExit
};

/**
 * Level-triggered readiness watch on one fd.
 * Destroying it stops the watch; the fd itself is not closed.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // FileReady bits to watch; 0 pauses the watch
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * One-shot timer. Re-arm from the callback for periodic behavior.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual void disableTimer() = 0;
  virtual bool enabled() const = 0;
};

/**
 * Single-threaded event loop.
 *
 * Sockets, timers and server state belong to the thread inside run(). Other
 * threads hand work over with post() and stop the loop with exit().
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() const = 0;

  // Thread safe. Callbacks run on the loop thread in post order; callbacks
  // still queued when the dispatcher is destroyed are dropped unrun.
  virtual void post(PostCb callback) = 0;

  // True on the thread currently inside run()
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  // Thread safe
  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace loopmux

#endif  // LOOPMUX_EVENT_EVENT_LOOP_H
