#ifndef MCPLINK_EVENT_EVENT_LOOP_H
#define MCPLINK_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcplink {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;

enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  Closed = 0x04,
  Error = 0x08
};

inline uint32_t operator|(FileReadyType a, FileReadyType b) {
  return static_cast<uint32_t>(a) | static_cast<uint32_t>(b);
}

inline uint32_t operator&(FileReadyType a, uint32_t b) {
  return static_cast<uint32_t>(a) & b;
}

enum class FileTriggerType {
  // Fires repeatedly while the descriptor stays ready
  Level,
  // Fires on readiness transitions; the consumer must drain until EAGAIN
  Edge
};

enum class RunType {
  Block,        // Run until exit() is called or no events remain
  NonBlock,     // Process ready events once and return
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Objects handed to the dispatcher for deletion on a later
 * iteration, used when an object must outlive the callback that
 * retires it.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

/**
 * @brief Readiness watcher for a file descriptor.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  /**
   * Replace the set of FileReadyType bits being watched. Zero disables
   * the watcher without destroying it.
   */
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * @brief One-shot timer. Destroying an enabled timer cancels it.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

/**
 * @brief Single-threaded event loop.
 *
 * All objects created by a dispatcher must be used and destroyed on the
 * dispatcher thread. post() and exit() are safe from any thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  /**
   * Queue a callback for the dispatcher thread. Thread-safe.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * True when called on the thread currently running (or last to run)
   * this dispatcher.
   */
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       FileTriggerType trigger,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;
  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace mcplink

#endif  // MCPLINK_EVENT_EVENT_LOOP_H
