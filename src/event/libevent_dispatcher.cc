#include "mcplink/event/libevent_dispatcher.h"

#include <fcntl.h>
#include <unistd.h>

#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Event
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace event {

namespace {

short toLibeventEvents(uint32_t events, FileTriggerType trigger) {
  short result = EV_PERSIST;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    result |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    result |= EV_WRITE;
  }
#ifdef EV_ET
  if (trigger == FileTriggerType::Edge) {
    result |= EV_ET;
  }
#else
  (void)trigger;
#endif
  return result;
}

uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
#ifdef EV_CLOSED
  if (events & EV_CLOSED) {
    result |= static_cast<uint32_t>(FileReadyType::Closed);
  }
#endif
  return result;
}

void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  deferred_delete_list_.clear();
  deferred_delete_timer_.reset();

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  for (int fd : wakeup_fd_) {
    if (fd >= 0) {
      close(fd);
    }
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }
  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  for (int fd : wakeup_fd_) {
    evutil_make_socket_nonblocking(fd);
    fcntl(fd, F_SETFD, FD_CLOEXEC);
  }

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);

  deferred_delete_timer_ =
      std::make_unique<TimerImpl>(*this, [this]() { runDeferredDeletes(); });

  MCPLINK_LOG_DEBUG("dispatcher '{}' using libevent backend {}", name_,
                    event_base_get_method(base_));
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  // The loop thread wakes itself too, so callbacks posted from inside an
  // event handler run without waiting for unrelated I/O.
  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), trigger,
                                         events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  if (!to_delete) {
    return;
  }
  deferred_delete_list_.push_back(std::move(to_delete));
  if (!deferred_delete_timer_->enabled()) {
    deferred_delete_timer_->enableTimer(std::chrono::milliseconds(0));
  }
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    post([this]() { event_base_loopbreak(base_); });
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      event_base_loop(base_, 0);
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      return;
  }

  runPostCallbacks();
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    PostCb cb = std::move(callbacks.front());
    callbacks.pop();
    if (cb) {
      cb();
    }
  }
}

void LibeventDispatcher::runDeferredDeletes() {
  // Deleting may queue further deferred deletes; those run next iteration
  std::vector<DeferredDeletablePtr> to_delete;
  to_delete.swap(deferred_delete_list_);
}

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)), trigger_(trigger) {
  event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::eventCallback,
                     this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    if (added_) {
      event_del(event_);
    }
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  if (added_ && enabled_events_ == events) {
    return;
  }
  if (added_) {
    event_del(event_);
    added_ = false;
  }
  enabled_events_ = events;
  if (events == 0) {
    return;
  }
  event_assign(event_, dispatcher_.base(), fd_,
               toLibeventEvents(events, trigger_),
               &FileEventImpl::eventCallback, this);
  added_ = event_add(event_, nullptr) == 0;
}

void LibeventDispatcher::FileEventImpl::eventCallback(int /*fd*/,
                                                      short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);
  uint32_t ready = fromLibeventEvents(events);
  if (ready != 0) {
    file_event->cb_(ready);
  }
}

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher.base(), &TimerImpl::timerCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  if (duration.count() < 0) {
    duration = std::chrono::milliseconds(0);
  }
  struct timeval tv;
  tv.tv_sec = static_cast<long>(duration.count() / 1000);
  tv.tv_usec = static_cast<long>((duration.count() % 1000) * 1000);
  event_add(event_, &tv);
  enabled_ = true;
}

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  static const std::string name = "libevent";
  return name;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace mcplink
