#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "mcplink/event/event_loop.h"
#include "mcplink/http/event_stream.h"
#include "mcplink/http/http_client.h"

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Sse
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace http {

const char* readyStateName(ReadyState state) {
  switch (state) {
    case ReadyState::Connecting:
      return "connecting";
    case ReadyState::Open:
      return "open";
    case ReadyState::Closed:
      return "closed";
  }
  return "unknown";
}

namespace {

// State shared between the stream handle (dispatcher thread) and its
// reader thread. callbacks and reported are only touched on the
// dispatcher thread.
struct StreamShared {
  event::Dispatcher& dispatcher;
  EventStreamCallbacks* callbacks;
  ReadyState reported{ReadyState::Connecting};

  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> stop{false};

  StreamShared(event::Dispatcher& d, EventStreamCallbacks* cb)
      : dispatcher(d), callbacks(cb) {}
};

class StreamReader : public SseParserCallbacks {
 public:
  StreamReader(std::shared_ptr<StreamShared> shared,
               EventStreamOptions options,
               std::string user_agent,
               std::chrono::milliseconds connect_timeout)
      : shared_(std::move(shared)),
        options_(std::move(options)),
        user_agent_(std::move(user_agent)),
        connect_timeout_(connect_timeout),
        parser_(*this) {}

  void run();

  // SseParserCallbacks
  void onSseEvent(const SseEvent& event) override {
    auto shared = shared_;
    shared_->dispatcher.post([shared, event]() {
      if (shared->callbacks) {
        shared->callbacks->onMessage(event);
      }
    });
  }

  void onSseComment(const std::string&) override {}

 private:
  enum class Outcome { Dropped, Rejected, Stopped };

  Outcome attempt(std::string& reason);
  void postOpen();
  void postError(ReadyState state, const std::string& reason);
  bool waitBeforeRetry();

  static size_t onData(char* ptr, size_t size, size_t nmemb, void* userdata);
  static int onProgress(void* clientp,
                        curl_off_t,
                        curl_off_t,
                        curl_off_t,
                        curl_off_t);

  std::shared_ptr<StreamShared> shared_;
  const EventStreamOptions options_;
  const std::string user_agent_;
  const std::chrono::milliseconds connect_timeout_;
  SseParser parser_;

  CURL* curl_{nullptr};
  bool opened_{false};
  long rejected_status_{0};
};

void StreamReader::run() {
  uint32_t failures = 0;
  while (!shared_->stop) {
    std::string reason;
    const Outcome outcome = attempt(reason);
    if (outcome == Outcome::Stopped || shared_->stop) {
      return;
    }
    if (outcome == Outcome::Rejected) {
      MCPLINK_LOG_ERROR("event stream {} rejected: {}", options_.url, reason);
      postError(ReadyState::Closed, reason);
      return;
    }

    if (opened_) {
      failures = 0;
    }
    ++failures;
    if (failures > options_.max_reconnect_attempts) {
      MCPLINK_LOG_ERROR("event stream {} lost: {}", options_.url, reason);
      postError(ReadyState::Closed, reason);
      return;
    }
    MCPLINK_LOG_WARNING("event stream {} dropped ({}), reconnect attempt {}/{}",
                        options_.url, reason, failures,
                        options_.max_reconnect_attempts);
    postError(ReadyState::Connecting, reason);
    if (!waitBeforeRetry()) {
      return;
    }
  }
}

StreamReader::Outcome StreamReader::attempt(std::string& reason) {
  opened_ = false;
  rejected_status_ = 0;
  parser_.reset();

  curl_ = curl_easy_init();
  if (!curl_) {
    reason = "failed to initialize libcurl";
    return Outcome::Rejected;
  }

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept: text/event-stream");
  headers = curl_slist_append(headers, "Cache-Control: no-cache");
  for (const auto& header : options_.headers) {
    const std::string line = header.first + ": " + header.second;
    headers = curl_slist_append(headers, line.c_str());
  }
  if (!parser_.lastEventId().empty()) {
    const std::string line = "Last-Event-ID: " + parser_.lastEventId();
    headers = curl_slist_append(headers, line.c_str());
  }

  curl_easy_setopt(curl_, CURLOPT_URL, options_.url.c_str());
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
  if (connect_timeout_.count() > 0) {
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(connect_timeout_.count()));
  }
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &StreamReader::onData);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, this);
  curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &StreamReader::onProgress);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);

  const CURLcode res = curl_easy_perform(curl_);

  long status = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl_);
  curl_ = nullptr;

  if (shared_->stop) {
    return Outcome::Stopped;
  }
  if (rejected_status_ == 0 && status != 0 && status != 200) {
    rejected_status_ = status;
  }
  if (rejected_status_ != 0) {
    reason = "HTTP " + std::to_string(rejected_status_);
    const std::string phrase = reasonPhrase(static_cast<int>(rejected_status_));
    if (!phrase.empty()) {
      reason += " " + phrase;
    }
    return Outcome::Rejected;
  }
  reason = res == CURLE_OK ? std::string("stream ended by server")
                           : std::string(curl_easy_strerror(res));
  return Outcome::Dropped;
}

size_t StreamReader::onData(char* ptr,
                            size_t size,
                            size_t nmemb,
                            void* userdata) {
  auto* self = static_cast<StreamReader*>(userdata);
  if (self->shared_->stop) {
    return 0;
  }
  if (!self->opened_) {
    long status = 0;
    curl_easy_getinfo(self->curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
      self->rejected_status_ = status;
      return 0;
    }
    self->opened_ = true;
    self->postOpen();
  }
  self->parser_.feed(ptr, size * nmemb);
  return size * nmemb;
}

int StreamReader::onProgress(void* clientp,
                             curl_off_t,
                             curl_off_t,
                             curl_off_t,
                             curl_off_t) {
  auto* self = static_cast<StreamReader*>(clientp);
  return self->shared_->stop ? 1 : 0;
}

void StreamReader::postOpen() {
  MCPLINK_LOG_INFO("event stream {} open", options_.url);
  auto shared = shared_;
  shared_->dispatcher.post([shared]() {
    if (shared->callbacks) {
      shared->reported = ReadyState::Open;
      shared->callbacks->onOpen();
    }
  });
}

void StreamReader::postError(ReadyState state, const std::string& reason) {
  auto shared = shared_;
  shared_->dispatcher.post([shared, state, reason]() {
    if (shared->callbacks) {
      shared->reported = state;
      shared->callbacks->onError(reason);
    }
  });
}

bool StreamReader::waitBeforeRetry() {
  std::chrono::milliseconds delay = options_.retry;
  if (parser_.retry()) {
    delay = std::chrono::milliseconds(*parser_.retry());
  }
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->cv.wait_for(lock, delay, [this]() { return shared_->stop.load(); });
  return !shared_->stop;
}

class CurlEventStream : public EventStream {
 public:
  CurlEventStream(std::shared_ptr<StreamShared> shared,
                  std::unique_ptr<StreamReader> reader)
      : shared_(std::move(shared)), reader_(std::move(reader)) {
    thread_ = std::thread([this]() { reader_->run(); });
  }

  ~CurlEventStream() override {
    close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void close() override {
    shared_->callbacks = nullptr;
    shared_->reported = ReadyState::Closed;
    {
      std::lock_guard<std::mutex> lock(shared_->mutex);
      shared_->stop = true;
    }
    shared_->cv.notify_all();
  }

  ReadyState readyState() const override { return shared_->reported; }

 private:
  std::shared_ptr<StreamShared> shared_;
  std::unique_ptr<StreamReader> reader_;
  std::thread thread_;
};

}  // namespace

CurlEventStreamFactory::CurlEventStreamFactory(
    event::Dispatcher& dispatcher, const config::ClientConfig& config)
    : dispatcher_(dispatcher),
      user_agent_(config.user_agent + " (" + config.client_id + ")"),
      connect_timeout_(config.connect_timeout) {
  ensureCurlInitialized();
}

EventStreamPtr CurlEventStreamFactory::open(const EventStreamOptions& options,
                                            EventStreamCallbacks& callbacks) {
  auto shared = std::make_shared<StreamShared>(dispatcher_, &callbacks);
  auto reader = std::make_unique<StreamReader>(shared, options, user_agent_,
                                               connect_timeout_);
  MCPLINK_LOG_DEBUG("opening event stream {}", options.url);
  return std::make_unique<CurlEventStream>(std::move(shared),
                                           std::move(reader));
}

}  // namespace http
}  // namespace mcplink
