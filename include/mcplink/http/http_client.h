#ifndef MCPLINK_HTTP_HTTP_CLIENT_H
#define MCPLINK_HTTP_HTTP_CLIENT_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/config/client_config.h"

namespace mcplink {
namespace event {
class Dispatcher;
}

namespace http {

enum class HttpMethod { Get, Post };

struct HttpRequest {
  std::string url;
  HttpMethod method{HttpMethod::Get};
  std::map<std::string, std::string> headers;
  std::string body;
  // Zero falls back to the client's configured timeout
  std::chrono::milliseconds timeout{0};
};

struct HttpResponse {
  // -1 when no HTTP response was received
  int status_code{-1};
  // Reason phrase from the status line, e.g. "Not Found"
  std::string status_text;
  std::map<std::string, std::string> headers;
  std::string body;
  // Transport failure description; empty when a response arrived
  std::string error;
  std::chrono::milliseconds latency{0};

  bool transportFailed() const { return status_code < 0; }
  bool success() const { return status_code >= 200 && status_code < 300; }
};

// Standard reason phrase for a status code, empty if unknown
std::string reasonPhrase(int status_code);

/**
 * @brief Asynchronous HTTP requests.
 *
 * Callbacks run on the dispatcher thread of the implementation.
 */
class HttpClient {
 public:
  using ResponseCallback = std::function<void(const HttpResponse&)>;

  virtual ~HttpClient() = default;

  virtual void requestAsync(const HttpRequest& request,
                            ResponseCallback callback) = 0;
};

/**
 * libcurl client backed by a fixed pool of worker threads. Completions are
 * posted to the dispatcher. Requests still queued when the client is
 * destroyed are dropped without a callback.
 */
class CurlHttpClient : public HttpClient {
 public:
  CurlHttpClient(event::Dispatcher& dispatcher,
                 const config::ClientConfig& config);
  ~CurlHttpClient() override;

  void requestAsync(const HttpRequest& request,
                    ResponseCallback callback) override;

  // Blocking request on the calling thread
  HttpResponse perform(const HttpRequest& request) const;

 private:
  struct Job {
    HttpRequest request;
    ResponseCallback callback;
  };

  void workerLoop();

  event::Dispatcher& dispatcher_;
  const std::string user_agent_;
  const std::chrono::milliseconds default_timeout_;
  const std::chrono::milliseconds connect_timeout_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> queue_;
  bool stopping_{false};
  std::vector<std::thread> workers_;
  // Lets posted completions detect that the client is gone
  std::shared_ptr<bool> alive_;
};

// curl_global_init exactly once per process
void ensureCurlInitialized();

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_HTTP_CLIENT_H
