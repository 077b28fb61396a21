#include <curl/curl.h>

#include <cctype>
#include <mutex>

#include "mcplink/event/event_loop.h"
#include "mcplink/http/http_client.h"

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Http
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace http {

namespace {

std::string trim(const std::string& text) {
  const size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  const size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

// Collects headers of the final response. A new status line (after a
// redirect or a 100 Continue) starts over.
size_t collectHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* response = static_cast<HttpResponse*>(userdata);
  const std::string line(buffer, size * nitems);

  if (line.compare(0, 5, "HTTP/") == 0) {
    response->headers.clear();
    response->status_text.clear();
    // HTTP/1.1 404 Not Found
    const size_t code_start = line.find(' ');
    if (code_start != std::string::npos) {
      const size_t reason_start = line.find(' ', code_start + 1);
      if (reason_start != std::string::npos) {
        response->status_text = trim(line.substr(reason_start + 1));
      }
    }
    return size * nitems;
  }

  const size_t colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = trim(line.substr(0, colon));
    for (auto& c : name) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (!name.empty()) {
      response->headers[name] = trim(line.substr(colon + 1));
    }
  }
  return size * nitems;
}

}  // namespace

void ensureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

std::string reasonPhrase(int status_code) {
  switch (status_code) {
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return std::string();
  }
}

CurlHttpClient::CurlHttpClient(event::Dispatcher& dispatcher,
                               const config::ClientConfig& config)
    : dispatcher_(dispatcher),
      user_agent_(config.user_agent + " (" + config.client_id + ")"),
      default_timeout_(config.http_timeout),
      connect_timeout_(config.connect_timeout),
      alive_(std::make_shared<bool>(true)) {
  ensureCurlInitialized();
  const uint32_t workers = config.http_workers > 0 ? config.http_workers : 1;
  for (uint32_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this]() { workerLoop(); });
  }
}

CurlHttpClient::~CurlHttpClient() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    queue_.clear();
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  alive_.reset();
}

void CurlHttpClient::requestAsync(const HttpRequest& request,
                                  ResponseCallback callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(Job{request, std::move(callback)});
  }
  cv_.notify_one();
}

void CurlHttpClient::workerLoop() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    auto response = std::make_shared<HttpResponse>(perform(job.request));
    std::weak_ptr<bool> alive = alive_;
    auto callback = std::make_shared<ResponseCallback>(std::move(job.callback));
    dispatcher_.post([alive, response, callback]() {
      if (alive.expired()) {
        return;
      }
      (*callback)(*response);
    });
  }
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request) const {
  const auto start = std::chrono::steady_clock::now();
  HttpResponse response;

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "failed to initialize libcurl";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (request.method == HttpMethod::Post) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  }

  struct curl_slist* headers = nullptr;
  for (const auto& header : request.headers) {
    const std::string line = header.first + ": " + header.second;
    headers = curl_slist_append(headers, line.c_str());
  }
  // Keep libcurl from waiting for 100 Continue on large bodies
  headers = curl_slist_append(headers, "Expect:");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());

  const auto timeout =
      request.timeout.count() > 0 ? request.timeout : default_timeout_;
  if (timeout.count() > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(timeout.count()));
  }
  if (connect_timeout_.count() > 0) {
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(connect_timeout_.count()));
  }

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collectHeader);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);

  const CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_OK) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    if (response.status_text.empty()) {
      response.status_text = reasonPhrase(response.status_code);
    }
  } else {
    response.status_code = -1;
    response.error = curl_easy_strerror(res);
  }

  response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  MCPLINK_LOG_DEBUG("{} {} -> {} in {}ms",
                    request.method == HttpMethod::Post ? "POST" : "GET",
                    request.url, response.status_code,
                    response.latency.count());

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return response;
}

}  // namespace http
}  // namespace mcplink
