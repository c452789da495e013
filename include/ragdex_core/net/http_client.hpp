#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>

namespace ragdex_core {

class HttpError : public std::exception {
 public:
  explicit HttpError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const {
    return status >= 200 && status < 300;
  }
};

class HttpClient {
 public:
  HttpClient();
  virtual ~HttpClient();

  // Disable copy constructor and assignment
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Allow move constructor and assignment
  HttpClient(HttpClient &&) noexcept;
  HttpClient &operator=(HttpClient &&) noexcept;

  // Plain GET. Transport failures throw; any HTTP status is returned to the caller.
  virtual HttpResponse get(const std::string &url);

  // POST a JSON body and parse the JSON reply. Non-2xx statuses throw.
  virtual nlohmann::json post_json(const std::string &url, const nlohmann::json &data);

 private:
  CURL *curl_handle_;

  void setup_curl_handle();
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace ragdex_core
