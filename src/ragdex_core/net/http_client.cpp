#include "ragdex_core/net/http_client.hpp"

#include <memory>
#include <utility>

namespace ragdex_core {

namespace {

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

}  // namespace

HttpClient::HttpClient() : curl_handle_(nullptr) {
  setup_curl_handle();
}

HttpClient::~HttpClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

HttpClient::HttpClient(HttpClient &&other) noexcept : curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

HttpClient &HttpClient::operator=(HttpClient &&other) noexcept {
  if (this != &other) {
    if (curl_handle_) {
      curl_easy_cleanup(curl_handle_);
    }
    curl_handle_ = other.curl_handle_;
    other.curl_handle_ = nullptr;
  }
  return *this;
}

void HttpClient::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw HttpError("Failed to initialize CURL");
  }
}

size_t HttpClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

HttpResponse HttpClient::get(const std::string &url) {
  if (!curl_handle_) {
    throw HttpError("CURL handle not initialized");
  }

  HttpResponse response;

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response.body);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw HttpError("GET " + url + " failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

nlohmann::json HttpClient::post_json(const std::string &url, const nlohmann::json &data) {
  if (!curl_handle_) {
    throw HttpError("CURL handle not initialized");
  }

  std::string request_json = data.dump();
  std::string response_buffer;
  std::unique_ptr<curl_slist, CurlSlistDeleter> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"));

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw HttpError("POST " + url + " failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw HttpError("POST " + url + " failed with status code: " + std::to_string(http_code));
  }

  try {
    return nlohmann::json::parse(response_buffer);
  } catch (const nlohmann::json::parse_error &e) {
    throw HttpError("POST " + url + " returned invalid JSON: " + std::string(e.what()));
  }
}

}  // namespace ragdex_core
