/* @file HttpProbe.cpp
 * @brief libcurl GET with per-attempt timeout, body discarded
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <mutex>
#include <stdexcept>

// 3rd-party headers
#include <curl/curl.h>

// Keel headers
#include "io/HttpProbe.hpp"

using namespace keel::io;

namespace {

  std::once_flag g_curlInit;

  std::size_t discardBody(char*, std::size_t size, std::size_t nmemb, void*) {
    return size * nmemb;
  }

} // namespace

HttpProbe::HttpProbe() {
  std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  curl_ = curl_easy_init();
  if (!curl_)
    throw std::runtime_error("[HttpProbe] curl_easy_init failed");
}

HttpProbe::~HttpProbe() {
  if (curl_)
    curl_easy_cleanup(static_cast<CURL*>(curl_));
}

ProbeResult HttpProbe::get(const std::string& url, std::chrono::milliseconds timeout) {
  CURL* curl = static_cast<CURL*>(curl_);
  curl_easy_reset(curl);

  char errbuf[CURL_ERROR_SIZE] = { 0 };
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

  ProbeResult result;
  CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    result.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
    return result;
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpStatus);
  result.reachable = true;
  return result;
}
