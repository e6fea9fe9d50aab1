#pragma once
/** @file  HttpProbe.hpp
 *  @brief Single-shot HTTP GET used as a liveness probe (libcurl).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

namespace keel {
  namespace io {

    struct ProbeResult {
      bool reachable{ false }; ///< a response arrived at all
      long httpStatus{ 0 };    ///< 0 when nothing arrived
      std::string error;       ///< transport error text, empty on response

      /// Any non-5xx answer counts; the body is never looked at.
      bool alive() const { return reachable && httpStatus > 0 && httpStatus < 500; }
    };

    /**
 * @class HttpProbe
 * @brief RAII owner of one libcurl easy handle.
 *
 *  * `get()` discards the response body.
 *  * *Non-copyable*.
 */
    class HttpProbe {
    public:
      HttpProbe();
      virtual ~HttpProbe();

      virtual ProbeResult get(const std::string& url, std::chrono::milliseconds timeout);

      HttpProbe(const HttpProbe&) = delete;
      HttpProbe& operator=(const HttpProbe&) = delete;

    private:
      void* curl_{ nullptr }; ///< CURL*, kept opaque so callers don't need curl.h
    };

  } // namespace io
} // namespace keel
