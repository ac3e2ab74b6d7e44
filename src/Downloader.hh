// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef DOWNLOADER_HH
#define DOWNLOADER_HH

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "trustinstall/Config.hh"
#include "HttpClient.hh"
#include "Logging.hh"
#include "Url.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  struct RetryPolicy
  {
    int attempts{3};
    std::chrono::milliseconds delay{std::chrono::seconds(1)};
  };

  /**
   * @brief Fetches release assets under the transport policy
   *
   * Plain HTTP is refused unless the host is loopback or the policy allows
   * insecure transport. The check is repeated for every redirect hop.
   * Transient failures (transport errors, HTTP 408, 429 and 5xx) are retried
   * with a fixed delay; everything else fails immediately.
   */
  class Downloader
  {
  public:
    static constexpr int max_redirects = 10;

    Downloader(std::shared_ptr<HttpClient> client, TrustPolicy policy, RetryPolicy retry = {});

    /// Downloads @p url into @p dest via a ".part" file renamed on success.
    outcome::std_result<void> download(const std::string &url, const std::filesystem::path &dest);

    outcome::std_result<std::string> fetch_text(const std::string &url);

    outcome::std_result<void> check_transport(const Url &url) const;

  private:
    using Attempt = std::function<outcome::std_result<void>(bool &retryable)>;

    outcome::std_result<void> with_retry(const Url &url, const Attempt &attempt);
    outcome::std_result<void> follow(const Url &start, std::ostream &body, bool &retryable);

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:download")};
    std::shared_ptr<HttpClient> client_;
    TrustPolicy policy_;
    RetryPolicy retry_;
  };

} // namespace trustinstall

#endif // DOWNLOADER_HH
