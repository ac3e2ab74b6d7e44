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

#include "Downloader.hh"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

#include "Interrupt.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    bool is_redirect(unsigned int status)
    {
      return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
    }

    bool is_success(unsigned int status)
    {
      return status >= 200 && status <= 299;
    }

    bool is_transient(unsigned int status)
    {
      return status == 408 || status == 429 || status >= 500;
    }
  } // namespace

  Downloader::Downloader(std::shared_ptr<HttpClient> client, TrustPolicy policy, RetryPolicy retry)
    : client_(std::move(client))
    , policy_(std::move(policy))
    , retry_(retry)
  {
  }

  outcome::std_result<void> Downloader::check_transport(const Url &url) const
  {
    if (url.is_https() || url.is_loopback())
      {
        return outcome::success();
      }

    if (policy_.allow_insecure_http)
      {
        logger_->warn("Using insecure HTTP for {}", url.str());
        return outcome::success();
      }

    logger_->error("Refusing insecure HTTP download: {}", url.str());
    return InstallerError::InsecureTransportRefused;
  }

  outcome::std_result<void> Downloader::download(const std::string &url, const std::filesystem::path &dest)
  {
    auto parsed = Url::parse(url);
    if (!parsed)
      {
        logger_->error("Invalid download URL: {}", url);
        return parsed.error();
      }

    auto part = dest;
    part += ".part";

    auto result = with_retry(parsed.value(), [&](bool &retryable) -> outcome::std_result<void> {
      std::ofstream out(part, std::ios::out | std::ios::binary | std::ios::trunc);
      if (!out.is_open())
        {
          logger_->error("Failed to open file for writing: {}", part.string());
          return InstallerError::IOError;
        }

      auto fetched = follow(parsed.value(), out, retryable);
      out.close();
      if (fetched && out.fail())
        {
          logger_->error("Failed to write file: {}", part.string());
          return InstallerError::IOError;
        }
      return fetched;
    });

    std::error_code ec;
    if (!result)
      {
        std::filesystem::remove(part, ec);
        if (ec)
          {
            logger_->warn("Failed to remove partial download {}: {}", part.string(), ec.message());
          }
        return result.error();
      }

    std::filesystem::rename(part, dest, ec);
    if (ec)
      {
        logger_->error("Failed to move {} to {}: {}", part.string(), dest.string(), ec.message());
        return InstallerError::IOError;
      }

    logger_->debug("Downloaded {} to {}", url, dest.string());
    return outcome::success();
  }

  outcome::std_result<std::string> Downloader::fetch_text(const std::string &url)
  {
    auto parsed = Url::parse(url);
    if (!parsed)
      {
        logger_->error("Invalid URL: {}", url);
        return parsed.error();
      }

    std::string text;
    auto result = with_retry(parsed.value(), [&](bool &retryable) -> outcome::std_result<void> {
      std::ostringstream out;
      auto fetched = follow(parsed.value(), out, retryable);
      if (fetched)
        {
          text = out.str();
        }
      return fetched;
    });

    if (!result)
      {
        return result.error();
      }
    return text;
  }

  outcome::std_result<void> Downloader::with_retry(const Url &url, const Attempt &attempt)
  {
    int attempts = std::max(retry_.attempts, 1);

    for (int count = 1;; ++count)
      {
        if (interrupted())
          {
            return InstallerError::Interrupted;
          }

        bool retryable = false;
        auto result = attempt(retryable);
        if (result)
          {
            return result;
          }

        if (!retryable || count >= attempts)
          {
            if (retryable)
              {
                logger_->error("Giving up on {} after {} attempts", url.str(), count);
              }
            return result.error();
          }

        logger_->warn("Attempt {}/{} for {} failed: {}; retrying in {} ms",
                      count,
                      attempts,
                      url.str(),
                      result.error().message(),
                      retry_.delay.count());
        std::this_thread::sleep_for(retry_.delay);
      }
  }

  outcome::std_result<void> Downloader::follow(const Url &start, std::ostream &body, bool &retryable)
  {
    Url current = start;

    for (int hop = 0; hop <= max_redirects; ++hop)
      {
        auto allowed = check_transport(current);
        if (!allowed)
          {
            return allowed.error();
          }

        auto response = client_->get(current, body);
        if (!response)
          {
            retryable = response.error() == InstallerError::DownloadError;
            return response.error();
          }

        unsigned int status = response.value().status;
        if (is_redirect(status))
          {
            if (response.value().location.empty())
              {
                logger_->error("Redirect from {} without Location header", current.str());
                return InstallerError::DownloadError;
              }

            auto next = current.resolve(response.value().location);
            if (!next)
              {
                logger_->error("Invalid redirect location from {}: {}", current.str(), response.value().location);
                return next.error();
              }

            logger_->debug("Redirect {} -> {}", current.str(), next.value().str());
            current = next.value();
            continue;
          }

        if (is_success(status))
          {
            return outcome::success();
          }

        if (status == 404 || status == 410)
          {
            logger_->debug("Not found: {} (HTTP {})", current.str(), status);
            return InstallerError::AssetNotFound;
          }

        retryable = is_transient(status);
        logger_->error("Request for {} failed with HTTP {}", current.str(), status);
        return InstallerError::DownloadError;
      }

    logger_->error("Too many redirects fetching {}", start.str());
    return InstallerError::DownloadError;
  }

} // namespace trustinstall
