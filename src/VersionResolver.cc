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

#include "VersionResolver.hh"

#include <boost/json.hpp>
#include <fmt/format.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    std::string strip_trailing_slashes(std::string url)
    {
      while (!url.empty() && url.back() == '/')
        {
          url.pop_back();
        }
      return url;
    }
  } // namespace

  VersionResolver::VersionResolver(std::shared_ptr<Downloader> downloader,
                                   std::string repo,
                                   std::optional<std::string> base_url_override,
                                   std::string api_root)
    : downloader_(std::move(downloader))
    , repo_(std::move(repo))
    , base_url_override_(std::move(base_url_override))
    , api_root_(strip_trailing_slashes(std::move(api_root)))
  {
  }

  outcome::std_result<std::string> VersionResolver::resolve(const std::optional<std::string> &explicit_version)
  {
    if (explicit_version && !explicit_version->empty())
      {
        logger_->debug("Using requested version {}", *explicit_version);
        return *explicit_version;
      }

    if (base_url_override_)
      {
        logger_->debug("Base URL override set; not querying the release index");
        return std::string(custom_version);
      }

    auto url = fmt::format("{}/repos/{}/releases/latest", api_root_, repo_);
    auto body = downloader_->fetch_text(url);
    if (!body)
      {
        if (body.error() == InstallerError::InsecureTransportRefused || body.error() == InstallerError::Interrupted)
          {
            return body.error();
          }
        logger_->error("Failed to query latest release of {}: {}", repo_, body.error().message());
        return InstallerError::VersionResolutionError;
      }

    return parse_latest_release(body.value());
  }

  outcome::std_result<std::string> VersionResolver::parse_latest_release(const std::string &json_content) const
  {
    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(json_content, ec);
    if (ec)
      {
        logger_->error("Failed to parse release JSON: {}", ec.message());
        return InstallerError::VersionResolutionError;
      }

    if (!parsed.is_object())
      {
        logger_->error("Release JSON root is not an object");
        return InstallerError::VersionResolutionError;
      }

    const auto &root = parsed.as_object();
    const auto *it = root.find("tag_name");
    if (it == root.end() || !it->value().is_string() || it->value().as_string().empty())
      {
        logger_->error("Release JSON has no usable tag_name");
        return InstallerError::VersionResolutionError;
      }

    std::string tag(it->value().as_string());
    logger_->info("Latest release of {} is {}", repo_, tag);
    return tag;
  }

  std::string VersionResolver::release_base_url(const std::string &version) const
  {
    if (base_url_override_)
      {
        return strip_trailing_slashes(*base_url_override_);
      }
    return fmt::format("{}/{}/releases/download/{}", default_release_root, repo_, version);
  }

} // namespace trustinstall
