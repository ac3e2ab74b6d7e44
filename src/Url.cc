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

#include "Url.hh"

#include <algorithm>
#include <cctype>
#include <boost/asio/ip/address.hpp>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    std::string to_lower(std::string_view value)
    {
      std::string result(value);
      std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return result;
    }

    bool is_digits(std::string_view value)
    {
      return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    }
  } // namespace

  outcome::std_result<Url> Url::parse(std::string_view text)
  {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos)
      {
        return InstallerError::InvalidUrl;
      }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https")
      {
        return InstallerError::InvalidUrl;
      }

    auto rest = text.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    if (authority_end != std::string_view::npos)
      {
        url.target = std::string(rest.substr(authority_end));
        if (url.target.front() != '/')
          {
            url.target.insert(url.target.begin(), '/');
          }
        auto fragment = url.target.find('#');
        if (fragment != std::string::npos)
          {
            url.target.erase(fragment);
          }
      }

    if (authority.find('@') != std::string_view::npos)
      {
        return InstallerError::InvalidUrl;
      }

    std::string_view host = authority;
    if (!authority.empty() && authority.front() == '[')
      {
        auto bracket = authority.find(']');
        if (bracket == std::string_view::npos)
          {
            return InstallerError::InvalidUrl;
          }
        host = authority.substr(0, bracket + 1);
        auto after = authority.substr(bracket + 1);
        if (!after.empty())
          {
            if (after.front() != ':' || !is_digits(after.substr(1)))
              {
                return InstallerError::InvalidUrl;
              }
            url.port = std::string(after.substr(1));
          }
      }
    else
      {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
          {
            if (!is_digits(authority.substr(colon + 1)))
              {
                return InstallerError::InvalidUrl;
              }
            url.port = std::string(authority.substr(colon + 1));
            host = authority.substr(0, colon);
          }
      }

    if (host.empty())
      {
        return InstallerError::InvalidUrl;
      }
    url.host = to_lower(host);
    return url;
  }

  bool Url::is_https() const
  {
    return scheme == "https";
  }

  bool Url::is_loopback() const
  {
    return host == "localhost" || host == "127.0.0.1" || host == "[::1]";
  }

  bool Url::is_ip_literal() const
  {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host_name(), ec);
    return !ec;
  }

  std::string Url::host_name() const
  {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
      {
        return host.substr(1, host.size() - 2);
      }
    return host;
  }

  std::string Url::effective_port() const
  {
    if (!port.empty())
      {
        return port;
      }
    return is_https() ? "443" : "80";
  }

  std::string Url::host_header() const
  {
    return port.empty() ? host : host + ":" + port;
  }

  std::string Url::str() const
  {
    return scheme + "://" + host_header() + target;
  }

  outcome::std_result<Url> Url::resolve(std::string_view location) const
  {
    if (location.find("://") != std::string_view::npos)
      {
        return Url::parse(location);
      }
    if (location.starts_with("//"))
      {
        return Url::parse(scheme + ":" + std::string(location));
      }
    if (location.empty())
      {
        return InstallerError::InvalidUrl;
      }

    location = location.substr(0, location.find('#'));

    Url resolved = *this;
    auto path = target.substr(0, target.find('?'));
    if (location.empty())
      {
        resolved.target = target;
      }
    else if (location.front() == '/')
      {
        resolved.target = std::string(location);
      }
    else if (location.front() == '?')
      {
        resolved.target = path + std::string(location);
      }
    else
      {
        resolved.target = path.substr(0, path.rfind('/') + 1) + std::string(location);
      }
    return resolved;
  }

} // namespace trustinstall
