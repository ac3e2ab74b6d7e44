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

#ifndef URL_HH
#define URL_HH

#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  struct Url
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};

    static outcome::std_result<Url> parse(std::string_view text);

    bool is_https() const;
    bool is_loopback() const;
    bool is_ip_literal() const;
    std::string effective_port() const;

    /// Host without the brackets of an IPv6 literal, for name resolution and TLS.
    std::string host_name() const;
    std::string host_header() const;
    std::string str() const;

    /// Resolves a redirect Location header against this URL.
    outcome::std_result<Url> resolve(std::string_view location) const;
  };

} // namespace trustinstall

#endif // URL_HH
