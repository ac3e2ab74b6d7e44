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

#ifndef HTTP_CLIENT_HH
#define HTTP_CLIENT_HH

#include <ostream>
#include <string>
#include <boost/outcome/std_result.hpp>

#include "Url.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  struct HttpResponse
  {
    unsigned int status{0};
    std::string location;
  };

  /**
   * Single GET request, no redirect handling and no retries.
   *
   * The body is written to `body` only for 2xx responses. Transport
   * failures (resolve, connect, TLS, timeouts) are reported as
   * InstallerError::DownloadError; HTTP error statuses are not errors at
   * this level.
   */
  class HttpClient
  {
  public:
    virtual ~HttpClient() = default;

    virtual outcome::std_result<HttpResponse> get(const Url &url, std::ostream &body) = 0;
  };

} // namespace trustinstall

#endif // HTTP_CLIENT_HH
