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

#ifndef BEAST_HTTP_CLIENT_HH
#define BEAST_HTTP_CLIENT_HH

#include <chrono>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <spdlog/spdlog.h>

#include "HttpClient.hh"
#include "Logging.hh"

namespace trustinstall
{
  class BeastHttpClient : public HttpClient
  {
  public:
    explicit BeastHttpClient(std::chrono::seconds timeout);
    ~BeastHttpClient() override = default;

    BeastHttpClient(const BeastHttpClient &) = delete;
    BeastHttpClient &operator=(const BeastHttpClient &) = delete;
    BeastHttpClient(BeastHttpClient &&) = delete;
    BeastHttpClient &operator=(BeastHttpClient &&) = delete;

    outcome::std_result<HttpResponse> get(const Url &url, std::ostream &body) override;

  private:
    template<typename Stream>
    outcome::std_result<HttpResponse> exchange(Stream &stream, const Url &url, std::ostream &body);

    void run_io();

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:http")};
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_context_;
    std::chrono::seconds timeout_;
  };

} // namespace trustinstall

#endif // BEAST_HTTP_CLIENT_HH
