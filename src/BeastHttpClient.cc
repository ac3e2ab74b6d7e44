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

#include "BeastHttpClient.hh"

#include <array>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/optional.hpp>
#include <openssl/ssl.h>

#include "Interrupt.hh"
#include "trustinstall/Errors.hh"

#ifndef TRUSTINSTALL_VERSION
#  define TRUSTINSTALL_VERSION "0.0.0"
#endif

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace trustinstall
{
  namespace
  {
    constexpr std::size_t BODY_CHUNK_SIZE = 64 * 1024;
    constexpr int HTTP_VERSION_1_1 = 11;
  } // namespace

  BeastHttpClient::BeastHttpClient(std::chrono::seconds timeout)
    : ssl_context_(ssl::context::tls_client)
    , timeout_(timeout)
  {
    ssl_context_.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 | ssl::context::no_tlsv1
                             | ssl::context::no_tlsv1_1);
    SSL_CTX_set_min_proto_version(ssl_context_.native_handle(), TLS1_2_VERSION);
    ssl_context_.set_verify_mode(ssl::verify_peer);

    boost::system::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec)
      {
        logger_->warn("Failed to load system trust store: {}", ec.message());
      }
  }

  void BeastHttpClient::run_io()
  {
    ioc_.restart();
    ioc_.run();
  }

  outcome::std_result<HttpResponse> BeastHttpClient::get(const Url &url, std::ostream &body)
  {
    logger_->debug("GET {}", url.str());

    try
      {
        tcp::resolver resolver(ioc_);
        tcp::resolver::results_type endpoints;
        beast::error_code ec = net::error::would_block;

        const auto host = url.host_name();
        resolver.async_resolve(host, url.effective_port(), [&](beast::error_code e, tcp::resolver::results_type results) {
          ec = e;
          endpoints = std::move(results);
        });
        ioc_.restart();
        ioc_.run_for(timeout_);
        if (!ioc_.stopped())
          {
            resolver.cancel();
            run_io();
            logger_->error("Timed out resolving {}", host);
            return InstallerError::DownloadError;
          }
        if (ec)
          {
            logger_->error("Failed to resolve {}: {}", host, ec.message());
            return InstallerError::DownloadError;
          }

        if (url.is_https())
          {
            beast::ssl_stream<beast::tcp_stream> stream(ioc_, ssl_context_);
            // SNI carries DNS names only.
            if (!url.is_ip_literal() && SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()) != 1)
              {
                logger_->error("Failed to set TLS server name for {}", host);
                return InstallerError::DownloadError;
              }
            stream.set_verify_callback(ssl::host_name_verification(host));

            beast::get_lowest_layer(stream).expires_after(timeout_);
            beast::get_lowest_layer(stream).async_connect(endpoints, [&ec](beast::error_code e, auto &&...) { ec = e; });
            run_io();
            if (ec)
              {
                logger_->error("Failed to connect to {}: {}", url.host_header(), ec.message());
                return InstallerError::DownloadError;
              }

            beast::get_lowest_layer(stream).expires_after(timeout_);
            stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
            run_io();
            if (ec)
              {
                logger_->error("TLS handshake with {} failed: {}", url.host_header(), ec.message());
                return InstallerError::DownloadError;
              }

            return exchange(stream, url, body);
          }

        beast::tcp_stream stream(ioc_);
        stream.expires_after(timeout_);
        stream.async_connect(endpoints, [&ec](beast::error_code e, auto &&...) { ec = e; });
        run_io();
        if (ec)
          {
            logger_->error("Failed to connect to {}: {}", url.host_header(), ec.message());
            return InstallerError::DownloadError;
          }

        return exchange(stream, url, body);
      }
    catch (const std::exception &e)
      {
        logger_->error("HTTP request to {} failed: {}", url.str(), e.what());
        return InstallerError::DownloadError;
      }
  }

  template<typename Stream>
  outcome::std_result<HttpResponse> BeastHttpClient::exchange(Stream &stream, const Url &url, std::ostream &body)
  {
    beast::error_code ec;

    http::request<http::empty_body> request{http::verb::get, url.target, HTTP_VERSION_1_1};
    request.set(http::field::host, url.host_header());
    request.set(http::field::user_agent, "trustinstall/" TRUSTINSTALL_VERSION);
    request.set(http::field::accept, "*/*");

    beast::get_lowest_layer(stream).expires_after(timeout_);
    http::async_write(stream, request, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_io();
    if (ec)
      {
        logger_->error("Failed to send request to {}: {}", url.host_header(), ec.message());
        return InstallerError::DownloadError;
      }

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(boost::none);

    beast::get_lowest_layer(stream).expires_after(timeout_);
    http::async_read_header(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_io();
    if (ec)
      {
        logger_->error("Failed to read response from {}: {}", url.host_header(), ec.message());
        return InstallerError::DownloadError;
      }

    HttpResponse response;
    response.status = parser.get().result_int();
    auto location = parser.get()[http::field::location];
    response.location.assign(location.data(), location.size());
    logger_->debug("{} -> HTTP {}", url.str(), response.status);

    constexpr unsigned int HTTP_OK_FIRST = 200;
    constexpr unsigned int HTTP_OK_LAST = 299;
    if (response.status < HTTP_OK_FIRST || response.status > HTTP_OK_LAST)
      {
        return response;
      }

    std::array<char, BODY_CHUNK_SIZE> chunk{};
    while (!parser.is_done())
      {
        if (interrupted())
          {
            return InstallerError::Interrupted;
          }

        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();

        beast::get_lowest_layer(stream).expires_after(timeout_);
        http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
        run_io();
        if (ec == http::error::need_buffer)
          {
            ec = {};
          }
        if (ec)
          {
            logger_->error("Failed to read response body from {}: {}", url.host_header(), ec.message());
            return InstallerError::DownloadError;
          }

        auto received = chunk.size() - parser.get().body().size;
        body.write(chunk.data(), static_cast<std::streamsize>(received));
        if (!body)
          {
            logger_->error("Failed to store response body from {}", url.str());
            return InstallerError::IOError;
          }
      }

    beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected)
      {
        logger_->debug("Socket shutdown for {} reported: {}", url.host_header(), ec.message());
      }

    return response;
  }

} // namespace trustinstall
