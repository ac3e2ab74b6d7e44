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

#include <gtest/gtest.h>

#include "FakeHttpClient.hh"
#include "Interrupt.hh"
#include "TestUtils.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall::test
{
  class DownloaderTest : public ::testing::Test
  {
  protected:
    std::unique_ptr<Downloader> make_downloader(TrustPolicy policy = {}, int attempts = 3)
    {
      return std::make_unique<Downloader>(client_, policy, RetryPolicy{attempts, std::chrono::milliseconds(0)});
    }

    std::shared_ptr<FakeHttpClient> client_{std::make_shared<FakeHttpClient>()};
    ScopedTempDir dir_;
  };

  TEST_F(DownloaderTest, DownloadsToDestination)
  {
    client_->serve("https://example.com/asset.tar.gz", "archive bytes");
    auto downloader = make_downloader();

    auto dest = dir_.path() / "asset.tar.gz";
    auto result = downloader->download("https://example.com/asset.tar.gz", dest);
    ASSERT_TRUE(result) << result.error().message();

    EXPECT_EQ(read_file(dest), "archive bytes");
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "asset.tar.gz.part"));
  }

  TEST_F(DownloaderTest, RefusesPlainHttpForRemoteHosts)
  {
    client_->serve("http://example.com/asset.tar.gz", "archive bytes");
    auto downloader = make_downloader();

    auto dest = dir_.path() / "asset.tar.gz";
    auto result = downloader->download("http://example.com/asset.tar.gz", dest);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::InsecureTransportRefused);
    EXPECT_TRUE(client_->requests().empty());
    EXPECT_FALSE(std::filesystem::exists(dest));
  }

  TEST_F(DownloaderTest, RefusesPlainHttpForEveryNonLoopbackHost)
  {
    auto downloader = make_downloader();
    for (const auto *url: {"http://10.0.0.1/a", "http://localhost.example.com/a", "http://127.0.0.2/a", "http://[::1]/a"})
      {
        auto result = downloader->fetch_text(url);
        ASSERT_FALSE(result) << url;
        EXPECT_EQ(result.error(), InstallerError::InsecureTransportRefused) << url;
      }
    EXPECT_TRUE(client_->requests().empty());
  }

  TEST_F(DownloaderTest, AllowsPlainHttpForLoopback)
  {
    client_->serve("http://localhost:8000/a", "one");
    client_->serve("http://127.0.0.1:8000/b", "two");
    auto downloader = make_downloader();

    auto first = downloader->fetch_text("http://localhost:8000/a");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), "one");

    auto second = downloader->fetch_text("http://127.0.0.1:8000/b");
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), "two");
  }

  TEST_F(DownloaderTest, InsecureOverrideAllowsPlainHttp)
  {
    client_->serve("http://example.com/a", "payload");
    TrustPolicy policy;
    policy.allow_insecure_http = true;
    auto downloader = make_downloader(policy);

    LogCapture capture("trustinstall:download");
    auto result = downloader->fetch_text("http://example.com/a");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), "payload");
    EXPECT_TRUE(capture.contains("Using insecure HTTP"));
  }

  TEST_F(DownloaderTest, FollowsRedirects)
  {
    client_->redirect("https://github.com/o/r/releases/download/v1/a.tar.gz", "https://objects.example.com/blob/1");
    client_->serve("https://objects.example.com/blob/1", "payload");
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://github.com/o/r/releases/download/v1/a.tar.gz");
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value(), "payload");
    EXPECT_EQ(client_->requests().size(), 2U);
  }

  TEST_F(DownloaderTest, RefusesRedirectToPlainHttp)
  {
    client_->redirect("https://example.com/a", "http://example.com/a");
    client_->serve("http://example.com/a", "payload");
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://example.com/a");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::InsecureTransportRefused);
    EXPECT_FALSE(client_->was_requested("http://example.com/a"));
  }

  TEST_F(DownloaderTest, StopsAfterTooManyRedirects)
  {
    client_->redirect("https://example.com/loop", "/loop");
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://example.com/loop");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::DownloadError);
    EXPECT_EQ(client_->requests().size(), static_cast<std::size_t>(Downloader::max_redirects + 1));
  }

  TEST_F(DownloaderTest, RetriesTransientFailures)
  {
    client_->sequence("https://example.com/a",
                      {
                        FakeHttpClient::Reply{503, {}, {}, {}},
                        FakeHttpClient::Reply{0, {}, {}, make_error_code(InstallerError::DownloadError)},
                        FakeHttpClient::Reply{200, "finally", {}, {}},
                      });
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://example.com/a");
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value(), "finally");
    EXPECT_EQ(client_->requests().size(), 3U);
  }

  TEST_F(DownloaderTest, GivesUpAfterConfiguredAttempts)
  {
    client_->status("https://example.com/a", 500);
    auto downloader = make_downloader({}, 3);

    auto dest = dir_.path() / "a";
    auto result = downloader->download("https://example.com/a", dest);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::DownloadError);
    EXPECT_EQ(client_->requests().size(), 3U);
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "a.part"));
  }

  TEST_F(DownloaderTest, DoesNotRetryMissingAssets)
  {
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://example.com/missing");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::AssetNotFound);
    EXPECT_EQ(client_->requests().size(), 1U);
  }

  TEST_F(DownloaderTest, DoesNotRetryClientErrors)
  {
    client_->status("https://example.com/forbidden", 403);
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://example.com/forbidden");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::DownloadError);
    EXPECT_EQ(client_->requests().size(), 1U);
  }

  TEST_F(DownloaderTest, RetriesRateLimiting)
  {
    client_->sequence("https://example.com/a", {FakeHttpClient::Reply{429, {}, {}, {}}, FakeHttpClient::Reply{200, "ok", {}, {}}});
    auto downloader = make_downloader();

    auto result = downloader->fetch_text("https://example.com/a");
    ASSERT_TRUE(result);
    EXPECT_EQ(client_->requests().size(), 2U);
  }

  TEST_F(DownloaderTest, RejectsInvalidUrl)
  {
    auto downloader = make_downloader();
    auto result = downloader->fetch_text("ftp://example.com/a");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::InvalidUrl);
  }

  TEST_F(DownloaderTest, StopsWhenInterrupted)
  {
    client_->serve("https://example.com/a", "payload");
    auto downloader = make_downloader();

    raise_interrupted();
    auto result = downloader->fetch_text("https://example.com/a");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::Interrupted);
    EXPECT_TRUE(client_->requests().empty());
  }

  // Declared in order: the second test runs after the first one leaves the
  // flag raised and must still be able to download.
  TEST_F(DownloaderTest, InterruptRaisedWithoutReset)
  {
    raise_interrupted();
    EXPECT_TRUE(interrupted());
  }

  TEST_F(DownloaderTest, InterruptDoesNotLeakIntoNextTest)
  {
    EXPECT_FALSE(interrupted());

    client_->serve("https://example.com/a", "payload");
    auto downloader = make_downloader();
    auto result = downloader->fetch_text("https://example.com/a");
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value(), "payload");
  }
} // namespace trustinstall::test
