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

#include <gtest/gtest.h>

#include "FakeHttpClient.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall::test
{
  namespace
  {
    constexpr const char *latest_url = "https://api.github.com/repos/forgemypcgit/FPStracker/releases/latest";
  }

  class VersionResolverTest : public ::testing::Test
  {
  protected:
    VersionResolver make_resolver(std::optional<std::string> base_url_override = {})
    {
      auto downloader = std::make_shared<Downloader>(client_, TrustPolicy{}, RetryPolicy{1, std::chrono::milliseconds(0)});
      return VersionResolver(downloader, "forgemypcgit/FPStracker", std::move(base_url_override));
    }

    std::shared_ptr<FakeHttpClient> client_{std::make_shared<FakeHttpClient>()};
  };

  TEST_F(VersionResolverTest, ExplicitVersionNeedsNoNetwork)
  {
    auto resolver = make_resolver();
    auto version = resolver.resolve(std::string("v0.2.5"));
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), "v0.2.5");
    EXPECT_TRUE(client_->requests().empty());
  }

  TEST_F(VersionResolverTest, ExplicitVersionWinsOverBaseUrl)
  {
    auto resolver = make_resolver(std::string("https://mirror.example.com/fps/"));
    auto version = resolver.resolve(std::string("v1.0.0"));
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), "v1.0.0");
  }

  TEST_F(VersionResolverTest, BaseUrlWithoutVersionIsCustom)
  {
    auto resolver = make_resolver(std::string("https://mirror.example.com/fps/"));
    auto version = resolver.resolve(std::nullopt);
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), VersionResolver::custom_version);
    EXPECT_TRUE(client_->requests().empty());
  }

  TEST_F(VersionResolverTest, EmptyVersionQueriesLatest)
  {
    client_->serve(latest_url, R"({"tag_name": "v0.3.0", "name": "Release 0.3.0"})");
    auto resolver = make_resolver();
    auto version = resolver.resolve(std::string());
    ASSERT_TRUE(version) << version.error().message();
    EXPECT_EQ(version.value(), "v0.3.0");
    EXPECT_TRUE(client_->was_requested(latest_url));
  }

  TEST_F(VersionResolverTest, MissingTagNameFails)
  {
    client_->serve(latest_url, R"({"name": "Release"})");
    auto resolver = make_resolver();
    auto version = resolver.resolve(std::nullopt);
    ASSERT_FALSE(version);
    EXPECT_EQ(version.error(), InstallerError::VersionResolutionError);
  }

  TEST_F(VersionResolverTest, MalformedJsonFails)
  {
    client_->serve(latest_url, "<html>rate limited</html>");
    auto resolver = make_resolver();
    auto version = resolver.resolve(std::nullopt);
    ASSERT_FALSE(version);
    EXPECT_EQ(version.error(), InstallerError::VersionResolutionError);
  }

  TEST_F(VersionResolverTest, UnreachableIndexFails)
  {
    client_->status(latest_url, 503);
    auto resolver = make_resolver();
    auto version = resolver.resolve(std::nullopt);
    ASSERT_FALSE(version);
    EXPECT_EQ(version.error(), InstallerError::VersionResolutionError);
  }

  TEST_F(VersionResolverTest, ReleaseBaseUrl)
  {
    auto resolver = make_resolver();
    EXPECT_EQ(resolver.release_base_url("v0.2.5"), "https://github.com/forgemypcgit/FPStracker/releases/download/v0.2.5");
  }

  TEST_F(VersionResolverTest, ReleaseBaseUrlOverrideDropsTrailingSlash)
  {
    auto resolver = make_resolver(std::string("https://mirror.example.com/fps//"));
    EXPECT_EQ(resolver.release_base_url("custom"), "https://mirror.example.com/fps");
  }
} // namespace trustinstall::test
