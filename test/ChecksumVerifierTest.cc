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

#include "ChecksumVerifier.hh"

#include <algorithm>
#include <cctype>
#include <gtest/gtest.h>

#include "TestUtils.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall::test
{
  class ChecksumVerifierTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      file_ = dir_.path() / "fps-tracker-x86_64-unknown-linux-gnu.tar.gz";
      write_file(file_, content_);
      digest_ = sha256_hex(content_);
    }

    ScopedTempDir dir_;
    std::string content_{"release archive contents"};
    std::filesystem::path file_;
    std::string digest_;
    ChecksumVerifier verifier_;
  };

  TEST_F(ChecksumVerifierTest, ComputesKnownDigest)
  {
    auto empty = dir_.path() / "empty";
    write_file(empty, "");
    auto digest = verifier_.compute(empty);
    ASSERT_TRUE(digest);
    EXPECT_EQ(digest.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  }

  TEST_F(ChecksumVerifierTest, ComputeOfMissingFileFails)
  {
    auto digest = verifier_.compute(dir_.path() / "missing");
    ASSERT_FALSE(digest);
    EXPECT_EQ(digest.error(), InstallerError::IOError);
  }

  TEST_F(ChecksumVerifierTest, AcceptsMatchingRecord)
  {
    auto result = verifier_.verify(file_, digest_ + "  fps-tracker-x86_64-unknown-linux-gnu.tar.gz\n");
    EXPECT_TRUE(result);
  }

  TEST_F(ChecksumVerifierTest, AcceptsBareDigest)
  {
    EXPECT_TRUE(verifier_.verify(file_, digest_));
  }

  TEST_F(ChecksumVerifierTest, ComparesCaseInsensitively)
  {
    std::string upper = digest_;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    EXPECT_TRUE(verifier_.verify(file_, upper + "\n"));
  }

  TEST_F(ChecksumVerifierTest, RejectsSingleCharacterDifference)
  {
    std::string altered = digest_;
    altered[10] = altered[10] == '0' ? '1' : '0';

    LogCapture capture("trustinstall:checksum");
    auto result = verifier_.verify(file_, altered + "  archive.tar.gz\n");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::ChecksumMismatch);
    EXPECT_TRUE(capture.contains(altered));
    EXPECT_TRUE(capture.contains(digest_));
  }

  TEST_F(ChecksumVerifierTest, RejectsEmptyRecords)
  {
    for (const auto *record: {"", "   \n", "\t\n\n"})
      {
        auto result = verifier_.verify(file_, record);
        ASSERT_FALSE(result) << record;
        EXPECT_EQ(result.error(), InstallerError::MalformedChecksum) << record;
      }
  }

  TEST_F(ChecksumVerifierTest, NonHexAlterationIsMismatch)
  {
    std::string altered = digest_;
    altered[0] = 'g';

    LogCapture capture("trustinstall:checksum");
    auto result = verifier_.verify(file_, altered + "  archive.tar.gz\n");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::ChecksumMismatch);
    EXPECT_TRUE(capture.contains(altered));
    EXPECT_TRUE(capture.contains(digest_));
  }

  TEST_F(ChecksumVerifierTest, TruncatedDigestIsMismatch)
  {
    std::string truncated = digest_.substr(0, ChecksumVerifier::digest_hex_length - 1);

    LogCapture capture("trustinstall:checksum");
    auto result = verifier_.verify(file_, truncated + "  archive.tar.gz\n");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::ChecksumMismatch);
    EXPECT_TRUE(capture.contains(digest_));
  }

  TEST_F(ChecksumVerifierTest, ArbitraryTokenIsMismatch)
  {
    auto result = verifier_.verify(file_, "not-a-digest archive.tar.gz");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), InstallerError::ChecksumMismatch);
  }

  TEST_F(ChecksumVerifierTest, FindsAssetInManifest)
  {
    std::string other(ChecksumVerifier::digest_hex_length, 'a');
    std::string manifest = "# release checksums\n"
                           "\n"
                           + other + "  fps-tracker-aarch64-apple-darwin.tar.gz\n" + digest_
                           + " *fps-tracker-x86_64-unknown-linux-gnu.tar.gz\n";

    auto record = verifier_.find_in_manifest(manifest, "fps-tracker-x86_64-unknown-linux-gnu.tar.gz");
    ASSERT_TRUE(record) << record.error().message();
    EXPECT_TRUE(verifier_.verify(file_, record.value()));

    auto darwin = verifier_.find_in_manifest(manifest, "fps-tracker-aarch64-apple-darwin.tar.gz");
    ASSERT_TRUE(darwin);
    EXPECT_FALSE(verifier_.verify(file_, darwin.value()));
  }

  TEST_F(ChecksumVerifierTest, ManifestWithoutAssetFails)
  {
    auto record = verifier_.find_in_manifest(digest_ + "  something-else.zip\n", "fps-tracker-x86_64-pc-windows-msvc.zip");
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error(), InstallerError::MalformedChecksum);
  }
} // namespace trustinstall::test
