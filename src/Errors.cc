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

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  const std::error_category &installer_error_category()
  {
    static const InstallerErrorCategory category;
    return category;
  }

  std::error_code make_error_code(InstallerError e)
  {
    return {static_cast<int>(e), installer_error_category()};
  }

  std::string remediation(const std::error_code &ec)
  {
    if (ec.category() != installer_error_category())
      {
        return "";
      }

    switch (static_cast<InstallerError>(ec.value()))
      {
      case InstallerError::UnsupportedPlatform:
        return "Download a release archive manually for your platform.";
      case InstallerError::VersionResolutionError:
        return "Set FPS_TRACKER_VERSION (or pass a version argument) to pick a release explicitly.";
      case InstallerError::DownloadError:
        return "Check your network connection and try again.";
      case InstallerError::AssetNotFound:
        return "Check that the requested version exists and publishes an archive for this platform.";
      case InstallerError::InsecureTransportRefused:
        return "Use https, or set FPS_TRACKER_ALLOW_INSECURE_HTTP=1 (not recommended).";
      case InstallerError::InvalidUrl:
        return "Check FPS_TRACKER_BASE_URL and FPS_TRACKER_REPO.";
      case InstallerError::ChecksumMismatch:
        return "The download is corrupt or was tampered with. Retry; report the release if it keeps failing.";
      case InstallerError::MalformedChecksum:
        return "The release publishes no usable SHA-256 checksum for this archive.";
      case InstallerError::SignatureAssetsMissing:
        return "Set FPS_TRACKER_SKIP_SIGNATURE_VERIFY=1 to bypass, or unset FPS_TRACKER_REQUIRE_SIGNATURE_VERIFY.";
      case InstallerError::SignatureVerificationFailed:
        return "Do not install this archive. Check FPS_TRACKER_COSIGN_PUBKEY if you pinned a key.";
      case InstallerError::PublicKeyNotFound:
        return "Point FPS_TRACKER_COSIGN_PUBKEY at an existing public key file.";
      case InstallerError::InvalidPublicKey:
        return "The public key must be a PEM encoded public key.";
      case InstallerError::ToolAcquisitionError:
        return "Install cosign manually and make sure it is on PATH.";
      case InstallerError::ToolChecksumUnpinned:
        return "Use a pinned cosign version, or set FPS_TRACKER_SKIP_COSIGN_CHECKSUM_VERIFY=1 to bypass (not recommended).";
      case InstallerError::ExtractionError:
      case InstallerError::BinaryNotFound:
        return "The release archive has an unexpected layout; report the release.";
      case InstallerError::IOError:
        return "Check permissions of the install directory, or set FPS_TRACKER_INSTALL_DIR.";
      case InstallerError::InvalidConfiguration:
        return "Boolean settings accept 1/0, true/false, yes/no or on/off.";
      case InstallerError::Interrupted:
        return "";
      default:
        return "";
      }
  }

} // namespace trustinstall
