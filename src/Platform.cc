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

#include "Platform.hh"

#ifdef _WIN32
#  include <windows.h>
#else
#  include <sys/utsname.h>
#endif

#include "Logging.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall
{
  ReleaseTarget::ReleaseTarget(std::string triple, ArchiveFormat format, bool windows, std::string tool_asset)
    : triple_(std::move(triple))
    , format_(format)
    , windows_(windows)
    , tool_asset_(std::move(tool_asset))
  {
  }

  const std::string &ReleaseTarget::triple() const
  {
    return triple_;
  }

  ArchiveFormat ReleaseTarget::archive_format() const
  {
    return format_;
  }

  bool ReleaseTarget::is_windows() const
  {
    return windows_;
  }

  std::string ReleaseTarget::archive_extension() const
  {
    return format_ == ArchiveFormat::Zip ? ".zip" : ".tar.gz";
  }

  std::string ReleaseTarget::asset_name(std::string_view binary_stem) const
  {
    return std::string(binary_stem) + "-" + triple_ + archive_extension();
  }

  std::string ReleaseTarget::binary_name(std::string_view binary_stem) const
  {
    return windows_ ? std::string(binary_stem) + ".exe" : std::string(binary_stem);
  }

  const std::string &ReleaseTarget::tool_asset_name() const
  {
    return tool_asset_;
  }

  std::string ReleaseTarget::tool_binary_name() const
  {
    return windows_ ? "cosign.exe" : "cosign";
  }

  outcome::std_result<ReleaseTarget> resolve_target(std::string_view os, std::string_view arch)
  {
    auto logger = Logging::create("trustinstall:platform");

    bool x86_64 = arch == "x86_64" || arch == "amd64" || arch == "AMD64";
    bool arm64 = arch == "arm64" || arch == "aarch64";

    if (os == "Linux")
      {
        if (x86_64)
          {
            return ReleaseTarget("x86_64-unknown-linux-gnu", ArchiveFormat::TarGz, false, "cosign-linux-amd64");
          }
        logger->error("Unsupported Linux architecture: {}", arch);
        return InstallerError::UnsupportedPlatform;
      }

    if (os == "Darwin")
      {
        if (x86_64)
          {
            return ReleaseTarget("x86_64-apple-darwin", ArchiveFormat::TarGz, false, "cosign-darwin-amd64");
          }
        if (arm64)
          {
            return ReleaseTarget("aarch64-apple-darwin", ArchiveFormat::TarGz, false, "cosign-darwin-arm64");
          }
        logger->error("Unsupported macOS architecture: {}", arch);
        return InstallerError::UnsupportedPlatform;
      }

    if (os == "Windows")
      {
        if (x86_64)
          {
            return ReleaseTarget("x86_64-pc-windows-msvc", ArchiveFormat::Zip, true, "cosign-windows-amd64.exe");
          }
        logger->error("Unsupported Windows architecture: {}", arch);
        return InstallerError::UnsupportedPlatform;
      }

    logger->error("Unsupported OS: {} ({})", os, arch);
    return InstallerError::UnsupportedPlatform;
  }

  outcome::std_result<ReleaseTarget> detect_target()
  {
#ifdef _WIN32
    SYSTEM_INFO info{};
    GetNativeSystemInfo(&info);
    switch (info.wProcessorArchitecture)
      {
      case PROCESSOR_ARCHITECTURE_AMD64:
        return resolve_target("Windows", "x86_64");
      case PROCESSOR_ARCHITECTURE_ARM64:
        return resolve_target("Windows", "arm64");
      default:
        return resolve_target("Windows", "unknown");
      }
#else
    struct utsname name{};
    if (uname(&name) != 0)
      {
        auto logger = Logging::create("trustinstall:platform");
        logger->error("uname() failed, cannot detect platform");
        return InstallerError::UnsupportedPlatform;
      }
    return resolve_target(name.sysname, name.machine);
#endif
  }

} // namespace trustinstall
