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

#include "BinaryInstaller.hh"

#include <random>
#include <fmt/format.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  outcome::std_result<std::filesystem::path> BinaryInstaller::install(const std::filesystem::path &source,
                                                                      const std::filesystem::path &install_dir,
                                                                      const std::string &binary_name)
  {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::create_directories(install_dir, ec);
    if (ec)
      {
        logger_->error("Failed to create install directory {}: {}", install_dir.string(), ec.message());
        return InstallerError::IOError;
      }

    std::random_device rd;
    auto staging = install_dir / fmt::format(".{}.{:08x}.tmp", binary_name, rd());
    auto target = install_dir / binary_name;

    fs::copy_file(source, staging, fs::copy_options::overwrite_existing, ec);
    if (ec)
      {
        logger_->error("Failed to copy {} to {}: {}", source.string(), staging.string(), ec.message());
        return InstallerError::IOError;
      }

    auto discard_staging = [&]() {
      std::error_code remove_ec;
      fs::remove(staging, remove_ec);
      if (remove_ec)
        {
          logger_->warn("Failed to remove {}: {}", staging.string(), remove_ec.message());
        }
    };

    fs::permissions(staging,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    if (ec)
      {
        logger_->error("Failed to set permissions on {}: {}", staging.string(), ec.message());
        discard_staging();
        return InstallerError::IOError;
      }

    fs::rename(staging, target, ec);
    if (ec)
      {
        logger_->error("Failed to move binary into place at {}: {}", target.string(), ec.message());
        discard_staging();
        return InstallerError::IOError;
      }

    logger_->info("Installed {}", target.string());
    return target;
  }

} // namespace trustinstall
