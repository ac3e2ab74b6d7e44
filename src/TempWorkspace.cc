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

#include "TempWorkspace.hh"

#include <random>
#include <fmt/format.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  outcome::std_result<std::unique_ptr<TempWorkspace>> TempWorkspace::create(const std::filesystem::path &parent)
  {
    auto logger = Logging::create("trustinstall:workspace");
    std::error_code ec;

    auto base = parent;
    if (base.empty())
      {
        base = std::filesystem::temp_directory_path(ec);
        if (ec)
          {
            logger->error("No temporary directory available: {}", ec.message());
            return InstallerError::IOError;
          }
      }

    std::random_device rd;
    std::mt19937_64 generator(rd());
    constexpr int max_attempts = 16;

    for (int attempt = 0; attempt < max_attempts; ++attempt)
      {
        auto candidate = base / fmt::format("trustinstall-{:016x}", generator());
        if (std::filesystem::create_directory(candidate, ec))
          {
            std::filesystem::permissions(candidate, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
            if (ec)
              {
                logger->warn("Failed to restrict permissions of {}: {}", candidate.string(), ec.message());
              }
            logger->debug("Created workspace {}", candidate.string());
            return std::make_unique<TempWorkspace>(candidate);
          }
        if (ec)
          {
            logger->error("Failed to create workspace in {}: {}", base.string(), ec.message());
            return InstallerError::IOError;
          }
      }

    logger->error("Failed to create a unique workspace in {}", base.string());
    return InstallerError::IOError;
  }

  TempWorkspace::TempWorkspace(std::filesystem::path root)
    : root_(std::move(root))
  {
  }

  TempWorkspace::~TempWorkspace()
  {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec)
      {
        logger_->warn("Failed to remove workspace {}: {}", root_.string(), ec.message());
      }
  }

  const std::filesystem::path &TempWorkspace::root() const
  {
    return root_;
  }

} // namespace trustinstall
