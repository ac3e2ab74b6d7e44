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

#ifndef BINARY_INSTALLER_HH
#define BINARY_INSTALLER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  class BinaryInstaller
  {
  public:
    /**
     * @brief Places @p source at @p install_dir / @p binary_name
     *
     * The install directory is created when missing. The binary is copied
     * to a temporary sibling, made executable (0755) and renamed over the
     * final path.
     *
     * @return outcome::std_result<std::filesystem::path> Installed path, or
     *         InstallerError::IOError
     */
    outcome::std_result<std::filesystem::path> install(const std::filesystem::path &source,
                                                       const std::filesystem::path &install_dir,
                                                       const std::string &binary_name);

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:install")};
  };

} // namespace trustinstall

#endif // BINARY_INSTALLER_HH
