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

#ifndef ARCHIVE_EXTRACTOR_HH
#define ARCHIVE_EXTRACTOR_HH

#include <filesystem>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

struct archive;

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /**
   * @brief Unpacks release archives (tar.gz and zip) with libarchive
   *
   * Entries with absolute paths or ".." components are refused, and
   * nothing is written through a symlink created by the archive. Symlinks
   * whose target leaves the extraction root are refused.
   */
  class ArchiveExtractor
  {
  public:
    outcome::std_result<void> extract(const std::filesystem::path &archive_file, const std::filesystem::path &destination);

    /// Finds @p binary_name at the top of @p root, else anywhere below it. Symlinks never match.
    outcome::std_result<std::filesystem::path> find_binary(const std::filesystem::path &root, const std::string &binary_name) const;

  private:
    outcome::std_result<void> copy_data(struct archive *reader, struct archive *writer, const std::string &entry_name);

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:extract")};
  };

} // namespace trustinstall

#endif // ARCHIVE_EXTRACTOR_HH
