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

#ifndef PATH_UPDATER_HH
#define PATH_UPDATER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /// Returns the separator used by @p path_value, ';' for Windows style lists.
  char path_separator_for(std::string_view path_value, std::string_view directory);

  /// Compares PATH entries ignoring surrounding whitespace, trailing separators and case.
  bool same_path_entry(std::string_view lhs, std::string_view rhs);

  bool path_contains(std::string_view path_value, std::string_view directory);

  /// Appends @p directory unless an equivalent entry exists. Empty entries are dropped.
  std::string append_path_entry(std::string_view path_value, std::string_view directory);

  /// Persistent location of the user's PATH list.
  class PathStore
  {
  public:
    virtual ~PathStore() = default;

    virtual outcome::std_result<std::string> read() = 0;
    virtual outcome::std_result<void> write(const std::string &value) = 0;
    virtual bool writable() const = 0;
  };

  /// PATH of the running process; read-only.
  class ProcessPathStore : public PathStore
  {
  public:
    outcome::std_result<std::string> read() override;
    outcome::std_result<void> write(const std::string &value) override;
    bool writable() const override;
  };

#if defined(_WIN32)
  /// User scope Path value under HKCU\Environment.
  class RegistryPathStore : public PathStore
  {
  public:
    outcome::std_result<std::string> read() override;
    outcome::std_result<void> write(const std::string &value) override;
    bool writable() const override;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:path")};
  };
#endif

  enum class PathStatus
  {
    AlreadyPresent,
    Added,
    NotOnPath,
  };

  class PathUpdater
  {
  public:
    explicit PathUpdater(std::shared_ptr<PathStore> store);

    outcome::std_result<PathStatus> ensure_on_path(const std::filesystem::path &directory);

    /// Registry store on Windows, the read-only process PATH elsewhere.
    static std::shared_ptr<PathStore> default_store();

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:path")};
    std::shared_ptr<PathStore> store_;
  };

} // namespace trustinstall

#endif // PATH_UPDATER_HH
