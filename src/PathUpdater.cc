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

#include "PathUpdater.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

#if defined(_WIN32)
#  include <windows.h>
#endif

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    std::string_view trim(std::string_view value)
    {
      while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0)
        {
          value.remove_prefix(1);
        }
      while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0)
        {
          value.remove_suffix(1);
        }
      return value;
    }

    std::string normalize(std::string_view value)
    {
      value = trim(value);
      while (!value.empty() && (value.back() == '/' || value.back() == '\\'))
        {
          value.remove_suffix(1);
        }
      std::string result(value);
      std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
      return result;
    }

    bool looks_like_windows_path(std::string_view value)
    {
      value = trim(value);
      return value.find('\\') != std::string_view::npos || (value.size() > 1 && value[1] == ':');
    }

    std::vector<std::string_view> split_entries(std::string_view value, char separator)
    {
      std::vector<std::string_view> entries;
      while (true)
        {
          auto pos = value.find(separator);
          auto entry = trim(value.substr(0, pos));
          if (!entry.empty())
            {
              entries.push_back(entry);
            }
          if (pos == std::string_view::npos)
            {
              break;
            }
          value.remove_prefix(pos + 1);
        }
      return entries;
    }

#if defined(_WIN32)
    std::wstring widen(const std::string &value)
    {
      if (value.empty())
        {
          return {};
        }
      int size = MultiByteToWideChar(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), nullptr, 0);
      std::wstring result(static_cast<std::size_t>(size), L'\0');
      MultiByteToWideChar(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), result.data(), size);
      return result;
    }

    std::string narrow(const std::wstring &value)
    {
      if (value.empty())
        {
          return {};
        }
      int size = WideCharToMultiByte(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), nullptr, 0, nullptr, nullptr);
      std::string result(static_cast<std::size_t>(size), '\0');
      WideCharToMultiByte(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), result.data(), size, nullptr, nullptr);
      return result;
    }
#endif
  } // namespace

  char path_separator_for(std::string_view path_value, std::string_view directory)
  {
    if (path_value.find(';') != std::string_view::npos || looks_like_windows_path(path_value) || looks_like_windows_path(directory))
      {
        return ';';
      }
    return ':';
  }

  bool same_path_entry(std::string_view lhs, std::string_view rhs)
  {
    return normalize(lhs) == normalize(rhs);
  }

  bool path_contains(std::string_view path_value, std::string_view directory)
  {
    auto entries = split_entries(path_value, path_separator_for(path_value, directory));
    return std::any_of(entries.begin(), entries.end(), [&](std::string_view entry) { return same_path_entry(entry, directory); });
  }

  std::string append_path_entry(std::string_view path_value, std::string_view directory)
  {
    char separator = path_separator_for(path_value, directory);
    auto entries = split_entries(path_value, separator);

    bool present = std::any_of(entries.begin(), entries.end(), [&](std::string_view entry) { return same_path_entry(entry, directory); });
    if (!present)
      {
        entries.push_back(trim(directory));
      }

    std::string result;
    for (const auto &entry: entries)
      {
        if (!result.empty())
          {
            result += separator;
          }
        result += entry;
      }
    return result;
  }

  outcome::std_result<std::string> ProcessPathStore::read()
  {
    const char *value = std::getenv("PATH");
    return std::string(value != nullptr ? value : "");
  }

  outcome::std_result<void> ProcessPathStore::write(const std::string & /*value*/)
  {
    return InstallerError::IOError;
  }

  bool ProcessPathStore::writable() const
  {
    return false;
  }

#if defined(_WIN32)
  outcome::std_result<std::string> RegistryPathStore::read()
  {
    HKEY key = nullptr;
    LONG rc = RegOpenKeyExW(HKEY_CURRENT_USER, L"Environment", 0, KEY_READ, &key);
    if (rc != ERROR_SUCCESS)
      {
        logger_->error("Failed to open HKCU\\Environment (error {})", rc);
        return InstallerError::IOError;
      }

    DWORD type = 0;
    DWORD size = 0;
    rc = RegQueryValueExW(key, L"Path", nullptr, &type, nullptr, &size);
    if (rc == ERROR_FILE_NOT_FOUND)
      {
        RegCloseKey(key);
        return std::string();
      }
    if (rc != ERROR_SUCCESS || (type != REG_SZ && type != REG_EXPAND_SZ))
      {
        RegCloseKey(key);
        logger_->error("Failed to query user Path (error {})", rc);
        return InstallerError::IOError;
      }

    std::wstring value(size / sizeof(wchar_t), L'\0');
    rc = RegQueryValueExW(key, L"Path", nullptr, &type, reinterpret_cast<LPBYTE>(value.data()), &size);
    RegCloseKey(key);
    if (rc != ERROR_SUCCESS)
      {
        logger_->error("Failed to read user Path (error {})", rc);
        return InstallerError::IOError;
      }

    while (!value.empty() && value.back() == L'\0')
      {
        value.pop_back();
      }
    return narrow(value);
  }

  outcome::std_result<void> RegistryPathStore::write(const std::string &value)
  {
    HKEY key = nullptr;
    LONG rc = RegOpenKeyExW(HKEY_CURRENT_USER, L"Environment", 0, KEY_SET_VALUE, &key);
    if (rc != ERROR_SUCCESS)
      {
        logger_->error("Failed to open HKCU\\Environment for writing (error {})", rc);
        return InstallerError::IOError;
      }

    std::wstring wide = widen(value);
    rc = RegSetValueExW(key,
                        L"Path",
                        0,
                        REG_EXPAND_SZ,
                        reinterpret_cast<const BYTE *>(wide.c_str()),
                        static_cast<DWORD>((wide.size() + 1) * sizeof(wchar_t)));
    RegCloseKey(key);
    if (rc != ERROR_SUCCESS)
      {
        logger_->error("Failed to write user Path (error {})", rc);
        return InstallerError::IOError;
      }

    DWORD_PTR result = 0;
    if (SendMessageTimeoutW(HWND_BROADCAST,
                            WM_SETTINGCHANGE,
                            0,
                            reinterpret_cast<LPARAM>(L"Environment"),
                            SMTO_ABORTIFHUNG,
                            5000,
                            &result)
        == 0)
      {
        logger_->warn("Failed to broadcast environment change; new shells may need a logoff");
      }
    return outcome::success();
  }

  bool RegistryPathStore::writable() const
  {
    return true;
  }
#endif

  PathUpdater::PathUpdater(std::shared_ptr<PathStore> store)
    : store_(std::move(store))
  {
  }

  std::shared_ptr<PathStore> PathUpdater::default_store()
  {
#if defined(_WIN32)
    return std::make_shared<RegistryPathStore>();
#else
    return std::make_shared<ProcessPathStore>();
#endif
  }

  outcome::std_result<PathStatus> PathUpdater::ensure_on_path(const std::filesystem::path &directory)
  {
    auto current = store_->read();
    if (!current)
      {
        return current.error();
      }

    auto entry = directory.string();
    if (path_contains(current.value(), entry))
      {
        logger_->debug("{} is already on PATH", entry);
        return PathStatus::AlreadyPresent;
      }

    if (!store_->writable())
      {
        return PathStatus::NotOnPath;
      }

    auto written = store_->write(append_path_entry(current.value(), entry));
    if (!written)
      {
        return written.error();
      }

    logger_->info("Added {} to the user PATH", entry);
    return PathStatus::Added;
  }

} // namespace trustinstall
