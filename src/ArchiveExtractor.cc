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

#include "ArchiveExtractor.hh"

#include <archive.h>
#include <archive_entry.h>

#include "trustinstall/Errors.hh"
#include "Interrupt.hh"

namespace trustinstall
{
  namespace
  {
    constexpr std::size_t READ_BLOCK_SIZE = 32 * 1024;

    bool is_safe_entry_path(const std::filesystem::path &path)
    {
      if (path.empty() || path.is_absolute() || path.has_root_name() || path.has_root_directory())
        {
          return false;
        }
      for (const auto &component: path)
        {
          if (component == "..")
            {
              return false;
            }
        }
      return true;
    }

    /// A symlink target must stay inside the extraction root once resolved against the link's directory.
    bool is_contained_symlink(const std::filesystem::path &entry, const std::filesystem::path &target)
    {
      if (target.empty() || target.is_absolute() || target.has_root_name() || target.has_root_directory())
        {
          return false;
        }
      auto resolved = (entry.parent_path() / target).lexically_normal();
      return resolved.empty() || *resolved.begin() != "..";
    }

    bool is_plain_file(std::filesystem::file_status status)
    {
      return status.type() == std::filesystem::file_type::regular;
    }
  } // namespace

  outcome::std_result<void> ArchiveExtractor::copy_data(struct archive *reader, struct archive *writer, const std::string &entry_name)
  {
    const void *buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true)
      {
        int r = archive_read_data_block(reader, &buffer, &size, &offset);
        if (r == ARCHIVE_EOF)
          {
            return outcome::success();
          }
        if (r == ARCHIVE_RETRY)
          {
            continue;
          }
        if (r != ARCHIVE_OK)
          {
            logger_->error("Failed to read {}: {}", entry_name, archive_error_string(reader));
            return InstallerError::ExtractionError;
          }
        if (archive_write_data_block(writer, buffer, size, offset) < ARCHIVE_OK)
          {
            logger_->error("Failed to write {}: {}", entry_name, archive_error_string(writer));
            return InstallerError::ExtractionError;
          }
      }
  }

  outcome::std_result<void> ArchiveExtractor::extract(const std::filesystem::path &archive_file, const std::filesystem::path &destination)
  {
    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec)
      {
        logger_->error("Failed to create {}: {}", destination.string(), ec.message());
        return InstallerError::IOError;
      }

    std::unique_ptr<struct archive, decltype(&archive_read_free)> reader(archive_read_new(), archive_read_free);
    std::unique_ptr<struct archive, decltype(&archive_write_free)> writer(archive_write_disk_new(), archive_write_free);
    if (!reader || !writer)
      {
        logger_->error("Failed to allocate libarchive handles");
        return InstallerError::ExtractionError;
      }

    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());

    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(writer.get(), flags);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archive_file.string().c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK)
      {
        logger_->error("Failed to open archive {}: {}", archive_file.string(), archive_error_string(reader.get()));
        return InstallerError::ExtractionError;
      }

    int entries = 0;
    struct archive_entry *entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK)
      {
        if (interrupted())
          {
            return InstallerError::Interrupted;
          }

        const char *raw_name = archive_entry_pathname(entry);
        std::string name = raw_name != nullptr ? raw_name : "";
        std::filesystem::path relative(name);
        if (!is_safe_entry_path(relative))
          {
            logger_->error("Refusing unsafe archive entry: '{}'", name);
            return InstallerError::ExtractionError;
          }
        archive_entry_set_pathname(entry, (destination / relative).string().c_str());

        const char *hardlink = archive_entry_hardlink(entry);
        if (hardlink != nullptr)
          {
            std::filesystem::path link_target(hardlink);
            if (!is_safe_entry_path(link_target))
              {
                logger_->error("Refusing unsafe hard link '{}' -> '{}'", name, hardlink);
                return InstallerError::ExtractionError;
              }
            archive_entry_set_hardlink(entry, (destination / link_target).string().c_str());
          }

        if (archive_entry_filetype(entry) == AE_IFLNK)
          {
            const char *symlink = archive_entry_symlink(entry);
            if (symlink == nullptr || !is_contained_symlink(relative, symlink))
              {
                logger_->error("Refusing symlink '{}' pointing outside the archive: '{}'", name, symlink != nullptr ? symlink : "");
                return InstallerError::ExtractionError;
              }
          }

        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK)
          {
            logger_->error("Failed to extract {}: {}", name, archive_error_string(writer.get()));
            return InstallerError::ExtractionError;
          }

        if (archive_entry_size(entry) > 0)
          {
            auto copied = copy_data(reader.get(), writer.get(), name);
            if (!copied)
              {
                return copied.error();
              }
          }

        if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK)
          {
            logger_->error("Failed to finish {}: {}", name, archive_error_string(writer.get()));
            return InstallerError::ExtractionError;
          }
        ++entries;
      }

    if (r != ARCHIVE_EOF)
      {
        logger_->error("Failed to read archive {}: {}", archive_file.string(), archive_error_string(reader.get()));
        return InstallerError::ExtractionError;
      }

    archive_read_close(reader.get());
    if (archive_write_close(writer.get()) != ARCHIVE_OK)
      {
        logger_->error("Failed to complete extraction: {}", archive_error_string(writer.get()));
        return InstallerError::ExtractionError;
      }

    logger_->debug("Extracted {} entries from {}", entries, archive_file.filename().string());
    return outcome::success();
  }

  outcome::std_result<std::filesystem::path> ArchiveExtractor::find_binary(const std::filesystem::path &root, const std::string &binary_name) const
  {
    std::error_code ec;
    auto direct = root / binary_name;
    if (is_plain_file(std::filesystem::symlink_status(direct, ec)))
      {
        return direct;
      }

    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec)
      {
        logger_->error("Failed to scan {}: {}", root.string(), ec.message());
        return InstallerError::ExtractionError;
      }

    for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec))
      {
        std::error_code type_ec;
        if (it->path().filename() == binary_name && is_plain_file(it->symlink_status(type_ec)))
          {
            return it->path();
          }
      }
    if (ec)
      {
        logger_->error("Failed to scan {}: {}", root.string(), ec.message());
        return InstallerError::ExtractionError;
      }

    logger_->error("Archive does not contain {}", binary_name);
    return InstallerError::BinaryNotFound;
  }

} // namespace trustinstall
