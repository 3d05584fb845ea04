/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/write_file.hpp"

#include <cerrno>
#include <cstdio>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/assert.hpp>
#include <boost/filesystem/operations.hpp>
#include <qtils/option_take.hpp>

namespace gorc {

  namespace {
    std::error_code lastError() {
      return {errno, std::generic_category()};
    }

    /// closes descriptor on scope exit
    struct FdGuard {
      int fd;
      ~FdGuard() {
        if (fd >= 0) {
          ::close(fd);
        }
      }
    };
  }  // namespace

  outcome::result<void> renameNoReplace(const filesystem::path &from,
                                        const filesystem::path &to) {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(),
                    RENAME_NOREPLACE)
        == 0) {
      return outcome::success();
    }
    if (errno != EINVAL and errno != ENOSYS) {
      return lastError();
    }
    return renameIfAbsent(from, to);
  }

  outcome::result<void> renameIfAbsent(const filesystem::path &from,
                                       const filesystem::path &to) {
    std::error_code ec;
    auto target = filesystem::symlink_status(to, ec);
    if (filesystem::exists(target)) {
      return std::make_error_code(std::errc::file_exists);
    }
    if (ec and ec != std::errc::no_such_file_or_directory) {
      return ec;
    }
    if (::rename(from.c_str(), to.c_str()) != 0) {
      return lastError();
    }
    return outcome::success();
  }

  outcome::result<void> fsyncDirectory(const filesystem::path &dir) {
    FdGuard dir_fd{::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (dir_fd.fd < 0) {
      return lastError();
    }
    if (::fsync(dir_fd.fd) != 0) {
      return lastError();
    }
    return outcome::success();
  }

  outcome::result<TmpFile> TmpFile::make(filesystem::path target) {
    boost::system::error_code ec;
    auto pattern = "." + target.filename().native() + ".tmp-%%%%%%%%";
    auto unique = boost::filesystem::unique_path(pattern, ec);
    if (ec) {
      return std::error_code{ec.value(), std::generic_category()};
    }
    auto tmp = target.parent_path() / unique.native();
    return TmpFile{std::move(target), std::move(tmp)};
  }

  TmpFile::TmpFile(filesystem::path target, filesystem::path tmp)
      : target_{std::move(target)}, tmp_{std::move(tmp)} {}

  TmpFile::TmpFile(TmpFile &&other) noexcept
      : target_{std::move(other.target_)},
        tmp_{qtils::optionTake(other.tmp_)} {}

  TmpFile::~TmpFile() {
    if (auto tmp = qtils::optionTake(tmp_)) {
      std::error_code ec;
      filesystem::remove(*tmp, ec);
    }
  }

  filesystem::path TmpFile::path() const {
    return tmp_.value_or(target_);
  }

  outcome::result<void> TmpFile::write(std::string_view data) {
    BOOST_ASSERT(tmp_.has_value());
    FdGuard file{::open(tmp_->c_str(),
                        O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                        S_IRUSR | S_IWUSR)};
    if (file.fd < 0) {
      return lastError();
    }
    while (not data.empty()) {
      auto written = ::write(file.fd, data.data(), data.size());
      if (written < 0) {
        if (errno == EINTR) {
          continue;
        }
        return lastError();
      }
      data.remove_prefix(static_cast<size_t>(written));
    }
    if (::fsync(file.fd) != 0) {
      return lastError();
    }
    return outcome::success();
  }

  outcome::result<void> TmpFile::commit() {
    if (auto tmp = qtils::optionTake(tmp_)) {
      if (auto res = renameNoReplace(*tmp, target_); not res) {
        tmp_ = std::move(tmp);
        return res.error();
      }
    }
    return outcome::success();
  }

  outcome::result<void> writeNewFile(const filesystem::path &path,
                                     std::string_view data) {
    OUTCOME_TRY(tmp, TmpFile::make(path));
    OUTCOME_TRY(tmp.write(data));
    OUTCOME_TRY(tmp.commit());
    OUTCOME_TRY(fsyncDirectory(path.parent_path()));
    return outcome::success();
  }

}  // namespace gorc
