/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"

namespace trielog {
  inline outcome::result<void> writeFile(const std::filesystem::path &path,
                                         BufferView data) {
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (file
        and file.write(
            reinterpret_cast<const char *>(data.data()),  // NOLINT
            static_cast<std::streamsize>(data.size()))
        and file.flush()) {
      return outcome::success();
    }
    return std::errc{errno};
  }

  /**
   * Wrapper to keep a tmp file name and rename it later.
   * Readers never observe a partially written file: the content is written
   * to the tmp file first and atomically renamed after it is complete.
   * A tmp file that was not renamed is removed on destruction.
   */
  struct TmpFile {
    /**
     * Tmp file is created in same directory as target path,
     * to avoid `EXDEV` error from `rename`.
     */
    explicit TmpFile(std::filesystem::path target,
                     std::string_view suffix = ".tmp")
        : target{std::move(target)} {
      tmp = std::filesystem::path{this->target.native() + std::string{suffix}};
    }

    TmpFile(TmpFile &&other) noexcept
        : target{std::move(other.target)}, tmp{std::exchange(other.tmp, {})} {}

    TmpFile(const TmpFile &) = delete;
    TmpFile &operator=(const TmpFile &) = delete;
    TmpFile &operator=(TmpFile &&) = delete;

    ~TmpFile() {
      if (tmp) {
        std::error_code ec;
        std::filesystem::remove(*tmp, ec);
      }
    }

    /**
     * Get current file path.
     */
    std::filesystem::path path() const {
      return tmp.value_or(target);
    }

    /**
     * Rename file to target name.
     */
    outcome::result<void> rename() {
      if (tmp) {
        std::error_code ec;
        std::filesystem::rename(*tmp, target, ec);
        if (ec) {
          return ec;
        }
        tmp.reset();
      }
      return outcome::success();
    }

    std::filesystem::path target;
    std::optional<std::filesystem::path> tmp;
  };

  inline outcome::result<void> writeFileTmp(const std::filesystem::path &path,
                                            BufferView data) {
    TmpFile tmp{path};
    OUTCOME_TRY(writeFile(tmp.path(), data));
    OUTCOME_TRY(tmp.rename());
    return outcome::success();
  }
}  // namespace trielog
