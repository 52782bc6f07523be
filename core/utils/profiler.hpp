/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"

#include <chrono>

namespace trielog {

  /// Logs the time elapsed since construction or the previous toc()
  class TicToc {
    std::string_view name_;
    const log::Logger &log_;
    std::chrono::time_point<std::chrono::steady_clock> t_;

   public:
    TicToc(std::string &&) = delete;
    TicToc(const std::string &) = delete;
    TicToc(std::string_view name, const log::Logger &log)
        : name_(name), log_(log) {
      t_ = std::chrono::steady_clock::now();
    }

    void toc() {
      auto prev = t_;
      t_ = std::chrono::steady_clock::now();
      SL_DEBUG(log_,
               "{} lasted for {} ms",
               name_,
               std::chrono::duration_cast<std::chrono::milliseconds>(t_ - prev)
                   .count());
    }

    ~TicToc() {
      toc();
    }
  };

}  // namespace trielog
