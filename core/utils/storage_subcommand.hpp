/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace trielog {

  /**
   * Entry point of `storage` subcommand.
   * argv[0] is "storage", node options follow an optional "--".
   * @return process exit code
   */
  int storage_subcommand_main(int argc, const char **argv);

}  // namespace trielog
