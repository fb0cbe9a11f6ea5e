/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace testutil {

  /**
   * Errors returned by mocks where the test only checks that a failure of a
   * collaborator is propagated or handled, not which one it was.
   */
  enum class DummyError {
    ERROR = 1,
    ERROR_2,
  };
  Q_ENUM_ERROR_CODE(DummyError) {
    using E = decltype(e);
    switch (e) {
      case E::ERROR:
        return "dummy error";
      case E::ERROR_2:
        return "second dummy error";
    }
    return "unknown dummy error";
  }

}  // namespace testutil
