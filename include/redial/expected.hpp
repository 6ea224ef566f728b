#pragma once

#include <iocoro/expected.hpp>

namespace redial {

// Every fallible redial operation returns expected<void, error_info>.
using iocoro::expected;
using iocoro::unexpected;

}  // namespace redial
