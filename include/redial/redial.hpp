#pragma once

#include <redial/assert.hpp>
#include <redial/config.hpp>
#include <redial/connection.hpp>
#include <redial/controller.hpp>
#include <redial/error.hpp>
#include <redial/error_info.hpp>
#include <redial/expected.hpp>
#include <redial/function_connection.hpp>
#include <redial/hooks.hpp>
#include <redial/lifecycle_state.hpp>
#include <redial/logger.hpp>
