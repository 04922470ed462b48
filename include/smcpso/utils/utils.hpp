/**
 * @file utils.hpp
 * @brief Main utilities include file
 */

#pragma once

#include "smcpso/utils/math_utils.hpp"
#include "smcpso/utils/ring_buffer.hpp"
#include "smcpso/utils/timer.hpp"
#include "smcpso/utils/logger.hpp"
