/**
 * @file
 * @brief Label set formatting
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <api/types.hpp>

#include <string>

namespace resprint {
namespace api {
namespace labels {

/**
 * @brief Format labels as a comma separated list of "key=value" pairs.
 *
 * Pairs are sorted by key. An empty set produces an empty string.
 */
std::string
to_string(const LabelMap &labels);

} // labels
} // api
} // resprint
