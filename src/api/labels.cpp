/**
 * @file
 * @brief Label set formatting
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <api/labels.hpp>

namespace resprint {
namespace api {
namespace labels {

std::string
to_string(const LabelMap &labels)
{
    std::string result;

    // std::map keeps keys ordered
    for (const auto &it : labels) {
        if (!result.empty()) {
            result.push_back(',');
        }
        result.append(it.first).append("=").append(it.second);
    }

    return result;
}

} // labels
} // api
} // resprint
