/**
 * @file
 * @brief Exceptions thrown by printers and their collaborators
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

namespace resprint {

/**
 * @class Error
 * @brief Base of all exceptions thrown by the library, message is formatted by fmt
 */
class Error : public std::runtime_error {
public:
    template <typename ...Args>
    Error(Args&& ...args) : std::runtime_error(fmt::format(std::forward<Args>(args)...)) {}
};

#define RESPRINT_DEFINE_ERROR(NAME) \
    class NAME : public Error { \
    public: \
        using Error::Error; \
    };

/** @brief Output format name is not known          */
RESPRINT_DEFINE_ERROR(UnsupportedFormat)
/** @brief Template format without template source  */
RESPRINT_DEFINE_ERROR(MissingTemplateInput)
/** @brief Template text is not valid               */
RESPRINT_DEFINE_ERROR(TemplateParseError)
/** @brief Template execution failed                */
RESPRINT_DEFINE_ERROR(TemplateExecError)
/** @brief Template file cannot be read             */
RESPRINT_DEFINE_ERROR(FileReadError)
/** @brief Object cannot be encoded at the API version */
RESPRINT_DEFINE_ERROR(EncodingError)
/** @brief Document cannot be decoded into an object */
RESPRINT_DEFINE_ERROR(DecodingError)
/** @brief No print handler for the object type     */
RESPRINT_DEFINE_ERROR(UnknownTypeError)
/** @brief Print handler has unexpected signature   */
RESPRINT_DEFINE_ERROR(MalformedHandler)
/** @brief Output stream rejected data              */
RESPRINT_DEFINE_ERROR(WriteError)

#undef RESPRINT_DEFINE_ERROR

} // resprint
