#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "arc.hpp"
#include "forward.hpp"
#include "stator/export.h"
#include <string>
#include <system_error>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct extended_error_t
 *  \brief Holds string context, error_code and the pointer to the following error.
 *
 *
 * This is extension over std::error_code, to make it possible to identify the
 * context of the error (usually it is an address or a child identity), and make
 * it possible to construct the chain of failures, that's why there is a smart
 * pointer to the next error.
 *
 */
struct STATOR_API extended_error_t : arc_base_t<extended_error_t> {
    /** \brief error context, usually identity of the failed entity */
    std::string context;

    /** \brief abstract error code */
    std::error_code ec;

    /** \brief pointer to the cause */
    extended_error_ptr_t next;

    /** \brief constructs extended error by assembling all fields */
    extended_error_t(const std::string &context_, const std::error_code &ec_,
                     const extended_error_ptr_t &next_ = {}) noexcept
        : context{context_}, ec{ec_}, next{next_} {}

    /** \brief human-readeable detailed description of the error
     *
     * First, it stringifies own error in accordance with the context.
     *
     * Second, it recursively ask details on all following errors, appedning them
     * into the result. The result string is returned.
     */
    std::string message() const noexcept;

    /** \brief returns the last error in the chain */
    extended_error_ptr_t root() const noexcept;
};

/** \brief constructs smart pointer to the extened error */
STATOR_API extended_error_ptr_t make_error(const std::string &context_, const std::error_code &ec_,
                                           const extended_error_ptr_t &next_ = {}) noexcept;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
