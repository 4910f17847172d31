//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/extended_error.h"
#include <sstream>

namespace stator {

std::string extended_error_t::message() const noexcept {
    std::stringstream out;
    for (auto it = this; it; it = it->next.get()) {
        if (it != this) {
            out << " <- ";
        }
        out << it->context << " " << it->ec.message();
    }
    return out.str();
}

extended_error_ptr_t extended_error_t::root() const noexcept {
    auto it = const_cast<extended_error_t *>(this);
    while (it->next) {
        it = it->next.get();
    }
    return extended_error_ptr_t(it);
}

extended_error_ptr_t make_error(const std::string &context_, const std::error_code &ec_,
                                const extended_error_ptr_t &next_) noexcept {
    return new extended_error_t(context_, ec_, next_);
}

} // namespace stator
