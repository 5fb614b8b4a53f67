#pragma once

#include <inboxkit/global.hpp>

namespace inboxkit {

enum class mailbox_errc {
    // no 0
    unexpected_structure = 1,
    invalid_parameter,
    out_of_range,
    storage_failure,
};

std::error_code make_error_code(mailbox_errc e);

}  // namespace inboxkit

namespace std {
template <>
struct is_error_code_enum<inboxkit::mailbox_errc> : true_type {};
}  // namespace std
