#pragma once

#include <inboxkit/global.hpp>

#include "part_structure.hpp"

namespace inboxkit::mime {

// Undoes Content-Transfer-Encoding. Never fails: broken input comes back as far as it could be
// decoded, unknown encodings come back untouched.
std::string decode_transfer_encoding(std::string_view data, transfer_encoding_t encoding);

std::string decode_quoted_printable(std::string_view data);

}  // namespace inboxkit::mime
