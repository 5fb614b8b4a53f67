#pragma once

#include <inboxkit/global.hpp>

#include "part_structure.hpp"

namespace inboxkit::mime {

struct flattened_part_t {
    std::string key;  // "1", "1.2", "2.1.1", ...
    part_descriptor_t descriptor;  // with parts cleared
    // Lies somewhere below a message/rfc822 part dispositioned as attachment.
    bool inside_attached_message = false;
};

// Linearizes the message's top level parts into positional keys, depth first. An entry whose key
// was already produced replaces the earlier entry in its original position.
std::vector<flattened_part_t> flatten_parts(std::vector<part_descriptor_t> parts);

}  // namespace inboxkit::mime

DEFINE_FMT_FORMATTER(inboxkit::mime::flattened_part_t,
                     "{} -> {}{}",
                     arg.key,
                     arg.descriptor,
                     arg.inside_attached_message ? " (attached message)" : "");
