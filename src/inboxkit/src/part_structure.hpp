#pragma once

#include <inboxkit/global.hpp>

#include "imap_structure.hpp"

namespace inboxkit::mime {

// Numeric codes follow the c-client convention servers' structure dumps are compared against.
enum class body_type_t {
    text = 0,
    multipart = 1,
    message = 2,
    application = 3,
    audio = 4,
    image = 5,
    video = 6,
    model = 7,
    other = 8,
};

enum class transfer_encoding_t {
    enc_7bit = 0,
    enc_8bit = 1,
    binary = 2,
    base64 = 3,
    quoted_printable = 4,
    other = 5,
};

struct part_param_t {
    std::string attribute;
    std::string value;
};

struct part_descriptor_t {
    body_type_t type = body_type_t::other;
    std::string subtype;  // upper case, "PLAIN", "RFC822", ...
    transfer_encoding_t encoding = transfer_encoding_t::enc_7bit;
    std::optional<std::string> disposition;
    std::vector<part_param_t> params;   // Content-Type parameters
    std::vector<part_param_t> dparams;  // Content-Disposition parameters
    std::optional<std::string> id;      // Content-ID as sent, with angle brackets
    std::optional<std::string> description;
    uint32_t octets = 0;
    std::vector<part_descriptor_t> parts;

    bool is_container() const { return !parts.empty(); }
    bool has_disposition(std::string_view d) const;
    // message/rfc822 dispositioned as attachment. Its parts are extracted as attachments too.
    bool is_attached_message() const;
};

body_type_t body_type_from_string(std::string_view media_type);
transfer_encoding_t transfer_encoding_from_string(std::string_view encoding);
std::string_view to_string(body_type_t t);
std::string_view to_string(transfer_encoding_t e);

// Converts the backend structure into descriptors, validating it on the way. Fails with
// mailbox_errc::unexpected_structure naming the offending part.
expected<part_descriptor_t> make_part_descriptor(const imap_structure::Body& body);

}  // namespace inboxkit::mime

DEFINE_FMT_FORMATTER(inboxkit::mime::body_type_t, "{}", inboxkit::mime::to_string(arg));
DEFINE_FMT_FORMATTER(inboxkit::mime::transfer_encoding_t, "{}", inboxkit::mime::to_string(arg));
DEFINE_FMT_FORMATTER(inboxkit::mime::part_descriptor_t,
                     "part({}/{}, enc: {}, disposition: {}, parts: {})",
                     arg.type,
                     arg.subtype,
                     arg.encoding,
                     arg.disposition.value_or("none"),
                     arg.parts.size());
