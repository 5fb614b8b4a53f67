#pragma once

#include <inboxkit/global.hpp>

#include "attachment.hpp"
#include "part_params.hpp"

namespace inboxkit {

struct attachment_build_request_t {
    const mime::part_descriptor_t& part;
    const mime::part_params_t& params;
    mail_id_t mail_id = 0;
    std::shared_ptr<data_part_t> data_part;
    bool eml_origin = false;
    std::string server_encoding = "UTF-8";
    std::optional<std::string> attachments_dir;
};

// Builds the attachment for a part and, when attachments_dir is set, saves it there right away.
// A failed save is logged and leaves the attachment without a file path.
attachment_t build_attachment(const attachment_build_request_t& request);

// Display name: "rfc822.eml"-like names for embedded messages and alternatives, the lower-cased
// subtype when the part carries no usable name, the decoded filename/name otherwise.
std::string resolve_attachment_name(const mime::part_descriptor_t& part,
                                    const mime::part_params_t& params,
                                    std::string_view server_encoding);

// Hex SHA-1 of name followed by the raw content id.
std::string make_attachment_id(std::string_view name, const std::optional<std::string>& content_id);

// "{dir}/{mail_id}_{attachment_id}_{sanitized name}", shortened to 255 bytes keeping the
// extension.
std::string make_attachment_path(std::string_view dir,
                                 mail_id_t mail_id,
                                 std::string_view attachment_id,
                                 std::string_view name);

std::string sanitize_file_name(std::string_view name);

}  // namespace inboxkit
