#include "attachment_builder.hpp"
#include "mime_decode.hpp"
#include "utils.hpp"

#include <glib.h>

#include <algorithm>
#include <cctype>

namespace inboxkit {

namespace {
constexpr size_t max_path_length = 255;

}  // namespace

std::string resolve_attachment_name(const mime::part_descriptor_t& part,
                                    const mime::part_params_t& params,
                                    std::string_view server_encoding) {
    using mime::param_kind_t;

    if (part.is_attached_message() || part.subtype == "ALTERNATIVE") {
        return utils::to_lower(part.subtype) + ".eml";
    }

    const bool has_filename = params.has_value(param_kind_t::filename);
    const bool has_name = params.has_value(param_kind_t::name);
    if (!has_filename && !has_name) {
        return utils::to_lower(part.subtype);
    }

    std::string name = has_filename ? *params.get(param_kind_t::filename)
                                    : params.get(param_kind_t::name).value_or("");
    name = mime::decode_mime_str(name, server_encoding);
    return mime::decode_rfc2231(name, server_encoding);
}

std::string make_attachment_id(std::string_view name,
                               const std::optional<std::string>& content_id) {
    const std::string input = std::string{name} + content_id.value_or("");
    gchar* digest = g_compute_checksum_for_string(G_CHECKSUM_SHA1, input.data(),
                                                  static_cast<gssize>(input.size()));
    std::string result{digest};
    g_free(digest);
    return result;
}

std::string sanitize_file_name(std::string_view name) {
    std::string kept;
    kept.reserve(name.size());
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            kept.push_back('_');
        } else if (uc < 0x80 && (std::isalnum(uc) || c == '_' || c == '.')) {
            kept.push_back(c);
        }
    }

    std::string collapsed;
    collapsed.reserve(kept.size());
    for (char c : kept) {
        if (c == '_' && !collapsed.empty() && collapsed.back() == '_') {
            continue;
        }
        collapsed.push_back(c);
    }

    return utils::trim(collapsed, "_");
}

std::string make_attachment_path(std::string_view dir,
                                 mail_id_t mail_id,
                                 std::string_view attachment_id,
                                 std::string_view name) {
    std::string file_name =
        fmt::format("{}_{}_{}", mail_id, attachment_id, sanitize_file_name(name));
    file_name.erase(std::remove_if(file_name.begin(), file_name.end(),
                                   [](char c) { return c == '/' || c == '\\'; }),
                    file_name.end());

    const std::string prefix = fmt::format("{}/", dir);
    if (prefix.size() + file_name.size() <= max_path_length) {
        return prefix + file_name;
    }
    if (prefix.size() >= max_path_length) {
        log_warning("attachments dir '{}' leaves no room for file names, not shortening", dir);
        return prefix + file_name;
    }

    // Only the file name is shortened, the directory is kept as is.
    const size_t room = max_path_length - prefix.size();
    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos) {
        return prefix + file_name.substr(0, room);
    }
    const std::string extension = file_name.substr(dot + 1);
    if (extension.size() + 1 >= room) {
        return prefix + file_name.substr(0, room);
    }
    return prefix + file_name.substr(0, room - 1 - extension.size()) + "." + extension;
}

attachment_t build_attachment(const attachment_build_request_t& request) {
    const auto& part = request.part;
    const auto& params = request.params;

    auto name = resolve_attachment_name(part, params, request.server_encoding);
    attachment_t attachment{make_attachment_id(name, part.id), request.data_part};

    if (part.id) {
        attachment.content_id = utils::trim(*part.id, " <>");
    }
    attachment.name = std::move(name);
    attachment.disposition = part.disposition;
    if (params.has_value(mime::param_kind_t::charset)) {
        attachment.charset = params.get(mime::param_kind_t::charset);
    }
    attachment.eml_origin = request.eml_origin;
    attachment.type = part.type;
    attachment.subtype = part.subtype;
    attachment.description = part.description;
    attachment.size_in_bytes = part.octets;

    if (request.attachments_dir) {
        auto path = make_attachment_path(*request.attachments_dir, request.mail_id,
                                         attachment.id(), attachment.name);
        attachment.set_file_path(std::move(path));
        if (!attachment.save_to_disk()) {
            log_warning("attachment {} of mail {} was not saved", attachment, request.mail_id);
        }
    }

    log_debug("built {}", attachment);
    return attachment;
}

}  // namespace inboxkit
