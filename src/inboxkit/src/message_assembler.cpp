#include "message_assembler.hpp"
#include "attachment_builder.hpp"
#include "mailbox_errors.hpp"
#include "part_flattener.hpp"
#include "part_params.hpp"
#include "utils.hpp"

namespace inboxkit {

namespace {

using mime::body_type_t;
using mime::param_kind_t;

bool is_plain_or_html_text(const mime::part_descriptor_t& part) {
    return part.type == body_type_t::text &&
           (utils::iequals(part.subtype, "plain") || utils::iequals(part.subtype, "html"));
}

}  // namespace

message_assembler_t::message_assembler_t(std::shared_ptr<mailbox_backend_t> backend,
                                         assembly_config_t config)
    : m_backend(std::move(backend)), m_config(std::move(config)) {}

std::shared_ptr<data_part_t> message_assembler_t::make_data_part(
    const incoming_mail_t& mail,
    const mime::part_descriptor_t& part,
    const traversal_context_t& ctx) const {
    const fetch_options_t options{.peek = !ctx.mark_as_seen, .uid = m_config.uid};
    return std::make_shared<data_part_t>(m_backend, mail.id(), ctx.key, part.encoding, options,
                                         m_config.server_encoding);
}

expected<void> message_assembler_t::classify_part(incoming_mail_t& mail,
                                                  const mime::part_descriptor_t& part,
                                                  const traversal_context_t& ctx) {
    if (part.subtype.empty()) {
        log_error("part {} of mail {} has no subtype", ctx.key, mail.id());
        return unexpected(make_error_code(mailbox_errc::unexpected_structure));
    }

    log_debug("classifying {} with {}", part, ctx);

    auto data_part = make_data_part(mail, part, ctx);
    const auto params = mime::build_part_params(part);

    bool is_attachment = params.has(param_kind_t::filename) || params.has(param_kind_t::name);
    // A single part text mail is never its own attachment, whatever its parameters say.
    if (ctx.key == whole_message_key && part.type == body_type_t::text) {
        is_attachment = false;
    }

    if (is_attachment) {
        mail.set_has_attachments(true);
    }

    auto make_request = [&](bool eml_origin) {
        return attachment_build_request_t{.part = part,
                                          .params = params,
                                          .mail_id = mail.id(),
                                          .data_part = data_part,
                                          .eml_origin = eml_origin,
                                          .server_encoding = m_config.server_encoding,
                                          .attachments_dir = m_config.attachments_dir};
    };

    // The embedded message as one .eml file, next to the attachments its parts turn into.
    if (part.is_attached_message()) {
        mail.set_has_attachments(true);
        mail.add_attachment(build_attachment(make_request(false)));
    }

    if (ctx.eml_parse) {
        is_attachment = true;
    }

    if (m_config.attachments_ignore && part.type != body_type_t::multipart &&
        !is_plain_or_html_text(part)) {
        log_debug("ignoring part {} of mail {}", ctx.key, mail.id());
        return {};
    }

    if (is_attachment) {
        mail.set_has_attachments(true);
        mail.add_attachment(build_attachment(make_request(ctx.eml_parse)));
    } else if (params.has_value(param_kind_t::charset)) {
        data_part->set_charset(*params.get(param_kind_t::charset));
    }

    if (!part.parts.empty()) {
        const bool not_attachment = !part.has_disposition("attachment");
        for (size_t i = 0; i < part.parts.size(); ++i) {
            const auto& child = part.parts[i];
            const std::string child_key = fmt::format("{}.{}", ctx.key, i + 1);

            expected<void> result;
            if (part.type == body_type_t::message && part.subtype == "RFC822" && not_attachment) {
                // The rfc822 envelope does not show up in positional keys.
                result = classify_part(mail, child, ctx.descend(ctx.key, ctx.eml_parse));
            } else if (part.type == body_type_t::multipart && part.subtype == "ALTERNATIVE" &&
                       not_attachment) {
                // Alternatives share the key of their container.
                result = classify_part(mail, child, ctx.descend(ctx.key, ctx.eml_parse));
            } else if (part.is_attached_message()) {
                result = classify_part(mail, child, ctx.descend(child_key, true));
            } else {
                result = classify_part(mail, child, ctx.descend(child_key, ctx.eml_parse));
            }

            if (!result) {
                return unexpected(result.error());
            }
        }
        return {};
    }

    if (is_attachment) {
        return {};
    }

    if (part.type == body_type_t::text) {
        if (utils::iequals(part.subtype, "plain")) {
            mail.set_text_plain_part(std::move(data_part));
        } else if (!part.disposition || !utils::iequals(*part.disposition, "attachment")) {
            mail.set_text_html_part(std::move(data_part));
        }
    } else if (part.type == body_type_t::message) {
        mail.set_text_plain_part(std::move(data_part));
    }

    return {};
}

expected<void> message_assembler_t::assemble(incoming_mail_t& mail,
                                             mime::part_descriptor_t root,
                                             bool mark_as_seen) {
    if (root.parts.empty()) {
        return classify_part(mail, root,
                             traversal_context_t{whole_message_key, mark_as_seen, false});
    }

    for (auto& flattened : mime::flatten_parts(std::move(root.parts))) {
        log_debug("mail {}: {}", mail.id(), flattened);
        auto classified_or_err = classify_part(
            mail, flattened.descriptor,
            traversal_context_t{flattened.key, mark_as_seen, flattened.inside_attached_message});
        if (!classified_or_err) {
            log_error("failed assembling mail {} at part {}: {}", mail.id(), flattened.key,
                      classified_or_err.error());
            return unexpected(classified_or_err.error());
        }
    }

    return {};
}

expected<void> assemble_message(incoming_mail_t& mail,
                                mime::part_descriptor_t root,
                                std::shared_ptr<mailbox_backend_t> backend,
                                const assembly_config_t& config,
                                bool mark_as_seen) {
    message_assembler_t assembler{std::move(backend), config};
    return assembler.assemble(mail, std::move(root), mark_as_seen);
}

}  // namespace inboxkit
