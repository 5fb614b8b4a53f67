#include "part_structure.hpp"
#include "mailbox_errors.hpp"
#include "utils.hpp"

namespace inboxkit::mime {

bool part_descriptor_t::has_disposition(std::string_view d) const {
    return disposition.has_value() && utils::iequals(*disposition, d);
}

bool part_descriptor_t::is_attached_message() const {
    return type == body_type_t::message && utils::iequals(subtype, "RFC822") &&
           has_disposition("attachment");
}

body_type_t body_type_from_string(std::string_view media_type) {
    namespace types = imap_structure::standard_basic_media_types;
    const auto t = utils::to_upper(utils::strip_double_quotes(media_type));
    if (t == types::text) {
        return body_type_t::text;
    } else if (t == "MULTIPART") {
        return body_type_t::multipart;
    } else if (t == types::message) {
        return body_type_t::message;
    } else if (t == types::application) {
        return body_type_t::application;
    } else if (t == types::audio) {
        return body_type_t::audio;
    } else if (t == types::image) {
        return body_type_t::image;
    } else if (t == types::video) {
        return body_type_t::video;
    } else if (t == types::model) {
        return body_type_t::model;
    }
    return body_type_t::other;
}

transfer_encoding_t transfer_encoding_from_string(std::string_view encoding) {
    namespace encodings = imap_structure::standard_field_encodings;
    const auto e = utils::to_upper(utils::strip_double_quotes(encoding));
    if (e.empty() || e == "NIL" || e == encodings::enc_7bit) {
        return transfer_encoding_t::enc_7bit;
    } else if (e == encodings::enc_8bit) {
        return transfer_encoding_t::enc_8bit;
    } else if (e == encodings::enc_binary) {
        return transfer_encoding_t::binary;
    } else if (e == encodings::enc_base64) {
        return transfer_encoding_t::base64;
    } else if (e == encodings::enc_quoted_pritable) {
        return transfer_encoding_t::quoted_printable;
    }
    return transfer_encoding_t::other;
}

std::string_view to_string(body_type_t t) {
    switch (t) {
        case body_type_t::text:
            return "text";
        case body_type_t::multipart:
            return "multipart";
        case body_type_t::message:
            return "message";
        case body_type_t::application:
            return "application";
        case body_type_t::audio:
            return "audio";
        case body_type_t::image:
            return "image";
        case body_type_t::video:
            return "video";
        case body_type_t::model:
            return "model";
        case body_type_t::other:
            return "other";
    }
    return "unknown";
}

std::string_view to_string(transfer_encoding_t e) {
    switch (e) {
        case transfer_encoding_t::enc_7bit:
            return "7bit";
        case transfer_encoding_t::enc_8bit:
            return "8bit";
        case transfer_encoding_t::binary:
            return "binary";
        case transfer_encoding_t::base64:
            return "base64";
        case transfer_encoding_t::quoted_printable:
            return "quoted-printable";
        case transfer_encoding_t::other:
            return "other";
    }
    return "unknown";
}

namespace {

bool is_nil(std::string_view raw) {
    return raw == "NIL" || raw == "nil";
}

std::optional<std::string> nstring(std::string_view raw) {
    if (is_nil(raw)) {
        return std::nullopt;
    }
    auto s = utils::strip_double_quotes(raw);
    if (s.empty()) {
        return std::nullopt;
    }
    return std::string{s};
}

expected<std::vector<part_param_t>> convert_params(
    const std::vector<imap_structure::param_value_t>& params,
    const std::string& path) {
    std::vector<part_param_t> result;
    for (auto& [attribute, value] : params) {
        auto attr = nstring(attribute);
        if (!attr) {
            log_error("part {}: parameter without attribute (value '{}')", path, value);
            return unexpected(make_error_code(mailbox_errc::unexpected_structure));
        }
        result.push_back(part_param_t{*attr, nstring(value).value_or("")});
    }
    return result;
}

expected<void> apply_disposition(part_descriptor_t& part,
                                 const std::optional<imap_structure::BodyFieldDSP>& dsp,
                                 const std::string& path) {
    if (!dsp) {
        return {};
    }

    auto disposition = nstring(dsp->field_dsp_string);
    if (!disposition) {
        if (!dsp->field_params.empty()) {
            log_error("part {}: disposition parameters present but disposition type is not",
                      path);
            return unexpected(make_error_code(mailbox_errc::unexpected_structure));
        }
        return {};
    }

    auto dparams_or_err = convert_params(dsp->field_params, path);
    if (!dparams_or_err) {
        return unexpected(dparams_or_err.error());
    }

    part.disposition = std::move(*disposition);
    part.dparams = std::move(*dparams_or_err);
    return {};
}

expected<void> apply_body_fields(part_descriptor_t& part,
                                 const imap_structure::BodyFields& fields,
                                 const std::string& path) {
    auto params_or_err = convert_params(fields.params, path);
    if (!params_or_err) {
        return unexpected(params_or_err.error());
    }
    part.params = std::move(*params_or_err);
    part.id = nstring(fields.field_id);
    part.description = nstring(fields.field_desc);
    part.encoding = transfer_encoding_from_string(fields.encoding);
    part.octets = fields.octets;
    return {};
}

expected<std::string> required_subtype(std::string_view raw, const std::string& path) {
    auto subtype = nstring(raw);
    if (!subtype) {
        log_error("part {}: missing media subtype", path);
        return unexpected(make_error_code(mailbox_errc::unexpected_structure));
    }
    return utils::to_upper(*subtype);
}

expected<part_descriptor_t> ingest(const imap_structure::Body& body, const std::string& path);

expected<part_descriptor_t> ingest_1part(const imap_structure::BodyType1Part& one_part,
                                         const std::string& path) {
    part_descriptor_t part;

    auto filled_or_err = std::visit(
        overload{
            [&](const imap_structure::BodyTypeText& text) -> expected<void> {
                part.type = body_type_t::text;
                auto subtype_or_err = required_subtype(text.media_subtype, path);
                if (!subtype_or_err) {
                    return unexpected(subtype_or_err.error());
                }
                part.subtype = std::move(*subtype_or_err);
                return apply_body_fields(part, text.body_fields, path);
            },
            [&](const imap_structure::BodyTypeBasic& basic) -> expected<void> {
                part.type = body_type_from_string(basic.media_type);
                auto subtype_or_err = required_subtype(basic.media_subtype, path);
                if (!subtype_or_err) {
                    return unexpected(subtype_or_err.error());
                }
                part.subtype = std::move(*subtype_or_err);
                return apply_body_fields(part, basic.body_fields, path);
            },
            [&](const imap_structure::BodyTypeMsg& msg) -> expected<void> {
                part.type = body_type_t::message;
                auto subtype_or_err = required_subtype(msg.media_subtype, path);
                if (!subtype_or_err) {
                    return unexpected(subtype_or_err.error());
                }
                part.subtype = std::move(*subtype_or_err);
                auto fields_or_err = apply_body_fields(part, msg.body_fields, path);
                if (!fields_or_err) {
                    return fields_or_err;
                }
                auto nested_or_err = ingest(msg.body, path + ".msg");
                if (!nested_or_err) {
                    return unexpected(nested_or_err.error());
                }
                part.parts.emplace_back(std::move(*nested_or_err));
                return {};
            }},
        one_part.part_body);
    if (!filled_or_err) {
        return unexpected(filled_or_err.error());
    }

    if (one_part.part_body_ext) {
        auto dsp_or_err = apply_disposition(part, one_part.part_body_ext->body_field_dsp, path);
        if (!dsp_or_err) {
            return unexpected(dsp_or_err.error());
        }
    }

    return part;
}

expected<part_descriptor_t> ingest_mpart(const imap_structure::BodyTypeMPart& mpart,
                                         const std::string& path) {
    part_descriptor_t part;
    part.type = body_type_t::multipart;

    auto subtype_or_err = required_subtype(mpart.media_subtype, path);
    if (!subtype_or_err) {
        return unexpected(subtype_or_err.error());
    }
    part.subtype = std::move(*subtype_or_err);

    if (mpart.body_ptrs.empty()) {
        log_error("part {}: multipart/{} without parts", path, part.subtype);
        return unexpected(make_error_code(mailbox_errc::unexpected_structure));
    }

    for (size_t i = 0; i < mpart.body_ptrs.size(); ++i) {
        auto child_or_err = ingest(mpart.body_ptrs[i], fmt::format("{}.{}", path, i + 1));
        if (!child_or_err) {
            return unexpected(child_or_err.error());
        }
        part.parts.emplace_back(std::move(*child_or_err));
    }

    if (mpart.multipart_body_ext) {
        auto params_or_err = convert_params(mpart.multipart_body_ext->body_fld_params, path);
        if (!params_or_err) {
            return unexpected(params_or_err.error());
        }
        part.params = std::move(*params_or_err);

        auto dsp_or_err = apply_disposition(part, mpart.multipart_body_ext->body_field_dsp, path);
        if (!dsp_or_err) {
            return unexpected(dsp_or_err.error());
        }
    }

    return part;
}

expected<part_descriptor_t> ingest(const imap_structure::Body& body, const std::string& path) {
    return std::visit(
        overload{[&](const std::unique_ptr<imap_structure::BodyType1Part>& one_part)
                     -> expected<part_descriptor_t> {
                     if (!one_part) {
                         log_error("part {}: null body", path);
                         return unexpected(make_error_code(mailbox_errc::unexpected_structure));
                     }
                     return ingest_1part(*one_part, path);
                 },
                 [&](const std::unique_ptr<imap_structure::BodyTypeMPart>& mpart)
                     -> expected<part_descriptor_t> {
                     if (!mpart) {
                         log_error("part {}: null multipart body", path);
                         return unexpected(make_error_code(mailbox_errc::unexpected_structure));
                     }
                     return ingest_mpart(*mpart, path);
                 }},
        body);
}

}  // namespace

expected<part_descriptor_t> make_part_descriptor(const imap_structure::Body& body) {
    return ingest(body, "root");
}

}  // namespace inboxkit::mime
