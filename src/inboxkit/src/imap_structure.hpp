#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// BODYSTRUCTURE as a protocol backend hands it over (RFC 3501, 7.4.2). Strings are kept the way
// the server sent them: possibly quoted, possibly NIL.
namespace inboxkit::imap_structure {

namespace standard_basic_media_types {
static const std::string application = "APPLICATION";
static const std::string audio = "AUDIO";
static const std::string image = "IMAGE";
static const std::string message = "MESSAGE";
static const std::string video = "VIDEO";
static const std::string model = "MODEL";
static const std::string text = "TEXT";
}  // namespace standard_basic_media_types

namespace standard_field_encodings {
static const std::string enc_7bit = "7BIT";
static const std::string enc_8bit = "8BIT";
static const std::string enc_binary = "BINARY";
static const std::string enc_base64 = "BASE64";
static const std::string enc_quoted_pritable = "QUOTED-PRINTABLE";
}  // namespace standard_field_encodings

using param_value_t = std::pair<std::string, std::string>;

struct BodyFields {
    std::vector<param_value_t> params;  // body-fld-param

    std::string field_id;    // body-fld-id
    std::string field_desc;  // body-fld-desc
    std::string encoding;    // body-fld-enc (see standard_field_encodings)
    uint32_t octets = 0;     // body-fld-octets
};

// body-type-text  = media-text SP body-fields SP body-fld-lines
struct BodyTypeText {
    std::string media_subtype;
    BodyFields body_fields;
    uint32_t lines = 0;
};

// body-type-basic = media-basic SP body-fields ; MESSAGE subtype MUST NOT be "RFC822"
struct BodyTypeBasic {
    std::string media_type;
    std::string media_subtype;
    BodyFields body_fields;
};

struct BodyType1Part;
struct BodyTypeMPart;

using Body = std::variant<std::unique_ptr<BodyType1Part>, std::unique_ptr<BodyTypeMPart>>;

// body-type-msg   = media-message SP body-fields SP envelope SP body SP body-fld-lines
// The envelope is not kept here, headers are fetched separately.
struct BodyTypeMsg {
    std::string media_subtype = "RFC822";
    BodyFields body_fields;
    Body body;
    uint32_t lines = 0;
};

struct BodyFieldDSP {
    std::string field_dsp_string;
    std::vector<param_value_t> field_params;
};

// body-ext-1part  = body-fld-md5 [SP body-fld-dsp [SP body-fld-lang [SP body-fld-loc *(SP
// body-extension)]]]
struct BodyExt1Part {
    std::string md5;
    std::optional<BodyFieldDSP> body_field_dsp;
};

// body-ext-mpart  = body-fld-param [SP body-fld-dsp [SP body-fld-lang [SP body-fld-loc *(SP
// body-extension)]]]
struct BodyExtMPart {
    std::vector<param_value_t> body_fld_params;
    std::optional<BodyFieldDSP> body_field_dsp;
};

// body-type-1part = (body-type-text / body-type-basic / body-type-msg) [SP body-ext-1part]
struct BodyType1Part {
    std::variant<BodyTypeText, BodyTypeBasic, BodyTypeMsg> part_body;
    std::optional<BodyExt1Part> part_body_ext;
};

// body-type-mpart = 1*body SP media-subtype [SP body-ext-mpart]
struct BodyTypeMPart {
    std::vector<Body> body_ptrs;
    std::string media_subtype;
    std::optional<BodyExtMPart> multipart_body_ext;
};

}  // namespace inboxkit::imap_structure
