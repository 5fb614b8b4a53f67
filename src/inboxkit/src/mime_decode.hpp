#pragma once

#include <inboxkit/global.hpp>

namespace inboxkit::mime {

// Decodes RFC 2047 encoded-words found in text. Plain runs are copied unchanged. Words declared
// as UTF-8 stay UTF-8, other charsets are converted to to_charset.
std::string decode_mime_str(std::string_view text, std::string_view to_charset = "UTF-8");

// Decodes a charset'language'percent-data parameter value. Values that do not look like that are
// returned unchanged.
std::string decode_rfc2231(std::string_view text, std::string_view to_charset = "UTF-8");

}  // namespace inboxkit::mime
