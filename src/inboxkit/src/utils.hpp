#pragma once
#include <inboxkit/global.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace inboxkit::utils {

std::vector<std::string_view> split_views(std::string_view s, char delimiter);

// Strips spaces, tabs, CR, LF, NUL and vertical tabs from both ends.
std::string trim(std::string_view s);
// Strips any of the characters in chars from both ends.
std::string trim(std::string_view s, std::string_view chars);
bool is_blank(std::string_view s);

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);
bool iequals(std::string_view a, std::string_view b);

std::string base64_naive_decode(const std::string& s);
// Drops everything outside of the base64 alphabet before decoding, so CRLFs and other injected
// characters do not break the output.
std::string base64_lenient_decode(std::string_view s);

// Modified UTF-7 from RFC 3501 (5.1.3) used for mailbox names. Returns utf8.
expected<std::string> decode_imap_utf7(std::string_view s);
expected<std::string> encode_imap_utf7(std::string_view utf8);

// Percent-decoding with '+' meaning space. Malformed escapes are kept as is.
std::string url_decode(std::string_view s);
// True when s has only url-safe characters and at least one %XX escape.
bool is_url_encoded(std::string_view s);

std::string_view strip_double_quotes(std::string_view s);

template <class StringOrStringView>
bool starts_with(const StringOrStringView& s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace inboxkit::utils
