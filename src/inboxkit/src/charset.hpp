#pragma once

#include <inboxkit/global.hpp>

namespace inboxkit::charset {

// Converts text between charsets with transliteration, skipping input that can not be converted.
// Returns text unchanged when from is "default"/ascii-like, when text is empty, when both
// charsets are the same, or when conversion fails or produces nothing.
std::string convert_string_encoding(std::string_view text,
                                    std::string_view from_charset,
                                    std::string_view to_charset);

// Whether name (already trimmed and upper-cased) is an encoding we accept as server encoding.
bool is_supported_encoding(std::string_view name);

}  // namespace inboxkit::charset
