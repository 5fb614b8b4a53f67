#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace inboxkit::utf8_codec {

bool encode_point(uint32_t cp, char* buff, size_t buff_size, size_t& bytes_written);
bool append_codepoint(std::string& s, uint32_t codepoint);

// Decodes one code point from the head of s. Rejects overlong forms, surrogates and truncated
// sequences.
bool decode_point(std::string_view s, uint32_t& cp, size_t& bytes_read);

}  // namespace inboxkit::utf8_codec
