#include "utils.hpp"

#include "mailbox_errors.hpp"
#include "utf8_codec.hpp"

#include <b64/decode.h>

#include <utf7/utf7.h>

#include <algorithm>
#include <cctype>

namespace inboxkit::utils {

std::vector<std::string_view> split_views(std::string_view s, char delimiter) {
    std::vector<std::string_view> r;
    bool in_word = false;
    size_t tok_start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == delimiter) {
            if (in_word) {
                in_word = false;
                r.emplace_back(&s[tok_start], i - tok_start);
            } else {
                // keep eating delimiters
            }
        } else {
            if (!in_word) {
                tok_start = i;
                in_word = true;
            }
        }
    }

    if (in_word) {
        r.emplace_back(&s[tok_start], s.length() - tok_start);
    }

    return r;
}

std::string trim(std::string_view s, std::string_view chars) {
    const size_t begin = s.find_first_not_of(chars);
    if (begin == std::string_view::npos) {
        return {};
    }
    const size_t end = s.find_last_not_of(chars);
    return std::string{s.substr(begin, end - begin + 1)};
}

std::string trim(std::string_view s) {
    return trim(s, std::string_view(" \t\n\r\v\0", 6));
}

bool is_blank(std::string_view s) {
    return trim(s).empty();
}

std::string to_lower(std::string_view s) {
    std::string r{s};
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

std::string to_upper(std::string_view s) {
    std::string r{s};
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return r;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string base64_naive_decode(const std::string& s) {
    std::string res(base64::base64_decode_maxlength(s.size()), 0);
    base64::base64_decodestate state;
    base64::base64_init_decodestate(&state);
    const size_t output_size = base64::base64_decode_block(s.data(), s.size(), res.data(), &state);
    res.resize(output_size);
    return res;
}

std::string base64_lenient_decode(std::string_view s) {
    std::string filtered;
    filtered.reserve(s.size());
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=') {
            filtered += c;
        }
    }
    return base64_naive_decode(filtered);
}

namespace {

bool is_imap_utf7_direct(unsigned char c) {
    return c >= 0x20 && c <= 0x7e;
}

// Decodes one "&...-" shift sequence (without the delimiters).
expected<std::string> decode_imap_utf7_chunk(std::string_view chunk) {
    // https://datatracker.ietf.org/doc/html/rfc3501#section-5.1.3
    // https://datatracker.ietf.org/doc/html/rfc2152
    std::string s;
    s.reserve(chunk.size() + 2);
    s += '+';
    for (char c : chunk) {
        s += c == ',' ? '/' : c;
    }
    s += '-';

    struct utf7 ctx;

    utf7_init(&ctx, nullptr);
    ctx.buf = s.data();
    ctx.len = s.size();

    std::string res;
    long pending_high_surrogate = -1;

    while (true) {
        long ret = utf7_decode(&ctx);

        if (ret == UTF7_OK) {
            if (pending_high_surrogate >= 0) {
                log_error("imap-utf7 input ends with a lone high surrogate: '{}'", chunk);
                return unexpected(make_error_code(mailbox_errc::invalid_parameter));
            }
            break;
        } else if (ret == UTF7_INCOMPLETE) {
            log_error("incomplete imap-utf7 input: '{}'", chunk);
            return unexpected(make_error_code(mailbox_errc::invalid_parameter));
        } else if (ret == UTF7_INVALID) {
            log_error("invalid imap-utf7 input: '{}'", chunk);
            return unexpected(make_error_code(mailbox_errc::invalid_parameter));
        } else if (ret >= 0xD800 && ret <= 0xDBFF && pending_high_surrogate < 0) {
            pending_high_surrogate = ret;
        } else if (ret >= 0xDC00 && ret <= 0xDFFF && pending_high_surrogate >= 0) {
            const long cp = 0x10000 + ((pending_high_surrogate - 0xD800) << 10) + (ret - 0xDC00);
            utf8_codec::append_codepoint(res, static_cast<uint32_t>(cp));
            pending_high_surrogate = -1;
        } else if (pending_high_surrogate >= 0 || (ret >= 0xD800 && ret <= 0xDFFF)) {
            log_error("unpaired surrogate {:#x} in imap-utf7 input: '{}'", ret, chunk);
            return unexpected(make_error_code(mailbox_errc::invalid_parameter));
        } else if (!utf8_codec::append_codepoint(res, static_cast<uint32_t>(ret))) {
            log_error("code point {:#x} out of range in imap-utf7 input: '{}'", ret, chunk);
            return unexpected(make_error_code(mailbox_errc::invalid_parameter));
        }
    }

    return res;
}

expected<std::string> encode_imap_utf7_run(const std::vector<uint32_t>& code_points) {
    std::string buffer(code_points.size() * 8 + 8, '\0');

    struct utf7 ctx;
    utf7_init(&ctx, "\t\r\n");
    ctx.buf = buffer.data();
    ctx.len = buffer.size();

    for (uint32_t cp : code_points) {
        if (utf7_encode(&ctx, static_cast<long>(cp)) != UTF7_OK) {
            log_error("failed encoding code point {:#x} to utf7", cp);
            return unexpected(make_error_code(mailbox_errc::invalid_parameter));
        }
    }
    if (utf7_encode(&ctx, UTF7_FLUSH) != UTF7_OK) {
        log_error("failed flushing utf7 encoder");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    buffer.resize(buffer.size() - ctx.len);

    // RFC 2152 form is "+<base64>[-]", IMAP wants "&<modified base64>-".
    std::string_view b64 = buffer;
    if (!b64.empty() && b64.front() == '+') {
        b64.remove_prefix(1);
    }
    if (!b64.empty() && b64.back() == '-') {
        b64.remove_suffix(1);
    }

    std::string res = "&";
    for (char c : b64) {
        res += c == '/' ? ',' : c;
    }
    res += '-';
    return res;
}

}  // namespace

expected<std::string> decode_imap_utf7(std::string_view s) {
    std::string res;

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            res += s[i++];
            continue;
        }

        const size_t end = s.find('-', i + 1);
        if (end == std::string_view::npos) {
            log_error("not terminated imap-utf7 shift sequence: '{}'", s);
            return unexpected(make_error_code(mailbox_errc::invalid_parameter));
        }

        if (end == i + 1) {
            res += '&';
        } else {
            auto chunk_or_err = decode_imap_utf7_chunk(s.substr(i + 1, end - i - 1));
            if (!chunk_or_err) {
                return unexpected(chunk_or_err.error());
            }
            res += *chunk_or_err;
        }
        i = end + 1;
    }

    return res;
}

expected<std::string> encode_imap_utf7(std::string_view utf8) {
    std::string res;

    size_t i = 0;
    while (i < utf8.size()) {
        const auto c = static_cast<unsigned char>(utf8[i]);
        if (is_imap_utf7_direct(c)) {
            if (c == '&') {
                res += "&-";
            } else {
                res += static_cast<char>(c);
            }
            ++i;
            continue;
        }

        std::vector<uint32_t> run;
        while (i < utf8.size() && !is_imap_utf7_direct(static_cast<unsigned char>(utf8[i]))) {
            uint32_t cp = 0;
            size_t len = 0;
            if (!utf8_codec::decode_point(utf8.substr(i), cp, len)) {
                log_error("invalid utf8 at offset {}", i);
                return unexpected(make_error_code(mailbox_errc::invalid_parameter));
            }
            run.push_back(cp);
            i += len;
        }

        auto encoded_or_err = encode_imap_utf7_run(run);
        if (!encoded_or_err) {
            return unexpected(encoded_or_err.error());
        }
        res += *encoded_or_err;
    }

    return res;
}

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
}  // namespace

std::string url_decode(std::string_view s) {
    std::string res;
    res.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            res += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
                   hex_value(s[i + 2]) >= 0) {
            res += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            res += s[i];
        }
    }
    return res;
}

bool is_url_encoded(std::string_view s) {
    bool has_escape = false;
    for (size_t i = 0; i < s.size(); ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '%' && c != '-' && c != '_' && c != '.' && c != '+') {
            return false;
        }
        if (c == '%' && i + 2 < s.size() && std::isalnum(static_cast<unsigned char>(s[i + 1])) &&
            std::isalnum(static_cast<unsigned char>(s[i + 2]))) {
            has_escape = true;
        }
    }
    return has_escape;
}

std::string_view strip_double_quotes(std::string_view s) {
    if (s.size() >= 2 && s[0] == '"' && s[s.size() - 1] == '"') {
        s.remove_suffix(1);
        s.remove_prefix(1);
        return s;
    } else {
        return s;
    }
}

}  // namespace inboxkit::utils
