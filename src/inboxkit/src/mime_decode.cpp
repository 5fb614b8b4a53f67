#include "mime_decode.hpp"
#include "charset.hpp"
#include "utils.hpp"

#include <cctype>
#include <optional>

namespace inboxkit::mime {

namespace {

// Charset of text that is not inside an encoded-word.
constexpr std::string_view default_charset = "default";

struct decoded_element_t {
    std::string charset;
    std::string text;
};

std::string decode_q(std::string_view s) {
    std::string res;
    res.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '_') {
            res += ' ';
        } else if (s[i] == '=' && i + 2 < s.size() &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            res += static_cast<char>(std::stoi(std::string{s.substr(i + 1, 2)}, nullptr, 16));
            i += 2;
        } else {
            res += s[i];
        }
    }
    return res;
}

// Parses "=?charset?E?text?=" at the head of s.
std::optional<std::pair<decoded_element_t, size_t>> parse_encoded_word(std::string_view s) {
    // Example: =?UTF-8?B?0J7QsdC70ZbQutC+0LLQuNC5INC30LDQv9C40YEg?=
    if (!utils::starts_with(s, "=?")) {
        return std::nullopt;
    }

    const size_t charset_end = s.find('?', 2);
    if (charset_end == std::string_view::npos || charset_end == 2) {
        return std::nullopt;
    }
    if (charset_end + 2 >= s.size() || s[charset_end + 2] != '?') {
        return std::nullopt;
    }
    const char encoding =
        static_cast<char>(std::toupper(static_cast<unsigned char>(s[charset_end + 1])));
    const size_t text_begin = charset_end + 3;
    const size_t text_end = s.find("?=", text_begin);
    if (text_end == std::string_view::npos) {
        return std::nullopt;
    }

    auto charset = s.substr(2, charset_end - 2);
    auto encoded_text = s.substr(text_begin, text_end - text_begin);
    if (charset.find_first_of(" \t\r\n") != std::string_view::npos ||
        encoded_text.find_first_of(" \t\r\n") != std::string_view::npos) {
        return std::nullopt;
    }

    // RFC 2231 allows a language suffix: =?utf-8*en?Q?...?=
    if (auto star = charset.find('*'); star != std::string_view::npos) {
        charset = charset.substr(0, star);
    }

    decoded_element_t element;
    element.charset = std::string{charset};
    if (encoding == 'B') {
        element.text = utils::base64_lenient_decode(encoded_text);
    } else if (encoding == 'Q') {
        element.text = decode_q(encoded_text);
    } else {
        log_debug("unsupported encoding in encoded-word: '{}'", encoding);
        return std::nullopt;
    }

    return std::pair{std::move(element), text_end + 2};
}

std::vector<decoded_element_t> split_elements(std::string_view s) {
    std::vector<decoded_element_t> elements;
    std::string plain;
    bool previous_was_word = false;

    auto flush_plain = [&](bool before_word) {
        if (plain.empty()) {
            return;
        }
        // Whitespace between two adjacent encoded-words is not part of the text.
        if (!(previous_was_word && before_word && utils::is_blank(plain))) {
            elements.push_back({std::string{default_charset}, plain});
        }
        plain.clear();
    };

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '=' && i + 1 < s.size() && s[i + 1] == '?') {
            if (auto word = parse_encoded_word(s.substr(i))) {
                flush_plain(true);
                auto& [element, consumed] = *word;
                if (!elements.empty() && previous_was_word &&
                    utils::iequals(elements.back().charset, element.charset)) {
                    // Same charset words are joined so multibyte characters split across words
                    // survive conversion.
                    elements.back().text += element.text;
                } else {
                    elements.push_back(std::move(element));
                }
                previous_was_word = true;
                i += consumed;
                continue;
            }
        }

        plain += s[i];
        if (!std::isspace(static_cast<unsigned char>(s[i]))) {
            previous_was_word = false;
        }
        ++i;
    }
    flush_plain(false);

    return elements;
}

}  // namespace

std::string decode_mime_str(std::string_view text, std::string_view to_charset) {
    if (utils::is_blank(text)) {
        return std::string{text};
    }

    std::string result;
    for (auto& element : split_elements(text)) {
        if (element.charset == default_charset) {
            result += element.text;
            continue;
        }

        const auto lower = utils::to_lower(element.charset);
        const bool keep_utf8 =
            lower.find("utf-8") != std::string::npos || lower.find("default") != std::string::npos;
        result += charset::convert_string_encoding(element.text, element.charset,
                                                   keep_utf8 ? "UTF-8" : to_charset);
    }

    return result;
}

std::string decode_rfc2231(std::string_view text, std::string_view to_charset) {
    // charset'language'data, both apostrophes are required.
    const size_t first = text.find('\'');
    if (first == std::string_view::npos) {
        return std::string{text};
    }
    const size_t second = text.find('\'', first + 1);
    if (second == std::string_view::npos) {
        return std::string{text};
    }

    const auto encoding = text.substr(0, first);
    const auto data = text.substr(second + 1);
    if (!utils::is_url_encoded(data)) {
        return std::string{text};
    }

    return charset::convert_string_encoding(utils::url_decode(data), encoding, to_charset);
}

}  // namespace inboxkit::mime
