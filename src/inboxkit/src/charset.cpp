#include "charset.hpp"
#include "utils.hpp"

#include <gmime/gmime.h>
#include <iconv.h>
#include <scope_guard/scope_guard.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <set>

namespace inboxkit::charset {

namespace {
const std::set<std::string, std::less<>> supported_encodings = {
    "UTF-8",        "UTF-7",        "UTF7-IMAP",    "ASCII",        "US-ASCII",
    "UTF-16",       "UTF-16BE",     "UTF-16LE",     "UTF-32",       "UTF-32BE",
    "UTF-32LE",     "UCS-2",        "UCS-2BE",      "UCS-2LE",      "UCS-4",
    "ISO-8859-1",   "ISO-8859-2",   "ISO-8859-3",   "ISO-8859-4",   "ISO-8859-5",
    "ISO-8859-6",   "ISO-8859-7",   "ISO-8859-8",   "ISO-8859-9",   "ISO-8859-10",
    "ISO-8859-13",  "ISO-8859-14",  "ISO-8859-15",  "ISO-8859-16",  "WINDOWS-1250",
    "WINDOWS-1251", "WINDOWS-1252", "WINDOWS-1253", "WINDOWS-1254", "WINDOWS-1255",
    "WINDOWS-1256", "WINDOWS-1257", "WINDOWS-1258", "CP1250",       "CP1251",
    "CP1252",       "CP866",        "CP850",        "CP936",        "CP949",
    "CP950",        "KOI8-R",       "KOI8-U",       "EUC-JP",       "SJIS",
    "SHIFT_JIS",    "ISO-2022-JP",  "EUC-KR",       "ISO-2022-KR",  "UHC",
    "BIG5",         "BIG-5",        "EUC-CN",       "EUC-TW",       "GB18030",
    "GB2312",       "HZ",           "ARMSCII-8",
};

bool passes_through(std::string_view from_charset) {
    const auto lower = utils::to_lower(from_charset);
    return lower.find("default") != std::string::npos || lower.find("ascii") != std::string::npos;
}

const char* iconv_name(const std::string& charset) {
    const char* name = g_mime_charset_iconv_name(charset.c_str());
    return name ? name : charset.c_str();
}
}  // namespace

std::string convert_string_encoding(std::string_view text,
                                    std::string_view from_charset,
                                    std::string_view to_charset) {
    if (passes_through(from_charset) || text.empty() || utils::iequals(from_charset, to_charset)) {
        return std::string{text};
    }

    const std::string from{from_charset};
    const std::string to{to_charset};
    const std::string to_spec = std::string{iconv_name(to)} + "//TRANSLIT//IGNORE";

    iconv_t cd = iconv_open(to_spec.c_str(), iconv_name(from));
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        log_warning("no conversion from '{}' to '{}': {}", from, to, std::strerror(errno));
        return std::string{text};
    }
    auto cd_guard = sg::make_scope_guard([cd] { iconv_close(cd); });

    std::string converted;
    converted.reserve(text.size());

    std::array<char, 4096> chunk;
    char* in_ptr = const_cast<char*>(text.data());
    size_t in_left = text.size();

    while (in_left > 0) {
        char* out_ptr = chunk.data();
        size_t out_left = chunk.size();
        const size_t rc = iconv(cd, &in_ptr, &in_left, &out_ptr, &out_left);
        converted.append(chunk.data(), chunk.size() - out_left);

        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) {
                continue;
            } else if (errno == EILSEQ || errno == EINVAL) {
                if (in_left > 0) {
                    ++in_ptr;
                    --in_left;
                }
                continue;
            }
            log_warning("converting from '{}' to '{}' failed: {}", from, to, std::strerror(errno));
            return std::string{text};
        }
    }

    char* out_ptr = chunk.data();
    size_t out_left = chunk.size();
    if (iconv(cd, nullptr, nullptr, &out_ptr, &out_left) != static_cast<size_t>(-1)) {
        converted.append(chunk.data(), chunk.size() - out_left);
    }

    if (converted.empty()) {
        return std::string{text};
    }

    return converted;
}

bool is_supported_encoding(std::string_view name) {
    return supported_encodings.find(name) != supported_encodings.end();
}

}  // namespace inboxkit::charset
