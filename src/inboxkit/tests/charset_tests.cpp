#include <inboxkit/charset.hpp>

#include <gtest/gtest.h>

namespace {

using namespace inboxkit;

TEST(charset_test, converts_latin1_to_utf8) {
    EXPECT_EQ(charset::convert_string_encoding("Kr\xe4tzig", "ISO-8859-1", "UTF-8"), "Krätzig");
    EXPECT_EQ(charset::convert_string_encoding("caf\xe9", "iso-8859-1", "utf-8"), "café");
}

TEST(charset_test, converts_utf8_to_cyrillic_single_byte) {
    EXPECT_EQ(charset::convert_string_encoding("Привет", "UTF-8", "WINDOWS-1251"),
              "\xcf\xf0\xe8\xe2\xe5\xf2");
    EXPECT_EQ(charset::convert_string_encoding("\xcf\xf0\xe8\xe2\xe5\xf2", "WINDOWS-1251", "UTF-8"),
              "Привет");
}

TEST(charset_test, passes_text_through) {
    // same charsets
    EXPECT_EQ(charset::convert_string_encoding("caf\xe9", "ISO-8859-1", "iso-8859-1"), "caf\xe9");
    // ascii and default charsets are never converted
    EXPECT_EQ(charset::convert_string_encoding("plain", "us-ascii", "UTF-8"), "plain");
    EXPECT_EQ(charset::convert_string_encoding("plain", "default", "UTF-8"), "plain");
    EXPECT_EQ(charset::convert_string_encoding("", "ISO-8859-1", "UTF-8"), "");
    // unknown charsets
    EXPECT_EQ(charset::convert_string_encoding("text", "X-NO-SUCH-CHARSET", "UTF-8"), "text");
}

TEST(charset_test, supported_encodings) {
    for (auto name : {"UTF-7", "UTF7-IMAP", "UTF-8", "ASCII", "US-ASCII", "ISO-8859-1",
                      "WINDOWS-1251", "KOI8-R"}) {
        EXPECT_TRUE(charset::is_supported_encoding(name)) << name;
    }
    for (auto name : {"UTF7", "UTF-7-IMAP", "UTF-7IMAP", "UTF8", "USASCII", "ASC11",
                      "ISO-8859-0", "ISO-8855-1", "ISO-8859", ""}) {
        EXPECT_FALSE(charset::is_supported_encoding(name)) << name;
    }
}

}  // namespace
