#include <inboxkit/mime_decode.hpp>

#include <gtest/gtest.h>

namespace {

using namespace inboxkit;

struct decode_sample_t {
    std::string encoded;
    std::string decoded;
};

TEST(mime_decode_test, decodes_encoded_words) {
    const std::vector<decode_sample_t> samples = {
        {"=?iso-8859-1?Q?Sebastian_Kr=E4tzig?= <sebastian.kraetzig@example.com>",
         "Sebastian Krätzig <sebastian.kraetzig@example.com>"},
        {"=?iso-8859-1?Q?Sebastian_Kr=E4tzig?=", "Sebastian Krätzig"},
        {"sebastian.kraetzig", "sebastian.kraetzig"},
        {"=?US-ASCII?Q?Keith_Moore?= <km@ab.example.edu>", "Keith Moore <km@ab.example.edu>"},
        {"=?ISO-8859-1?Q?Max_J=F8rn_Simsen?= <max.joern.s@example.dk>",
         "Max Jørn Simsen <max.joern.s@example.dk>"},
        {"=?ISO-8859-1?Q?Andr=E9?= Pirard <PIRARD@vm1.ulg.ac.be>",
         "André Pirard <PIRARD@vm1.ulg.ac.be>"},
        {"=?ISO-8859-1?B?SWYgeW91IGNhbiByZWFkIHRoaXMgeW8=?=", "If you can read this yo"},
        {"=?ISO-8859-2?B?dSB1bmRlcnN0YW5kIHRoZSBleGFtcGxlLg==?=", "u understand the example."},
        {"=?utf-8?B?0J7QsdC70ZbQutC+0LLQuNC5INC30LDQv9C40YEg?=", "Обліковий запис "},
        {"=?UTF-8?b?0J/RgNC40LLRltGCINGB0LLRltGC?=", "Привіт світ"},
    };

    for (auto& sample : samples) {
        EXPECT_EQ(mime::decode_mime_str(sample.encoded), sample.decoded) << sample.encoded;
    }
}

TEST(mime_decode_test, whitespace_between_encoded_words) {
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a?=)"), "(a)");
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a?= b)"), "(a b)");
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a?= =?ISO-8859-1?Q?b?=)"), "(ab)");
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a?=  =?ISO-8859-1?Q?b?=)"), "(ab)");
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a?=\r\n    =?ISO-8859-1?Q?b?=)"), "(ab)");
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a_b?=)"), "(a b)");
    EXPECT_EQ(mime::decode_mime_str("(=?ISO-8859-1?Q?a?= =?ISO-8859-2?Q?_b?=)"), "(a b)");
}

TEST(mime_decode_test, joins_multibyte_sequence_split_between_words) {
    // "й" is D0 B9, split between two words
    EXPECT_EQ(mime::decode_mime_str("=?UTF-8?Q?=D0?= =?UTF-8?Q?=B9?="), "й");
}

TEST(mime_decode_test, keeps_blank_and_malformed_input) {
    EXPECT_EQ(mime::decode_mime_str("   "), "   ");
    EXPECT_EQ(mime::decode_mime_str(""), "");
    EXPECT_EQ(mime::decode_mime_str("=?broken"), "=?broken");
    EXPECT_EQ(mime::decode_mime_str("=?UTF-8?X?abc?="), "=?UTF-8?X?abc?=");
    EXPECT_EQ(mime::decode_mime_str("=?UTF-8?Q?with space?="), "=?UTF-8?Q?with space?=");
}

TEST(mime_decode_test, converts_to_requested_charset) {
    EXPECT_EQ(mime::decode_mime_str("=?KOI8-R?B?8NLJ18XU?=", "UTF-8"), "Привет");
    EXPECT_EQ(mime::decode_mime_str("=?ISO-8859-1?Q?caf=E9?=", "ISO-8859-1"), "caf\xe9");
    // utf-8 words stay utf-8
    EXPECT_EQ(mime::decode_mime_str("=?UTF-8?Q?caf=C3=A9?=", "ISO-8859-1"), "café");
}

TEST(mime_decode_test, decodes_rfc2231_values) {
    EXPECT_EQ(mime::decode_rfc2231("utf-8''%D0%A2%D0%B5%D1%81%D1%82.txt"), "Тест.txt");
    EXPECT_EQ(mime::decode_rfc2231("iso-8859-1'en'caf%E9.txt"), "café.txt");
    EXPECT_EQ(mime::decode_rfc2231("plain.txt"), "plain.txt");
    EXPECT_EQ(mime::decode_rfc2231("it's.txt"), "it's.txt");
    EXPECT_EQ(mime::decode_rfc2231("utf-8''no-escapes.txt"), "utf-8''no-escapes.txt");
}

TEST(mime_decode_test, rfc2231_decode_is_idempotent_on_plain_names) {
    for (std::string name : {"plain.txt", "it's.txt", "o'brien's notes.txt"}) {
        EXPECT_EQ(mime::decode_rfc2231(mime::decode_rfc2231(name)), name);
    }
    const auto once = mime::decode_rfc2231("utf-8''%D0%A2%D0%B5%D1%81%D1%82.txt");
    EXPECT_EQ(mime::decode_rfc2231(once), once);
}

}  // namespace
