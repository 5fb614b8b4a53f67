#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <inboxkit/part_flattener.hpp>

#include "test_backends.hpp"

using namespace inboxkit;
using namespace inboxkit::testing;
using namespace ::testing;

namespace {

std::vector<std::string> keys_of(const std::vector<mime::flattened_part_t>& parts) {
    std::vector<std::string> keys;
    for (auto& p : parts) {
        keys.push_back(p.key);
    }
    return keys;
}

mime::part_descriptor_t attachment(std::string subtype, std::string filename) {
    return parts::leaf(mime::body_type_t::application, std::move(subtype),
                       mime::transfer_encoding_t::base64, {}, "attachment",
                       {{"filename", std::move(filename)}});
}

}  // namespace

TEST(part_flattener_test, numbers_top_level_parts_from_one) {
    auto flat =
        mime::flatten_parts({parts::text_plain(), parts::text_html(), attachment("PDF", "a.pdf")});

    EXPECT_THAT(keys_of(flat), ElementsAre("1", "2", "3"));
    EXPECT_EQ(flat[2].descriptor.subtype, "PDF");
    for (auto& p : flat) {
        EXPECT_FALSE(p.inside_attached_message);
    }
}

TEST(part_flattener_test, nested_multipart_extends_prefix) {
    auto flat = mime::flatten_parts(
        {parts::multipart("ALTERNATIVE", {parts::text_plain(), parts::text_html()}),
         attachment("ZIP", "a.zip")});

    EXPECT_THAT(keys_of(flat), ElementsAre("1", "1.1", "1.2", "2"));
    EXPECT_FALSE(flat[0].descriptor.is_container());
    EXPECT_EQ(flat[2].descriptor.subtype, "HTML");
}

TEST(part_flattener_test, message_part_restarts_numbering) {
    auto attached = parts::container(
        mime::body_type_t::message, "RFC822",
        {parts::multipart("MIXED", {parts::text_plain(), attachment("PDF", "inner.pdf")})},
        "attachment");

    auto flat = mime::flatten_parts({parts::text_plain(), std::move(attached)});

    EXPECT_THAT(keys_of(flat), ElementsAre("1", "2", "2.0", "2.1", "2.2"));
    EXPECT_FALSE(flat[1].inside_attached_message);
    EXPECT_TRUE(flat[2].inside_attached_message);
    EXPECT_TRUE(flat[3].inside_attached_message);
    EXPECT_TRUE(flat[4].inside_attached_message);
}

TEST(part_flattener_test, inline_message_is_not_attached) {
    auto forwarded = parts::container(mime::body_type_t::message, "RFC822",
                                      {parts::text_plain()}, "inline");

    auto flat = mime::flatten_parts({std::move(forwarded)});

    EXPECT_THAT(keys_of(flat), ElementsAre("1", "1.0"));
    EXPECT_FALSE(flat[1].inside_attached_message);
}

TEST(part_flattener_test, only_rfc822_attachment_marks_children) {
    auto report = parts::container(mime::body_type_t::message, "DELIVERY-STATUS",
                                   {parts::text_plain()}, "attachment");
    auto forwarded = parts::container(mime::body_type_t::message, "rfc822",
                                      {parts::text_plain()}, "Attachment");

    auto flat = mime::flatten_parts({std::move(report), std::move(forwarded)});

    EXPECT_THAT(keys_of(flat), ElementsAre("1", "1.0", "2", "2.0"));
    EXPECT_FALSE(flat[1].inside_attached_message);
    EXPECT_TRUE(flat[3].inside_attached_message);
}

TEST(part_flattener_test, repeated_key_overwrites_in_place) {
    // The second child of the message lands on "1.1" again.
    auto odd_message = parts::container(
        mime::body_type_t::message, "RFC822",
        {parts::multipart("MIXED", {parts::text_plain(), attachment("PDF", "a.pdf")}),
         attachment("ZIP", "b.zip")});

    auto flat = mime::flatten_parts({std::move(odd_message)});

    EXPECT_THAT(keys_of(flat), ElementsAre("1", "1.0", "1.1", "1.2"));
    EXPECT_EQ(flat[2].descriptor.subtype, "ZIP");
    EXPECT_EQ(flat[3].descriptor.subtype, "PDF");
}

TEST(part_flattener_test, empty_input) {
    EXPECT_TRUE(mime::flatten_parts({}).empty());
}
