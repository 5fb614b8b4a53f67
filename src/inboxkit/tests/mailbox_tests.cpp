#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <inboxkit/mailbox.hpp>
#include <inboxkit/mailbox_errors.hpp>

#include "test_backends.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace inboxkit;
using namespace inboxkit::testing;
using namespace ::testing;

namespace {

MATCHER_P2(search_request_is, criteria, charset, "") {
    return arg.criteria == criteria && arg.charset == charset;
}

class mailbox_test : public Test {
   protected:
    void SetUp() override {
        m_backend = std::make_shared<StrictMock<mock_mailbox_backend_t>>();
        auto mailbox_or_err = mailbox_t::create(m_backend);
        ASSERT_TRUE(mailbox_or_err) << mailbox_or_err.error();
        m_mailbox.emplace(std::move(*mailbox_or_err));
    }

    mailbox_t& mailbox() { return *m_mailbox; }

    std::shared_ptr<StrictMock<mock_mailbox_backend_t>> m_backend;
    std::optional<mailbox_t> m_mailbox;
};

}  // namespace

TEST(mailbox_create_test, requires_backend) {
    auto mailbox_or_err = mailbox_t::create(nullptr);
    ASSERT_FALSE(mailbox_or_err);
    EXPECT_EQ(mailbox_or_err.error(), mailbox_errc::invalid_parameter);
}

TEST(mailbox_create_test, validates_options) {
    auto backend = std::make_shared<fake_mailbox_backend_t>();

    EXPECT_FALSE(mailbox_t::create(backend, mailbox_options_t{.server_encoding = "UTF8"}));
    EXPECT_FALSE(mailbox_t::create(backend, mailbox_options_t{.path_delimiter = ","}));
    EXPECT_FALSE(
        mailbox_t::create(backend, mailbox_options_t{.attachments_dir = "/no/such/inboxkit/dir"}));

    auto mailbox_or_err = mailbox_t::create(
        backend, mailbox_options_t{.server_encoding = " iso-8859-1 ", .path_delimiter = "/"});
    ASSERT_TRUE(mailbox_or_err) << mailbox_or_err.error();
    EXPECT_EQ(mailbox_or_err->server_encoding(), "ISO-8859-1");
    EXPECT_EQ(mailbox_or_err->path_delimiter(), "/");
    EXPECT_EQ(mailbox_or_err->search_option(), search_option_t::uid);
    EXPECT_FALSE(mailbox_or_err->attachments_dir());
}

TEST_F(mailbox_test, server_encoding_validation) {
    for (auto name : {"UTF-7", "UTF7-IMAP", "UTF-8", "ASCII", "US-ASCII", "ISO-8859-1", "utf-8"}) {
        EXPECT_TRUE(mailbox().set_server_encoding(name)) << name;
    }
    for (auto name : {"UTF7", "UTF-7-IMAP", "UTF-7IMAP", "UTF8", "USASCII", "ASC11", "ISO-8859-0",
                      "ISO-8855-1", "ISO-8859"}) {
        auto set_or_err = mailbox().set_server_encoding(name);
        ASSERT_FALSE(set_or_err) << name;
        EXPECT_EQ(set_or_err.error(), mailbox_errc::invalid_parameter);
    }
    // last valid one stays
    EXPECT_EQ(mailbox().server_encoding(), "UTF-8");
}

TEST_F(mailbox_test, path_delimiter_validation) {
    EXPECT_TRUE(mailbox_t::validate_path_delimiter("."));
    EXPECT_TRUE(mailbox_t::validate_path_delimiter("/"));
    for (auto d : {"", ",", "//", "\\", "-"}) {
        EXPECT_FALSE(mailbox_t::validate_path_delimiter(d)) << d;
        EXPECT_FALSE(mailbox().set_path_delimiter(d)) << d;
    }
    EXPECT_EQ(mailbox().path_delimiter(), ".");
}

TEST_F(mailbox_test, attachments_dir_validation) {
    EXPECT_FALSE(mailbox().set_attachments_dir("  "));
    EXPECT_FALSE(mailbox().set_attachments_dir("/no/such/inboxkit/dir"));

    const auto dir = std::filesystem::temp_directory_path() / "inboxkit-mailbox-attachments";
    std::filesystem::create_directories(dir);

    ASSERT_TRUE(mailbox().set_attachments_dir(dir.string() + "/"));
    ASSERT_TRUE(mailbox().attachments_dir());
    EXPECT_EQ(*mailbox().attachments_dir(), std::filesystem::canonical(dir).string());
    EXPECT_EQ(mailbox().assembly_config().attachments_dir, mailbox().attachments_dir());

    std::filesystem::remove_all(dir);
}

TEST_F(mailbox_test, search_uses_server_encoding_unless_disabled) {
    EXPECT_CALL(*m_backend,
                search(search_request_is("UNSEEN", std::optional<std::string>{"UTF-8"})))
        .WillOnce(Return(std::vector<mail_id_t>{4, 5}));
    EXPECT_CALL(*m_backend, search(search_request_is("ALL", std::optional<std::string>{})))
        .WillOnce(Return(std::vector<mail_id_t>{1}));

    auto ids_or_err = mailbox().search_mailbox("UNSEEN");
    ASSERT_TRUE(ids_or_err);
    EXPECT_THAT(*ids_or_err, ElementsAre(4, 5));

    ids_or_err = mailbox().search_mailbox("ALL", true);
    ASSERT_TRUE(ids_or_err);
    EXPECT_THAT(*ids_or_err, ElementsAre(1));
}

TEST_F(mailbox_test, search_from_deduplicates_senders_and_results) {
    const std::optional<std::string> no_charset;
    EXPECT_CALL(*m_backend, search(search_request_is("UNSEEN FROM a@example.com", no_charset)))
        .WillOnce(Return(std::vector<mail_id_t>{1, 2}));
    EXPECT_CALL(*m_backend, search(search_request_is("UNSEEN FROM b@example.com", no_charset)))
        .WillOnce(Return(std::vector<mail_id_t>{2, 3}));

    auto ids_or_err = mailbox().search_mailbox_from(
        "UNSEEN", {"A@Example.com", "a@example.com", "b@example.com"}, true);
    ASSERT_TRUE(ids_or_err) << ids_or_err.error();
    EXPECT_THAT(*ids_or_err, ElementsAre(1, 2, 3));

    auto empty_or_err = mailbox().search_mailbox_from("UNSEEN", {});
    ASSERT_FALSE(empty_or_err);
    EXPECT_EQ(empty_or_err.error(), mailbox_errc::invalid_parameter);
}

TEST_F(mailbox_test, merged_search_keeps_first_occurrence_order) {
    EXPECT_CALL(*m_backend, search(Field(&search_request_t::criteria, "SUBJECT a")))
        .WillOnce(Return(std::vector<mail_id_t>{9, 3}));
    EXPECT_CALL(*m_backend, search(Field(&search_request_t::criteria, "SUBJECT b")))
        .WillOnce(Return(std::vector<mail_id_t>{3, 7}));

    auto ids_or_err = mailbox().search_mailbox_merge_results({"SUBJECT a", "SUBJECT b"});
    ASSERT_TRUE(ids_or_err) << ids_or_err.error();
    EXPECT_THAT(*ids_or_err, ElementsAre(9, 3, 7));
}

TEST_F(mailbox_test, search_failure_is_propagated) {
    EXPECT_CALL(*m_backend, search(_))
        .WillOnce(Return(unexpected(make_error_code(std::errc::connection_reset))));

    auto ids_or_err = mailbox().search_mailbox();
    ASSERT_FALSE(ids_or_err);
    EXPECT_EQ(ids_or_err.error(), std::errc::connection_reset);
}

TEST_F(mailbox_test, sort_passes_criteria_without_charset) {
    EXPECT_CALL(*m_backend, sort(sort_criteria_t::arrival, true,
                                 search_request_is("ALL", std::optional<std::string>{})))
        .WillOnce(Return(std::vector<mail_id_t>{3, 2, 1}));

    auto ids_or_err = mailbox().sort_mails();
    ASSERT_TRUE(ids_or_err);
    EXPECT_THAT(*ids_or_err, ElementsAre(3, 2, 1));
}

TEST_F(mailbox_test, flags_are_stored_by_uid) {
    ASSERT_TRUE(mailbox().set_search_option(search_option_t::sequence));

    InSequence seq;
    EXPECT_CALL(*m_backend, store_flags("1,2,3", "\\Seen", true, true));
    EXPECT_CALL(*m_backend, store_flags("4", "\\Seen", false, true));
    EXPECT_CALL(*m_backend, store_flags("5", "\\Flagged", true, true));
    EXPECT_CALL(*m_backend, store_flags("6", "\\Deleted", true, false));

    EXPECT_TRUE(mailbox().mark_mails_as_read({1, 2, 3}));
    EXPECT_TRUE(mailbox().mark_mail_as_unread(4));
    EXPECT_TRUE(mailbox().mark_mail_as_important(5));
    EXPECT_TRUE(mailbox().delete_mail(6));

    auto empty_or_err = mailbox().set_flag({}, "\\Seen");
    ASSERT_FALSE(empty_or_err);
    EXPECT_EQ(empty_or_err.error(), mailbox_errc::invalid_parameter);
}

TEST_F(mailbox_test, move_and_copy_expunge_afterwards) {
    InSequence seq;
    EXPECT_CALL(*m_backend, move_messages("3:7", "Entw&APw-rfe", true));
    EXPECT_CALL(*m_backend, expunge());
    EXPECT_CALL(*m_backend, copy_messages("8", "Archive", true));
    EXPECT_CALL(*m_backend, expunge());

    EXPECT_TRUE(mailbox().move_mail("3:7", "Entwürfe"));
    EXPECT_TRUE(mailbox().copy_mail("8", "Archive"));
}

TEST_F(mailbox_test, failed_move_does_not_expunge) {
    EXPECT_CALL(*m_backend, move_messages("1", "Trash", true))
        .WillOnce(Return(unexpected(make_error_code(std::errc::permission_denied))));

    EXPECT_FALSE(mailbox().move_mail("1", "Trash"));
}

TEST_F(mailbox_test, mailbox_names_are_relative_to_current) {
    InSequence seq;
    EXPECT_CALL(*m_backend, create_mailbox("Projects"));
    EXPECT_CALL(*m_backend, select_mailbox("INBOX"));
    EXPECT_CALL(*m_backend, create_mailbox("INBOX.Entw&APw-rfe"));
    EXPECT_CALL(*m_backend, rename_mailbox("INBOX.old", "INBOX.new"));
    EXPECT_CALL(*m_backend, subscribe("INBOX.new"));
    EXPECT_CALL(*m_backend, unsubscribe("INBOX"));
    EXPECT_CALL(*m_backend, delete_mailbox("INBOX.new"));
    EXPECT_CALL(*m_backend, status("INBOX"))
        .WillOnce(Return(mailbox_status_t{.messages = 3, .unseen = 1}));

    EXPECT_TRUE(mailbox().create_mailbox("Projects"));
    ASSERT_TRUE(mailbox().switch_mailbox("INBOX"));
    EXPECT_EQ(mailbox().current_mailbox(), "INBOX");
    EXPECT_TRUE(mailbox().create_mailbox("Entwürfe"));
    EXPECT_TRUE(mailbox().rename_mailbox("old", "new"));
    EXPECT_TRUE(mailbox().subscribe_mailbox("new"));
    EXPECT_TRUE(mailbox().unsubscribe_mailbox(""));
    EXPECT_TRUE(mailbox().delete_mailbox("new"));

    auto status_or_err = mailbox().status_mailbox();
    ASSERT_TRUE(status_or_err);
    EXPECT_EQ(status_or_err->messages, 3);
    EXPECT_EQ(status_or_err->unseen, 1);
}

TEST_F(mailbox_test, failed_switch_keeps_current_mailbox) {
    EXPECT_CALL(*m_backend, select_mailbox("Nope"))
        .WillOnce(Return(unexpected(make_error_code(std::errc::no_such_file_or_directory))));

    EXPECT_FALSE(mailbox().switch_mailbox("Nope"));
    EXPECT_EQ(mailbox().current_mailbox(), "");
}

TEST_F(mailbox_test, lists_mailboxes_with_decoded_names) {
    EXPECT_CALL(*m_backend, list_mailboxes("", "*"))
        .WillOnce(Return(std::vector<mailbox_list_entry_t>{
            {"INBOX", {"\\HasChildren"}, "."},
            {"INBOX.Entw&APw-rfe", {"\\HasNoChildren", "\\Drafts"}, "."},
            {"[Gmail]/&BB4EQgQ,BEAEMAQyBDsENQQ9BD0ESwQ1-", {}, "/"}}));
    EXPECT_CALL(*m_backend, list_subscribed("", "INBOX*"))
        .WillOnce(Return(std::vector<mailbox_list_entry_t>{{"INBOX", {}, ""}}));

    auto infos_or_err = mailbox().get_mailboxes();
    ASSERT_TRUE(infos_or_err) << infos_or_err.error();
    auto& infos = *infos_or_err;
    ASSERT_EQ(infos.size(), 3);

    EXPECT_EQ(infos[1].full_path, "INBOX.Entwürfe");
    EXPECT_THAT(infos[1].path, ElementsAre("INBOX", "Entwürfe"));
    EXPECT_THAT(infos[1].attributes, ElementsAre("\\HasNoChildren", "\\Drafts"));
    EXPECT_EQ(infos[1].delimiter, ".");
    EXPECT_EQ(infos[2].full_path, "[Gmail]/Отправленные");
    EXPECT_THAT(infos[2].path, ElementsAre("[Gmail]", "Отправленные"));

    auto subscribed_or_err = mailbox().get_subscribed_mailboxes("INBOX*");
    ASSERT_TRUE(subscribed_or_err) << subscribed_or_err.error();
    ASSERT_EQ(subscribed_or_err->size(), 1);
    EXPECT_THAT((*subscribed_or_err)[0].path, ElementsAre("INBOX"));
}

TEST_F(mailbox_test, raw_mail_fetch_options) {
    EXPECT_CALL(*m_backend, fetch_section(9, "", AllOf(Field(&fetch_options_t::peek, true),
                                                      Field(&fetch_options_t::uid, true))))
        .WillOnce(Return(std::string{"raw"}));

    auto raw_or_err = mailbox().get_raw_mail(9, false);
    ASSERT_TRUE(raw_or_err);
    EXPECT_EQ(*raw_or_err, "raw");
}

TEST_F(mailbox_test, helpers) {
    EXPECT_EQ(mailbox().encode_string_to_utf7_imap("Entwürfe"), "Entw&APw-rfe");
    EXPECT_EQ(mailbox().decode_string_from_utf7_imap_to_utf8("Entw&APw-rfe"), "Entwürfe");
    EXPECT_EQ(mailbox().decode_mime_str("=?ISO-8859-1?Q?Andr=E9?="), "André");
    EXPECT_EQ(mailbox().convert_string_encoding("caf\xe9", "ISO-8859-1", "UTF-8"), "café");
    EXPECT_EQ(mailbox().parse_date_time("Sun, 14 Aug 2005 16:13:03 +1000"),
              "2005-08-14T06:13:03+00:00");
}

namespace {

const std::string mail_header =
    "From: Alice <alice@example.com>\r\n"
    "To: bob@example.com\r\n"
    "Subject: Report\r\n"
    "Date: Sun, 14 Aug 2005 16:13:03 +0000\r\n"
    "\r\n";

class mailbox_fetch_test : public Test {
   protected:
    void SetUp() override {
        m_backend = std::make_shared<fake_mailbox_backend_t>();
        m_backend->add_mail(21, mail_header, [] {
            using namespace structures;
            return multipart("MIXED", text("PLAIN", fields("7BIT", {{"CHARSET", "us-ascii"}})),
                             basic("APPLICATION", "PDF", fields("BASE64", {{"NAME", "report.pdf"}}),
                                   dsp("ATTACHMENT")));
        });
        m_backend->set_section(21, "1", "See attached.");
        m_backend->set_section(21, "2", "JVBERi0=");
        m_backend->set_section(21, "", mail_header + "body");

        m_file = std::filesystem::temp_directory_path() / "inboxkit-saved-mail.eml";
        std::filesystem::remove(m_file);
    }
    void TearDown() override { std::filesystem::remove(m_file); }

    std::shared_ptr<fake_mailbox_backend_t> m_backend;
    std::filesystem::path m_file;
};

}  // namespace

TEST_F(mailbox_fetch_test, get_mail_assembles_header_bodies_and_attachments) {
    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    auto mail_or_err = mailbox_or_err->get_mail(21, false);
    ASSERT_TRUE(mail_or_err) << mail_or_err.error();
    auto& mail = *mail_or_err;

    EXPECT_EQ(mail.id(), 21);
    EXPECT_EQ(mail.header().subject, "Report");
    EXPECT_EQ(mail.header().from_address, "alice@example.com");
    EXPECT_EQ(mail.header().date, "2005-08-14T16:13:03+00:00");

    auto plain_or_err = mail.text_plain();
    ASSERT_TRUE(plain_or_err) << plain_or_err.error();
    EXPECT_EQ(*plain_or_err, "See attached.");

    ASSERT_TRUE(mail.has_attachments());
    ASSERT_EQ(mail.get_attachments().size(), 1);
    auto contents_or_err = mail.get_attachments()[0].get_contents();
    ASSERT_TRUE(contents_or_err) << contents_or_err.error();
    EXPECT_EQ(*contents_or_err, "%PDF-");
}

TEST_F(mailbox_fetch_test, get_mail_of_unknown_id_fails) {
    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    EXPECT_FALSE(mailbox_or_err->get_mail(99));
    EXPECT_FALSE(mailbox_or_err->get_mail_header(99));
}

TEST_F(mailbox_fetch_test, save_mail_writes_raw_message) {
    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    ASSERT_TRUE(mailbox_or_err->save_mail(21, m_file.string()));

    std::ifstream in{m_file, std::ios::binary};
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), mail_header + "body");

    auto failed_or_err = mailbox_or_err->save_mail(21, "/no/such/inboxkit/dir/mail.eml");
    ASSERT_FALSE(failed_or_err);
    EXPECT_EQ(failed_or_err.error(), mailbox_errc::storage_failure);
}

TEST_F(mailbox_fetch_test, mbox_format_is_header_then_body) {
    m_backend->set_body(21, "See attached.\r\n");
    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    auto mbox_or_err = mailbox_or_err->get_mail_mbox_format(21);
    ASSERT_TRUE(mbox_or_err) << mbox_or_err.error();
    EXPECT_EQ(*mbox_or_err, mail_header + "See attached.\r\n");

    ASSERT_EQ(m_backend->fetches().size(), 1);
    EXPECT_EQ(m_backend->fetches()[0].section, "0");
    EXPECT_FALSE(m_backend->fetches()[0].options.peek);
    EXPECT_TRUE(m_backend->fetches()[0].options.uid);

    EXPECT_FALSE(mailbox_or_err->get_mail_mbox_format(99));
}

TEST_F(mailbox_fetch_test, mails_info_decodes_address_and_subject_fields) {
    m_backend->set_overview(
        21, mail_overview_t{.subject = "=?UTF-8?Q?Caf=C3=A9_menu?=",
                            .from = "=?ISO-8859-1?Q?Andr=E9?= <andre@example.com>",
                            .date = "Sun, 14 Aug 2005 16:13:03 +0000",
                            .message_id = "<m-21@example.com>",
                            .size = 1512,
                            .uid = 21,
                            .msgno = 1,
                            .seen = true});
    m_backend->set_overview(22, mail_overview_t{.subject = "plain subject", .uid = 22, .msgno = 2});

    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    auto info_or_err = mailbox_or_err->get_mails_info({21, 22});
    ASSERT_TRUE(info_or_err) << info_or_err.error();
    ASSERT_EQ(info_or_err->size(), 2);

    auto& first = (*info_or_err)[0];
    EXPECT_EQ(first.subject, "Café menu");
    EXPECT_EQ(first.from, "André <andre@example.com>");
    EXPECT_EQ(first.to, "");
    EXPECT_EQ(first.date, "Sun, 14 Aug 2005 16:13:03 +0000");
    EXPECT_EQ(first.message_id, "<m-21@example.com>");
    EXPECT_EQ(first.size, 1512);
    EXPECT_TRUE(first.seen);
    EXPECT_EQ((*info_or_err)[1].subject, "plain subject");

    ASSERT_EQ(m_backend->overview_requests().size(), 1);
    EXPECT_EQ(m_backend->overview_requests()[0].sequence_set, "21,22");
    EXPECT_TRUE(m_backend->overview_requests()[0].uid);

    auto empty_or_err = mailbox_or_err->get_mails_info({});
    ASSERT_FALSE(empty_or_err);
    EXPECT_EQ(empty_or_err.error(), mailbox_errc::invalid_parameter);
}

TEST_F(mailbox_fetch_test, mailbox_headers_lists_every_mail) {
    m_backend->set_overview(21, mail_overview_t{.subject = "Report",
                                                .from = "Alice <alice@example.com>",
                                                .date = "Sun, 14 Aug 2005 16:13:03 +0000",
                                                .size = 1512,
                                                .msgno = 1,
                                                .flagged = true,
                                                .seen = true});
    m_backend->set_overview(
        22, mail_overview_t{.subject = "=?UTF-8?Q?A_subject_that_is_longer_than_25?=",
                            .from = "=?UTF-8?Q?Jo_Smith?= <jo@example.com>",
                            .date = "Fri, 5 Aug 2005 12:00:00 +0000",
                            .size = 300,
                            .msgno = 2,
                            .recent = true,
                            .draft = true});
    m_backend->set_overview(23, mail_overview_t{.from = "bob", .date = "not a date", .msgno = 3});

    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    auto lines_or_err = mailbox_or_err->get_mailbox_headers();
    ASSERT_TRUE(lines_or_err) << lines_or_err.error();
    EXPECT_THAT(*lines_or_err,
                ElementsAre("  F      1)14-Aug-2005 Alice <alice@example Report (1512 chars)",
                            "N    X   2) 5-Aug-2005 Jo Smith <jo@example A subject that is "
                            "longer  (300 chars)",
                            " U       3)not a date  bob                   (0 chars)"));

    ASSERT_EQ(m_backend->overview_requests().size(), 1);
    EXPECT_EQ(m_backend->overview_requests()[0].sequence_set, "1:*");
    EXPECT_FALSE(m_backend->overview_requests()[0].uid);
}

TEST_F(mailbox_fetch_test, quota_reads_storage_resource) {
    m_backend->set_quota_root("INBOX", {quota_resource_t{"MESSAGE", 10, 1000},
                                        quota_resource_t{"storage", 512, 2048}});
    m_backend->set_quota_root("Archive", {quota_resource_t{"MESSAGE", 3, 100}});

    auto mailbox_or_err = mailbox_t::create(m_backend);
    ASSERT_TRUE(mailbox_or_err);

    auto limit_or_err = mailbox_or_err->get_quota_limit();
    ASSERT_TRUE(limit_or_err) << limit_or_err.error();
    EXPECT_EQ(*limit_or_err, 2048);
    auto usage_or_err = mailbox_or_err->get_quota_usage();
    ASSERT_TRUE(usage_or_err) << usage_or_err.error();
    EXPECT_EQ(*usage_or_err, 512);

    auto archive_limit_or_err = mailbox_or_err->get_quota_limit("Archive");
    ASSERT_TRUE(archive_limit_or_err);
    EXPECT_EQ(*archive_limit_or_err, 0);
    auto archive_usage_or_err = mailbox_or_err->get_quota_usage("Archive");
    ASSERT_TRUE(archive_usage_or_err);
    EXPECT_EQ(*archive_usage_or_err, 0);

    EXPECT_FALSE(mailbox_or_err->get_quota_limit("Missing"));
    EXPECT_FALSE(mailbox_or_err->get_quota_usage("Missing"));
}
