#pragma once

#include <inboxkit/global.hpp>

#include "incoming_mail.hpp"
#include "mailbox_backend.hpp"
#include "message_assembler.hpp"

namespace inboxkit {

enum class search_option_t { uid = 1, sequence = 2 };

struct mailbox_options_t {
    std::string server_encoding = "UTF-8";
    std::optional<std::string> attachments_dir;
    bool attachments_ignore = false;
    std::string path_delimiter = ".";
    search_option_t search_option = search_option_t::uid;
};

struct mailbox_info_t {
    std::string full_path;          // utf-8
    std::vector<std::string> path;  // full_path split on the delimiter
    std::vector<std::string> attributes;
    std::string delimiter;
};

// Mail access on top of a protocol backend. Mailbox names are taken and returned as utf-8 and
// sent to the backend in modified UTF-7.
class mailbox_t {
   public:
    static expected<mailbox_t> create(std::shared_ptr<mailbox_backend_t> backend,
                                      mailbox_options_t options = {});

   public:  // configuration
    expected<void> set_server_encoding(std::string_view encoding);
    const std::string& server_encoding() const { return m_options.server_encoding; }

    expected<void> set_attachments_dir(std::string_view dir);
    const std::optional<std::string>& attachments_dir() const { return m_options.attachments_dir; }

    void set_attachments_ignore(bool v) { m_options.attachments_ignore = v; }
    bool attachments_ignore() const { return m_options.attachments_ignore; }

    static bool validate_path_delimiter(std::string_view delimiter);
    expected<void> set_path_delimiter(std::string_view delimiter);
    const std::string& path_delimiter() const { return m_options.path_delimiter; }

    expected<void> set_search_option(search_option_t option);
    search_option_t search_option() const { return m_options.search_option; }

    const mailbox_options_t& options() const { return m_options; }
    const std::string& current_mailbox() const { return m_current_mailbox; }

   public:  // messages
    expected<incoming_mail_t> get_mail(mail_id_t id, bool mark_as_seen = true);
    expected<incoming_mail_header_t> get_mail_header(mail_id_t id);
    expected<std::string> get_raw_mail(mail_id_t id, bool mark_as_seen = true);
    expected<void> save_mail(mail_id_t id, const std::string& filename = "email.eml");
    // Header block followed by the body, the way mbox files store a mail.
    expected<std::string> get_mail_mbox_format(mail_id_t id);
    // Overviews with subject, from, sender and to decoded into the server encoding.
    expected<std::vector<mail_overview_t>> get_mails_info(const std::vector<mail_id_t>& ids);
    // One listing line per mail of the selected mailbox with flags, number, date, sender,
    // subject and size:
    // " U      12)14-Aug-2005 Jane Doe             Lunch (1512 chars)"
    expected<std::vector<std::string>> get_mailbox_headers();

   public:  // search
    expected<std::vector<mail_id_t>> search_mailbox(const std::string& criteria = "ALL",
                                                    bool disable_server_encoding = false);
    expected<std::vector<mail_id_t>> search_mailbox_from(const std::string& criteria,
                                                         const std::vector<std::string>& senders,
                                                         bool disable_server_encoding = false);
    expected<std::vector<mail_id_t>> search_mailbox_merge_results(
        const std::vector<std::string>& criteria,
        bool disable_server_encoding = false);
    expected<std::vector<mail_id_t>> sort_mails(sort_criteria_t criteria = sort_criteria_t::arrival,
                                                bool reverse = true,
                                                const std::string& search_criteria = "ALL");
    expected<uint32_t> count_mails();

   public:  // flags and moves
    expected<void> mark_mail_as_read(mail_id_t id);
    expected<void> mark_mail_as_unread(mail_id_t id);
    expected<void> mark_mail_as_important(mail_id_t id);
    expected<void> mark_mails_as_read(const std::vector<mail_id_t>& ids);
    expected<void> mark_mails_as_unread(const std::vector<mail_id_t>& ids);
    expected<void> mark_mails_as_important(const std::vector<mail_id_t>& ids);
    expected<void> set_flag(const std::vector<mail_id_t>& ids, const std::string& flag);
    expected<void> clear_flag(const std::vector<mail_id_t>& ids, const std::string& flag);

    expected<void> delete_mail(mail_id_t id);
    // sequence_set is a single id or an IMAP range like "3:7".
    expected<void> move_mail(const std::string& sequence_set, const std::string& mailbox);
    expected<void> copy_mail(const std::string& sequence_set, const std::string& mailbox);
    expected<void> expunge_deleted_mails();

   public:  // mailboxes
    // Absolute path, becomes the base for the relative names below.
    expected<void> switch_mailbox(const std::string& path);
    expected<void> create_mailbox(const std::string& name);
    expected<void> delete_mailbox(const std::string& name);
    expected<void> rename_mailbox(const std::string& old_name, const std::string& new_name);
    expected<void> subscribe_mailbox(const std::string& name);
    expected<void> unsubscribe_mailbox(const std::string& name);
    expected<mailbox_status_t> status_mailbox();
    // STORAGE resource of quota_root in KB, 0 when the server reports none.
    expected<uint64_t> get_quota_limit(const std::string& quota_root = "INBOX");
    expected<uint64_t> get_quota_usage(const std::string& quota_root = "INBOX");
    expected<std::vector<mailbox_info_t>> get_mailboxes(const std::string& pattern = "*");
    expected<std::vector<mailbox_info_t>> get_subscribed_mailboxes(
        const std::string& pattern = "*");

   public:  // helpers
    expected<std::string> encode_string_to_utf7_imap(std::string_view utf8) const;
    expected<std::string> decode_string_from_utf7_imap_to_utf8(std::string_view text) const;
    std::string decode_mime_str(std::string_view text) const;
    std::string convert_string_encoding(std::string_view text,
                                        std::string_view from,
                                        std::string_view to) const;
    expected<std::string> parse_date_time(std::string_view date_header) const;

    assembly_config_t assembly_config() const;

   private:
    explicit mailbox_t(std::shared_ptr<mailbox_backend_t> backend);

    bool use_uid() const { return m_options.search_option == search_option_t::uid; }
    std::string combined_path(const std::string& name) const;
    expected<std::string> encoded_combined_path(const std::string& name) const;
    expected<quota_resource_t> storage_quota(const std::string& quota_root);
    expected<std::vector<mailbox_info_t>> to_mailbox_infos(
        const std::vector<mailbox_list_entry_t>& entries) const;

    std::shared_ptr<mailbox_backend_t> m_backend;
    mailbox_options_t m_options;
    std::string m_current_mailbox;
};

}  // namespace inboxkit

DEFINE_FMT_FORMATTER(inboxkit::mailbox_info_t,
                     "mailbox({}, attributes: {}, delimiter: '{}')",
                     arg.full_path,
                     arg.attributes,
                     arg.delimiter);
