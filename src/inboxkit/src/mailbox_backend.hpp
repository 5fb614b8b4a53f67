#pragma once

#include <inboxkit/global.hpp>

#include "imap_structure.hpp"

#include <cstdint>

namespace inboxkit {

using mail_id_t = uint32_t;

struct fetch_options_t {
    bool peek = false;  // do not set \Seen
    bool uid = true;    // ids are UIDs rather than sequence numbers
};

struct mailbox_list_entry_t {
    std::string mailbox_raw;  // as on the wire, modified UTF-7
    std::vector<std::string> flags;
    std::string hierarchy_delimiter;
};

struct mailbox_status_t {
    uint32_t messages = 0;
    uint32_t recent = 0;
    uint32_t unseen = 0;
    uint32_t uidnext = 0;
    uint32_t uidvalidity = 0;
};

// Summary of one mail as returned by FETCH (ENVELOPE RFC822.SIZE FLAGS UID). Text fields are
// raw header values and may hold encoded-words. Absent values are empty.
struct mail_overview_t {
    std::string subject;
    std::string from;
    std::string sender;
    std::string to;
    std::string date;
    std::string message_id;
    std::string references;
    std::string in_reply_to;
    uint32_t size = 0;
    mail_id_t uid = 0;
    uint32_t msgno = 0;
    bool recent = false;
    bool flagged = false;
    bool answered = false;
    bool deleted = false;
    bool seen = false;
    bool draft = false;
};

// One resource of a GETQUOTAROOT answer (RFC 2087). STORAGE is counted in KB.
struct quota_resource_t {
    std::string name;
    uint64_t usage = 0;
    uint64_t limit = 0;
};

// RFC 5256 sort keys.
enum class sort_criteria_t { date = 0, arrival, from, subject, to, cc, size };

std::string_view to_string(sort_criteria_t c);

struct search_request_t {
    std::string criteria;
    std::optional<std::string> charset;
    bool uid = true;
};

// Message access protocol session the library is driven through. It owns the connection, the
// selected mailbox and all timeouts. Methods block until the server answered.
class mailbox_backend_t {
   public:
    virtual ~mailbox_backend_t() = default;

   public:  // message content
    virtual expected<imap_structure::Body> fetch_structure(mail_id_t id,
                                                           fetch_options_t options) = 0;
    // Empty section fetches the whole raw message.
    virtual expected<std::string> fetch_section(mail_id_t id,
                                                const std::string& section,
                                                fetch_options_t options) = 0;
    virtual expected<std::string> fetch_body(mail_id_t id, fetch_options_t options) = 0;
    // Raw header block, including the empty line that ends it.
    virtual expected<std::string> fetch_header(mail_id_t id, fetch_options_t options) = 0;
    virtual expected<std::vector<mail_overview_t>> fetch_overview(const std::string& sequence_set,
                                                                  bool uid) = 0;

   public:  // mailboxes
    virtual expected<void> select_mailbox(const std::string& mailbox) = 0;
    virtual expected<std::vector<mailbox_list_entry_t>> list_mailboxes(
        const std::string& reference,
        const std::string& pattern) = 0;
    virtual expected<std::vector<mailbox_list_entry_t>> list_subscribed(
        const std::string& reference,
        const std::string& pattern) = 0;
    virtual expected<void> create_mailbox(const std::string& mailbox) = 0;
    virtual expected<void> delete_mailbox(const std::string& mailbox) = 0;
    virtual expected<void> rename_mailbox(const std::string& from, const std::string& to) = 0;
    virtual expected<void> subscribe(const std::string& mailbox) = 0;
    virtual expected<void> unsubscribe(const std::string& mailbox) = 0;
    virtual expected<mailbox_status_t> status(const std::string& mailbox) = 0;
    virtual expected<std::vector<quota_resource_t>> get_quota_root(
        const std::string& quota_root) = 0;

   public:  // messages
    virtual expected<std::vector<mail_id_t>> search(const search_request_t& request) = 0;
    virtual expected<std::vector<mail_id_t>> sort(sort_criteria_t criteria,
                                                  bool reverse,
                                                  const search_request_t& request) = 0;
    virtual expected<uint32_t> count_messages() = 0;
    // sequence_set is an IMAP sequence set, "1,5,7" or "3:9".
    virtual expected<void> store_flags(const std::string& sequence_set,
                                       const std::string& flags,
                                       bool add,
                                       bool uid) = 0;
    virtual expected<void> copy_messages(const std::string& sequence_set,
                                         const std::string& mailbox,
                                         bool uid) = 0;
    virtual expected<void> move_messages(const std::string& sequence_set,
                                         const std::string& mailbox,
                                         bool uid) = 0;
    virtual expected<void> expunge() = 0;
};

}  // namespace inboxkit

DEFINE_FMT_FORMATTER(inboxkit::sort_criteria_t, "{}", inboxkit::to_string(arg));
DEFINE_FMT_FORMATTER(inboxkit::fetch_options_t, "(peek: {}, uid: {})", arg.peek, arg.uid);
DEFINE_FMT_FORMATTER(inboxkit::quota_resource_t,
                     "quota({}: {}/{})",
                     arg.name,
                     arg.usage,
                     arg.limit);
