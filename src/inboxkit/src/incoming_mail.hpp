#pragma once

#include <inboxkit/global.hpp>

#include "attachment.hpp"
#include "data_part.hpp"

namespace inboxkit {

// Lower-cased address -> decoded display name, in header order. A repeated address replaces the
// name of the first occurrence.
class address_map_t {
   public:
    using entry_t = std::pair<std::string, std::optional<std::string>>;

    void set(std::string address, std::optional<std::string> name);
    bool contains(std::string_view address) const;
    // Empty optional when the address is absent, an optional holding nullopt when it has no name.
    std::optional<std::optional<std::string>> get(std::string_view address) const;

    const std::vector<entry_t>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

   private:
    std::vector<entry_t> m_entries;
};

struct incoming_mail_header_t {
    mail_id_t id = 0;
    std::string headers_raw;
    bool is_draft = false;
    std::string date;  // RFC 3339

    std::string priority;
    std::string importance;
    std::string sensitivity;
    std::string auto_submitted;
    std::string precedence;
    std::string failed_recipients;

    std::optional<std::string> subject;

    std::optional<std::string> from_host;
    std::optional<std::string> from_name;
    std::optional<std::string> from_address;

    std::optional<std::string> sender_host;
    std::optional<std::string> sender_name;
    std::optional<std::string> sender_address;

    address_map_t to;
    std::string to_string;
    address_map_t cc;
    address_map_t bcc;
    address_map_t reply_to;

    std::optional<std::string> message_id;
};

class incoming_mail_t {
   public:
    incoming_mail_t() = default;
    explicit incoming_mail_t(incoming_mail_header_t header) : m_header(std::move(header)) {}

    const incoming_mail_header_t& header() const { return m_header; }
    void set_header(incoming_mail_header_t header) { m_header = std::move(header); }
    mail_id_t id() const { return m_header.id; }

    // A body slot keeps the first part assigned to it.
    void set_text_plain_part(std::shared_ptr<data_part_t> part);
    void set_text_html_part(std::shared_ptr<data_part_t> part);
    std::shared_ptr<data_part_t> text_plain_part() const { return m_text_plain; }
    std::shared_ptr<data_part_t> text_html_part() const { return m_text_html; }

    // Fetch and decode the body on first use. A missing body reads as empty text.
    expected<std::string> text_plain();
    expected<std::string> text_html();

    void set_has_attachments(bool v) { m_has_attachments = v; }
    bool has_attachments() const { return m_has_attachments; }

    // An attachment with an id already present replaces it in place.
    void add_attachment(attachment_t attachment);
    bool remove_attachment(std::string_view id);
    attachment_t* find_attachment(std::string_view id);
    std::vector<attachment_t>& get_attachments() { return m_attachments; }
    const std::vector<attachment_t>& get_attachments() const { return m_attachments; }

   private:
    incoming_mail_header_t m_header;
    std::shared_ptr<data_part_t> m_text_plain;
    std::shared_ptr<data_part_t> m_text_html;
    std::vector<attachment_t> m_attachments;
    bool m_has_attachments = false;
};

// Header fields and attachment metadata, pretty printed. Bodies are not fetched.
std::string to_json(const incoming_mail_t& mail);

}  // namespace inboxkit

DEFINE_FMT_FORMATTER(inboxkit::incoming_mail_header_t,
                     "header(id: {}, date: {}, subject: '{}', from: {})",
                     arg.id,
                     arg.date,
                     arg.subject.value_or(""),
                     arg.from_address.value_or(""));
