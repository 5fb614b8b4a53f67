#include "incoming_mail.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>

namespace inboxkit {

void address_map_t::set(std::string address, std::optional<std::string> name) {
    for (auto& [a, n] : m_entries) {
        if (a == address) {
            n = std::move(name);
            return;
        }
    }
    m_entries.emplace_back(std::move(address), std::move(name));
}

bool address_map_t::contains(std::string_view address) const {
    return get(address).has_value();
}

std::optional<std::optional<std::string>> address_map_t::get(std::string_view address) const {
    for (auto& [a, n] : m_entries) {
        if (a == address) {
            return n;
        }
    }
    return std::nullopt;
}

void incoming_mail_t::set_text_plain_part(std::shared_ptr<data_part_t> part) {
    if (m_text_plain) {
        log_debug("mail {} already has plain text body {}, ignoring {}", id(), *m_text_plain,
                  *part);
        return;
    }
    m_text_plain = std::move(part);
}

void incoming_mail_t::set_text_html_part(std::shared_ptr<data_part_t> part) {
    if (m_text_html) {
        log_debug("mail {} already has html body {}, ignoring {}", id(), *m_text_html, *part);
        return;
    }
    m_text_html = std::move(part);
}

expected<std::string> incoming_mail_t::text_plain() {
    if (!m_text_plain) {
        return std::string{};
    }
    return m_text_plain->fetch();
}

expected<std::string> incoming_mail_t::text_html() {
    if (!m_text_html) {
        return std::string{};
    }
    return m_text_html->fetch();
}

void incoming_mail_t::add_attachment(attachment_t attachment) {
    if (auto* existing = find_attachment(attachment.id())) {
        log_debug("mail {}: replacing {} with {}", id(), *existing, attachment);
        *existing = std::move(attachment);
        return;
    }
    m_attachments.emplace_back(std::move(attachment));
}

bool incoming_mail_t::remove_attachment(std::string_view id) {
    auto it = std::find_if(m_attachments.begin(), m_attachments.end(),
                           [&](const attachment_t& a) { return a.id() == id; });
    if (it == m_attachments.end()) {
        return false;
    }
    m_attachments.erase(it);
    return true;
}

attachment_t* incoming_mail_t::find_attachment(std::string_view id) {
    auto it = std::find_if(m_attachments.begin(), m_attachments.end(),
                           [&](const attachment_t& a) { return a.id() == id; });
    return it != m_attachments.end() ? &*it : nullptr;
}

using namespace rapidjson;

namespace {

void write_optional_string(PrettyWriter<StringBuffer>& writer,
                           const char* key,
                           const std::optional<std::string>& value) {
    writer.Key(key);
    if (value.has_value()) {
        writer.String(value->c_str(), static_cast<SizeType>(value->size()));
    } else {
        writer.Null();
    }
}

void write_string(PrettyWriter<StringBuffer>& writer, const char* key, const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<SizeType>(value.size()));
}

void write_address_map(PrettyWriter<StringBuffer>& writer,
                       const char* key,
                       const address_map_t& addresses) {
    writer.Key(key);
    writer.StartObject();
    for (auto& [address, name] : addresses.entries()) {
        writer.Key(address.c_str(), static_cast<SizeType>(address.size()));
        if (name.has_value()) {
            writer.String(name->c_str(), static_cast<SizeType>(name->size()));
        } else {
            writer.Null();
        }
    }
    writer.EndObject();
}

}  // namespace

std::string to_json(const incoming_mail_t& mail) {
    StringBuffer s;
    PrettyWriter<StringBuffer> writer(s);

    const auto& header = mail.header();

    writer.StartObject();

    writer.Key("id");
    writer.Uint(header.id);
    writer.Key("is_draft");
    writer.Bool(header.is_draft);
    write_string(writer, "date", header.date);
    write_optional_string(writer, "subject", header.subject);

    write_optional_string(writer, "from_host", header.from_host);
    write_optional_string(writer, "from_name", header.from_name);
    write_optional_string(writer, "from_address", header.from_address);
    write_optional_string(writer, "sender_host", header.sender_host);
    write_optional_string(writer, "sender_name", header.sender_name);
    write_optional_string(writer, "sender_address", header.sender_address);

    write_address_map(writer, "to", header.to);
    write_string(writer, "to_string", header.to_string);
    write_address_map(writer, "cc", header.cc);
    write_address_map(writer, "bcc", header.bcc);
    write_address_map(writer, "reply_to", header.reply_to);
    write_optional_string(writer, "message_id", header.message_id);

    write_string(writer, "priority", header.priority);
    write_string(writer, "importance", header.importance);
    write_string(writer, "sensitivity", header.sensitivity);
    write_string(writer, "auto_submitted", header.auto_submitted);
    write_string(writer, "precedence", header.precedence);
    write_string(writer, "failed_recipients", header.failed_recipients);

    writer.Key("has_attachments");
    writer.Bool(mail.has_attachments());

    writer.Key("attachments");
    writer.StartArray();
    for (auto& a : mail.get_attachments()) {
        writer.StartObject();
        write_string(writer, "id", a.id());
        write_optional_string(writer, "content_id", a.content_id);
        write_string(writer, "name", a.name);
        write_optional_string(writer, "disposition", a.disposition);
        write_optional_string(writer, "charset", a.charset);
        writer.Key("eml_origin");
        writer.Bool(a.eml_origin);
        writer.Key("type");
        writer.String(std::string{mime::to_string(a.type)}.c_str());
        write_string(writer, "subtype", a.subtype);
        writer.Key("octets");
        writer.Uint(a.size_in_bytes);
        write_optional_string(writer, "file_path", a.file_path());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    return s.GetString();
}

}  // namespace inboxkit
