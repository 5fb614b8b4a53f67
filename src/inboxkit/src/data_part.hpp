#pragma once

#include <inboxkit/global.hpp>

#include "mailbox_backend.hpp"
#include "part_structure.hpp"

namespace inboxkit {

// Section key addressing the whole message body rather than one of its parts.
inline const std::string whole_message_key = "0";

// Lazy handle to the content of one part. Nothing is fetched before fetch() is called, and a
// fetched result is kept for later calls.
class data_part_t {
   public:
    data_part_t(std::shared_ptr<mailbox_backend_t> backend,
                mail_id_t mail_id,
                std::string key,
                mime::transfer_encoding_t encoding,
                fetch_options_t options,
                std::string server_encoding);

    // Raw bytes from the backend, transfer-decoded, then converted from charset() (when set) to
    // the server encoding. Only a backend failure is an error.
    expected<std::string> fetch();

    void set_charset(std::string charset) { m_charset = std::move(charset); }
    const std::optional<std::string>& charset() const { return m_charset; }

    mail_id_t mail_id() const { return m_mail_id; }
    const std::string& key() const { return m_key; }
    mime::transfer_encoding_t encoding() const { return m_encoding; }
    const fetch_options_t& options() const { return m_options; }
    bool fetched() const { return m_data.has_value(); }

   private:
    std::shared_ptr<mailbox_backend_t> m_backend;
    mail_id_t m_mail_id;
    std::string m_key;
    mime::transfer_encoding_t m_encoding;
    fetch_options_t m_options;
    std::string m_server_encoding;
    std::optional<std::string> m_charset;
    std::optional<std::string> m_data;
};

}  // namespace inboxkit

DEFINE_FMT_FORMATTER(inboxkit::data_part_t,
                     "data_part(mail: {}, key: {}, enc: {}, charset: {})",
                     arg.mail_id(),
                     arg.key(),
                     arg.encoding(),
                     arg.charset().value_or("none"));
