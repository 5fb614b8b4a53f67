#include "data_part.hpp"
#include "charset.hpp"
#include "transfer_decoding.hpp"
#include "utils.hpp"

namespace inboxkit {

data_part_t::data_part_t(std::shared_ptr<mailbox_backend_t> backend,
                         mail_id_t mail_id,
                         std::string key,
                         mime::transfer_encoding_t encoding,
                         fetch_options_t options,
                         std::string server_encoding)
    : m_backend(std::move(backend)),
      m_mail_id(mail_id),
      m_key(std::move(key)),
      m_encoding(encoding),
      m_options(options),
      m_server_encoding(std::move(server_encoding)) {}

expected<std::string> data_part_t::fetch() {
    if (m_data) {
        return *m_data;
    }

    auto raw_or_err = m_key == whole_message_key
                          ? m_backend->fetch_body(m_mail_id, m_options)
                          : m_backend->fetch_section(m_mail_id, m_key, m_options);
    if (!raw_or_err) {
        log_error("failed fetching {}: {}", *this, raw_or_err.error());
        return unexpected(raw_or_err.error());
    }

    auto data = mime::decode_transfer_encoding(*raw_or_err, m_encoding);
    if (m_charset && !utils::is_blank(*m_charset)) {
        data = charset::convert_string_encoding(data, *m_charset, m_server_encoding);
    }

    log_debug("fetched {}: {} bytes", *this, data.size());
    m_data = std::move(data);
    return *m_data;
}

}  // namespace inboxkit
