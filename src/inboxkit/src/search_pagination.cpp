#include "search_pagination.hpp"
#include "mailbox_errors.hpp"

#include <algorithm>

namespace inboxkit {

mail_page_iterator_t::mail_page_iterator_t(mailbox_t& mailbox,
                                           std::vector<mail_id_t> ids,
                                           size_t page_size,
                                           bool mark_as_seen)
    : m_mailbox(mailbox),
      m_ids(std::move(ids)),
      m_page_size(page_size),
      m_mark_as_seen(mark_as_seen) {}

size_t mail_page_iterator_t::count() const {
    return (m_ids.size() + m_page_size - 1) / m_page_size;
}

expected<void> mail_page_iterator_t::seek(size_t page) {
    if (page >= count()) {
        log_error("page {} is out of range 0-{}", page, count());
        return unexpected(make_error_code(mailbox_errc::out_of_range));
    }
    m_page = page;
    return {};
}

std::vector<mail_id_t> mail_page_iterator_t::current_ids() const {
    if (!valid()) {
        return {};
    }
    const size_t begin = m_page * m_page_size;
    const size_t end = std::min(begin + m_page_size, m_ids.size());
    return std::vector<mail_id_t>(m_ids.begin() + begin, m_ids.begin() + end);
}

expected<std::vector<incoming_mail_t>> mail_page_iterator_t::current() {
    if (!valid()) {
        log_error("no page {}, there are {}", m_page, count());
        return unexpected(make_error_code(mailbox_errc::out_of_range));
    }

    std::vector<incoming_mail_t> mails;
    for (auto id : current_ids()) {
        auto mail_or_err = m_mailbox.get().get_mail(id, m_mark_as_seen);
        if (!mail_or_err) {
            log_error("failed getting mail {} of page {}: {}", id, m_page, mail_or_err.error());
            return unexpected(mail_or_err.error());
        }
        mails.emplace_back(std::move(*mail_or_err));
    }
    return mails;
}

search_pagination_t::search_pagination_t(mailbox_t& mailbox,
                                         size_t page_size,
                                         bool disable_server_encoding,
                                         bool mark_as_seen)
    : m_mailbox(mailbox),
      m_page_size(page_size),
      m_disable_server_encoding(disable_server_encoding),
      m_mark_as_seen(mark_as_seen) {}

expected<search_pagination_t> search_pagination_t::create(mailbox_t& mailbox,
                                                          int page_size,
                                                          bool disable_server_encoding,
                                                          bool mark_as_seen) {
    if (page_size < 1) {
        log_error("page size must be greater than zero, {} given", page_size);
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    return search_pagination_t{mailbox, static_cast<size_t>(page_size), disable_server_encoding,
                               mark_as_seen};
}

expected<mail_page_iterator_t> search_pagination_t::paginate(
    expected<std::vector<mail_id_t>> ids_or_err) {
    if (!ids_or_err) {
        return unexpected(ids_or_err.error());
    }
    return mail_page_iterator_t{m_mailbox.get(), std::move(*ids_or_err), m_page_size,
                                m_mark_as_seen};
}

expected<mail_page_iterator_t> search_pagination_t::search_mailbox(const std::string& criteria) {
    return paginate(m_mailbox.get().search_mailbox(criteria, m_disable_server_encoding));
}

expected<mail_page_iterator_t> search_pagination_t::search_mailbox_from(
    const std::string& criteria,
    const std::vector<std::string>& senders) {
    return paginate(
        m_mailbox.get().search_mailbox_from(criteria, senders, m_disable_server_encoding));
}

expected<mail_page_iterator_t> search_pagination_t::search_mailbox_merge_results(
    const std::vector<std::string>& criteria) {
    return paginate(
        m_mailbox.get().search_mailbox_merge_results(criteria, m_disable_server_encoding));
}

}  // namespace inboxkit
