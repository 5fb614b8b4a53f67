#pragma once

#include <inboxkit/global.hpp>

#include "mailbox.hpp"

#include <functional>

namespace inboxkit {

// Pages over a fixed list of mail ids; mails of the current page are fetched on current().
// Refers to the mailbox it was created with: that mailbox must outlive the iterator and must not
// be moved while the iterator is in use.
class mail_page_iterator_t {
   public:
    mail_page_iterator_t(mailbox_t& mailbox,
                         std::vector<mail_id_t> ids,
                         size_t page_size,
                         bool mark_as_seen);

    // Number of pages.
    size_t count() const;
    size_t mail_count() const { return m_ids.size(); }

    size_t key() const { return m_page; }
    expected<void> seek(size_t page);
    bool valid() const { return m_page < count(); }
    void next() { ++m_page; }
    void rewind() { m_page = 0; }

    std::vector<mail_id_t> current_ids() const;
    expected<std::vector<incoming_mail_t>> current();

   private:
    std::reference_wrapper<mailbox_t> m_mailbox;
    std::vector<mail_id_t> m_ids;
    size_t m_page_size;
    bool m_mark_as_seen;
    size_t m_page = 0;
};

// Runs mailbox searches and pages over their results. Holds a reference to mailbox, so it sees
// later configuration changes of it. The mailbox must outlive the pagination and every iterator
// it returned, and must stay at the same address (keep it in a std::optional or on the heap
// rather than moving it around).
class search_pagination_t {
   public:
    static expected<search_pagination_t> create(mailbox_t& mailbox,
                                                int page_size,
                                                bool disable_server_encoding = false,
                                                bool mark_as_seen = false);

    expected<mail_page_iterator_t> search_mailbox(const std::string& criteria = "ALL");
    expected<mail_page_iterator_t> search_mailbox_from(const std::string& criteria,
                                                       const std::vector<std::string>& senders);
    expected<mail_page_iterator_t> search_mailbox_merge_results(
        const std::vector<std::string>& criteria);

    size_t page_size() const { return m_page_size; }

   private:
    search_pagination_t(mailbox_t& mailbox,
                        size_t page_size,
                        bool disable_server_encoding,
                        bool mark_as_seen);

    expected<mail_page_iterator_t> paginate(expected<std::vector<mail_id_t>> ids_or_err);

    std::reference_wrapper<mailbox_t> m_mailbox;
    size_t m_page_size;
    bool m_disable_server_encoding;
    bool m_mark_as_seen;
};

}  // namespace inboxkit
