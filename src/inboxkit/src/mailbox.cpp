#include "mailbox.hpp"
#include "charset.hpp"
#include "mail_header_parser.hpp"
#include "mailbox_errors.hpp"
#include "mime_decode.hpp"
#include "part_structure.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace inboxkit {

namespace {

std::string join_ids(const std::vector<mail_id_t>& ids) {
    return fmt::format("{}", fmt::join(ids, ","));
}

void append_unique(std::vector<mail_id_t>& target, const std::vector<mail_id_t>& ids) {
    for (auto id : ids) {
        if (std::find(target.begin(), target.end(), id) == target.end()) {
            target.push_back(id);
        }
    }
}

std::string format_listing_line(const mail_overview_t& mail,
                                std::string_view from,
                                std::string_view subject) {
    std::string flags(6, ' ');
    if (mail.recent) {
        flags[0] = mail.seen ? 'R' : 'N';
    }
    if (!mail.recent && !mail.seen) {
        flags[1] = 'U';
    }
    if (mail.flagged) {
        flags[2] = 'F';
    }
    if (mail.answered) {
        flags[3] = 'A';
    }
    if (mail.deleted) {
        flags[4] = 'D';
    }
    if (mail.draft) {
        flags[5] = 'X';
    }
    return fmt::format("{}{:>4}){:<11} {:<20.20} {:.25} ({} chars)", flags, mail.msgno,
                       rfc822::format_listing_date(mail.date), from, subject, mail.size);
}

}  // namespace

mailbox_t::mailbox_t(std::shared_ptr<mailbox_backend_t> backend) : m_backend(std::move(backend)) {}

expected<mailbox_t> mailbox_t::create(std::shared_ptr<mailbox_backend_t> backend,
                                      mailbox_options_t options) {
    if (!backend) {
        log_error("mailbox needs a backend");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    mailbox_t mailbox{std::move(backend)};

    if (auto r = mailbox.set_server_encoding(options.server_encoding); !r) {
        return unexpected(r.error());
    }
    if (options.attachments_dir) {
        if (auto r = mailbox.set_attachments_dir(*options.attachments_dir); !r) {
            return unexpected(r.error());
        }
    }
    if (auto r = mailbox.set_path_delimiter(options.path_delimiter); !r) {
        return unexpected(r.error());
    }
    if (auto r = mailbox.set_search_option(options.search_option); !r) {
        return unexpected(r.error());
    }
    mailbox.set_attachments_ignore(options.attachments_ignore);

    return mailbox;
}

expected<void> mailbox_t::set_server_encoding(std::string_view encoding) {
    auto normalized = utils::to_upper(utils::trim(encoding));
    if (!charset::is_supported_encoding(normalized)) {
        log_error("'{}' is not supported as server encoding", normalized);
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    m_options.server_encoding = std::move(normalized);
    return {};
}

expected<void> mailbox_t::set_attachments_dir(std::string_view dir) {
    if (utils::is_blank(dir)) {
        log_error("attachments dir can not be blank");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    std::error_code ec;
    const std::filesystem::path path{std::string{dir}};
    if (!std::filesystem::is_directory(path, ec)) {
        log_error("attachments dir '{}' is not an existing directory", dir);
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    auto canonical = std::filesystem::canonical(path, ec);
    std::string result = ec ? path.string() : canonical.string();
    while (result.size() > 1 && (result.back() == '/' || result.back() == '\\')) {
        result.pop_back();
    }
    m_options.attachments_dir = std::move(result);
    return {};
}

bool mailbox_t::validate_path_delimiter(std::string_view delimiter) {
    return delimiter == "." || delimiter == "/";
}

expected<void> mailbox_t::set_path_delimiter(std::string_view delimiter) {
    if (!validate_path_delimiter(delimiter)) {
        log_error("path delimiter can be '.' or '/', not '{}'", delimiter);
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    m_options.path_delimiter = std::string{delimiter};
    return {};
}

expected<void> mailbox_t::set_search_option(search_option_t option) {
    if (option != search_option_t::uid && option != search_option_t::sequence) {
        log_error("unsupported search option {}", static_cast<int>(option));
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    m_options.search_option = option;
    return {};
}

assembly_config_t mailbox_t::assembly_config() const {
    return assembly_config_t{.server_encoding = m_options.server_encoding,
                             .attachments_ignore = m_options.attachments_ignore,
                             .attachments_dir = m_options.attachments_dir,
                             .uid = use_uid()};
}

expected<incoming_mail_header_t> mailbox_t::get_mail_header(mail_id_t id) {
    auto raw_or_err = m_backend->fetch_header(id, fetch_options_t{.peek = true, .uid = use_uid()});
    if (!raw_or_err) {
        log_error("failed fetching header of mail {}: {}", id, raw_or_err.error());
        return unexpected(raw_or_err.error());
    }
    return rfc822::parse_mail_header(*raw_or_err, id, m_options.server_encoding);
}

expected<incoming_mail_t> mailbox_t::get_mail(mail_id_t id, bool mark_as_seen) {
    auto header_or_err = get_mail_header(id);
    if (!header_or_err) {
        return unexpected(header_or_err.error());
    }

    auto structure_or_err =
        m_backend->fetch_structure(id, fetch_options_t{.peek = true, .uid = use_uid()});
    if (!structure_or_err) {
        log_error("failed fetching structure of mail {}: {}", id, structure_or_err.error());
        return unexpected(structure_or_err.error());
    }

    auto root_or_err = mime::make_part_descriptor(*structure_or_err);
    if (!root_or_err) {
        log_error("mail {} has unusable structure: {}", id, root_or_err.error());
        return unexpected(root_or_err.error());
    }

    incoming_mail_t mail{std::move(*header_or_err)};
    auto assembled_or_err =
        assemble_message(mail, std::move(*root_or_err), m_backend, assembly_config(), mark_as_seen);
    if (!assembled_or_err) {
        return unexpected(assembled_or_err.error());
    }
    return mail;
}

expected<std::string> mailbox_t::get_raw_mail(mail_id_t id, bool mark_as_seen) {
    return m_backend->fetch_section(id, "",
                                    fetch_options_t{.peek = !mark_as_seen, .uid = use_uid()});
}

expected<void> mailbox_t::save_mail(mail_id_t id, const std::string& filename) {
    auto raw_or_err = m_backend->fetch_section(id, "", fetch_options_t{.uid = use_uid()});
    if (!raw_or_err) {
        log_error("failed fetching mail {}: {}", id, raw_or_err.error());
        return unexpected(raw_or_err.error());
    }

    std::ofstream out{filename, std::ios::binary | std::ios::trunc};
    out.write(raw_or_err->data(), static_cast<std::streamsize>(raw_or_err->size()));
    if (!out) {
        log_error("failed writing mail {} to '{}'", id, filename);
        return unexpected(make_error_code(mailbox_errc::storage_failure));
    }
    return {};
}

expected<std::string> mailbox_t::get_mail_mbox_format(mail_id_t id) {
    auto header_or_err =
        m_backend->fetch_header(id, fetch_options_t{.peek = true, .uid = use_uid()});
    if (!header_or_err) {
        log_error("failed fetching header of mail {}: {}", id, header_or_err.error());
        return unexpected(header_or_err.error());
    }
    auto body_or_err = m_backend->fetch_body(id, fetch_options_t{.peek = false, .uid = use_uid()});
    if (!body_or_err) {
        log_error("failed fetching body of mail {}: {}", id, body_or_err.error());
        return unexpected(body_or_err.error());
    }
    return *header_or_err + *body_or_err;
}

expected<std::vector<mail_overview_t>> mailbox_t::get_mails_info(
    const std::vector<mail_id_t>& ids) {
    if (ids.empty()) {
        log_error("no mails to get info for");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    auto overviews_or_err = m_backend->fetch_overview(join_ids(ids), use_uid());
    if (!overviews_or_err) {
        log_error("failed fetching overview of {}: {}", join_ids(ids), overviews_or_err.error());
        return unexpected(overviews_or_err.error());
    }

    for (auto& mail : *overviews_or_err) {
        for (auto* field : {&mail.subject, &mail.from, &mail.sender, &mail.to}) {
            if (!utils::is_blank(*field)) {
                *field = decode_mime_str(*field);
            }
        }
    }
    return overviews_or_err;
}

expected<std::vector<std::string>> mailbox_t::get_mailbox_headers() {
    auto overviews_or_err = m_backend->fetch_overview("1:*", false);
    if (!overviews_or_err) {
        log_error("failed fetching overview of '{}': {}", m_current_mailbox,
                  overviews_or_err.error());
        return unexpected(overviews_or_err.error());
    }

    std::vector<std::string> lines;
    lines.reserve(overviews_or_err->size());
    for (auto& mail : *overviews_or_err) {
        lines.emplace_back(
            format_listing_line(mail, decode_mime_str(mail.from), decode_mime_str(mail.subject)));
    }
    return lines;
}

expected<std::vector<mail_id_t>> mailbox_t::search_mailbox(const std::string& criteria,
                                                           bool disable_server_encoding) {
    search_request_t request{.criteria = criteria, .uid = use_uid()};
    if (!disable_server_encoding) {
        request.charset = m_options.server_encoding;
    }
    return m_backend->search(request);
}

expected<std::vector<mail_id_t>> mailbox_t::search_mailbox_from(
    const std::string& criteria,
    const std::vector<std::string>& senders,
    bool disable_server_encoding) {
    if (senders.empty()) {
        log_error("searching by sender needs at least one sender");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    std::vector<std::string> unique_senders;
    for (auto& sender : senders) {
        auto lower = utils::to_lower(sender);
        if (std::find(unique_senders.begin(), unique_senders.end(), lower) ==
            unique_senders.end()) {
            unique_senders.emplace_back(std::move(lower));
        }
    }

    std::vector<mail_id_t> result;
    for (auto& sender : unique_senders) {
        auto ids_or_err = search_mailbox(criteria + " FROM " + sender, disable_server_encoding);
        if (!ids_or_err) {
            return unexpected(ids_or_err.error());
        }
        append_unique(result, *ids_or_err);
    }
    return result;
}

expected<std::vector<mail_id_t>> mailbox_t::search_mailbox_merge_results(
    const std::vector<std::string>& criteria,
    bool disable_server_encoding) {
    if (criteria.empty()) {
        log_error("merging search results needs at least one criteria");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    std::vector<mail_id_t> result;
    for (auto& c : criteria) {
        auto ids_or_err = search_mailbox(c, disable_server_encoding);
        if (!ids_or_err) {
            return unexpected(ids_or_err.error());
        }
        append_unique(result, *ids_or_err);
    }
    return result;
}

expected<std::vector<mail_id_t>> mailbox_t::sort_mails(sort_criteria_t criteria,
                                                       bool reverse,
                                                       const std::string& search_criteria) {
    return m_backend->sort(criteria, reverse,
                           search_request_t{.criteria = search_criteria, .uid = use_uid()});
}

expected<uint32_t> mailbox_t::count_mails() {
    return m_backend->count_messages();
}

expected<void> mailbox_t::mark_mail_as_read(mail_id_t id) {
    return set_flag({id}, "\\Seen");
}

expected<void> mailbox_t::mark_mail_as_unread(mail_id_t id) {
    return clear_flag({id}, "\\Seen");
}

expected<void> mailbox_t::mark_mail_as_important(mail_id_t id) {
    return set_flag({id}, "\\Flagged");
}

expected<void> mailbox_t::mark_mails_as_read(const std::vector<mail_id_t>& ids) {
    return set_flag(ids, "\\Seen");
}

expected<void> mailbox_t::mark_mails_as_unread(const std::vector<mail_id_t>& ids) {
    return clear_flag(ids, "\\Seen");
}

expected<void> mailbox_t::mark_mails_as_important(const std::vector<mail_id_t>& ids) {
    return set_flag(ids, "\\Flagged");
}

// Flag stores always address UIDs.
expected<void> mailbox_t::set_flag(const std::vector<mail_id_t>& ids, const std::string& flag) {
    if (ids.empty()) {
        log_error("no mails to set {} on", flag);
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    return m_backend->store_flags(join_ids(ids), flag, true, true);
}

expected<void> mailbox_t::clear_flag(const std::vector<mail_id_t>& ids, const std::string& flag) {
    if (ids.empty()) {
        log_error("no mails to clear {} from", flag);
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }
    return m_backend->store_flags(join_ids(ids), flag, false, true);
}

expected<void> mailbox_t::delete_mail(mail_id_t id) {
    return m_backend->store_flags(std::to_string(id), "\\Deleted", true, use_uid());
}

expected<void> mailbox_t::move_mail(const std::string& sequence_set, const std::string& mailbox) {
    auto encoded_or_err = encode_string_to_utf7_imap(mailbox);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    if (auto r = m_backend->move_messages(sequence_set, *encoded_or_err, true); !r) {
        log_error("failed moving {} to '{}': {}", sequence_set, mailbox, r.error());
        return r;
    }
    return expunge_deleted_mails();
}

expected<void> mailbox_t::copy_mail(const std::string& sequence_set, const std::string& mailbox) {
    auto encoded_or_err = encode_string_to_utf7_imap(mailbox);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    if (auto r = m_backend->copy_messages(sequence_set, *encoded_or_err, true); !r) {
        log_error("failed copying {} to '{}': {}", sequence_set, mailbox, r.error());
        return r;
    }
    return expunge_deleted_mails();
}

expected<void> mailbox_t::expunge_deleted_mails() {
    return m_backend->expunge();
}

std::string mailbox_t::combined_path(const std::string& name) const {
    if (utils::is_blank(name)) {
        return m_current_mailbox;
    }
    if (m_current_mailbox.empty()) {
        return name;
    }
    return m_current_mailbox + m_options.path_delimiter + name;
}

expected<std::string> mailbox_t::encoded_combined_path(const std::string& name) const {
    return encode_string_to_utf7_imap(combined_path(name));
}

expected<void> mailbox_t::switch_mailbox(const std::string& path) {
    auto encoded_or_err = encode_string_to_utf7_imap(path);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    if (auto r = m_backend->select_mailbox(*encoded_or_err); !r) {
        log_error("failed selecting '{}': {}", path, r.error());
        return r;
    }
    m_current_mailbox = path;
    return {};
}

expected<void> mailbox_t::create_mailbox(const std::string& name) {
    auto encoded_or_err = encoded_combined_path(name);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    return m_backend->create_mailbox(*encoded_or_err);
}

expected<void> mailbox_t::delete_mailbox(const std::string& name) {
    auto encoded_or_err = encoded_combined_path(name);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    return m_backend->delete_mailbox(*encoded_or_err);
}

expected<void> mailbox_t::rename_mailbox(const std::string& old_name, const std::string& new_name) {
    auto old_or_err = encoded_combined_path(old_name);
    if (!old_or_err) {
        return unexpected(old_or_err.error());
    }
    auto new_or_err = encoded_combined_path(new_name);
    if (!new_or_err) {
        return unexpected(new_or_err.error());
    }
    return m_backend->rename_mailbox(*old_or_err, *new_or_err);
}

expected<void> mailbox_t::subscribe_mailbox(const std::string& name) {
    auto encoded_or_err = encoded_combined_path(name);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    return m_backend->subscribe(*encoded_or_err);
}

expected<void> mailbox_t::unsubscribe_mailbox(const std::string& name) {
    auto encoded_or_err = encoded_combined_path(name);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    return m_backend->unsubscribe(*encoded_or_err);
}

expected<mailbox_status_t> mailbox_t::status_mailbox() {
    auto encoded_or_err = encode_string_to_utf7_imap(m_current_mailbox);
    if (!encoded_or_err) {
        return unexpected(encoded_or_err.error());
    }
    return m_backend->status(*encoded_or_err);
}

expected<quota_resource_t> mailbox_t::storage_quota(const std::string& quota_root) {
    auto resources_or_err = m_backend->get_quota_root(quota_root);
    if (!resources_or_err) {
        log_error("failed getting quota of '{}': {}", quota_root, resources_or_err.error());
        return unexpected(resources_or_err.error());
    }
    for (auto& resource : *resources_or_err) {
        if (utils::iequals(resource.name, "STORAGE")) {
            return resource;
        }
    }
    log_debug("no storage quota for '{}'", quota_root);
    return quota_resource_t{.name = "STORAGE"};
}

expected<uint64_t> mailbox_t::get_quota_limit(const std::string& quota_root) {
    auto quota_or_err = storage_quota(quota_root);
    if (!quota_or_err) {
        return unexpected(quota_or_err.error());
    }
    return quota_or_err->limit;
}

expected<uint64_t> mailbox_t::get_quota_usage(const std::string& quota_root) {
    auto quota_or_err = storage_quota(quota_root);
    if (!quota_or_err) {
        return unexpected(quota_or_err.error());
    }
    return quota_or_err->usage;
}

expected<std::vector<mailbox_info_t>> mailbox_t::to_mailbox_infos(
    const std::vector<mailbox_list_entry_t>& entries) const {
    std::vector<mailbox_info_t> result;

    for (auto& entry : entries) {
        mailbox_info_t info;
        info.attributes = entry.flags;
        info.delimiter = entry.hierarchy_delimiter;

        auto full_path_or_err = utils::decode_imap_utf7(entry.mailbox_raw);
        if (!full_path_or_err) {
            log_error("failed decoding mailbox name '{}': {}", entry.mailbox_raw,
                      full_path_or_err.error());
            return unexpected(full_path_or_err.error());
        }
        info.full_path = std::move(*full_path_or_err);

        if (entry.hierarchy_delimiter.size() == 1) {
            for (auto& tok : utils::split_views(entry.mailbox_raw, entry.hierarchy_delimiter[0])) {
                auto utf8_or_err = utils::decode_imap_utf7(tok);
                if (!utf8_or_err) {
                    log_error("failed parsing token: '{}': {}", tok, utf8_or_err.error());
                    continue;
                }
                info.path.emplace_back(std::move(*utf8_or_err));
            }
        } else {
            if (!entry.hierarchy_delimiter.empty()) {
                log_warning("we can't split multichar hierarchy delimiters, skipping");
            }
            info.path.push_back(info.full_path);
        }

        log_debug("{}", info);
        result.emplace_back(std::move(info));
    }

    return result;
}

expected<std::vector<mailbox_info_t>> mailbox_t::get_mailboxes(const std::string& pattern) {
    auto entries_or_err = m_backend->list_mailboxes("", pattern);
    if (!entries_or_err) {
        log_error("failed listing mailboxes: {}", entries_or_err.error());
        return unexpected(entries_or_err.error());
    }
    return to_mailbox_infos(*entries_or_err);
}

expected<std::vector<mailbox_info_t>> mailbox_t::get_subscribed_mailboxes(
    const std::string& pattern) {
    auto entries_or_err = m_backend->list_subscribed("", pattern);
    if (!entries_or_err) {
        log_error("failed listing subscribed mailboxes: {}", entries_or_err.error());
        return unexpected(entries_or_err.error());
    }
    return to_mailbox_infos(*entries_or_err);
}

expected<std::string> mailbox_t::encode_string_to_utf7_imap(std::string_view utf8) const {
    return utils::encode_imap_utf7(utf8);
}

expected<std::string> mailbox_t::decode_string_from_utf7_imap_to_utf8(
    std::string_view text) const {
    return utils::decode_imap_utf7(text);
}

std::string mailbox_t::decode_mime_str(std::string_view text) const {
    return mime::decode_mime_str(text, m_options.server_encoding);
}

std::string mailbox_t::convert_string_encoding(std::string_view text,
                                               std::string_view from,
                                               std::string_view to) const {
    return charset::convert_string_encoding(text, from, to);
}

expected<std::string> mailbox_t::parse_date_time(std::string_view date_header) const {
    return rfc822::parse_date_time(date_header);
}

}  // namespace inboxkit
