#include "mail_header_parser.hpp"
#include "charset.hpp"
#include "mailbox_errors.hpp"
#include "mime_decode.hpp"
#include "utils.hpp"

#include <gmime/gmime.h>
#include <scope_guard/scope_guard.hpp>

#include <algorithm>
#include <array>
#include <regex>

namespace inboxkit::rfc822 {

namespace {

struct parsed_mailbox_t {
    std::string address;  // as written, local@host
    std::optional<std::string> name;  // decoded by GMime to utf-8
};

void collect_mailboxes(InternetAddressList* list, std::vector<parsed_mailbox_t>& result) {
    const int list_size = internet_address_list_length(list);
    for (int i = 0; i < list_size; ++i) {
        auto* addr = internet_address_list_get_address(list, i);
        if (!addr) {
            log_warning("{} is null address", i);
            continue;
        }

        if (INTERNET_ADDRESS_IS_MAILBOX(addr)) {
            auto* as_mailbox = reinterpret_cast<InternetAddressMailbox*>(addr);
            const char* address_part = internet_address_mailbox_get_addr(as_mailbox);
            const char* name_part = internet_address_get_name(addr);
            parsed_mailbox_t mailbox;
            mailbox.address = address_part ? address_part : "";
            if (name_part) {
                mailbox.name = name_part;
            }
            result.emplace_back(std::move(mailbox));
        } else if (INTERNET_ADDRESS_IS_GROUP(addr)) {
            auto* as_group = reinterpret_cast<InternetAddressGroup*>(addr);
            InternetAddressList* members = internet_address_group_get_members(as_group);
            if (members) {
                collect_mailboxes(members, result);
            }
        } else {
            log_warning("something else, skip");
        }
    }
}

std::vector<parsed_mailbox_t> get_mailboxes(InternetAddressList* list) {
    std::vector<parsed_mailbox_t> result;
    if (list) {
        collect_mailboxes(list, result);
    }
    return result;
}

std::pair<std::string, std::string> split_address(std::string_view address) {
    const auto at = address.rfind('@');
    if (at == std::string_view::npos) {
        return {std::string{address}, ""};
    }
    return {std::string{address.substr(0, at)}, std::string{address.substr(at + 1)}};
}

std::optional<std::string> decode_name(const std::optional<std::string>& name,
                                       std::string_view server_encoding) {
    if (!name || utils::is_blank(*name)) {
        return std::nullopt;
    }
    return charset::convert_string_encoding(*name, "UTF-8", server_encoding);
}

// Unfolded but otherwise undecoded value of the first header called name.
std::optional<std::string> get_raw_header(GMimeObject* object, std::string_view name) {
    GMimeHeaderList* list = g_mime_object_get_header_list(object);
    if (!list) {
        return std::nullopt;
    }

    const int list_size = g_mime_header_list_get_count(list);
    for (int i = 0; i < list_size; ++i) {
        auto* header = g_mime_header_list_get_header_at(list, i);
        if (!header) {
            log_warning("null returned for header {}", i);
            continue;
        }
        if (!utils::iequals(g_mime_header_get_name(header), name)) {
            continue;
        }
        const char* raw_value = g_mime_header_get_raw_value(header);
        if (!raw_value) {
            return std::string{};
        }
        char* unfolded = g_mime_utils_header_unfold(raw_value);
        auto unfolded_guard = sg::make_scope_guard([unfolded] { g_free(unfolded); });
        return utils::trim(unfolded ? unfolded : "");
    }
    return std::nullopt;
}

std::string format_utc(GDateTime* date_time) {
    GDateTime* utc = g_date_time_to_utc(date_time);
    auto utc_guard = sg::make_scope_guard([utc] { g_date_time_unref(utc); });
    gchar* formatted = g_date_time_format(utc, "%Y-%m-%dT%H:%M:%S+00:00");
    auto formatted_guard = sg::make_scope_guard([formatted] { g_free(formatted); });
    return formatted ? formatted : "";
}

std::string now_utc() {
    GDateTime* now = g_date_time_new_now_utc();
    auto now_guard = sg::make_scope_guard([now] { g_date_time_unref(now); });
    return format_utc(now);
}

void fill_recipients(InternetAddressList* list,
                     std::string_view server_encoding,
                     address_map_t& target,
                     std::vector<std::string>* strings = nullptr) {
    for (auto& mailbox : get_mailboxes(list)) {
        auto [local, host] = split_address(mailbox.address);
        if (utils::is_blank(local) || utils::is_blank(host)) {
            log_debug("skipping recipient without mailbox or host: '{}'", mailbox.address);
            continue;
        }
        auto address = utils::to_lower(mailbox.address);
        auto name = decode_name(mailbox.name, server_encoding);
        if (strings) {
            strings->emplace_back(name ? fmt::format("{} <{}>", *name, address) : address);
        }
        target.set(std::move(address), std::move(name));
    }
}

struct host_name_address_t {
    std::optional<std::string> host;
    std::optional<std::string> name;
    std::string address;
};

// The first mailbox gives host and address, the name comes from the first of the first two
// mailboxes that has one.
std::optional<host_name_address_t> get_host_name_and_address(InternetAddressList* list,
                                                            std::string_view server_encoding) {
    auto mailboxes = get_mailboxes(list);
    if (mailboxes.empty()) {
        return std::nullopt;
    }

    host_name_address_t result;
    auto [local, host] = split_address(mailboxes[0].address);
    if (!host.empty()) {
        result.host = host;
    } else if (mailboxes.size() > 1) {
        auto [second_local, second_host] = split_address(mailboxes[1].address);
        if (!second_host.empty()) {
            result.host = second_host;
        }
    }

    for (size_t i = 0; i < std::min<size_t>(2, mailboxes.size()); ++i) {
        if (auto name = decode_name(mailboxes[i].name, server_encoding)) {
            result.name = std::move(name);
            break;
        }
    }

    result.address = utils::to_lower(fmt::format("{}@{}", local, result.host.value_or("")));
    return result;
}

std::optional<std::string> find_smtp_mailfrom(const std::string& headers_raw) {
    static const std::regex mailfrom_re{
        R"(smtp.mailfrom=[-0-9a-zA-Z.+_]+@[-0-9a-zA-Z.+_]+.[a-zA-Z]{2,4})"};
    std::smatch match;
    if (!std::regex_search(headers_raw, match, mailfrom_re)) {
        return std::nullopt;
    }
    return match.str(0).substr(std::string_view{"smtp.mailfrom="}.size());
}

}  // namespace

std::string find_header_flag(std::string_view headers_raw, std::string_view name) {
    const std::regex flag_re{fmt::format("{}:(.*)", name), std::regex::icase};
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(headers_raw.begin(), headers_raw.end(), match, flag_re)) {
        return {};
    }
    return utils::trim(match.str(1));
}

expected<std::string> parse_date_time(std::string_view date_header) {
    if (utils::is_blank(date_header)) {
        log_error("can not parse a blank date");
        return unexpected(make_error_code(mailbox_errc::invalid_parameter));
    }

    const std::string date{date_header};
    GDateTime* parsed = g_mime_utils_header_decode_date(date.c_str());
    if (!parsed) {
        log_debug("'{}' is not a date, keeping it as is", date);
        return date;
    }
    auto parsed_guard = sg::make_scope_guard([parsed] { g_date_time_unref(parsed); });
    return format_utc(parsed);
}

std::string format_listing_date(std::string_view date_header) {
    static constexpr std::array<std::string_view, 12> months = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    const std::string date = utils::trim(date_header);
    if (date.empty()) {
        return date;
    }
    GDateTime* parsed = g_mime_utils_header_decode_date(date.c_str());
    if (!parsed) {
        return date;
    }
    auto parsed_guard = sg::make_scope_guard([parsed] { g_date_time_unref(parsed); });

    const int month = g_date_time_get_month(parsed);
    if (month < 1 || month > 12) {
        return date;
    }
    return fmt::format("{:>2}-{}-{:04}", g_date_time_get_day_of_month(parsed), months[month - 1],
                       g_date_time_get_year(parsed));
}

expected<incoming_mail_header_t> parse_mail_header(std::string_view headers_raw,
                                                   mail_id_t id,
                                                   std::string_view server_encoding) {
    std::string data{headers_raw};
    if (!data.ends_with("\n\n") && !data.ends_with("\r\n\r\n")) {
        data += "\r\n";
    }

    GMimeStream* stream = g_mime_stream_mem_new_with_buffer(data.data(), data.size());
    if (!stream) {
        log_error("failed creating stream");
        return unexpected(make_error_code(mailbox_errc::unexpected_structure));
    }
    auto stream_guard = sg::make_scope_guard([stream] { g_object_unref(stream); });

    GMimeParser* parser = g_mime_parser_new_with_stream(stream);
    if (!parser) {
        log_error("failed creating parser from stream");
        return unexpected(make_error_code(mailbox_errc::unexpected_structure));
    }
    auto parser_guard = sg::make_scope_guard([parser] { g_object_unref(parser); });

    GMimeMessage* message = g_mime_parser_construct_message(parser, nullptr);
    if (!message) {
        log_error("failed constructing message from headers of mail {}", id);
        return unexpected(make_error_code(mailbox_errc::unexpected_structure));
    }
    auto message_guard = sg::make_scope_guard([message] { g_object_unref(message); });
    auto* object = reinterpret_cast<GMimeObject*>(message);

    incoming_mail_header_t header;
    header.id = id;
    header.headers_raw = std::string{headers_raw};

    auto date = get_raw_header(object, "Date");
    header.is_draft = !date.has_value();
    if (date && !utils::is_blank(*date)) {
        auto date_or_err = parse_date_time(*date);
        if (!date_or_err) {
            return unexpected(date_or_err.error());
        }
        header.date = std::move(*date_or_err);
    } else {
        header.date = now_utc();
    }

    header.priority = find_header_flag(headers_raw, "Priority");
    header.importance = find_header_flag(headers_raw, "Importance");
    header.sensitivity = find_header_flag(headers_raw, "Sensitivity");
    header.auto_submitted = find_header_flag(headers_raw, "Auto-Submitted");
    header.precedence = find_header_flag(headers_raw, "Precedence");
    header.failed_recipients = find_header_flag(headers_raw, "Failed-Recipients");

    if (auto subject = get_raw_header(object, "Subject"); subject && !utils::is_blank(*subject)) {
        header.subject = mime::decode_mime_str(*subject, server_encoding);
    }

    if (auto from = get_host_name_and_address(g_mime_message_get_from(message), server_encoding)) {
        header.from_host = std::move(from->host);
        header.from_name = std::move(from->name);
        header.from_address = std::move(from->address);
    } else if (auto mailfrom = find_smtp_mailfrom(header.headers_raw)) {
        header.from_address = std::move(*mailfrom);
    }

    if (auto sender =
            get_host_name_and_address(g_mime_message_get_sender(message), server_encoding)) {
        header.sender_host = std::move(sender->host);
        header.sender_name = std::move(sender->name);
        header.sender_address = std::move(sender->address);
    }

    std::vector<std::string> to_strings;
    fill_recipients(g_mime_message_get_to(message), server_encoding, header.to, &to_strings);
    header.to_string = fmt::format("{}", fmt::join(to_strings, ", "));
    fill_recipients(g_mime_message_get_cc(message), server_encoding, header.cc);
    fill_recipients(g_mime_message_get_bcc(message), server_encoding, header.bcc);
    fill_recipients(g_mime_message_get_reply_to(message), server_encoding, header.reply_to);

    if (auto message_id = get_raw_header(object, "Message-ID")) {
        header.message_id = std::move(*message_id);
    }

    log_debug("parsed {}", header);
    return header;
}

}  // namespace inboxkit::rfc822
