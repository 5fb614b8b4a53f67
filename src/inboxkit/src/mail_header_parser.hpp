#pragma once

#include <inboxkit/global.hpp>

#include "incoming_mail.hpp"

namespace inboxkit::rfc822 {

// Parses a raw header block as fetched from the server. Names and the subject are decoded into
// server_encoding.
expected<incoming_mail_header_t> parse_mail_header(std::string_view headers_raw,
                                                   mail_id_t id,
                                                   std::string_view server_encoding = "UTF-8");

// RFC 2822 date to "YYYY-MM-DDTHH:MM:SS+00:00". Text that is not a date comes back unchanged,
// blank text is an error.
expected<std::string> parse_date_time(std::string_view date_header);

// Date as shown in mailbox listings, " 5-Aug-2005", in the zone the date was written in. Text
// that is not a date comes back trimmed.
std::string format_listing_date(std::string_view date_header);

// Value after the first case-insensitive "name:" in the raw headers, trimmed. Matches anywhere
// in a line, so "Priority" also finds "X-Priority: 1".
std::string find_header_flag(std::string_view headers_raw, std::string_view name);

}  // namespace inboxkit::rfc822
