#include "mailbox_backend.hpp"

namespace inboxkit {

std::string_view to_string(sort_criteria_t c) {
    switch (c) {
        case sort_criteria_t::date:
            return "DATE";
        case sort_criteria_t::arrival:
            return "ARRIVAL";
        case sort_criteria_t::from:
            return "FROM";
        case sort_criteria_t::subject:
            return "SUBJECT";
        case sort_criteria_t::to:
            return "TO";
        case sort_criteria_t::cc:
            return "CC";
        case sort_criteria_t::size:
            return "SIZE";
    }
    return "UNKNOWN";
}

}  // namespace inboxkit
