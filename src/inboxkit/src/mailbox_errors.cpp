#include "mailbox_errors.hpp"

namespace inboxkit {

namespace {
struct mailbox_errc_cat_t : std::error_category {
   public:
    const char* name() const noexcept override { return "inboxkit"; }
    std::string message(int ev) const override {
        switch (static_cast<mailbox_errc>(ev)) {
            case mailbox_errc::unexpected_structure:
                return "unexpected structure";
            case mailbox_errc::invalid_parameter:
                return "invalid parameter";
            case mailbox_errc::out_of_range:
                return "out of range";
            case mailbox_errc::storage_failure:
                return "storage failure";
            default:
                return "unrecognized error";
        }
    }
};

const mailbox_errc_cat_t the_mailbox_errc_category;
}  // namespace

std::error_code make_error_code(mailbox_errc e) {
    return {static_cast<int>(e), the_mailbox_errc_category};
}

}  // namespace inboxkit
