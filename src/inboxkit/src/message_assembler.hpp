#pragma once

#include <inboxkit/global.hpp>

#include "incoming_mail.hpp"
#include "mailbox_backend.hpp"
#include "part_structure.hpp"

namespace inboxkit {

struct assembly_config_t {
    std::string server_encoding = "UTF-8";
    bool attachments_ignore = false;
    std::optional<std::string> attachments_dir;
    bool uid = true;
};

struct traversal_context_t {
    std::string key;  // positional key of the part, whole_message_key for a single part mail
    bool mark_as_seen = true;
    // Reached by descending into a message/rfc822 part that is itself an attachment.
    bool eml_parse = false;

    traversal_context_t descend(std::string child_key, bool child_eml_parse) const {
        return traversal_context_t{std::move(child_key), mark_as_seen, child_eml_parse};
    }
};

// Walks the part structure of one mail and fills body text slots and attachments of mail.
class message_assembler_t {
   public:
    message_assembler_t(std::shared_ptr<mailbox_backend_t> backend, assembly_config_t config);

    // Classifies root (when it has no children) or every part of its flattened tree. Parts added
    // before a failure stay in mail.
    expected<void> assemble(incoming_mail_t& mail, mime::part_descriptor_t root, bool mark_as_seen);

    // Classifies one part and recurses into its children.
    expected<void> classify_part(incoming_mail_t& mail,
                                 const mime::part_descriptor_t& part,
                                 const traversal_context_t& ctx);

    const assembly_config_t& config() const { return m_config; }

   private:
    std::shared_ptr<data_part_t> make_data_part(const incoming_mail_t& mail,
                                                const mime::part_descriptor_t& part,
                                                const traversal_context_t& ctx) const;

    std::shared_ptr<mailbox_backend_t> m_backend;
    assembly_config_t m_config;
};

expected<void> assemble_message(incoming_mail_t& mail,
                                mime::part_descriptor_t root,
                                std::shared_ptr<mailbox_backend_t> backend,
                                const assembly_config_t& config,
                                bool mark_as_seen = true);

}  // namespace inboxkit

DEFINE_FMT_FORMATTER(inboxkit::traversal_context_t,
                     "ctx(key: {}, mark_as_seen: {}, eml_parse: {})",
                     arg.key,
                     arg.mark_as_seen,
                     arg.eml_parse);
