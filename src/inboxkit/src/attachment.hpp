#pragma once

#include <inboxkit/global.hpp>

#include "data_part.hpp"

namespace inboxkit {

class attachment_t {
   public:
    attachment_t(std::string id, std::shared_ptr<data_part_t> data_part);

    const std::string& id() const { return m_id; }
    std::shared_ptr<data_part_t> data_part() const { return m_data_part; }

    // Fetches and decodes on first call.
    expected<std::string> get_contents();

    // The path can be assigned only once; later calls return false and keep the first one.
    bool set_file_path(std::string path);
    const std::optional<std::string>& file_path() const { return m_file_path; }

    // Writes the contents to file_path(). On failure the path is dropped again.
    bool save_to_disk();

   public:
    std::optional<std::string> content_id;  // without angle brackets
    std::string name;
    std::optional<std::string> disposition;
    std::optional<std::string> charset;
    bool eml_origin = false;
    mime::body_type_t type = mime::body_type_t::other;
    std::string subtype;
    std::optional<std::string> description;
    uint32_t size_in_bytes = 0;

   private:
    std::string m_id;
    std::shared_ptr<data_part_t> m_data_part;
    std::optional<std::string> m_file_path;
};

}  // namespace inboxkit

DEFINE_FMT_FORMATTER(inboxkit::attachment_t,
                     "attachment(id: {}, name: '{}', {}/{}, eml: {})",
                     arg.id(),
                     arg.name,
                     arg.type,
                     arg.subtype,
                     arg.eml_origin);
