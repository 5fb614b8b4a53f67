#include "attachment.hpp"

#include <fstream>

namespace inboxkit {

attachment_t::attachment_t(std::string id, std::shared_ptr<data_part_t> data_part)
    : m_id(std::move(id)), m_data_part(std::move(data_part)) {}

expected<std::string> attachment_t::get_contents() {
    return m_data_part->fetch();
}

bool attachment_t::set_file_path(std::string path) {
    if (m_file_path) {
        log_warning("{} already has a file path '{}', ignoring '{}'", *this, *m_file_path, path);
        return false;
    }
    m_file_path = std::move(path);
    return true;
}

bool attachment_t::save_to_disk() {
    if (!m_file_path) {
        log_warning("{} has no file path to save to", *this);
        return false;
    }

    auto contents_or_err = get_contents();
    if (!contents_or_err) {
        log_warning("failed saving {} to '{}': {}", *this, *m_file_path, contents_or_err.error());
        m_file_path.reset();
        return false;
    }

    std::ofstream out{*m_file_path, std::ios::binary | std::ios::trunc};
    if (!out) {
        log_warning("failed opening '{}' for {}", *m_file_path, *this);
        m_file_path.reset();
        return false;
    }
    out.write(contents_or_err->data(), static_cast<std::streamsize>(contents_or_err->size()));
    if (!out) {
        log_warning("failed writing {} bytes to '{}'", contents_or_err->size(), *m_file_path);
        m_file_path.reset();
        return false;
    }

    log_debug("saved {} to '{}'", *this, *m_file_path);
    return true;
}

}  // namespace inboxkit
