#pragma once

#include <inboxkit/global.hpp>

#include "part_structure.hpp"

namespace inboxkit::mime {

enum class param_kind_t { filename, name, charset, other };

param_kind_t param_kind_from_attribute(std::string_view lowercase_attribute);

struct part_param_entry_t {
    param_kind_t kind = param_kind_t::other;
    std::string attribute;  // lower case, continuation marker removed
    std::string value;
};

// Content-Type and Content-Disposition parameters of one part merged by attribute, in the order
// the attributes were first seen.
class part_params_t {
   public:
    bool has(param_kind_t kind) const;
    bool has(std::string_view attribute) const;
    // Present and not blank.
    bool has_value(param_kind_t kind) const;

    std::optional<std::string> get(param_kind_t kind) const;
    std::optional<std::string> get(std::string_view attribute) const;

    const std::vector<part_param_entry_t>& entries() const { return m_entries; }
    bool empty() const { return m_entries.empty(); }

    void set(std::string_view attribute, std::string value);
    void append(std::string_view attribute, std::string_view value);

   private:
    part_param_entry_t* find(std::string_view attribute);
    const part_param_entry_t* find(std::string_view attribute) const;
    const part_param_entry_t* find(param_kind_t kind) const;

    std::vector<part_param_entry_t> m_entries;
};

// Type parameters are MIME-decoded (blank ones become empty). Disposition parameters are appended
// without decoding; "filename*0*", "filename*1" and the like are folded onto "filename" in the
// order they are met, so an RFC 2231 value arrives in one piece.
part_params_t build_part_params(const part_descriptor_t& part);

}  // namespace inboxkit::mime
