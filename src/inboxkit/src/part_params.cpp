#include "part_params.hpp"
#include "mime_decode.hpp"
#include "utils.hpp"

#include <algorithm>

namespace inboxkit::mime {

param_kind_t param_kind_from_attribute(std::string_view lowercase_attribute) {
    if (lowercase_attribute == "filename") {
        return param_kind_t::filename;
    } else if (lowercase_attribute == "name") {
        return param_kind_t::name;
    } else if (lowercase_attribute == "charset") {
        return param_kind_t::charset;
    }
    return param_kind_t::other;
}

part_param_entry_t* part_params_t::find(std::string_view attribute) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const part_param_entry_t& e) { return e.attribute == attribute; });
    return it != m_entries.end() ? &*it : nullptr;
}

const part_param_entry_t* part_params_t::find(std::string_view attribute) const {
    return const_cast<part_params_t*>(this)->find(attribute);
}

const part_param_entry_t* part_params_t::find(param_kind_t kind) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const part_param_entry_t& e) { return e.kind == kind; });
    return it != m_entries.end() ? &*it : nullptr;
}

bool part_params_t::has(param_kind_t kind) const {
    return find(kind) != nullptr;
}

bool part_params_t::has(std::string_view attribute) const {
    return find(utils::to_lower(attribute)) != nullptr;
}

bool part_params_t::has_value(param_kind_t kind) const {
    auto* entry = find(kind);
    return entry && !utils::is_blank(entry->value);
}

std::optional<std::string> part_params_t::get(param_kind_t kind) const {
    auto* entry = find(kind);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

std::optional<std::string> part_params_t::get(std::string_view attribute) const {
    auto* entry = find(utils::to_lower(attribute));
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

void part_params_t::set(std::string_view attribute, std::string value) {
    const auto lower = utils::to_lower(attribute);
    if (auto* entry = find(lower)) {
        entry->value = std::move(value);
        return;
    }
    m_entries.push_back(
        part_param_entry_t{param_kind_from_attribute(lower), lower, std::move(value)});
}

void part_params_t::append(std::string_view attribute, std::string_view value) {
    const auto lower = utils::to_lower(attribute);
    if (auto* entry = find(lower)) {
        entry->value.append(value);
        return;
    }
    m_entries.push_back(
        part_param_entry_t{param_kind_from_attribute(lower), lower, std::string{value}});
}

namespace {
// "filename*0*" -> "filename", "name*" -> "name", "size" -> "size"
std::string_view continuation_base(std::string_view attribute) {
    const auto star = attribute.find('*');
    return star == std::string_view::npos ? attribute : attribute.substr(0, star);
}
}  // namespace

part_params_t build_part_params(const part_descriptor_t& part) {
    part_params_t params;

    for (auto& [attribute, value] : part.params) {
        if (utils::is_blank(value)) {
            params.set(attribute, "");
        } else {
            params.set(attribute, decode_mime_str(value));
        }
    }

    for (auto& [attribute, value] : part.dparams) {
        params.append(continuation_base(attribute), value);
    }

    return params;
}

}  // namespace inboxkit::mime
