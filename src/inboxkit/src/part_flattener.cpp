#include "part_flattener.hpp"

namespace inboxkit::mime {

namespace {

class flattener_t {
   public:
    std::vector<flattened_part_t> result() && { return std::move(m_parts); }

    // A message part restarts numbering of its children at 0 and turns off prefix growth for
    // the level below it.
    void flatten(std::vector<part_descriptor_t>& parts,
                 const std::string& prefix,
                 int index,
                 bool full_prefix,
                 bool inside_attached_message) {
        for (auto& part : parts) {
            const std::string key = prefix + std::to_string(index);
            std::vector<part_descriptor_t> children = std::move(part.parts);
            part.parts.clear();

            const bool child_inside_attached_message =
                inside_attached_message || part.is_attached_message();

            const body_type_t type = part.type;
            emit(key, std::move(part), inside_attached_message);

            if (!children.empty()) {
                if (type == body_type_t::message) {
                    flatten(children, key + ".", 0, false, child_inside_attached_message);
                } else if (full_prefix) {
                    flatten(children, key + ".", 1, true, child_inside_attached_message);
                } else {
                    flatten(children, prefix, 1, true, child_inside_attached_message);
                }
            }
            ++index;
        }
    }

   private:
    void emit(const std::string& key, part_descriptor_t descriptor, bool inside_attached_message) {
        for (auto& existing : m_parts) {
            if (existing.key == key) {
                log_debug("part key {} produced twice, overwriting {}", key, existing.descriptor);
                existing.descriptor = std::move(descriptor);
                existing.inside_attached_message = inside_attached_message;
                return;
            }
        }
        m_parts.push_back(flattened_part_t{key, std::move(descriptor), inside_attached_message});
    }

    std::vector<flattened_part_t> m_parts;
};

}  // namespace

std::vector<flattened_part_t> flatten_parts(std::vector<part_descriptor_t> parts) {
    flattener_t flattener;
    flattener.flatten(parts, "", 1, true, false);
    return std::move(flattener).result();
}

}  // namespace inboxkit::mime
