#include "index/EntityIndex.hpp"

#include <utility>

namespace wordspace {

UnknownEntityError::UnknownEntityError(const std::string& kind, const std::string& name)
    : std::runtime_error("unknown " + kind + ": \"" + name + "\""), m_kind(kind), m_name(name) {}

EntityIndex::EntityIndex(std::vector<std::string> names, std::string kind)
    : m_kind(std::move(kind)), m_names(std::move(names)) {
    m_pos.reserve(m_names.size() * 2 + 8);
    for (size_t i = 0; i < m_names.size(); ++i) {
        if (!m_pos.emplace(m_names[i], i).second) {
            throw std::invalid_argument("duplicate " + m_kind + " in index: " + m_names[i]);
        }
    }
}

const std::string& EntityIndex::name_of(size_t pos) const {
    if (pos >= m_names.size()) {
        throw std::out_of_range(m_kind + " position out of range: " + std::to_string(pos));
    }
    return m_names[pos];
}

bool EntityIndex::contains(const std::string& name) const {
    return m_pos.find(name) != m_pos.end();
}

bool EntityIndex::try_position(const std::string& name, size_t& pos) const {
    auto it = m_pos.find(name);
    if (it == m_pos.end()) return false;
    pos = it->second;
    return true;
}

size_t EntityIndex::position_of(const std::string& name) const {
    auto it = m_pos.find(name);
    if (it == m_pos.end()) throw UnknownEntityError(m_kind, name);
    return it->second;
}

}  // namespace wordspace
