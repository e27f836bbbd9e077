#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace wordspace {

// Thrown when a user-facing lookup names something that was never indexed.
class UnknownEntityError : public std::runtime_error {
public:
    UnknownEntityError(const std::string& kind, const std::string& name);

    const std::string& kind() const { return m_kind; }
    const std::string& name() const { return m_name; }

private:
    std::string m_kind;
    std::string m_name;
};

// Bijection name <-> dense position in [0, size()).
class EntityIndex {
public:
    EntityIndex() = default;
    EntityIndex(std::vector<std::string> names, std::string kind);

    size_t size() const { return m_names.size(); }
    const std::string& kind() const { return m_kind; }
    const std::vector<std::string>& names() const { return m_names; }

    const std::string& name_of(size_t pos) const;
    bool contains(const std::string& name) const;

    // builder-side lookup: a miss is not an error
    bool try_position(const std::string& name, size_t& pos) const;

    // user-side lookup: throws UnknownEntityError on a miss
    size_t position_of(const std::string& name) const;

private:
    std::string m_kind = "entity";
    std::vector<std::string> m_names;                  // pos -> name
    std::unordered_map<std::string, size_t> m_pos;     // name -> pos
};

}  // namespace wordspace
