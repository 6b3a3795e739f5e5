#pragma once

#include "Value.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tablemap {

// Values to bind into a prepared statement, keyed either by 0-based index
// or by parameter name. Setting an existing key replaces its value.
class Criteria {
public:
    using Key = std::variant<size_t, std::string>;
    using Entry = std::pair<Key, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Criteria() = default;

    // Positional criteria: values get keys 0..n-1 in order
    Criteria(std::initializer_list<Value> values);

    // Append under the next free index (current size)
    Criteria& add(Value value);

    Criteria& set(size_t index, Value value);
    Criteria& set(const std::string& name, Value value);

    // Positional iff the key set is exactly {0, ..., n-1}
    bool isPositional() const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    // A JSON array gives positional criteria, a JSON object named ones.
    // Throws std::invalid_argument for anything else.
    static Criteria fromJson(const std::string& text);

private:
    Criteria& setKey(Key key, Value value);

    std::vector<Entry> m_entries;
};

// Renders a key the way it appears in logs: "#0" or ":name"
std::string keyToString(const Criteria::Key& key);

}  // namespace tablemap
