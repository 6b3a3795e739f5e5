#include "Criteria.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace tablemap {

using json = nlohmann::json;

namespace {

Value jsonToValue(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return Value{};
        case json::value_t::boolean:
            return Value{static_cast<int64_t>(value.get<bool>() ? 1 : 0)};
        case json::value_t::number_integer:
            return Value{value.get<int64_t>()};
        case json::value_t::number_unsigned:
        {
            const uint64_t number = value.get<uint64_t>();
            const auto limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            return Value{static_cast<int64_t>(std::min(number, limit))};
        }
        case json::value_t::number_float:
            return Value{doubleToInteger(value.get<double>())};
        case json::value_t::string:
            return Value{value.get<std::string>()};
        default:
            throw std::invalid_argument("Unsupported criteria value: " + value.dump());
    }
}

}  // namespace

Criteria::Criteria(std::initializer_list<Value> values) {
    m_entries.reserve(values.size());
    for (const auto& value : values) {
        add(value);
    }
}

Criteria& Criteria::add(Value value) {
    return setKey(Key{m_entries.size()}, std::move(value));
}

Criteria& Criteria::set(size_t index, Value value) {
    return setKey(Key{index}, std::move(value));
}

Criteria& Criteria::set(const std::string& name, Value value) {
    return setKey(Key{name}, std::move(value));
}

Criteria& Criteria::setKey(Key key, Value value) {
    for (auto& entry : m_entries) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return *this;
        }
    }
    m_entries.emplace_back(std::move(key), std::move(value));
    return *this;
}

bool Criteria::isPositional() const {
    // Keys are unique, so n distinct indices all below n cover {0..n-1}
    const size_t n = m_entries.size();
    for (const auto& entry : m_entries) {
        const size_t* index = std::get_if<size_t>(&entry.first);
        if (!index || *index >= n) {
            return false;
        }
    }
    return true;
}

Criteria Criteria::fromJson(const std::string& text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid criteria JSON: ") + e.what());
    }

    Criteria criteria;
    if (parsed.is_array()) {
        for (const auto& item : parsed) {
            criteria.add(jsonToValue(item));
        }
    } else if (parsed.is_object()) {
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            criteria.set(it.key(), jsonToValue(it.value()));
        }
    } else {
        throw std::invalid_argument("Criteria JSON must be an array or an object");
    }
    return criteria;
}

std::string keyToString(const Criteria::Key& key) {
    if (const size_t* index = std::get_if<size_t>(&key)) {
        return "#" + std::to_string(*index);
    }
    const auto& name = std::get<std::string>(key);
    return (!name.empty() && name[0] == ':') ? name : ":" + name;
}

}  // namespace tablemap
