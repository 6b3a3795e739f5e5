#pragma once

#include "ErrorHandler.hpp"
#include "IdentifierSanitizer.hpp"
#include "Value.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tablemap {

// Conversion between a field's C++ type and a Value
template <typename F, typename Enable = void>
struct ValueConverter;

template <typename F>
struct ValueConverter<F, std::enable_if_t<std::is_integral_v<F> && !std::is_same_v<F, bool>>> {
    static Value toValue(F field) { return Value{static_cast<int64_t>(field)}; }

    // Numeric-looking text is accepted; null and other text give 0
    static F fromValue(const Value& value) {
        Value coerced = coerceNumeric(value);
        return isInteger(coerced) ? static_cast<F>(std::get<int64_t>(coerced)) : F{};
    }
};

template <>
struct ValueConverter<std::string> {
    static Value toValue(const std::string& field) { return Value{field}; }

    static std::string fromValue(const Value& value) {
        if (isNull(value)) return std::string();
        return valueToString(value);
    }
};

template <typename F>
struct ValueConverter<std::optional<F>> {
    static Value toValue(const std::optional<F>& field) {
        return field ? ValueConverter<F>::toValue(*field) : Value{};
    }

    static std::optional<F> fromValue(const Value& value) {
        if (isNull(value)) return std::nullopt;
        return ValueConverter<F>::fromValue(value);
    }
};

// One persisted column of T: its name, how to read it, how to write it
template <typename T>
struct FieldDescriptor {
    std::string column;
    std::function<Value(const T&)> get;
    std::function<void(T&, const Value&)> set;
};

// Table name plus the ordered field list of an entity type. Entity types
// expose it as `static const EntityMapping<T>& mapping()`.
template <typename T>
class EntityMapping {
public:
    static constexpr const char* kIdColumn = "id";

    // Throws MappingError if there is no "id" field, a column repeats or a
    // column name sanitizes to nothing
    EntityMapping(std::string table, std::vector<FieldDescriptor<T>> fields)
        : m_table(std::move(table)), m_fields(std::move(fields)) {
        if (m_table.empty()) {
            throw MappingError("Entity mapping has no table name");
        }
        for (size_t i = 0; i < m_fields.size(); ++i) {
            if (sanitizeIdentifier(m_fields[i].column).empty()) {
                throw MappingError("Column '" + m_fields[i].column +
                                   "' of " + m_table + " has an empty name");
            }
            for (size_t j = 0; j < i; ++j) {
                if (lower(m_fields[i].column) == lower(m_fields[j].column)) {
                    throw MappingError("Column '" + m_fields[i].column +
                                       "' is mapped twice in " + m_table);
                }
            }
        }
        m_id = find(kIdColumn);
        if (!m_id) {
            throw MappingError("Entity mapping for " + m_table + " has no id field");
        }
        m_idIndex = static_cast<size_t>(m_id - m_fields.data());
    }

    // Copies would leave m_id pointing into the source
    EntityMapping(const EntityMapping&) = delete;
    EntityMapping& operator=(const EntityMapping&) = delete;

    const std::string& table() const { return m_table; }
    const std::vector<FieldDescriptor<T>>& fields() const { return m_fields; }

    // Case-insensitive lookup by column name
    const FieldDescriptor<T>* find(const std::string& column) const {
        const std::string wanted = lower(column);
        for (const auto& field : m_fields) {
            if (lower(field.column) == wanted) {
                return &field;
            }
        }
        return nullptr;
    }

    // Position of the id field in fields(), whatever case it was declared in
    size_t idIndex() const { return m_idIndex; }

    int64_t idOf(const T& entity) const {
        return ValueConverter<int64_t>::fromValue(m_id->get(entity));
    }

    void setId(T& entity, int64_t id) const {
        m_id->set(entity, Value{id});
    }

private:
    static std::string lower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string m_table;
    std::vector<FieldDescriptor<T>> m_fields;
    const FieldDescriptor<T>* m_id = nullptr;
    size_t m_idIndex = 0;
};

// Field backed by a data member
template <typename T, typename M>
FieldDescriptor<T> field(std::string column, M T::*member) {
    static_assert(!std::is_function_v<M>, "use field(column, getter, setter) for accessors");
    return FieldDescriptor<T>{
        std::move(column),
        [member](const T& entity) { return ValueConverter<M>::toValue(entity.*member); },
        [member](T& entity, const Value& value) { entity.*member = ValueConverter<M>::fromValue(value); }
    };
}

// Field backed by a getter/setter pair
template <typename T, typename G, typename S>
FieldDescriptor<T> field(std::string column, G (T::*getter)() const, void (T::*setter)(S)) {
    using Getter = std::decay_t<G>;
    using Setter = std::decay_t<S>;
    return FieldDescriptor<T>{
        std::move(column),
        [getter](const T& entity) { return ValueConverter<Getter>::toValue((entity.*getter)()); },
        [setter](T& entity, const Value& value) { (entity.*setter)(ValueConverter<Setter>::fromValue(value)); }
    };
}

}  // namespace tablemap
