#pragma once

#include "EntityMapping.hpp"
#include "IdentifierSanitizer.hpp"
#include "Value.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace tablemap {

// Moves values between rows and entities through T::mapping()
template <typename T>
class RowMapper {
public:
    // Every declared field in declaration order, names sanitized
    static FieldValues extractFields(const T& entity) {
        const auto& mapping = T::mapping();
        FieldValues fields;
        fields.reserve(mapping.fields().size());
        for (const auto& field : mapping.fields()) {
            fields.emplace_back(sanitizeIdentifier(field.column), field.get(entity));
        }
        return fields;
    }

    // Columns without a matching field are skipped
    static T hydrate(const Row& row) {
        T entity{};
        hydrateInto(row, entity);
        return entity;
    }

    // Returns the number of columns that found a field
    static size_t hydrateInto(const Row& row, T& entity) {
        const auto& mapping = T::mapping();
        size_t mapped = 0;
        for (const auto& [column, value] : row) {
            const auto* field = mapping.find(column);
            if (!field) {
                spdlog::debug("No field for column '{}' in {}", column, mapping.table());
                continue;
            }
            field->set(entity, value);
            ++mapped;
        }
        return mapped;
    }
};

}  // namespace tablemap
