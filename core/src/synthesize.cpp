#include "pactforge/synthesize.h"
#include "pactforge/errors.h"

#include <map>
#include <stdexcept>
#include <utility>

namespace pactforge {

Matcher match(const TypeDesc& type) {
    return match(type, TagParams{});
}

Matcher match(const TypeDesc& type, const TagParams& params) {
    switch (type.kind) {
        case TypeKind::POINTER:
            if (!type.elem) throw UnsupportedTypeKind(type_name(type));
            return match(*type.elem, params);

        case TypeKind::SLICE:
        case TypeKind::ARRAY:
            if (!type.elem) throw UnsupportedTypeKind(type_name(type));
            return each_like(match(*type.elem, TagParams{}), params.min);

        case TypeKind::STRUCT: {
            std::map<std::string, Node> fields;
            for (const auto& f : type.fields) {
                if (f.omitted()) continue;
                if (!f.type) throw UnsupportedTypeKind(type.name + "." + f.name);
                fields[f.wire_name()] = match(*f.type, parse_tag(*f.type, f.pact_tag));
            }
            return struct_matcher(std::move(fields));
        }

        case TypeKind::STRING:
            if (params.regex) return term(params.example.value_or(""), *params.regex);
            if (params.example) return like(*params.example);
            return like(kDefaultStringExample);

        case TypeKind::BOOL:
            return like(params.boolean.value_or(kDefaultBoolExample));

        case TypeKind::INT: case TypeKind::INT8: case TypeKind::INT16:
        case TypeKind::INT32: case TypeKind::INT64:
        case TypeKind::UINT: case TypeKind::UINT8: case TypeKind::UINT16:
        case TypeKind::UINT32: case TypeKind::UINT64:
            return like(params.integer.value_or(kDefaultIntegerExample));

        case TypeKind::FLOAT32:
        case TypeKind::FLOAT64:
            return like(params.number.value_or(kDefaultFloatExample));

        case TypeKind::MAP:
        case TypeKind::INTERFACE:
            break;
    }
    throw UnsupportedTypeKind(type_name(type));
}

Matcher match(const SchemaRegistry& registry, const std::string& name) {
    TypePtr t = registry.getType(name);
    if (!t) throw std::runtime_error("match: unknown type: " + name);
    return match(*t);
}

} // namespace pactforge
