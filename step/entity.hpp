#ifndef LASERCUT_STEP_ENTITY_HPP
#define LASERCUT_STEP_ENTITY_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lasercut {
namespace step {

using EntityId = uint64_t;

// One parameter of an entity instance
struct Parameter {
    enum class Kind {
        Number,       // integer or real
        String,
        Enumeration,  // text holds the name without dots
        Reference,    // ref holds the instance id
        Null,         // $
        Derived,      // *
        List,         // items
        Typed         // text holds the type name, items its single argument
    };

    Kind kind = Kind::Null;
    double number = 0.0;
    std::string text;
    EntityId ref = 0;
    std::vector<Parameter> items;

    bool is_number() const { return kind == Kind::Number; }
    bool is_reference() const { return kind == Kind::Reference; }
    bool is_list() const { return kind == Kind::List; }
    bool is_null() const { return kind == Kind::Null; }
};

// TYPE_NAME(params) inside an instance. Complex instances carry several.
struct EntityPart {
    std::string type;
    std::vector<Parameter> params;
};

struct EntityRecord {
    EntityId id = 0;
    std::vector<EntityPart> parts;

    bool is_complex() const { return parts.size() > 1; }

    // Type of a simple instance, empty for complex ones
    const std::string& type() const {
        static const std::string empty;
        return parts.size() == 1 ? parts.front().type : empty;
    }

    // Part with the given type, or nullptr
    const EntityPart* find_part(const std::string& type_name) const {
        for (const auto& part : parts) {
            if (part.type == type_name) {
                return &part;
            }
        }
        return nullptr;
    }
};

// Data section of a Part 21 file, keyed by instance id
struct EntityTable {
    std::map<EntityId, EntityRecord> entities;

    const EntityRecord* find(EntityId id) const {
        auto it = entities.find(id);
        return it == entities.end() ? nullptr : &it->second;
    }

    size_t size() const { return entities.size(); }
};

}  // namespace step
}  // namespace lasercut

#endif // LASERCUT_STEP_ENTITY_HPP
