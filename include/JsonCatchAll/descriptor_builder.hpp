#pragma once

#include <memory>
#include <set>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "descriptor.hpp"
#include "logging.hpp"
#include "struct_introspection.hpp"
#include "value_codec.hpp"

namespace JsonCatchAll {

namespace builder_detail {

template<class T, class Info>
FieldBinding makeFieldBinding() {
    using V = typename Info::value_type;
    constexpr FieldTag tag = Info::tag;

    FieldBinding b;
    b.fromNames.emplace_back(tag.name);
    b.toNames.emplace_back(tag.name);
    b.omitEmpty = tag.omitEmpty();
    b.decode = [](void* obj, JsonReader& reader, DecodeContext& ctx) {
        return ValueCodec<V>::decode(Info::get(*static_cast<T*>(obj)), reader, ctx);
    };
    b.encode = [](const void* obj, JsonWriter& writer, EncodeContext& ctx) {
        return ValueCodec<V>::encode(Info::get(*static_cast<const T*>(obj)), writer, ctx);
    };
    b.isEmpty = [](const void* obj) {
        return ValueCodec<V>::isEmpty(Info::get(*static_cast<const T*>(obj)));
    };
    if constexpr (std::is_same_v<V, AdditionalProperties>) {
        b.additional = [](void* obj) {
            return &Info::get(*static_cast<T*>(obj));
        };
        b.additionalView = [](const void* obj) {
            return &Info::get(*static_cast<const T*>(obj));
        };
    }
    return b;
}

inline bool anyNameTaken(const FieldBinding & b, const std::set<std::string> & taken) {
    for(const std::string & n : b.fromNames) {
        if(taken.count(n)) return true;
    }
    return false;
}

} // namespace builder_detail


/// Reflects T into a descriptor: one binding per member in declaration order,
/// embedded members flattened in place. `scope` resolves embedded types to
/// their own (fully built) descriptors.
/// The wildcard member is still an ordinary binding here; extensions decide
/// what it becomes.
template<class T, class Scope>
std::unique_ptr<StructDescriptor> buildStructDescriptor(Scope & scope) {
    static_assert(value_codec_detail::ReflectableStruct<T>,
                  "[[[ JsonCatchAll ]]] Record types must be aggregates or have a StructMeta specialization");

    auto desc = std::make_unique<StructDescriptor>(std::type_index(typeid(T)), typeid(T).name());

    // Names declared directly win over promoted ones
    std::set<std::string> taken;
    introspection::forEachField<T>([&](auto info) {
        using Info = decltype(info);
        static_assert(!Info::tag.tooManyQualifiers, "[[[ JsonCatchAll ]]] Too many tag qualifiers");
        if constexpr (!Info::embedded) {
            if(!Info::tag.ignored) {
                taken.emplace(Info::tag.name);
            }
        }
    });

    introspection::forEachField<T>([&](auto info) {
        using Info = decltype(info);
        using V = typename Info::value_type;

        if constexpr (Info::embedded) {
            static_assert(value_codec_detail::ReflectableStruct<V>,
                          "[[[ JsonCatchAll ]]] Embedded members must be records");
            const StructDescriptor & embedded = scope.template embedded<V>();

            DeclaredMember member;
            member.embedded = &embedded;
            member.project = [](void* obj) -> void* {
                return &Info::get(*static_cast<T*>(obj));
            };
            member.projectConst = [](const void* obj) -> const void* {
                return &Info::get(*static_cast<const T*>(obj));
            };

            for(const FieldBinding & f : embedded.fields) {
                if(builder_detail::anyNameTaken(f, taken)) {
                    log::logger()->debug("{}: promoted field '{}' from {} is shadowed",
                                         desc->typeName, f.name(), embedded.typeName);
                    continue;
                }
                taken.insert(f.fromNames.begin(), f.fromNames.end());
                desc->fields.push_back(f.projected(member.project, member.projectConst));
            }
            desc->members.push_back(std::move(member));
        } else {
            if(Info::tag.ignored) {
                return;
            }
            desc->fields.push_back(builder_detail::makeFieldBinding<T, Info>());
            DeclaredMember member;
            member.name = std::string(Info::tag.name);
            member.omitEmpty = Info::tag.omitEmpty();
            desc->members.push_back(std::move(member));
        }
    });

    if(log::logger()->should_log(spdlog::level::debug)) {
        std::vector<std::string> names;
        for(const FieldBinding & f : desc->fields) {
            names.push_back(f.name());
        }
        log::logger()->debug("Built descriptor {}: fields [{}]", desc->typeName, fmt::join(names, ", "));
    }
    return desc;
}

} // namespace JsonCatchAll
