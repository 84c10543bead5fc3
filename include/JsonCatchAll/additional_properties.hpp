#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "descriptor.hpp"
#include "extension.hpp"
#include "logging.hpp"
#include "struct_codec.hpp"
#include "value_codec.hpp"

namespace JsonCatchAll {

/// Routes object keys a record does not declare into its catch-all member
/// (external name "*", storage AdditionalProperties), and writes them back
/// after the typed fields on output.
class AdditionalPropertiesExtension : public Extension {
public:
    /// Moves the first "*" member out of the typed fields and makes it the
    /// catch-all binding. Without one, the first embedded record carrying a
    /// catch-all binding donates it.
    void updateStructDescriptor(StructDescriptor & desc) override {
        log::logger()->debug("Updating descriptor {}", desc.typeName);

        std::size_t wildcards = 0;
        for(std::size_t i = 0; i < desc.fields.size();) {
            FieldBinding & f = desc.fields[i];
            if(!f.isWildcard()) {
                i ++;
                continue;
            }
            wildcards ++;
            if(wildcards > 1) {
                log::logger()->warn("{}: more than one '*' field, only the first declared captures unknown keys",
                                    desc.typeName);
                i ++;
                continue;
            }
            if(!f.isAdditionalPropertiesStorage()) {
                log::logger()->warn("{}: '*' field is not an AdditionalProperties map, keeping it as a typed field",
                                    desc.typeName);
                i ++;
                continue;
            }
            desc.additional = std::move(f);
            desc.fields.erase(desc.fields.begin() + static_cast<std::ptrdiff_t>(i));
            log::logger()->debug("{}: catch-all binding extracted", desc.typeName);
        }

        if(wildcards > 0) {
            return;
        }
        for(const DeclaredMember & m : desc.members) {
            if(m.embedded && m.embedded->additional) {
                desc.additional = m.embedded->additional->projected(m.project, m.projectConst);
                log::logger()->debug("{}: catch-all binding promoted from embedded {}",
                                     desc.typeName, m.embedded->typeName);
                break;
            }
        }
    }

    StructDecoder decorateDecoder(const StructDescriptor & desc, StructDecoder decoder) override {
        if(!desc.additional) {
            log::logger()->debug("Not decorating decoder of {}: no catch-all field", desc.typeName);
            return decoder;
        }
        log::logger()->debug("Decorating decoder of {}", desc.typeName);

        auto index = std::make_shared<const struct_codec_detail::FieldIndex>(desc.fields);
        const StructDescriptor * d = &desc;
        return [index, d](void* obj, JsonReader & reader, DecodeContext & ctx) {
            AdditionalProperties & ap = *d->additional->additional(obj);
            ap = AdditionalProperties{};
            return struct_codec_detail::decodeObject(obj, *index, reader, ctx, [&](const std::string & key) {
                RawJson value;
                if(!reader.capture_value(value.bytes)) {
                    return ctx.withReaderError(reader);
                }
                log::logger()->trace("{}: key '{}' captured as additional property", d->typeName, key);
                ap[key] = std::move(value);
                return true;
            });
        };
    }

    StructEncoder decorateEncoder(const StructDescriptor & desc, StructEncoder encoder) override {
        if(!desc.additional) {
            log::logger()->debug("Not decorating encoder of {}: no catch-all field", desc.typeName);
            return encoder;
        }
        log::logger()->debug("Decorating encoder of {}", desc.typeName);

        auto omitEmpties = std::make_shared<const std::map<std::string, bool>>(desc.omitEmptyTable());
        const StructDescriptor * d = &desc;
        return [omitEmpties, d](const void* obj, JsonWriter & writer, EncodeContext & ctx) {
            typename JsonWriter::MapFrame frame;
            if(!writer.write_map_begin(frame)) {
                return ctx.withWriterError(writer);
            }
            bool first = true;
            auto omit = [&](const FieldBinding & f) {
                auto it = omitEmpties->find(f.name());
                return it != omitEmpties->end() && it->second;
            };
            if(!struct_codec_detail::encodeTypedFields(obj, d->fields, omit, first, frame, writer, ctx)) {
                return false;
            }

            const AdditionalProperties & ap = *d->additional->additionalView(obj);
            for(const auto & [key, value] : ap) {
                if(!struct_codec_detail::writeSeparator(first, frame, writer, ctx)) {
                    return false;
                }
                if(!writer.write_key(key) || !writer.move_to_value(frame)) {
                    return ctx.withWriterError(writer);
                }
                if(!ValueCodec<RawJson>::encode(value, writer, ctx)) {
                    return false;
                }
            }
            return writer.write_map_end(frame) || ctx.withWriterError(writer);
        };
    }
};

class Codec;

/// Installs AdditionalPropertiesExtension on `codec`; every record type the
/// codec builds afterwards is checked for a catch-all member.
inline Codec & registerAdditionalPropertiesExtension(Codec & codec);

} // namespace JsonCatchAll
