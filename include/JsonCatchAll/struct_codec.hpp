#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "descriptor.hpp"
#include "logging.hpp"

namespace JsonCatchAll {

namespace struct_codec_detail {

inline std::string toLowerAscii(std::string_view s) {
    std::string res(s);
    for(char & c : res) {
        if(c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return res;
}

/// Key -> binding routing table of one record type: exact names, plus a
/// lowercase table for the case-insensitive fallback. The first binding
/// claiming a name keeps it.
class FieldIndex {
public:
    explicit FieldIndex(const std::vector<FieldBinding> & fields) {
        for(const FieldBinding & f : fields) {
            for(const std::string & n : f.fromNames) {
                m_exact.emplace(n, &f);
                m_folded.emplace(toLowerAscii(n), &f);
            }
        }
    }

    const FieldBinding * find(const std::string & key, bool caseSensitive) const {
        auto it = m_exact.find(key);
        if(it != m_exact.end()) {
            log::logger()->trace("key '{}': exact match", key);
            return it->second;
        }
        if(caseSensitive) {
            return nullptr;
        }
        it = m_folded.find(toLowerAscii(key));
        if(it != m_folded.end()) {
            log::logger()->trace("key '{}': case-insensitive match '{}'", key, it->second->name());
            return it->second;
        }
        return nullptr;
    }

private:
    std::unordered_map<std::string, const FieldBinding*> m_exact;
    std::unordered_map<std::string, const FieldBinding*> m_folded;
};

/// Walks one JSON object, routing every value to its binding or, for keys
/// no binding claims, to `onUnknown(key)`, which must consume the value.
template<class OnUnknown>
bool decodeObject(void* obj, const FieldIndex & index, JsonReader & reader, DecodeContext & ctx,
                  OnUnknown && onUnknown) {
    typename JsonReader::MapFrame frame;
    reader::IterationStatus st = reader.read_map_begin(frame);
    if(st.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    }
    if(st.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    if(!ctx.enter(reader)) {
        return false;
    }
    std::string key;
    while(st.has_value) {
        if(!reader.read_key(key) || !reader.move_to_value(frame)) {
            return ctx.withReaderError(reader);
        }
        const FieldBinding * binding = index.find(key, ctx.config.caseSensitive);
        if(binding) {
            if(!binding->decode(obj, reader, ctx)) {
                return false;
            }
        } else if(!onUnknown(key)) {
            return false;
        }
        st = reader.advance_after_value(frame);
        if(st.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    ctx.leave();
    return true;
}

inline bool writeSeparator(bool & first, typename JsonWriter::MapFrame & frame, JsonWriter & writer, EncodeContext & ctx) {
    if(!first && !writer.advance_after_value(frame)) {
        return ctx.withWriterError(writer);
    }
    first = false;
    return true;
}

/// Writes the typed fields of the record at `obj` into an open object,
/// skipping those `omit(binding)` selects when their value is empty.
template<class OmitPredicate>
bool encodeTypedFields(const void* obj, const std::vector<FieldBinding> & fields, OmitPredicate && omit,
                       bool & first, typename JsonWriter::MapFrame & frame, JsonWriter & writer, EncodeContext & ctx) {
    for(const FieldBinding & f : fields) {
        if(omit(f) && f.isEmpty(obj)) {
            continue;
        }
        if(!writeSeparator(first, frame, writer, ctx)) {
            return false;
        }
        if(!writer.write_key(f.name()) || !writer.move_to_value(frame)) {
            return ctx.withWriterError(writer);
        }
        if(!f.encode(obj, writer, ctx)) {
            return false;
        }
    }
    return true;
}

} // namespace struct_codec_detail


/// Plain record decoder: typed fields only. Unknown keys are skipped, or
/// rejected with EXCESS_FIELD under Config::disallowUnknownFields.
inline StructDecoder makeStructDecoder(const StructDescriptor & desc) {
    auto index = std::make_shared<const struct_codec_detail::FieldIndex>(desc.fields);
    const StructDescriptor * d = &desc;
    return [index, d](void* obj, JsonReader & reader, DecodeContext & ctx) {
        return struct_codec_detail::decodeObject(obj, *index, reader, ctx, [&](const std::string & key) {
            if(ctx.config.disallowUnknownFields) {
                log::logger()->debug("{}: unknown key '{}' rejected", d->typeName, key);
                return ctx.withParseError(ParseError::EXCESS_FIELD, reader);
            }
            log::logger()->trace("{}: unknown key '{}' skipped", d->typeName, key);
            return reader.skip_value() || ctx.withReaderError(reader);
        });
    };
}

/// Plain record encoder: typed fields in descriptor order, honouring omitempty.
inline StructEncoder makeStructEncoder(const StructDescriptor & desc) {
    const StructDescriptor * d = &desc;
    return [d](const void* obj, JsonWriter & writer, EncodeContext & ctx) {
        typename JsonWriter::MapFrame frame;
        if(!writer.write_map_begin(frame)) {
            return ctx.withWriterError(writer);
        }
        bool first = true;
        if(!struct_codec_detail::encodeTypedFields(obj, d->fields,
                                                   [](const FieldBinding & f) { return f.omitEmpty; },
                                                   first, frame, writer, ctx)) {
            return false;
        }
        return writer.write_map_end(frame) || ctx.withWriterError(writer);
    };
}

} // namespace JsonCatchAll
