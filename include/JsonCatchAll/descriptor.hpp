#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "field_tag.hpp"
#include "raw_json.hpp"
#include "reader.hpp"
#include "writer.hpp"

namespace JsonCatchAll {

using JsonReader = JsonIteratorReader<const char*, const char*, 512>;
using JsonWriter = JsonIteratorWriter<std::back_insert_iterator<std::string>, limitless_sentinel>;

static_assert(reader::ReaderLike<JsonReader>);
static_assert(writer::WriterLike<JsonWriter>);

class DescriptorRegistry;

/// Per-call decoding state.
class DecodeContext {
public:
    const Config & config;
    DescriptorRegistry & registry;

    DecodeContext(const Config & cfg, DescriptorRegistry & reg) : config(cfg), registry(reg) {}

    bool withParseError(ParseError err, const JsonReader & reader) {
        error = err;
        if(err == ParseError::NO_ERROR) {
            error = ParseError::READER_ERROR;
        }
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    bool withReaderError(const JsonReader & reader) {
        error = ParseError::READER_ERROR;
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    /// Enters one level of object/array nesting; fails past Config::maxDepth.
    bool enter(const JsonReader & reader) {
        if(m_depth >= config.maxDepth) {
            return withParseError(ParseError::NESTING_TOO_DEEP, reader);
        }
        m_depth ++;
        return true;
    }
    void leave() {
        m_depth --;
    }

    ParseError currentError() const { return error; }
    JsonIteratorReaderError readerError() const { return reader_error; }
    const char* pos() const { return m_pos; }

private:
    ParseError error = ParseError::NO_ERROR;
    JsonIteratorReaderError reader_error = JsonIteratorReaderError::NO_ERROR;
    const char* m_pos = nullptr;
    std::size_t m_depth = 0;
};

/// Per-call encoding state.
class EncodeContext {
public:
    const Config & config;
    DescriptorRegistry & registry;

    EncodeContext(const Config & cfg, DescriptorRegistry & reg) : config(cfg), registry(reg) {}

    bool withSerializeError(SerializeError err, const JsonWriter & writer) {
        error = err;
        writer_error = writer.getError();
        return false;
    }
    bool withWriterError(const JsonWriter & writer) {
        return withSerializeError(SerializeError::WRITER_ERROR, writer);
    }

    SerializeError currentError() const { return error; }
    JsonIteratorWriterError writerError() const { return writer_error; }

private:
    SerializeError error = SerializeError::NO_ERROR;
    JsonIteratorWriterError writer_error = JsonIteratorWriterError::NO_ERROR;
};


/// Decodes one JSON value into the record at `obj`.
using StructDecoder = std::function<bool(void* obj, JsonReader&, DecodeContext&)>;
/// Writes the record at `obj` as one JSON value.
using StructEncoder = std::function<bool(const void* obj, JsonWriter&, EncodeContext&)>;

/// One serialisable member of a record, reached through type-erased closures
/// bound to the member accessor. The closures take the record's address.
struct FieldBinding {
    std::vector<std::string> fromNames;
    std::vector<std::string> toNames;
    bool omitEmpty = false;

    std::function<bool(void*, JsonReader&, DecodeContext&)> decode;
    std::function<bool(const void*, JsonWriter&, EncodeContext&)> encode;
    std::function<bool(const void*)> isEmpty;

    // Set only when the member's storage is AdditionalProperties
    std::function<AdditionalProperties*(void*)> additional;
    std::function<const AdditionalProperties*(const void*)> additionalView;

    bool isAdditionalPropertiesStorage() const {
        return static_cast<bool>(additional);
    }
    bool isWildcard() const {
        return fromNames.size() == 1 && fromNames.front() == WildcardFieldName;
    }
    const std::string & name() const {
        return toNames.front();
    }

    /// Rebinds every closure to a sub-object reached through `project`.
    FieldBinding projected(std::function<void*(void*)> project,
                           std::function<const void*(const void*)> projectConst) const;
};

struct StructDescriptor;

/// A member as declared on the record, before flattening. Embedded members
/// point at the descriptor of the embedded type.
struct DeclaredMember {
    std::string name;
    bool omitEmpty = false;
    const StructDescriptor * embedded = nullptr;
    std::function<void*(void*)> project;
    std::function<const void*(const void*)> projectConst;
};

/// Runtime schema of one record type. Built once by the registry, then only read.
struct StructDescriptor {
    std::type_index type;
    std::string typeName;

    std::vector<FieldBinding> fields;
    std::optional<FieldBinding> additional;
    std::vector<DeclaredMember> members;

    StructDecoder decoder;
    StructEncoder encoder;

    explicit StructDescriptor(std::type_index t, std::string name)
        : type(t), typeName(std::move(name)) {}

    const FieldBinding * findField(std::string_view fromName) const {
        for(const FieldBinding & f : fields) {
            for(const std::string & n : f.fromNames) {
                if(n == fromName) return &f;
            }
        }
        return nullptr;
    }

    /// External name -> omit-empty, merged recursively through embedded types.
    std::map<std::string, bool> omitEmptyTable() const {
        std::map<std::string, bool> table;
        for(const DeclaredMember & m : members) {
            if(m.embedded) {
                for(const auto & [name, omit] : m.embedded->omitEmptyTable()) {
                    table[name] = omit;
                }
                continue;
            }
            table[m.name] = m.omitEmpty;
        }
        return table;
    }
};

inline FieldBinding FieldBinding::projected(std::function<void*(void*)> project,
                                            std::function<const void*(const void*)> projectConst) const {
    FieldBinding res;
    res.fromNames = fromNames;
    res.toNames = toNames;
    res.omitEmpty = omitEmpty;
    res.decode = [project, inner = decode](void* obj, JsonReader& reader, DecodeContext& ctx) {
        return inner(project(obj), reader, ctx);
    };
    res.encode = [projectConst, inner = encode](const void* obj, JsonWriter& writer, EncodeContext& ctx) {
        return inner(projectConst(obj), writer, ctx);
    };
    res.isEmpty = [projectConst, inner = isEmpty](const void* obj) {
        return inner(projectConst(obj));
    };
    if(additional) {
        res.additional = [project, inner = additional](void* obj) {
            return inner(project(obj));
        };
        res.additionalView = [projectConst, inner = additionalView](const void* obj) {
            return inner(projectConst(obj));
        };
    }
    return res;
}

/// Descriptor of T, built on first use. Defined with DescriptorRegistry.
template<class T>
const StructDescriptor & lookupDescriptor(DescriptorRegistry & registry);

} // namespace JsonCatchAll
