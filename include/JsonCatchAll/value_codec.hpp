#pragma once

#include <algorithm>
#include <concepts>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "descriptor.hpp"
#include "struct_introspection.hpp"

namespace JsonCatchAll {

template<class V>
struct ValueCodec;

namespace value_codec_detail {

template<class T>
struct is_optional : std::false_type {};
template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

template<class T>
concept StringLike = std::same_as<T, std::string>;

template<class T>
concept OptionalLike = is_optional<T>::value;

template<class C>
concept StringKeyedMapLike = requires {
    typename C::key_type;
    typename C::mapped_type;
} && std::same_as<typename C::key_type, std::string>
  && requires(C & c, const std::string & k) { c[k]; c.clear(); c.begin(); c.end(); };

template<class C>
concept UnorderedMapLike = StringKeyedMapLike<C> && requires { typename C::hasher; };

template<class C>
concept SequenceLike = !StringLike<C> && !StringKeyedMapLike<C> &&
    requires(C & c, typename C::value_type && v) {
        c.push_back(std::move(v));
        c.clear();
        c.begin();
        c.end();
        c.empty();
    };

template<class T>
concept ReflectableStruct = std::is_class_v<T> && !std::same_as<T, RawJson> &&
    (introspection::detail::has_struct_meta_specialization<T> || std::is_aggregate_v<T>);

template<class M>
bool encodeMapEntry(bool & first, const std::string & key, const M & value,
                    typename JsonWriter::MapFrame & frame, JsonWriter & writer, EncodeContext & ctx) {
    if(!first && !writer.advance_after_value(frame)) {
        return ctx.withWriterError(writer);
    }
    first = false;
    if(!writer.write_key(key) || !writer.move_to_value(frame)) {
        return ctx.withWriterError(writer);
    }
    return ValueCodec<M>::encode(value, writer, ctx);
}

} // namespace value_codec_detail


/// Typed conversion of one field value between JSON and its C++ storage.
template<class V>
struct ValueCodec {
    static bool decode(V & v, JsonReader & reader, DecodeContext & ctx) {
        using namespace value_codec_detail;

        if constexpr (std::same_as<V, RawJson>) {
            // Raw-fragment mode keeps the exact bytes, null included
            v.bytes.clear();
            if(!reader.capture_value(v.bytes)) {
                return ctx.withReaderError(reader);
            }
            return true;
        } else {
            reader::TryParseStatus nullStatus = reader.start_value_and_try_read_null();
            if(nullStatus == reader::TryParseStatus::error) {
                return ctx.withReaderError(reader);
            }
            if(nullStatus == reader::TryParseStatus::ok) {
                return decodeNull(v, reader, ctx);
            }
            return decodeNonNull(v, reader, ctx);
        }
    }

    static bool encode(const V & v, JsonWriter & writer, EncodeContext & ctx) {
        using namespace value_codec_detail;

        if constexpr (std::same_as<V, RawJson>) {
            if(v.empty()) {
                return writer.write_null() || ctx.withWriterError(writer);
            }
            if(ctx.config.validateRawJson && !isValidJson(v.view(), ctx.config.maxDepth)) {
                return ctx.withSerializeError(SerializeError::INVALID_RAW_JSON, writer);
            }
            return writer.write_raw(v.view()) || ctx.withWriterError(writer);
        } else if constexpr (std::same_as<V, bool>) {
            return writer.write_bool(v) || ctx.withWriterError(writer);
        } else if constexpr (std::is_arithmetic_v<V>) {
            return writer.write_number(v) || ctx.withWriterError(writer);
        } else if constexpr (StringLike<V>) {
            return writer.write_string(v) || ctx.withWriterError(writer);
        } else if constexpr (OptionalLike<V>) {
            if(!v.has_value()) {
                return writer.write_null() || ctx.withWriterError(writer);
            }
            return ValueCodec<typename V::value_type>::encode(*v, writer, ctx);
        } else if constexpr (StringKeyedMapLike<V>) {
            return encodeMap(v, writer, ctx);
        } else if constexpr (SequenceLike<V>) {
            typename JsonWriter::ArrayFrame frame;
            if(!writer.write_array_begin(frame)) {
                return ctx.withWriterError(writer);
            }
            bool first = true;
            for(const auto & item : v) {
                if(!first && !writer.advance_after_value(frame)) {
                    return ctx.withWriterError(writer);
                }
                first = false;
                if(!ValueCodec<std::remove_cvref_t<decltype(item)>>::encode(item, writer, ctx)) {
                    return false;
                }
            }
            return writer.write_array_end(frame) || ctx.withWriterError(writer);
        } else if constexpr (ReflectableStruct<V>) {
            const StructDescriptor & desc = lookupDescriptor<V>(ctx.registry);
            return desc.encoder(&v, writer, ctx);
        } else {
            static_assert(!sizeof(V), "[[[ JsonCatchAll ]]] Unsupported field storage type");
        }
    }

    /// Go-style emptiness used by omitempty. Records are never empty.
    static bool isEmpty(const V & v) {
        using namespace value_codec_detail;

        if constexpr (std::same_as<V, RawJson>) {
            return v.empty();
        } else if constexpr (std::same_as<V, bool>) {
            return !v;
        } else if constexpr (std::is_arithmetic_v<V>) {
            return v == V{};
        } else if constexpr (OptionalLike<V>) {
            return !v.has_value();
        } else if constexpr (StringLike<V> || StringKeyedMapLike<V> || SequenceLike<V>) {
            return v.empty();
        } else {
            return false;
        }
    }

private:
    static bool decodeNull(V & v, JsonReader & reader, DecodeContext & ctx) {
        using namespace value_codec_detail;

        if constexpr (OptionalLike<V>) {
            v.reset();
            return true;
        } else if constexpr (StringKeyedMapLike<V> || SequenceLike<V>) {
            v.clear();
            return true;
        } else if constexpr (ReflectableStruct<V>) {
            // The record decoder treats null as "leave untouched"
            return true;
        } else {
            return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        }
    }

    static bool decodeNonNull(V & v, JsonReader & reader, DecodeContext & ctx) {
        using namespace value_codec_detail;

        if constexpr (std::same_as<V, bool>) {
            switch(reader.read_bool(v)) {
            case reader::TryParseStatus::ok:
                return true;
            case reader::TryParseStatus::no_match:
                return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE, reader);
            default:
                return ctx.withReaderError(reader);
            }
        } else if constexpr (std::is_arithmetic_v<V>) {
            switch(reader.read_number(v)) {
            case reader::TryParseStatus::ok:
                return true;
            case reader::TryParseStatus::no_match:
                return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, reader);
            default:
                return ctx.withReaderError(reader);
            }
        } else if constexpr (StringLike<V>) {
            v.clear();
            switch(reader.read_string(v)) {
            case reader::TryParseStatus::ok:
                return true;
            case reader::TryParseStatus::no_match:
                return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
            default:
                return ctx.withReaderError(reader);
            }
        } else if constexpr (OptionalLike<V>) {
            if(!v.has_value()) {
                v.emplace();
            }
            return ValueCodec<typename V::value_type>::decode(*v, reader, ctx);
        } else if constexpr (StringKeyedMapLike<V>) {
            return decodeMap(v, reader, ctx);
        } else if constexpr (SequenceLike<V>) {
            return decodeSequence(v, reader, ctx);
        } else if constexpr (ReflectableStruct<V>) {
            const StructDescriptor & desc = lookupDescriptor<V>(ctx.registry);
            return desc.decoder(&v, reader, ctx);
        } else {
            static_assert(!sizeof(V), "[[[ JsonCatchAll ]]] Unsupported field storage type");
        }
    }

    static bool decodeSequence(V & v, JsonReader & reader, DecodeContext & ctx) {
        typename JsonReader::ArrayFrame frame;
        reader::IterationStatus st = reader.read_array_begin(frame);
        if(st.status == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, reader);
        }
        if(st.status == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        if(!ctx.enter(reader)) {
            return false;
        }
        v.clear();
        while(st.has_value) {
            typename V::value_type item{};
            if(!ValueCodec<typename V::value_type>::decode(item, reader, ctx)) {
                return false;
            }
            v.push_back(std::move(item));
            st = reader.advance_after_value(frame);
            if(st.status != reader::TryParseStatus::ok) {
                return ctx.withReaderError(reader);
            }
        }
        ctx.leave();
        return true;
    }

    static bool decodeMap(V & v, JsonReader & reader, DecodeContext & ctx) {
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
        v.clear();
        std::string key;
        while(st.has_value) {
            if(!reader.read_key(key) || !reader.move_to_value(frame)) {
                return ctx.withReaderError(reader);
            }
            typename V::mapped_type item{};
            if(!ValueCodec<typename V::mapped_type>::decode(item, reader, ctx)) {
                return false;
            }
            v[key] = std::move(item);
            st = reader.advance_after_value(frame);
            if(st.status != reader::TryParseStatus::ok) {
                return ctx.withReaderError(reader);
            }
        }
        ctx.leave();
        return true;
    }

    static bool encodeMap(const V & v, JsonWriter & writer, EncodeContext & ctx) {
        typename JsonWriter::MapFrame frame;
        if(!writer.write_map_begin(frame)) {
            return ctx.withWriterError(writer);
        }
        bool first = true;
        if constexpr (value_codec_detail::UnorderedMapLike<V>) {
            if(ctx.config.sortMapKeys) {
                std::vector<const typename V::value_type*> entries;
                entries.reserve(v.size());
                for(const auto & entry : v) {
                    entries.push_back(&entry);
                }
                std::sort(entries.begin(), entries.end(), [](const auto * a, const auto * b) {
                    return a->first < b->first;
                });
                for(const auto * entry : entries) {
                    if(!value_codec_detail::encodeMapEntry(first, entry->first, entry->second, frame, writer, ctx)) {
                        return false;
                    }
                }
                return writer.write_map_end(frame) || ctx.withWriterError(writer);
            }
        }
        for(const auto & [key, value] : v) {
            if(!value_codec_detail::encodeMapEntry(first, key, value, frame, writer, ctx)) {
                return false;
            }
        }
        return writer.write_map_end(frame) || ctx.withWriterError(writer);
    }
};

} // namespace JsonCatchAll
