#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "additional_properties.hpp"
#include "config.hpp"
#include "descriptor.hpp"
#include "extension.hpp"
#include "logging.hpp"
#include "parse_result.hpp"
#include "registry.hpp"
#include "value_codec.hpp"

namespace JsonCatchAll {

/// Decode/encode entry point. Owns the configuration and the descriptor
/// registry; safe to share between threads once extensions are registered.
class Codec {
public:
    explicit Codec(Config config = Config::compatibleWithStandardLibrary())
        : m_config(config) {}

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    const Config & config() const {
        return m_config;
    }
    DescriptorRegistry & registry() {
        return m_registry;
    }

    void registerExtension(std::shared_ptr<Extension> ext) {
        m_registry.registerExtension(std::move(ext));
    }

    template<class T>
    ParseResult Parse(T & obj, std::string_view input) {
        const char* begin = input.data();
        JsonReader reader(begin, begin + input.size(), m_config.maxDepth);
        DecodeContext ctx(m_config, m_registry);

        if(ValueCodec<T>::decode(obj, reader, ctx)) {
            if(!reader.finish()) {
                ctx.withReaderError(reader);
            }
        }
        if(ctx.currentError() != ParseError::NO_ERROR) {
            log::logger()->debug("Parse failed: {} ({}) at offset {}",
                                 error_to_string(ctx.currentError()), error_to_string(ctx.readerError()),
                                 static_cast<std::size_t>(ctx.pos() - begin));
            return ParseResult(ctx.currentError(), ctx.readerError(), static_cast<std::size_t>(ctx.pos() - begin));
        }
        return ParseResult(ParseError::NO_ERROR, JsonIteratorReaderError::NO_ERROR,
                           static_cast<std::size_t>(reader.current() - begin));
    }

    /// Replaces the contents of `out` with the JSON encoding of `obj`.
    template<class T>
    SerializeResult Serialize(const T & obj, std::string & out) {
        out.clear();
        JsonWriter writer(std::back_inserter(out), limitless_sentinel{}, m_config.escapeHtml);
        EncodeContext ctx(m_config, m_registry);

        if(!ValueCodec<T>::encode(obj, writer, ctx)) {
            log::logger()->debug("Serialize failed: {} ({})",
                                 error_to_string(ctx.currentError()), error_to_string(ctx.writerError()));
            return SerializeResult(ctx.currentError(), ctx.writerError());
        }
        return SerializeResult(SerializeError::NO_ERROR, JsonIteratorWriterError::NO_ERROR);
    }

private:
    Config m_config;
    DescriptorRegistry m_registry;
};

inline Codec & registerAdditionalPropertiesExtension(Codec & codec) {
    codec.registerExtension(std::make_shared<AdditionalPropertiesExtension>());
    return codec;
}

/// Codec with the default configuration and the additional-properties
/// extension already registered.
inline std::unique_ptr<Codec> makeCompatibleCodec() {
    auto codec = std::make_unique<Codec>(Config::compatibleWithStandardLibrary());
    registerAdditionalPropertiesExtension(*codec);
    return codec;
}

} // namespace JsonCatchAll
