#pragma once

#include <cstddef>

#include "errors.hpp"
#include "reader.hpp"
#include "writer.hpp"

namespace JsonCatchAll {

class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    JsonIteratorReaderError m_readerError = JsonIteratorReaderError::NO_ERROR;
    std::size_t m_offset = 0;

public:
    constexpr ParseResult(ParseError err, JsonIteratorReaderError rerr, std::size_t offset):
        m_error(err), m_readerError(rerr), m_offset(offset)
    {}
    constexpr operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    /// Byte offset into the input where decoding stopped.
    constexpr std::size_t offset() const {
        return m_offset;
    }
    constexpr ParseError error() const {
        return m_error;
    }
    constexpr JsonIteratorReaderError readerError() const {
        return m_readerError;
    }
};

class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    JsonIteratorWriterError m_writerError = JsonIteratorWriterError::NO_ERROR;

public:
    constexpr SerializeResult(SerializeError err, JsonIteratorWriterError werr):
        m_error(err), m_writerError(werr)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr JsonIteratorWriterError writerError() const {
        return m_writerError;
    }
};

} // namespace JsonCatchAll
