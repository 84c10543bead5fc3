#pragma once

#include "descriptor.hpp"

namespace JsonCatchAll {

/// Hook into descriptor construction. The registry calls every registered
/// extension, in registration order, exactly once per record type:
/// first updateStructDescriptor(), then the decorate functions, each
/// receiving the codec produced by the previous extension.
class Extension {
public:
    virtual ~Extension() = default;

    virtual void updateStructDescriptor(StructDescriptor & desc) {
        (void)desc;
    }
    virtual StructDecoder decorateDecoder(const StructDescriptor & desc, StructDecoder decoder) {
        (void)desc;
        return decoder;
    }
    virtual StructEncoder decorateEncoder(const StructDescriptor & desc, StructEncoder encoder) {
        (void)desc;
        return encoder;
    }
};

} // namespace JsonCatchAll
