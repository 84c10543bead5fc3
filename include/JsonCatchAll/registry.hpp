#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <vector>

#include "descriptor.hpp"
#include "descriptor_builder.hpp"
#include "extension.hpp"
#include "logging.hpp"
#include "struct_codec.hpp"

namespace JsonCatchAll {

/// Per-type descriptor cache. A descriptor is built at most once, on first
/// request, then published and never modified or evicted.
/// Lookups of published descriptors take a shared lock; construction runs
/// under the exclusive lock, re-checking the cache after acquiring it.
class DescriptorRegistry {
public:
    DescriptorRegistry() = default;
    DescriptorRegistry(const DescriptorRegistry&) = delete;
    DescriptorRegistry& operator=(const DescriptorRegistry&) = delete;

    template<class T>
    const StructDescriptor & get() {
        const std::type_index key(typeid(T));
        {
            std::shared_lock lock(m_mutex);
            auto it = m_descriptors.find(key);
            if(it != m_descriptors.end()) {
                return *it->second;
            }
        }
        std::unique_lock lock(m_mutex);
        BuildScope scope(*this);
        return scope.template embedded<T>();
    }

    /// Extensions apply to types built after registration.
    void registerExtension(std::shared_ptr<Extension> ext) {
        std::unique_lock lock(m_mutex);
        m_extensions.push_back(std::move(ext));
    }

    std::size_t constructions() const {
        return m_constructions.load();
    }

    std::size_t size() const {
        std::shared_lock lock(m_mutex);
        return m_descriptors.size();
    }

    /// Gives the descriptor builder access to the cache while the exclusive
    /// lock is held, so embedded types are built in the same critical section.
    class BuildScope {
    public:
        template<class T>
        const StructDescriptor & embedded() {
            return m_registry.getLocked<T>();
        }
    private:
        friend class DescriptorRegistry;
        explicit BuildScope(DescriptorRegistry & r) : m_registry(r) {}
        DescriptorRegistry & m_registry;
    };

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::type_index, std::unique_ptr<StructDescriptor>> m_descriptors;
    std::vector<std::shared_ptr<Extension>> m_extensions;
    std::atomic<std::size_t> m_constructions{0};

    // Exclusive lock held
    template<class T>
    const StructDescriptor & getLocked() {
        const std::type_index key(typeid(T));
        auto it = m_descriptors.find(key);
        if(it != m_descriptors.end()) {
            return *it->second;
        }

        BuildScope scope(*this);
        std::unique_ptr<StructDescriptor> desc = buildStructDescriptor<T>(scope);

        for(const std::shared_ptr<Extension> & ext : m_extensions) {
            ext->updateStructDescriptor(*desc);
        }
        StructDecoder decoder = makeStructDecoder(*desc);
        StructEncoder encoder = makeStructEncoder(*desc);
        for(const std::shared_ptr<Extension> & ext : m_extensions) {
            decoder = ext->decorateDecoder(*desc, std::move(decoder));
            encoder = ext->decorateEncoder(*desc, std::move(encoder));
        }
        desc->decoder = std::move(decoder);
        desc->encoder = std::move(encoder);

        m_constructions ++;
        log::logger()->debug("Registered descriptor {} ({} typed fields, catch-all: {})",
                             desc->typeName, desc->fields.size(),
                             desc->additional ? desc->additional->name() : std::string("none"));

        const StructDescriptor & ref = *desc;
        m_descriptors.emplace(key, std::move(desc));
        return ref;
    }
};

template<class T>
const StructDescriptor & lookupDescriptor(DescriptorRegistry & registry) {
    return registry.template get<T>();
}

} // namespace JsonCatchAll
