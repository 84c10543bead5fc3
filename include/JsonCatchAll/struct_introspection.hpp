#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "field_tag.hpp"
#include "tagged.hpp"

namespace JsonCatchAll {

/// Explicit schema for a record type. Specialise with
///
///     template<> struct StructMeta<Doc> {
///         using Fields = StructFields<
///             Field<&Doc::name, "Name">,
///             Field<&Doc::extra, "*">,
///             Embedded<&Doc::base>
///         >;
///     };
///
/// Types without a specialisation are reflected through PFR.
template <class T>
struct StructMeta {

};

template <auto MPtr, ConstString tag>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString tag>
struct Field<MPtr, tag>{
    using ClassT = C;
    using ValueT = T;
    static constexpr ConstString Tag  = tag;
    static constexpr T C::* MemberP = MPtr;
    static constexpr bool IsEmbedded = false;

    static_assert(tag.toStringView() == "-" || (!tag.toStringView().empty() && tag.toStringView().front() != ','),
                  "[[[ JsonCatchAll ]]] Field<> tag must start with the external name");
    static_assert(tag.isPrintable(), "[[[ JsonCatchAll ]]] Field<> tag contains control characters");
};

/// Anonymous member: its fields are promoted into the enclosing record.
template <auto MPtr>
struct Embedded;

template <typename C, typename T, T C::*MPtr>
struct Embedded<MPtr>{
    using ClassT = C;
    using ValueT = T;
    static constexpr ConstString Tag = "";
    static constexpr T C::* MemberP = MPtr;
    static constexpr bool IsEmbedded = true;
};

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack_v<typename StructMeta<T>::Fields>
                                                  > {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;


template<class M>
struct unwrap_tagged {
    using type = M;
    static constexpr std::string_view tag = "";
    static constexpr M& get(M& m) { return m; }
    static constexpr const M& get(const M& m) { return m; }
};

template<class V, ConstString Tag>
struct unwrap_tagged<Tagged<V, Tag>> {
    using type = V;
    static constexpr std::string_view tag = Tag.toStringView();
    static constexpr V& get(Tagged<V, Tag>& m) { return m.value; }
    static constexpr const V& get(const Tagged<V, Tag>& m) { return m.value; }
};


template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    struct FieldInfo {
        using MemberT = pfr::tuple_element_t<Index, StructT>;
        using Unwrap = unwrap_tagged<MemberT>;
        using value_type = typename Unwrap::type;

        static constexpr std::string_view memberName = pfr::get_name<Index, StructT>();
        static constexpr FieldTag tag = parseFieldTag(Unwrap::tag, memberName);
        static constexpr bool embedded = false;

        static constexpr value_type& get(StructT& s) {
            return Unwrap::get(pfr::get<Index>(s));
        }
        static constexpr const value_type& get(const StructT& s) {
            return Unwrap::get(pfr::get<Index>(s));
        }
    };
};

template <class T>
requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index>
    struct FieldInfo {
        using FieldT = std::tuple_element_t<Index, Fields>;
        using value_type = typename FieldT::ValueT;

        static constexpr std::string_view memberName = "";
        static constexpr FieldTag tag = parseFieldTag(FieldT::Tag.toStringView(), memberName);
        static constexpr bool embedded = FieldT::IsEmbedded;

        static constexpr value_type& get(T& s) {
            return s.*(FieldT::MemberP);
        }
        static constexpr const value_type& get(const T& s) {
            return s.*(FieldT::MemberP);
        }
    };
};

} // namespace detail


template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

/// Compile-time handle of one member: name, parsed tag, storage type and accessor.
template<std::size_t Index, class StructT>
using FieldInfo = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template FieldInfo<Index>;

template<class StructT, class Visitor, std::size_t... Is>
constexpr void forEachFieldImpl(Visitor&& visitor, std::index_sequence<Is...>) {
    (visitor(FieldInfo<Is, StructT>{}), ...);
}

/// Calls `visitor(FieldInfo<I, StructT>{})` for every member in declaration order.
template<class StructT, class Visitor>
constexpr void forEachField(Visitor&& visitor) {
    forEachFieldImpl<StructT>(std::forward<Visitor>(visitor),
                              std::make_index_sequence<structureElementsCount<StructT>>{});
}

} // namespace introspection

} // namespace JsonCatchAll
