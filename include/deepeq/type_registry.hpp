#pragma once

/** \file type_registry.hpp
 *  \brief Runtime type descriptions backing member enumeration and access.
 *
 * C++ offers no runtime reflection, so every type taking part in a comparison
 * is described once in a TypeRegistry:
 * - composites list their members (fields or const getters) and base types
 * - leaves carry value equality and a printable rendering
 * - sequences (std::vector) are registered implicitly from member fields
 *
 * The engine only ever sees type-erased ValueRef handles and MemberDescriptor
 * accessors, never the concrete C++ types.
 *
 * Ownership: a registry is populated up front and then shared read-only
 * (std::shared_ptr<const TypeRegistry>) by every plan built against it.
 */

#include <chrono>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "deepeq/error.hpp"

namespace deepeq {

/** \brief Date/time leaf type compared as a single value. */
using date_time = std::chrono::system_clock::time_point;

/** \brief How a registered type takes part in a comparison. */
enum class TypeKind {
    leaf,        /**< compared by value equality */
    composite,   /**< compared member by member */
    sequence     /**< compared element by element */
};

/** \brief Non-owning handle to a value of a registered type; null when address is nullptr. */
struct ValueRef {
    const void* address{nullptr};
    std::type_index type{typeid(void)};

    [[nodiscard]] bool is_null() const noexcept { return address == nullptr; }
};

/**
 * \brief Names one member of a type and knows how to read it from an instance.
 *
 * The getter expects a pointer to an instance of owner_type(), the type that
 * declares the member. Inherited members keep their declaring type as owner;
 * TypeRegistry::read_member performs the upcast.
 */
class MemberDescriptor {
public:
    using Getter = std::function<ValueRef(const void* owner)>;

    MemberDescriptor(std::string name, std::type_index declared_type,
                     std::type_index owner_type, Getter getter)
        : name_(std::move(name))
        , declared_type_(declared_type)
        , owner_type_(owner_type)
        , getter_(std::move(getter)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto declared_type() const noexcept -> std::type_index { return declared_type_; }
    [[nodiscard]] auto owner_type() const noexcept -> std::type_index { return owner_type_; }

    /** \brief Reads the member from a pointer to an owner_type() instance. */
    [[nodiscard]] auto read(const void* owner) const -> ValueRef { return getter_(owner); }

private:
    std::string name_;
    std::type_index declared_type_;
    std::type_index owner_type_;
    Getter getter_;
};

/** \brief Inheritance edge from a registered type to one of its bases. */
struct BaseLink {
    std::type_index base;
    const void* (*upcast)(const void*){nullptr};
};

/** \brief Registered description of one C++ type. */
struct TypeDesc {
    std::type_index id{typeid(void)};
    std::string name;
    TypeKind kind{TypeKind::composite};

    std::vector<BaseLink> bases;             /**< direct bases, registration order */
    std::vector<MemberDescriptor> members;   /**< own members, registration order */

    bool (*equals)(const void*, const void*){nullptr};   /**< value equality, if any */
    std::string (*to_string)(const void*){nullptr};      /**< printable rendering, if any */
    ValueRef (*most_derived)(const void*){nullptr};      /**< polymorphic types only */

    // Sequence access (kind == sequence)
    std::size_t (*size)(const void*){nullptr};
    ValueRef (*element)(const void*, std::size_t){nullptr};
    std::type_index element_type{typeid(void)};
};

template <class T>
class TypeBuilder;

namespace detail {

template <class T>
concept streamable = requires(std::ostream& os, const T& v) { os << v; };

template <class T>
struct is_vector : std::false_type {};
template <class E, class A>
struct is_vector<std::vector<E, A>> : std::true_type {};

/** \brief Maps a stored field type to the value it exposes for comparison. */
template <class M>
struct field_traits {
    using declared = M;
    static auto read(const M& field) -> ValueRef { return ValueRef{&field, typeid(M)}; }
};

template <class U>
struct field_traits<U*> {
    using declared = std::remove_cv_t<U>;
    static auto read(U* const& field) -> ValueRef { return ValueRef{field, typeid(declared)}; }
};

template <class U>
struct field_traits<std::shared_ptr<U>> {
    using declared = std::remove_cv_t<U>;
    static auto read(const std::shared_ptr<U>& field) -> ValueRef {
        return ValueRef{field.get(), typeid(declared)};
    }
};

template <class U, class D>
struct field_traits<std::unique_ptr<U, D>> {
    using declared = std::remove_cv_t<U>;
    static auto read(const std::unique_ptr<U, D>& field) -> ValueRef {
        return ValueRef{field.get(), typeid(declared)};
    }
};

template <class U>
struct field_traits<std::optional<U>> {
    using declared = U;
    static auto read(const std::optional<U>& field) -> ValueRef {
        return ValueRef{field ? &*field : nullptr, typeid(declared)};
    }
};

std::string quote(std::string_view text);

} // namespace detail

/**
 * \brief Registry of type descriptions keyed by std::type_index.
 *
 * Example:
 * ```cpp
 * auto registry = std::make_shared<TypeRegistry>();
 * registry->add<Address>("Address").member("Street", &Address::street);
 * registry->add<Customer>("Customer")
 *     .member("Name", &Customer::name)
 *     .member("Address", &Customer::address);
 * ```
 *
 * Re-registering a type replaces its previous description.
 */
class TypeRegistry {
public:
    /** \brief Creates a registry holding the built-in leaf types. */
    TypeRegistry();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /** \brief Registers a composite type and returns a builder for its members. */
    template <class T>
    auto add(std::string name) -> TypeBuilder<T>;

    /** \brief Registers a leaf type compared with operator==. */
    template <class T>
        requires std::equality_comparable<T>
    auto add_leaf(std::string name) -> TypeRegistry& {
        TypeDesc desc;
        desc.id = typeid(T);
        desc.name = std::move(name);
        desc.kind = TypeKind::leaf;
        desc.equals = [](const void* a, const void* b) {
            return *static_cast<const T*>(a) == *static_cast<const T*>(b);
        };
        if constexpr (detail::streamable<T>) {
            desc.to_string = [](const void* p) {
                std::ostringstream os;
                os << *static_cast<const T*>(p);
                return os.str();
            };
        }
        insert(std::move(desc));
        return *this;
    }

    /** \brief Registers std::vector<E> as a sequence; nested vectors are registered too. */
    template <class V>
        requires detail::is_vector<V>::value
    void ensure_sequence() {
        using E = typename V::value_type;
        static_assert(!std::is_same_v<E, bool>, "std::vector<bool> elements are not addressable");
        if constexpr (detail::is_vector<E>::value) ensure_sequence<E>();
        if (contains(typeid(V))) return;

        TypeDesc desc;
        desc.id = typeid(V);
        desc.kind = TypeKind::sequence;
        desc.element_type = typeid(typename detail::field_traits<E>::declared);
        desc.size = [](const void* p) { return static_cast<const V*>(p)->size(); };
        desc.element = [](const void* p, std::size_t i) {
            return detail::field_traits<E>::read((*static_cast<const V*>(p))[i]);
        };
        if constexpr (std::equality_comparable<E>) {
            desc.equals = [](const void* a, const void* b) {
                return *static_cast<const V*>(a) == *static_cast<const V*>(b);
            };
        }
        insert(std::move(desc));
    }

    [[nodiscard]] auto find(std::type_index type) const -> const TypeDesc*;

    template <class T>
    [[nodiscard]] auto find() const -> const TypeDesc* { return find(typeid(T)); }

    [[nodiscard]] auto contains(std::type_index type) const -> bool { return find(type) != nullptr; }

    /** \brief Display name; sequences render as "Element[]". Unregistered types use typeid names. */
    [[nodiscard]] auto type_name(std::type_index type) const -> std::string;

    /** \brief True when type equals base or reaches it through registered base links. */
    [[nodiscard]] auto is_same_or_derived(std::type_index type, std::type_index base) const -> bool;

    /** \brief Converts a pointer to `from` into a pointer to its ancestor `to`; nullptr if unrelated. */
    [[nodiscard]] auto upcast(const void* address, std::type_index from, std::type_index to) const
        -> const void*;

    /** \brief Registered types that derive (directly or not) from base, excluding base itself. */
    [[nodiscard]] auto derived_types(std::type_index base) const -> std::vector<std::type_index>;

    /**
     * \brief All members visible on a type: inherited members first, walking the
     *        base chain from the root ancestor down, then own members.
     */
    [[nodiscard]] auto members_of(std::type_index type) const
        -> std::expected<std::vector<MemberDescriptor>, core::error>;

    /** \brief Reads a member from an object whose type is the owner or derives from it. */
    [[nodiscard]] auto read_member(ValueRef object, const MemberDescriptor& member) const
        -> std::expected<ValueRef, core::error>;

    /** \brief Resolves a polymorphic value to its most-derived registered type. */
    [[nodiscard]] auto resolve_runtime(ValueRef value) const -> ValueRef;

    /** \brief Printable rendering used in failure reports. */
    [[nodiscard]] auto render(ValueRef value) const -> std::string;

private:
    template <class T>
    friend class TypeBuilder;

    auto insert(TypeDesc desc) -> TypeDesc&;

    std::unordered_map<std::type_index, std::unique_ptr<TypeDesc>> types_;
};

/** \brief Fluent registration of a composite type's members and bases. */
template <class T>
class TypeBuilder {
public:
    TypeBuilder(TypeRegistry& registry, TypeDesc& desc) : registry_(registry), desc_(desc) {}

    /** \brief Adds a data member. Pointer, smart pointer and optional fields read through. */
    template <class M>
    auto member(std::string name, M T::*field) -> TypeBuilder& {
        using traits = detail::field_traits<std::remove_cv_t<M>>;
        using declared = typename traits::declared;
        if constexpr (detail::is_vector<declared>::value) registry_.ensure_sequence<declared>();
        desc_.members.emplace_back(std::move(name), typeid(declared), typeid(T),
            [field](const void* owner) {
                return traits::read(static_cast<const T*>(owner)->*field);
            });
        return *this;
    }

    /** \brief Adds a read-only property exposed through a const getter returning a reference. */
    template <class R>
    auto property(std::string name, const R& (T::*getter)() const) -> TypeBuilder& {
        using traits = detail::field_traits<std::remove_cv_t<R>>;
        using declared = typename traits::declared;
        if constexpr (detail::is_vector<declared>::value) registry_.ensure_sequence<declared>();
        desc_.members.emplace_back(std::move(name), typeid(declared), typeid(T),
            [getter](const void* owner) {
                return traits::read((static_cast<const T*>(owner)->*getter)());
            });
        return *this;
    }

    /** \brief Declares B as a base of T; B's members become visible on T. */
    template <class B>
        requires std::is_base_of_v<B, T>
    auto base() -> TypeBuilder& {
        desc_.bases.push_back(BaseLink{typeid(B), [](const void* p) -> const void* {
            return static_cast<const B*>(static_cast<const T*>(p));
        }});
        return *this;
    }

    /** \brief Uses T::operator== when T is compared without recursion. */
    auto with_equality() -> TypeBuilder&
        requires std::equality_comparable<T>
    {
        desc_.equals = [](const void* a, const void* b) {
            return *static_cast<const T*>(a) == *static_cast<const T*>(b);
        };
        return *this;
    }

private:
    TypeRegistry& registry_;
    TypeDesc& desc_;
};

template <class T>
auto TypeRegistry::add(std::string name) -> TypeBuilder<T> {
    static_assert(std::is_class_v<T>, "composite types must be classes");
    TypeDesc desc;
    desc.id = typeid(T);
    desc.name = std::move(name);
    desc.kind = TypeKind::composite;
    if constexpr (std::is_polymorphic_v<T>) {
        desc.most_derived = [](const void* p) {
            const auto* object = static_cast<const T*>(p);
            return ValueRef{dynamic_cast<const void*>(object), std::type_index(typeid(*object))};
        };
    }
    return TypeBuilder<T>(*this, insert(std::move(desc)));
}

} // namespace deepeq
