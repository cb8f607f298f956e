/** \file type_registry.cpp
 *  \brief Built-in leaf types, inheritance walks and member access.
 */

#include "deepeq/type_registry.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>

namespace deepeq {

namespace detail {

std::string quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace detail

namespace {

// Renders as ISO-8601 UTC with a fractional part only when non-zero.
std::string render_date_time(const void* p) {
    const auto& tp = *static_cast<const date_time*>(p);
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const auto frac = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (frac != 0) os << '.' << std::setw(6) << std::setfill('0') << frac;
    os << 'Z';
    return os.str();
}

// Depth-first search for `to` through the base links of `from`.
const void* upcast_walk(const std::unordered_map<std::type_index, std::unique_ptr<TypeDesc>>& types,
                        const void* address, std::type_index from, std::type_index to) {
    if (from == to) return address;
    auto it = types.find(from);
    if (it == types.end()) return nullptr;
    for (const auto& link : it->second->bases) {
        const void* base_address = link.upcast(address);
        if (link.base == to) return base_address;
        if (const void* found = upcast_walk(types, base_address, link.base, to)) return found;
    }
    return nullptr;
}

} // namespace

TypeRegistry::TypeRegistry() {
    add_leaf<bool>("bool");
    add_leaf<char>("char");
    add_leaf<signed char>("signed char");
    add_leaf<unsigned char>("unsigned char");
    add_leaf<short>("short");
    add_leaf<unsigned short>("unsigned short");
    add_leaf<int>("int");
    add_leaf<unsigned int>("unsigned int");
    add_leaf<long>("long");
    add_leaf<unsigned long>("unsigned long");
    add_leaf<long long>("long long");
    add_leaf<unsigned long long>("unsigned long long");
    add_leaf<float>("float");
    add_leaf<double>("double");
    add_leaf<std::string>("string");
    add_leaf<date_time>("date_time");

    // Built-ins with renderings the stream operators do not give us.
    types_.at(typeid(bool))->to_string = [](const void* p) -> std::string {
        return *static_cast<const bool*>(p) ? "true" : "false";
    };
    types_.at(typeid(char))->to_string = [](const void* p) -> std::string {
        return std::string("'") + *static_cast<const char*>(p) + "'";
    };
    types_.at(typeid(signed char))->to_string = [](const void* p) -> std::string {
        return std::to_string(static_cast<int>(*static_cast<const signed char*>(p)));
    };
    types_.at(typeid(unsigned char))->to_string = [](const void* p) -> std::string {
        return std::to_string(static_cast<unsigned>(*static_cast<const unsigned char*>(p)));
    };
    types_.at(typeid(std::string))->to_string = [](const void* p) -> std::string {
        return detail::quote(*static_cast<const std::string*>(p));
    };
    types_.at(typeid(date_time))->to_string = &render_date_time;
}

auto TypeRegistry::insert(TypeDesc desc) -> TypeDesc& {
    auto owned = std::make_unique<TypeDesc>(std::move(desc));
    auto& slot = types_[owned->id];
    slot = std::move(owned);
    return *slot;
}

auto TypeRegistry::find(std::type_index type) const -> const TypeDesc* {
    auto it = types_.find(type);
    return it == types_.end() ? nullptr : it->second.get();
}

auto TypeRegistry::type_name(std::type_index type) const -> std::string {
    const TypeDesc* desc = find(type);
    if (!desc) return type.name();
    if (desc->kind == TypeKind::sequence) return type_name(desc->element_type) + "[]";
    return desc->name;
}

auto TypeRegistry::is_same_or_derived(std::type_index type, std::type_index base) const -> bool {
    if (type == base) return true;
    const TypeDesc* desc = find(type);
    if (!desc) return false;
    for (const auto& link : desc->bases) {
        if (is_same_or_derived(link.base, base)) return true;
    }
    return false;
}

auto TypeRegistry::upcast(const void* address, std::type_index from, std::type_index to) const
    -> const void* {
    if (address == nullptr) return nullptr;
    return upcast_walk(types_, address, from, to);
}

auto TypeRegistry::derived_types(std::type_index base) const -> std::vector<std::type_index> {
    std::vector<std::type_index> out;
    for (const auto& [id, desc] : types_) {
        if (id != base && desc->kind == TypeKind::composite && is_same_or_derived(id, base)) {
            out.push_back(id);
        }
    }
    return out;
}

auto TypeRegistry::members_of(std::type_index type) const
    -> std::expected<std::vector<MemberDescriptor>, core::error> {
    using core::error; using core::error_code;
    const TypeDesc* desc = find(type);
    if (!desc) {
        return std::unexpected(error{error_code::config_invalid,
            std::string("type is not registered: ") + type.name(), "deepeq.registry"});
    }
    std::vector<MemberDescriptor> out;
    for (const auto& link : desc->bases) {
        auto inherited = members_of(link.base);
        if (!inherited) return std::unexpected(inherited.error());
        for (auto& m : *inherited) {
            // A member redeclared further down the chain hides the inherited one.
            bool hidden = false;
            for (const auto& own : desc->members) {
                if (own.name() == m.name()) { hidden = true; break; }
            }
            if (!hidden) out.push_back(std::move(m));
        }
    }
    out.insert(out.end(), desc->members.begin(), desc->members.end());
    return out;
}

auto TypeRegistry::read_member(ValueRef object, const MemberDescriptor& member) const
    -> std::expected<ValueRef, core::error> {
    using core::error; using core::error_code;
    if (object.is_null()) {
        return std::unexpected(error{error_code::precondition_failed,
            "cannot read member '" + member.name() + "' of a null object", "deepeq.registry"});
    }
    const void* owner = upcast(object.address, object.type, member.owner_type());
    if (!owner) {
        return std::unexpected(error{error_code::config_invalid,
            "member '" + member.name() + "' of " + type_name(member.owner_type()) +
            " is not reachable from " + type_name(object.type), "deepeq.registry"});
    }
    return member.read(owner);
}

auto TypeRegistry::resolve_runtime(ValueRef value) const -> ValueRef {
    if (value.is_null()) return value;
    const TypeDesc* desc = find(value.type);
    if (!desc || !desc->most_derived) return value;
    ValueRef derived = desc->most_derived(value.address);
    if (derived.type == value.type || !contains(derived.type)) return value;
    return derived;
}

auto TypeRegistry::render(ValueRef value) const -> std::string {
    if (value.is_null()) return "<null>";
    const TypeDesc* desc = find(value.type);
    if (desc && desc->to_string) return desc->to_string(value.address);
    if (desc && desc->kind == TypeKind::sequence) {
        return type_name(value.type) + " with " + std::to_string(desc->size(value.address)) + " item(s)";
    }
    return "<" + type_name(value.type) + ">";
}

} // namespace deepeq
