#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <tuple>
#include <utility>
#include <concepts>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>

namespace intercept
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name> class ValidatedField;
template <typename T, fixstr::fixed_string Name> class ComputedField;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

/**
 * @brief Trait to check if a lambda can be invoked with a given type
 *
 * Provides a nested Predicate template that evaluates to true_type if
 * Lambda can be called with an argument of type T.
 */
template <typename Lambda>
struct DoesLambdaSupportType
{
    template <typename T>
    struct Predicate : std::bool_constant<requires { std::declval<Lambda>()(std::declval<T>()); }> {};
};

//-----------------------------------------------------------------------------
// Descriptor detection
//-----------------------------------------------------------------------------

template <typename T> struct is_descriptor_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name> struct is_descriptor_helper<ValidatedField<T, Name>> : std::true_type {};
template <typename T, fixstr::fixed_string Name> struct is_descriptor_helper<ComputedField<T, Name>> : std::true_type {};

/// Predicate that is true if T is a ValidatedField<> or ComputedField<> specialization
template <typename T> struct is_descriptor { static constexpr auto value = is_descriptor_helper<std::remove_cvref_t<T>>::value; };

/// Compile-time name of a ValidatedField<> type
template <typename T> struct field_name;
template <typename T, fixstr::fixed_string Name> struct field_name<ValidatedField<T, Name>>
{
    static constexpr std::string_view value = Name;
};
template <typename T, fixstr::fixed_string Name> struct field_name<ComputedField<T, Name>>
{
    static constexpr std::string_view value = Name;
};

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

/// Index of name in names, or names.size() if absent
template <typename Names>
constexpr std::size_t index_of(Names const& names, std::string_view name)
{
    for (std::size_t i = 0; i < names.size(); ++i)
        if (names[i] == name)
            return i;

    return names.size();
}

//-----------------------------------------------------------------------------
// Value type helpers
//-----------------------------------------------------------------------------

/// The type a value of type T is stored as (string-like types become std::string)
template <typename T>
struct storage_type
{
    using decayed = std::decay_t<T>;
    using type = std::conditional_t<std::is_same_v<decayed, char const*> || std::is_same_v<decayed, char*> || std::is_same_v<decayed, std::string_view>,
                                    std::string, decayed>;
};

template <typename T> using storage_type_t = typename storage_type<T>::type;

/// Human readable name of a supported value type, used in error messages
template <typename T>
constexpr std::string_view typeName()
{
    if constexpr (std::is_same_v<T, bool>)              return "bool";
    else if constexpr (std::is_same_v<T, std::int8_t>)  return "int8_t";
    else if constexpr (std::is_same_v<T, std::int16_t>) return "int16_t";
    else if constexpr (std::is_same_v<T, std::int32_t>) return "int32_t";
    else if constexpr (std::is_same_v<T, std::int64_t>) return "int64_t";
    else if constexpr (std::is_same_v<T, float>)        return "float";
    else if constexpr (std::is_same_v<T, double>)       return "double";
    else if constexpr (std::is_same_v<T, std::string>)  return "std::string";
    else                                                return "unknown";
}

template<template<typename, typename> class Cls, typename T>
struct BindFirst
{
    template <typename U>
    struct Result
    {
        using type = Cls<T, U>;
    };
};

/// Helper to transform tuple element types
template <typename Tuple, template<typename> class Transform>
struct transform_tuple;

template <typename... Ts, template<typename> class Transform>
struct transform_tuple<std::tuple<Ts...>, Transform> {
    using type = std::tuple<typename Transform<Ts>::type...>;
};

// Helper class to transform a tuple to a variant
template <template<typename...> class Transform, typename Tuple>
struct apply_tuple;

template <template<typename...> class Transform, typename... Ts>
struct apply_tuple<Transform, std::tuple<Ts...>> {
    using type = Transform<Ts...>;
};

template <typename T> struct add_lvalue_ref { using type = T&; };
template <typename T> struct add_const_lvalue_ref { using type = T const&; };
template <typename T> struct add_reference_wrapper { using type = std::reference_wrapper<T>; };
template <typename T> struct add_const_reference_wrapper { using type = std::reference_wrapper<T const>; };

//-----------------------------------------------------------------------------
// Record identity
//-----------------------------------------------------------------------------

/**
 * @brief Identity token owned by exactly one record
 *
 * A record holds the only strong reference to its Identity. Descriptors key
 * their side-tables with a weak_ptr to it, so a descriptor can observe a record
 * but never keep it alive. When the record is destroyed the token dies with it
 * and every registered release hook runs, giving each side-table the chance to
 * drop its entry for the record.
 */
class Identity : public std::enable_shared_from_this<Identity>
{
public:
    using Key = std::weak_ptr<Identity const>;
    using ReleaseHook = std::function<void(Key const&)>;

    Identity() = default;
    ~Identity();

    Identity(Identity const&) = delete;
    Identity& operator=(Identity const&) = delete;

    /// Returns the weak key descriptors use to refer to this identity
    Key key() const { return weak_from_this(); }

    /**
     * @brief Register a hook to run when this identity is released
     *
     * At most one hook is kept per owner; registering again for the same owner
     * replaces the previous hook.
     */
    void onRelease(void const* owner, ReleaseHook hook) const;

private:
    mutable std::mutex lock;
    mutable std::map<void const*, ReleaseHook> releaseHooks;
};
} // namespace detail

} // namespace intercept
