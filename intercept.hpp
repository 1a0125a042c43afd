/**
 * @file intercept.hpp
 * @brief Attribute interception and validated lazy-binding for record types
 *
 * This file implements a small attribute layer that lets unrelated record types
 * share validation and lazy-computation logic for their fields:
 *   - Type-erased values (Value, Fundamental<T>, Dictionary)
 *   - A per-record AttributeStore, the raw (never intercepted) attribute map
 *   - Shared ValidatedField<T, Name> descriptors holding per-record values in a
 *     side-table keyed by a weak reference to the record
 *   - LazyBinder, FullInterceptor and WriteInterceptor which route reads and
 *     writes of undeclared attributes through user supplied logic
 *
 * Usage example:
 *   struct ExamFields {
 *       ValidatedField<int32_t, "math_grade"> math_grade { inRange(0, 100) };
 *   };
 *   Record<ExamFields> exam;
 *   exam("math_grade"_fld) = 95;          // validated, stored in the side-table
 *   exam.setattr("comment", "well done"); // undeclared, stored in the record
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <typeinfo>
#include <concepts>
#include <map>
#include <mutex>
#include <iostream>
#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <utility>
#include <variant>
#include <vector>
#include <fixed_string.hpp>
#include <CxxUtilities.hpp>
#include "intercept_detail.hpp"
#include "intercept_log.hpp"

namespace intercept
{

//=============================================================================
// Errors
//=============================================================================

/**
 * @brief Raised when nothing resolves an attribute name
 *
 * Thrown by Object::getattr and Object::delattr when neither a declared field,
 * the record's AttributeStore nor an installed read interceptor can produce a
 * value. Object::hasattr catches it and returns false instead.
 */
class AttributeMissing : public std::out_of_range
{
public:
    explicit AttributeMissing(std::string_view attributeName);

    /// Name of the attribute that could not be resolved
    std::string const& name() const noexcept { return attribute; }

private:
    std::string attribute;
};

/**
 * @brief Raised when a candidate value is rejected by a ValidatedField
 *
 * The record's state is left exactly as it was before the write.
 */
class ValidationError : public std::invalid_argument
{
public:
    ValidationError(std::string_view fieldName, std::string_view reasonText);

    std::string const& fieldname() const noexcept { return field; }
    std::string const& reason() const noexcept { return why; }

private:
    std::string field;
    std::string why;
};

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * Used as a tag type for accessing declared fields by name.
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

// Forward declarations
template <typename T> class Fundamental;
template <typename T> class Record;
class Object;
class Value;
class Invalid;
class Dictionary;
class AttributeStore;
class Descriptor;
class ReadInterceptor;
class WriteInterceptor;

//=============================================================================
// Values
//=============================================================================

/**
 * @brief Abstract base class for type-erased attribute values
 *
 * Value provides a common interface for values of unknown type. It supports:
 *   - Type identification via type() and isDictionary()
 *   - Validity checking via isValid() and operator bool()
 *   - Type-safe visitation via visit() with lambda overloads
 *   - Deep copies via clone() and comparison via equals()
 *
 * Derived classes include:
 *   - Invalid: Sentinel for missing attributes (Value::kInvalid)
 *   - Fundamental<T>: Wrapper for the supported fundamental types
 *   - Dictionary: A nested name to value mapping
 *
 * Lookups in this library return Value references and use kInvalid as the
 * "not found" answer, so every stage of attribute resolution can be checked
 * with a plain boolean test.
 */
class Value
{
private:
    /// Tuple of all fundamental types supported by the visitor pattern
    using SupportedFundamentalTypes = std::tuple<
        int8_t, int16_t, int32_t, int64_t,
        float, double,
        bool,
        std::string
    >;

public:
    /// Global singleton representing an invalid/missing value
    static Invalid& kInvalid;

    virtual ~Value() = default;

    /// Returns the std::type_info for the underlying value type
    virtual std::type_info const& type() const = 0;

    /// Returns true if this value is valid (not Invalid)
    virtual bool isValid() const = 0;

    /// Returns true if this value is a Dictionary
    virtual bool isDictionary() const { return false; }

    /// Converts to bool based on validity (same as isValid())
    operator bool() const { return isValid(); }

    /**
     * @brief Visit the underlying value with a type-safe lambda
     *
     * The lambda will be called with the underlying value if it supports
     * that type. The lambda can accept any subset of the supported types,
     * as well as Invalid and Dictionary.
     *
     * @code
     * value.visit([](auto const& v) { std::cout << v; });  // Generic visitor
     * value.visit([](int32_t& i) { i *= 2; });             // int-only visitor
     * @endcode
     */
    template <typename Lambda>
    auto visit(this auto&& self, Lambda && lambda) -> decltype(auto);

    /// True if T is one of the supported fundamental types
    template <typename T>
    static constexpr bool isSupported()
    {
        return std::invoke(
            [] <typename... Type> (std::type_identity<std::tuple<Type...>>)
            {
                return (std::is_same_v<T, Type> || ...);
            },
            std::type_identity<SupportedFundamentalTypes>()
        );
    }

    /**
     * @brief Returns the underlying value as a T
     *
     * Throws std::bad_cast if this value does not hold a T.
     */
    template <typename T>
    T const& as() const;

    /// Returns a deep copy of this value
    virtual std::unique_ptr<Value> clone() const = 0;

    /// Returns true if other holds the same type and an equal value
    virtual bool equals(Value const& other) const = 0;

    /**
     * @brief Assign the value of another Value to the recipient
     *
     * @return Returns true on success, false if the underlying types differ.
     */
    virtual bool assign(Value const& other) = 0;

protected:
    friend class Invalid;
    friend class Dictionary;
    template <typename T> friend class Fundamental;

    using TypesVariant = detail::apply_tuple<std::variant, decltype(std::tuple_cat(std::declval<std::tuple<std::monostate>>(),
        std::declval<detail::transform_tuple<SupportedFundamentalTypes, detail::add_reference_wrapper>::type>()))>::type;
    using ConstTypesVariant = detail::apply_tuple<std::variant, decltype(std::tuple_cat(std::declval<std::tuple<std::monostate>>(),
        std::declval<detail::transform_tuple<SupportedFundamentalTypes, detail::add_const_reference_wrapper>::type>()))>::type;

    virtual TypesVariant visit_helper() { return std::monostate(); }
    virtual ConstTypesVariant visit_helper() const { return std::monostate(); }

    constexpr Value() = default;
    Value(Value const&) = default;
    Value& operator=(Value const&) = default;
};

/**
 * @brief Sentinel type representing a missing attribute
 *
 * Invalid is returned when a lookup fails. It always returns false for
 * isValid() and can be used in boolean context to check for lookup failures.
 *
 * @code
 * auto const& value = record.attributes().get("nonexistent");
 * if (! value) {
 *     std::cout << "Attribute not found!" << std::endl;
 * }
 * @endcode
 */
class Invalid : public Value
{
public:
    /// Compile-time constant indicating this is not a valid value
    static constexpr auto kIsValid = false;

    constexpr Invalid() = default;

    std::type_info const& type() const override { return typeid(void); }
    bool isValid() const override { return false; }
    constexpr operator bool() const { return false; }

    std::unique_ptr<Value> clone() const override;
    bool equals(Value const& other) const override { return ! other.isValid(); }
    bool assign(Value const&) override { return false; }
};

/**
 * @brief Concrete wrapper for a value of a supported fundamental type T
 *
 * @tparam T One of int8_t, int16_t, int32_t, int64_t, float, double, bool or std::string
 */
template <typename T>
class Fundamental : public Value
{
public:
    static_assert(Value::isSupported<T>(), "T must be one of the supported fundamental types");

    /// Compile-time constant indicating this is always a valid value
    static constexpr auto kIsValid = true;

    /// Default constructor - creates a Fundamental with default-initialized value
    Fundamental();

    /// Construct from underlying value
    Fundamental(T underlying_);

    Fundamental(Fundamental const& o) = default;
    Fundamental(Fundamental&& o) = default;
    Fundamental& operator=(Fundamental const&) = default;
    Fundamental& operator=(Fundamental&&) = default;

    /// Assign new value
    Fundamental& operator=(T const& newValue);

    /// Assign new value (move version)
    Fundamental& operator=(T && newValue);

    /// Returns the type_info for the underlying type T
    std::type_info const& type() const override { return typeid(T); }

    /// Always returns true - Fundamental values are always valid
    bool isValid() const override { return true; }

    /// Always returns true (disabled for bool to avoid conflict with operator T())
    constexpr operator bool() const requires (!std::is_same_v<T, bool>) { return true; }

    /// Returns the underlying value (read-only access)
    T const& operator()() const { return underlying; }

    /// Implicit conversion to the underlying type
    operator T() const { return underlying; }

    void set(T const& newValue);
    void set(T && newValue);

    // overridden base methods
    std::unique_ptr<Value> clone() const override;
    bool equals(Value const& other) const override;
    bool assign(Value const& other) override;

protected:
    typename Value::TypesVariant visit_helper() override;
    typename Value::ConstTypesVariant visit_helper() const override;

    T underlying;
};

/// Types that can be wrapped in a Fundamental<> (string literals become std::string)
template <typename T>
concept FundamentalConvertible = Value::isSupported<detail::storage_type_t<T>>();

/// Wraps a plain C++ value into a heap allocated Fundamental<>
template <FundamentalConvertible T>
std::unique_ptr<Value> makeValue(T && value);

//=============================================================================
// AttributeStore
//=============================================================================

/**
 * @brief A record's own name to value mapping
 *
 * AttributeStore is the raw access primitive of this library: none of its
 * methods are ever intercepted. Interceptors receive the store, and never the
 * record, so their logic cannot re-enter the intercepted entry points of
 * Object.
 *
 * Names starting with "__" are reserved for bookkeeping (see isReserved()).
 */
class AttributeStore
{
public:
    AttributeStore() = default;
    AttributeStore(AttributeStore const& o);
    AttributeStore(AttributeStore&& o) noexcept = default;
    AttributeStore& operator=(AttributeStore const& o);
    AttributeStore& operator=(AttributeStore&& o) noexcept = default;

    /// Returns the value stored under name, or Value::kInvalid
    Value const& get(std::string_view name) const;

    /// @overload
    Value& get(std::string_view name);

    /**
     * @brief Store a copy of value under name
     *
     * Storing an invalid value removes name from the store.
     */
    void set(std::string_view name, Value const& value);

    /// @overload Takes ownership of value
    void set(std::string_view name, std::unique_ptr<Value> value);

    /// @overload Wraps a plain C++ value
    template <FundamentalConvertible T>
    void set(std::string_view name, T && value);

    bool contains(std::string_view name) const;

    /// Removes name, returns false if it was not stored
    bool remove(std::string_view name);

    /// Names of all stored attributes in lexicographical order
    std::vector<std::string> names() const;

    std::size_t size() const noexcept { return attributes.size(); }
    bool empty() const noexcept { return attributes.empty(); }
    void clear() noexcept { attributes.clear(); }

    /// Returns true for names reserved for interception bookkeeping
    static bool isReserved(std::string_view name) noexcept { return name.starts_with("__"); }

    friend bool operator==(AttributeStore const& a, AttributeStore const& b);

private:
    std::map<std::string, std::unique_ptr<Value>, std::less<>> attributes;
};

/**
 * @brief A nested name to value mapping usable as a Value
 *
 * Dictionaries are typically used as the external backing of records with a
 * FullInterceptor installed.
 *
 * @code
 * Dictionary data;
 * data.entries().set("foo", 3);
 * record.attributes().set(FullInterceptor::kBackingField, data);
 * @endcode
 */
class Dictionary : public Value
{
public:
    Dictionary() = default;
    Dictionary(AttributeStore entries_);

    std::type_info const& type() const override { return typeid(Dictionary); }
    bool isValid() const override { return true; }
    bool isDictionary() const override { return true; }

    AttributeStore& entries() noexcept { return items; }
    AttributeStore const& entries() const noexcept { return items; }

    /// Returns the value stored under key, or Value::kInvalid
    Value const& operator[](std::string_view key) const { return items.get(key); }

    // overridden base methods
    std::unique_ptr<Value> clone() const override;
    bool equals(Value const& other) const override;
    bool assign(Value const& other) override;

private:
    AttributeStore items;
};

//=============================================================================
// Object
//=============================================================================

/**
 * @brief Base class for records whose attributes can be intercepted
 *
 * An Object owns an AttributeStore and an identity token. Attribute access
 * through getattr/setattr is resolved in priority order:
 *   1. Reserved names ("__" prefix) always go straight to the store
 *   2. A declared field (see Record<Schema>) owning the name
 *   3. An installed ReadInterceptor (LazyBinder or FullInterceptor) for reads,
 *      or an installed WriteInterceptor for writes
 *   4. The AttributeStore
 *
 * A plain Object has no declared fields and is the schemaless record: every
 * attribute lives in its store or is produced by an interceptor.
 *
 * @see Record<Schema> for records with declared, validated fields
 */
class Object
{
public:
    Object();

    /// Copies attributes and interceptors; the copy gets its own identity
    Object(Object const& o);

    /// Moves attributes and copies interceptors; the new object gets its own identity
    Object(Object&& o);

    Object& operator=(Object const& o);
    Object& operator=(Object&& o);

    virtual ~Object() = default;

    //=============================================================================
    // Intercepted entry points
    //=============================================================================

    /**
     * @brief Read an attribute
     *
     * @return Reference to the resolved value. The reference stays valid until the
     *         attribute is written or removed.
     * @throws AttributeMissing if nothing resolves name
     */
    Value const& getattr(std::string_view name);

    /// Typed read, throws AttributeMissing or std::bad_cast
    template <typename T>
    T const& get(std::string_view name) { return getattr(name).template as<T>(); }

    /**
     * @brief Write an attribute
     *
     * The installed write interceptor audits every write except those to reserved
     * names, including writes to declared fields.
     *
     * @throws ValidationError if a declared field rejects the value
     * @throws std::invalid_argument if value is invalid
     */
    void setattr(std::string_view name, Value const& value);

    /// @overload Wraps a plain C++ value
    template <FundamentalConvertible T>
    void setattr(std::string_view name, T && value);

    /// Returns true if getattr(name) would succeed. May populate lazily bound attributes.
    bool hasattr(std::string_view name);

    /**
     * @brief Remove an attribute
     *
     * Declared fields are reset to their default value.
     *
     * @throws AttributeMissing if nothing is populated under name
     */
    void delattr(std::string_view name);

    /// Names of all populated, non-reserved attributes: declared fields first, then the store
    std::vector<std::string> attributeNames() const;

    //=============================================================================
    // Raw access
    //=============================================================================

    AttributeStore& attributes() noexcept { return store; }
    AttributeStore const& attributes() const noexcept { return store; }

    /**
     * @brief Read a declared field without interception
     *
     * Intended for ComputedField getters and setters which derive their value
     * from sibling fields.
     *
     * @throws AttributeMissing if name is not a declared field
     */
    Value const& fieldValue(std::string_view name) const;

    /// Typed fieldValue, throws AttributeMissing or std::bad_cast
    template <typename T>
    T const& fieldValue(std::string_view name) const { return fieldValue(name).template as<T>(); }

    //=============================================================================
    // Interception
    //=============================================================================

    /// Installs (or with nullptr removes) the read interceptor
    void intercept(std::shared_ptr<ReadInterceptor const> interceptor) noexcept { reader = std::move(interceptor); }

    /// Installs (or with nullptr removes) the write interceptor
    void intercept(std::shared_ptr<WriteInterceptor const> interceptor) noexcept { writer = std::move(interceptor); }

    ReadInterceptor const* readInterceptor() const noexcept { return reader.get(); }
    WriteInterceptor const* writeInterceptor() const noexcept { return writer.get(); }

    //=============================================================================
    // Declared fields
    //=============================================================================

    /// Returns the declared field owning name, or nullptr
    virtual Descriptor const* descriptor(std::string_view) const { return nullptr; }

    /// Returns all declared fields in declaration order
    virtual std::vector<std::reference_wrapper<Descriptor const>> descriptors() const { return {}; }

    /// Identity token used by descriptors to key their side-tables
    detail::Identity const& identity() const noexcept { return *id; }

    /// Number of intercepted reads currently active on this thread
    static std::size_t interceptionDepth() noexcept { return depth; }

private:
    Value const& resolve(std::string_view name);

    AttributeStore store;
    std::shared_ptr<detail::Identity> id;
    std::shared_ptr<ReadInterceptor const> reader;
    std::shared_ptr<WriteInterceptor const> writer;

    static thread_local std::size_t depth;
};

//=============================================================================
// Descriptors
//=============================================================================

/**
 * @brief Type-erased interface of a declared field
 *
 * One descriptor instance is shared by every record of a type. It never owns a
 * record; per-record state lives in a side-table keyed by the record's identity.
 */
class Descriptor
{
public:
    virtual ~Descriptor() = default;

    virtual std::string_view fieldname() const = 0;
    virtual std::type_info const& type() const = 0;

    /// Returns the record's value, or the default value. Never throws.
    virtual Value const& read(Object const& record) const = 0;

    /// Validates and stores value for record, throws ValidationError
    virtual void write(Object& record, Value const& value) const = 0;

    /// True if record has an entry in the side-table
    virtual bool isPopulated(Object const& record) const = 0;

    /// Drops record's entry, returns false if there was none
    virtual bool reset(Object& record) const = 0;

    /// Makes to's entry identical to from's (including having none)
    virtual void copy(Object const& from, Object& to) const = 0;

    /// False if copying into to would overwrite an immutable value
    virtual bool acceptsCopy(Object const&) const { return true; }

    /// Number of side-table entries belonging to live records
    virtual std::size_t size() const = 0;

    /// Prunes entries of records that no longer exist, returns the number pruned
    virtual std::size_t collect() const = 0;

protected:
    Descriptor() = default;
    Descriptor(Descriptor const&) = default;
    Descriptor& operator=(Descriptor const&) = default;
};

/**
 * @brief A validation predicate together with the reason reported on failure
 *
 * A default constructed Validator accepts every value.
 */
template <typename T>
struct Validator
{
    std::function<bool(T const&)> predicate;
    std::string reason;

    bool operator()(T const& value) const { return predicate == nullptr || predicate(value); }
};

/// Accepts values v with min <= v <= max
template <typename T>
Validator<T> inRange(T min, T max);

/// Accepts values v > 0
template <typename T>
Validator<T> positive();

/// Accepts non-empty strings
Validator<std::string> nonEmpty();

enum class Mutability
{
    readWrite,   ///< Every write is validated and may overwrite the previous value
    writeOnce    ///< Only the first write is accepted
};

namespace detail
{
/**
 * @brief Weak-keyed side-table from record identity to a descriptor's value
 *
 * Entries are keyed by std::weak_ptr<Identity const> so the table never keeps
 * a record alive. When a record is destroyed, its identity releases the entry
 * through a hook registered on first insertion.
 */
template <typename T>
class SideTable : public std::enable_shared_from_this<SideTable<T>>
{
public:
    /// Returns the stored value or nullptr
    Fundamental<T> const* find(Identity const& owner) const;

    std::optional<T> copyOf(Identity const& owner) const;

    bool contains(Identity const& owner) const;

    /**
     * @brief Insert or overwrite the entry of owner
     *
     * @return false, and leaves the table untouched, if mustBeAbsent is set and
     *         owner already has an entry
     */
    bool store(Identity const& owner, T value, bool mustBeAbsent);

    bool erase(Identity const& owner);

    /// Removes the entry for an expired key
    void evict(Identity::Key const& key);

    std::size_t size() const;
    std::size_t collect();

private:
    mutable std::mutex lock;
    std::map<Identity::Key, Fundamental<T>, std::owner_less<Identity::Key>> entries;
};
} // namespace detail

/**
 * @brief Reusable validated field shared by all records of a type
 *
 * Declare ValidatedFields as members of a plain schema struct and derive the
 * record from Record<Schema>. The schema is instantiated once per record type,
 * so every record of that type shares the same descriptor instances.
 *
 * @tparam T The value type (one of the supported fundamental types)
 * @tparam Name Compile-time string literal for the field name
 *
 * @code
 * struct ResistorFields {
 *     ValidatedField<double, "ohms"> ohms { positive<double>() };
 *     ValidatedField<double, "voltage"> voltage;
 * };
 *
 * struct Resistor : Record<ResistorFields> {
 *     Resistor(double ohms) { schema().ohms.set(*this, ohms); }
 * };
 * @endcode
 */
template <typename T, fixstr::fixed_string Name>
class ValidatedField : public Descriptor
{
public:
    using ValueType = T;

    /// The compile-time field name
    static constexpr std::string_view kName = Name;

    ValidatedField(Validator<T> validator_ = {}, T defaultValue_ = T(), Mutability mutability_ = Mutability::readWrite);

    ValidatedField(ValidatedField const&) = default;
    ValidatedField& operator=(ValidatedField const&) = default;

    /// Returns the record's value or the default value
    T get(Object const& record) const;

    /**
     * @brief Validate value and store it for record
     *
     * @throws ValidationError if the validator rejects value, or if the field is
     *         write-once and already populated. The previous value is kept.
     */
    void set(Object& record, T value) const;

    Validator<T> const& validator() const noexcept { return check; }
    T const& defaultValue() const noexcept { return fallback(); }
    Mutability mutability() const noexcept { return access; }

    // overridden base methods
    std::string_view fieldname() const override { return kName; }
    std::type_info const& type() const override { return typeid(T); }
    Value const& read(Object const& record) const override;
    void write(Object& record, Value const& value) const override;
    bool isPopulated(Object const& record) const override;
    bool reset(Object& record) const override;
    void copy(Object const& from, Object& to) const override;
    bool acceptsCopy(Object const& to) const override;
    std::size_t size() const override;
    std::size_t collect() const override;

private:
    std::shared_ptr<detail::SideTable<T>> table;
    Validator<T> check;
    Fundamental<T> fallback;
    Mutability access;
};

/**
 * @brief Declared field whose value is derived by a getter and setter
 *
 * A ComputedField owns no per-record value. Reads call the getter and writes
 * call the setter, which typically update sibling fields. A ComputedField
 * without a setter is read-only.
 *
 * @code
 * struct BucketFields {
 *     ValidatedField<int64_t, "max_quota">      max_quota      { inRange<int64_t>(0, 1000) };
 *     ValidatedField<int64_t, "quota_consumed"> quota_consumed { inRange<int64_t>(0, 1000) };
 *     ComputedField<int64_t, "quota"> quota { [] (Object const& b)
 *     {
 *         return b.fieldValue<int64_t>("max_quota") - b.fieldValue<int64_t>("quota_consumed");
 *     } };
 * };
 * @endcode
 */
template <typename T, fixstr::fixed_string Name>
class ComputedField : public Descriptor
{
public:
    static_assert(Value::isSupported<T>(), "T must be one of the supported fundamental types");

    using ValueType = T;
    using Getter = std::function<T(Object const& record)>;
    using Setter = std::function<void(Object& record, T value)>;

    /// The compile-time field name
    static constexpr std::string_view kName = Name;

    ComputedField(Getter getter_, Setter setter_ = {});

    ComputedField(ComputedField const&) = default;
    ComputedField& operator=(ComputedField const&) = default;

    T get(Object const& record) const { return getter(record); }

    /// Calls the setter, throws ValidationError if the field is read-only
    void set(Object& record, T value) const;

    bool isReadOnly() const noexcept { return setter == nullptr; }

    // overridden base methods
    std::string_view fieldname() const override { return kName; }
    std::type_info const& type() const override { return typeid(T); }

    /// The returned reference stays valid until the next read of this field for record
    Value const& read(Object const& record) const override;
    void write(Object& record, Value const& value) const override;
    bool isPopulated(Object const&) const override { return true; }
    bool reset(Object& record) const override;
    void copy(Object const&, Object&) const override {}
    std::size_t size() const override;
    std::size_t collect() const override;

private:
    std::shared_ptr<detail::SideTable<T>> lastRead;
    Getter getter;
    Setter setter;
};

/**
 * @brief A declared field bound to one record
 *
 * Returned by Record<Schema>::operator()(CompileTimeString). Reading goes
 * through ValidatedField::get and assignment through ValidatedField::set.
 */
template <typename Field, typename RecordType>
class BoundField
{
public:
    using ValueType = typename Field::ValueType;

    BoundField(Field const& field_, RecordType& record_) : field(field_), record(record_) {}

    /// Returns the record's value of this field
    ValueType operator()() const { return field.get(record); }

    operator ValueType() const { return field.get(record); }

    /// Validates and stores a new value, throws ValidationError
    BoundField& operator=(ValueType newValue) requires (! std::is_const_v<RecordType>)
    {
        field.set(record, std::move(newValue));
        return *this;
    }

    Field const& descriptor() const noexcept { return field; }

private:
    Field const& field;
    RecordType& record;
};

/**
 * @brief User-defined literal for creating compile-time field name tags
 *
 * @code
 * exam("math_grade"_fld) = 95;
 * @endcode
 *
 * @return CompileTimeString containing the field name
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

/**
 * @brief A record type with declared, validated fields
 *
 * Record extends Object with:
 *   - A per-type schema singleton whose ValidatedField members are enumerated
 *     at compile time
 *   - Compile-time field access via operator()(CompileTimeString) using "_fld"
 *   - Static kFieldNames array containing all declared field names
 *   - Routing of getattr/setattr for declared names to their descriptor
 *
 * @tparam Schema An aggregate whose members are ValidatedField<Type, "name"> or
 *                ComputedField<Type, "name">
 *
 * @code
 * struct ExamFields {
 *     ValidatedField<int32_t, "math_grade">    math_grade    { inRange(0, 100) };
 *     ValidatedField<int32_t, "writing_grade"> writing_grade { inRange(0, 100) };
 * };
 *
 * Record<ExamFields> exam;
 * exam("writing_grade"_fld) = 82;
 * int32_t grade = exam("writing_grade"_fld);
 * @endcode
 */
template <typename Schema>
class Record : public Object
{
private:
    static auto fields_with(Schema& s);
public:
    Record() = default;

    /// Copies attributes, interceptors and declared field values under a new identity
    Record(Record const& o);

    Record(Record&& o);

    Record& operator=(Record const& o);
    Record& operator=(Record&& o);

    /// The schema shared by every record of this type
    static Schema& schema();

    //=============================================================================
    // Type aliases for field access
    //=============================================================================

    /// Tuple type of references to all declared fields
    using ReferenceTuple = decltype(fields_with(std::declval<Schema&>()));

    /// Tuple type of all declared field types (decayed)
    using FieldsAsTuple = detail::decay_tuple<ReferenceTuple>::type;
    static_assert(std::tuple_size_v<FieldsAsTuple> >= 1);

    /// Compile-time array of all declared field names in declaration order
    static constexpr std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> kFieldNames =
        std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
        {
            std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> returnValue = {{
                detail::field_name<Types>::value...
            }};

            return returnValue;
        }, std::type_identity<FieldsAsTuple>());

    /**
     * @brief Access a declared field by compile-time name using "_fld" literal
     *
     * A name that is not declared in Schema fails to compile.
     *
     * @return BoundField for this record
     */
    template <fixstr::fixed_string FieldName>
    auto operator()(this auto& self, CompileTimeString<FieldName>);

    /// Returns a tuple of references to all declared fields of the schema
    static auto fields() { return fields_with(schema()); }

    /**
     * @brief Visit all declared fields with a lambda
     *
     * @param lambda Callable taking (std::string_view name, ValidatedField const& field)
     */
    template <typename Lambda>
    static void visitFields(Lambda && lambda);

    // overridden base methods
    Descriptor const* descriptor(std::string_view name) const override;
    std::vector<std::reference_wrapper<Descriptor const>> descriptors() const override;

private:
    /// Declared fields as base pointers, in declaration order
    static std::array<Descriptor const*, std::tuple_size_v<FieldsAsTuple>> const& descriptorTable();

    /// Copies every declared field of o, throws ValidationError before copying anything if an immutable field would change
    void copyFields(Record const& o);
};

//=============================================================================
// Interceptors
//=============================================================================

/**
 * @brief Capability interface for routing reads of undeclared attributes
 *
 * Implementations receive the record's raw AttributeStore, never the record
 * itself, so any attribute they touch is read without interception.
 * Returning Value::kInvalid means the attribute is missing.
 */
class ReadInterceptor
{
public:
    virtual ~ReadInterceptor() = default;

    virtual Value const& read(AttributeStore& raw, std::string_view name) const = 0;

    /// True if names present in the store never need to reach read()
    virtual bool fallbackOnly() const { return false; }
};

/**
 * @brief Computes missing attributes once and memoizes them in the store
 *
 * The compute function is only called for names absent from the store. Its
 * result is stored under name, so later reads are plain store lookups. A
 * compute function returning nullptr (or throwing AttributeMissing) reports
 * the attribute as missing.
 *
 * @code
 * record.intercept(std::make_shared<LazyBinder const>([] (std::string_view name)
 * {
 *     return makeValue(std::format("Value for {}", name));
 * }));
 * @endcode
 */
class LazyBinder : public ReadInterceptor
{
public:
    using Compute = std::function<std::unique_ptr<Value>(std::string_view name)>;

    explicit LazyBinder(Compute compute_);

    Value const& read(AttributeStore& raw, std::string_view name) const override;
    bool fallbackOnly() const override { return true; }

private:
    Compute compute;
};

/**
 * @brief Routes every read through custom logic
 *
 * The store is consulted first. Only on a miss is the resolve function called,
 * with a read-only view of the store. Reserved names never reach it, so its
 * bookkeeping (e.g. the backing Dictionary stored under kBackingField) is read
 * without recursion.
 */
class FullInterceptor : public ReadInterceptor
{
public:
    /// Reserved store name holding the backing Dictionary
    static constexpr std::string_view kBackingField = "__backing";

    using Resolve = std::function<Value const&(AttributeStore const& raw, std::string_view name)>;

    explicit FullInterceptor(Resolve resolve_);

    /// Interceptor resolving missing names from the Dictionary stored under kBackingField
    static std::shared_ptr<FullInterceptor const> dictionaryBacked();

    Value const& read(AttributeStore& raw, std::string_view name) const override;

private:
    Resolve resolve;
};

/**
 * @brief Runs a side effect for every write before it is committed
 *
 * The side effect sees a read-only view of the store and the incoming value.
 * Once it returns, an undeclared attribute is committed with the raw
 * AttributeStore::set and a declared field through its descriptor. If the side
 * effect throws, nothing is written.
 */
class WriteInterceptor
{
public:
    using SideEffect = std::function<void(AttributeStore const& raw, std::string_view name, Value const& value)>;

    explicit WriteInterceptor(SideEffect sideEffect_);

    /// Runs the side effect only
    void audit(AttributeStore const& raw, std::string_view name, Value const& value) const;

    /// Runs the side effect, then commits value to the store
    void write(AttributeStore& raw, std::string_view name, Value const& value) const;

private:
    SideEffect sideEffect;
};

// Stream output operators
std::ostream& operator<<(std::ostream& o, intercept::Value const& x);
std::ostream& operator<<(std::ostream& o, intercept::Invalid const& x);
std::ostream& operator<<(std::ostream& o, intercept::Dictionary const& x);
std::ostream& operator<<(std::ostream& o, intercept::Object const& x);
} // namespace intercept

// std::formatter specializations
template <>
struct std::formatter<intercept::Value> : std::formatter<std::string>
{
    auto format(intercept::Value const& v, format_context& ctx) const;
};

template <>
struct std::formatter<intercept::Object> : std::formatter<std::string>
{
    auto format(intercept::Object const& v, format_context& ctx) const;
};

// Include template implementations
#include "intercept.tpp"
