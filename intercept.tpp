#pragma once

namespace intercept
{

//=============================================================================
// Value implementations
//=============================================================================
template <typename Lambda>
auto Value::visit(this auto&& self, Lambda && lambda) -> decltype(auto)
{
    static constexpr auto kIsConst = std::is_const_v<std::remove_reference_t<decltype(self)>>;

    using NonFundamentalArgumentTypes = std::tuple<Invalid, Dictionary>;
    using AllArgumentTypes = decltype(std::tuple_cat(std::declval<NonFundamentalArgumentTypes>(), std::declval<SupportedFundamentalTypes>()));
    using AllArgumentRefs = std::conditional_t<kIsConst, typename detail::transform_tuple<AllArgumentTypes, detail::add_const_lvalue_ref>::type,
                                                         typename detail::transform_tuple<AllArgumentTypes, detail::add_lvalue_ref>::type>;
    using SupportedArgumentsByLambda = decltype(detail::filter_tuple<detail::DoesLambdaSupportType<Lambda>::template Predicate>(std::declval<AllArgumentRefs>()));
    static_assert(std::tuple_size_v<SupportedArgumentsByLambda> >= 1, "Your lambda must be callable with at least one of the types in SupportedFundamentalTypes");

    using LambdaReturnTypes = typename detail::transform_tuple<SupportedArgumentsByLambda, detail::BindFirst<std::invoke_result_t, Lambda>::template Result>::type;
    using LambdaReturnType = typename detail::apply_tuple<std::common_type, LambdaReturnTypes>::type::type;

    using BaseRef = std::conditional_t<kIsConst, Value const, Value>&;
    using InvalidRef = std::conditional_t<kIsConst, Invalid const, Invalid>&;
    using DictionaryRef = std::conditional_t<kIsConst, Dictionary const, Dictionary>&;

    BaseRef base = self;

    if constexpr (std::is_invocable_v<Lambda, InvalidRef>)
    {
        if (! base.isValid())
            return static_cast<LambdaReturnType>(lambda(static_cast<InvalidRef>(base)));
    }

    if constexpr (std::is_invocable_v<Lambda, DictionaryRef>)
    {
        if (base.isDictionary())
            return static_cast<LambdaReturnType>(lambda(static_cast<DictionaryRef>(base)));
    }

    return std::visit(cxxutils::multilambda(
        [] (std::monostate) -> LambdaReturnType
        {
            // Invalid or Dictionary which the lambda does not handle
            if constexpr (! std::is_void_v<LambdaReturnType>)
                throw std::bad_variant_access();
        },
        [&lambda] <typename T> (std::reference_wrapper<T> v) -> LambdaReturnType
        {
            if constexpr (std::is_invocable_v<Lambda, T&>)
                return static_cast<LambdaReturnType>(lambda(v.get()));
            else if constexpr (! std::is_void_v<LambdaReturnType>)
                throw std::bad_variant_access();
        }
    ), base.visit_helper());
}

template <typename T>
T const& Value::as() const
{
    return dynamic_cast<Fundamental<T> const&>(*this)();
}

template <FundamentalConvertible T>
std::unique_ptr<Value> makeValue(T && value)
{
    using Stored = detail::storage_type_t<T>;
    return std::make_unique<Fundamental<Stored>>(Stored(std::forward<T>(value)));
}

//=============================================================================
// Fundamental implementations
//=============================================================================

template <typename T>
Fundamental<T>::Fundamental() : underlying() { }

template <typename T>
Fundamental<T>::Fundamental(T underlying_) : underlying(std::move(underlying_)) {}

template <typename T>
Fundamental<T>& Fundamental<T>::operator=(T const& newValue)
{
    set(newValue);
    return *this;
}

template <typename T>
Fundamental<T>& Fundamental<T>::operator=(T && newValue)
{
    set(std::move(newValue));
    return *this;
}

template <typename T>
void Fundamental<T>::set(T const& newValue)
{
    underlying = newValue;
}

template <typename T>
void Fundamental<T>::set(T && newValue)
{
    underlying = std::move(newValue);
}

template <typename T>
std::unique_ptr<Value> Fundamental<T>::clone() const
{
    return std::make_unique<Fundamental<T>>(underlying);
}

template <typename T>
bool Fundamental<T>::equals(Value const& other) const
{
    if (type() != other.type())
        return false;

    auto const& o = static_cast<Fundamental<T> const&>(other);

    if constexpr (std::is_floating_point_v<T>)
        return cxxutils::fltIsEqual(underlying, o.underlying);
    else
        return underlying == o.underlying;
}

template <typename T>
bool Fundamental<T>::assign(Value const& other)
{
    if (type() != other.type())
        return false;

    set(static_cast<Fundamental<T> const&>(other).underlying);
    return true;
}

template <typename T>
typename Value::TypesVariant Fundamental<T>::visit_helper()
{
    return TypesVariant(std::in_place_type<std::reference_wrapper<T>>, underlying);
}

template <typename T>
typename Value::ConstTypesVariant Fundamental<T>::visit_helper() const
{
    return ConstTypesVariant(std::in_place_type<std::reference_wrapper<T const>>, underlying);
}

//=============================================================================
// AttributeStore implementations
//=============================================================================
template <FundamentalConvertible T>
void AttributeStore::set(std::string_view name, T && value)
{
    set(name, makeValue(std::forward<T>(value)));
}

//=============================================================================
// Object implementations
//=============================================================================
template <FundamentalConvertible T>
void Object::setattr(std::string_view name, T && value)
{
    using Stored = detail::storage_type_t<T>;
    setattr(name, Fundamental<Stored>(Stored(std::forward<T>(value))));
}

//=============================================================================
// Validator implementations
//=============================================================================
template <typename T>
Validator<T> inRange(T min, T max)
{
    return { [min, max] (T const& v) { return min <= v && v <= max; },
             std::format("must be between {} and {}", min, max) };
}

template <typename T>
Validator<T> positive()
{
    return { [] (T const& v) { return v > T(0); }, "must be > 0" };
}

//=============================================================================
// SideTable implementations
//=============================================================================
namespace detail
{
template <typename T>
Fundamental<T> const* SideTable<T>::find(Identity const& owner) const
{
    std::lock_guard<std::mutex> guard(lock);

    if (auto it = entries.find(owner.key()); it != entries.end())
        return &it->second;

    return nullptr;
}

template <typename T>
std::optional<T> SideTable<T>::copyOf(Identity const& owner) const
{
    std::lock_guard<std::mutex> guard(lock);

    if (auto it = entries.find(owner.key()); it != entries.end())
        return it->second();

    return std::nullopt;
}

template <typename T>
bool SideTable<T>::contains(Identity const& owner) const
{
    std::lock_guard<std::mutex> guard(lock);
    return entries.contains(owner.key());
}

template <typename T>
bool SideTable<T>::store(Identity const& owner, T value, bool mustBeAbsent)
{
    {
        std::lock_guard<std::mutex> guard(lock);

        if (auto it = entries.find(owner.key()); it != entries.end())
        {
            if (mustBeAbsent)
                return false;

            it->second.set(std::move(value));
            return true;
        }

        entries.emplace(owner.key(), Fundamental<T>(std::move(value)));
    }

    // the identity may outlive this table, so the hook only holds a weak reference
    owner.onRelease(this, [table = this->weak_from_this()] (Identity::Key const& key)
    {
        if (auto strong = table.lock())
            strong->evict(key);
    });

    return true;
}

template <typename T>
bool SideTable<T>::erase(Identity const& owner)
{
    std::lock_guard<std::mutex> guard(lock);
    return entries.erase(owner.key()) > 0;
}

template <typename T>
void SideTable<T>::evict(Identity::Key const& key)
{
    std::lock_guard<std::mutex> guard(lock);

    if (entries.erase(key) > 0)
        INTERCEPT_LOG_DEBUG("intercept", "evicted side-table entry of a released record, %zu left", entries.size());
}

template <typename T>
std::size_t SideTable<T>::size() const
{
    std::lock_guard<std::mutex> guard(lock);
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [] (auto const& entry) { return ! entry.first.expired(); }));
}

template <typename T>
std::size_t SideTable<T>::collect()
{
    std::lock_guard<std::mutex> guard(lock);
    return std::erase_if(entries, [] (auto const& entry) { return entry.first.expired(); });
}
} // namespace detail

//=============================================================================
// ValidatedField implementations
//=============================================================================
template <typename T, fixstr::fixed_string Name>
ValidatedField<T, Name>::ValidatedField(Validator<T> validator_, T defaultValue_, Mutability mutability_)
    : table(std::make_shared<detail::SideTable<T>>()),
      check(std::move(validator_)),
      fallback(std::move(defaultValue_)),
      access(mutability_)
{}

template <typename T, fixstr::fixed_string Name>
T ValidatedField<T, Name>::get(Object const& record) const
{
    if (auto value = table->copyOf(record.identity()))
        return std::move(*value);

    return fallback();
}

template <typename T, fixstr::fixed_string Name>
void ValidatedField<T, Name>::set(Object& record, T value) const
{
    if (! check(value))
    {
        auto const reason = check.reason.empty() ? std::string("invalid value") : check.reason;
        INTERCEPT_LOG_DEBUG("intercept", "rejected write of '%.*s': %s", static_cast<int>(kName.size()), kName.data(), reason.c_str());
        throw ValidationError(kName, reason);
    }

    if (! table->store(record.identity(), std::move(value), access == Mutability::writeOnce))
    {
        INTERCEPT_LOG_DEBUG("intercept", "rejected write of '%.*s': field is immutable", static_cast<int>(kName.size()), kName.data());
        throw ValidationError(kName, "field is immutable");
    }
}

template <typename T, fixstr::fixed_string Name>
Value const& ValidatedField<T, Name>::read(Object const& record) const
{
    if (auto const* value = table->find(record.identity()))
        return *value;

    return fallback;
}

template <typename T, fixstr::fixed_string Name>
void ValidatedField<T, Name>::write(Object& record, Value const& value) const
{
    if (value.type() != typeid(T))
        throw ValidationError(kName, std::format("expected a value of type {}", detail::typeName<T>()));

    set(record, value.template as<T>());
}

template <typename T, fixstr::fixed_string Name>
bool ValidatedField<T, Name>::isPopulated(Object const& record) const
{
    return table->contains(record.identity());
}

template <typename T, fixstr::fixed_string Name>
bool ValidatedField<T, Name>::reset(Object& record) const
{
    return table->erase(record.identity());
}

template <typename T, fixstr::fixed_string Name>
void ValidatedField<T, Name>::copy(Object const& from, Object& to) const
{
    if (&from == &to)
        return;

    if (! acceptsCopy(to))
        throw ValidationError(kName, "field is immutable");

    if (auto value = table->copyOf(from.identity()))
        table->store(to.identity(), std::move(*value), false);
    else
        table->erase(to.identity());
}

template <typename T, fixstr::fixed_string Name>
bool ValidatedField<T, Name>::acceptsCopy(Object const& to) const
{
    return access != Mutability::writeOnce || ! table->contains(to.identity());
}

template <typename T, fixstr::fixed_string Name>
std::size_t ValidatedField<T, Name>::size() const
{
    return table->size();
}

template <typename T, fixstr::fixed_string Name>
std::size_t ValidatedField<T, Name>::collect() const
{
    return table->collect();
}

//=============================================================================
// ComputedField implementations
//=============================================================================
template <typename T, fixstr::fixed_string Name>
ComputedField<T, Name>::ComputedField(Getter getter_, Setter setter_)
    : lastRead(std::make_shared<detail::SideTable<T>>()),
      getter(std::move(getter_)),
      setter(std::move(setter_))
{}

template <typename T, fixstr::fixed_string Name>
void ComputedField<T, Name>::set(Object& record, T value) const
{
    if (setter == nullptr)
        throw ValidationError(kName, "field is read-only");

    setter(record, std::move(value));
}

template <typename T, fixstr::fixed_string Name>
Value const& ComputedField<T, Name>::read(Object const& record) const
{
    lastRead->store(record.identity(), getter(record), false);
    return *lastRead->find(record.identity());
}

template <typename T, fixstr::fixed_string Name>
void ComputedField<T, Name>::write(Object& record, Value const& value) const
{
    if (value.type() != typeid(T))
        throw ValidationError(kName, std::format("expected a value of type {}", detail::typeName<T>()));

    set(record, value.template as<T>());
}

template <typename T, fixstr::fixed_string Name>
bool ComputedField<T, Name>::reset(Object& record) const
{
    // nothing is owned per record, so there is never an entry to drop
    lastRead->erase(record.identity());
    return false;
}

template <typename T, fixstr::fixed_string Name>
std::size_t ComputedField<T, Name>::size() const
{
    return lastRead->size();
}

template <typename T, fixstr::fixed_string Name>
std::size_t ComputedField<T, Name>::collect() const
{
    return lastRead->collect();
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Record implementations
//=============================================================================

template <typename Schema>
auto Record<Schema>::fields_with(Schema& s)
{
    return detail::filter_tuple<detail::is_descriptor>(boost::pfr::structure_tie(s));
}

template <typename Schema>
Schema& Record<Schema>::schema()
{
    static Schema instance;
    return instance;
}

template <typename Schema>
Record<Schema>::Record(Record const& o) : Object(o)
{
    copyFields(o);
}

template <typename Schema>
Record<Schema>::Record(Record&& o) : Object(std::move(o))
{
    copyFields(o);
}

template <typename Schema>
Record<Schema>& Record<Schema>::operator=(Record const& o)
{
    if (this == &o)
        return *this;

    copyFields(o);
    Object::operator=(o);
    return *this;
}

template <typename Schema>
Record<Schema>& Record<Schema>::operator=(Record&& o)
{
    if (this == &o)
        return *this;

    copyFields(o);
    Object::operator=(std::move(o));
    return *this;
}

template <typename Schema>
template <fixstr::fixed_string FieldName>
auto Record<Schema>::operator()(this auto& self, CompileTimeString<FieldName>)
{
    static constexpr auto kIndex = detail::index_of(kFieldNames, std::string_view(FieldName));
    static_assert(kIndex < kFieldNames.size(), "No field with this name is declared in the schema");

    using FieldType = std::tuple_element_t<kIndex, FieldsAsTuple>;
    using RecordType = std::remove_reference_t<decltype(self)>;

    return BoundField<FieldType, RecordType>(std::get<kIndex>(fields()), self);
}

template <typename Schema>
template <typename Lambda>
void Record<Schema>::visitFields(Lambda && lambda)
{
    std::apply([&lambda] <typename... Types> (Types &&... flds)
    {
        (lambda(flds.fieldname(), static_cast<std::remove_reference_t<Types> const&>(flds)), ...);
    }, fields());
}

template <typename Schema>
auto Record<Schema>::descriptorTable() -> std::array<Descriptor const*, std::tuple_size_v<FieldsAsTuple>> const&
{
    static auto const table = std::apply([] <typename... Fields> (Fields && ...flds)
    {
        return std::array<Descriptor const*, sizeof...(Fields)> {{ static_cast<Descriptor const*>(&flds)... }};
    }, fields());

    return table;
}

template <typename Schema>
Descriptor const* Record<Schema>::descriptor(std::string_view name) const
{
    auto const index = detail::index_of(kFieldNames, name);

    if (index == kFieldNames.size())
        return nullptr;

    return descriptorTable()[index];
}

template <typename Schema>
std::vector<std::reference_wrapper<Descriptor const>> Record<Schema>::descriptors() const
{
    std::vector<std::reference_wrapper<Descriptor const>> returnValue;

    for (auto const* field : descriptorTable())
        returnValue.emplace_back(*field);

    return returnValue;
}

template <typename Schema>
void Record<Schema>::copyFields(Record const& o)
{
    for (auto const* field : descriptorTable())
    {
        if (! field->acceptsCopy(*this))
            throw ValidationError(field->fieldname(), "field is immutable");
    }

    for (auto const* field : descriptorTable())
        field->copy(o, *this);
}
} // namespace intercept

//=============================================================================
// std::formatter implementations
//=============================================================================
inline auto std::formatter<intercept::Value>::format(intercept::Value const& v, format_context& ctx) const
{
    std::ostringstream ss;
    ss << v;
    return std::formatter<std::string>::format(ss.str(), ctx);
}

inline auto std::formatter<intercept::Object>::format(intercept::Object const& v, format_context& ctx) const
{
    std::ostringstream ss;
    ss << v;
    return std::formatter<std::string>::format(ss.str(), ctx);
}
