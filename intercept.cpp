#include "intercept.hpp"

#include <iomanip>

namespace intercept
{
std::atomic<log_level> g_log_level{static_cast<log_level>(INTERCEPT_DEFAULT_LOG_LEVEL)};

//=============================================================================
// Error implementations
//=============================================================================
AttributeMissing::AttributeMissing(std::string_view attributeName)
    : std::out_of_range(std::format("'{}' is missing", attributeName)),
      attribute(attributeName)
{}

ValidationError::ValidationError(std::string_view fieldName, std::string_view reasonText)
    : std::invalid_argument(std::format("'{}': {}", fieldName, reasonText)),
      field(fieldName),
      why(reasonText)
{}

//=============================================================================
// Identity implementations
//=============================================================================
namespace detail
{
Identity::~Identity()
{
    std::map<void const*, ReleaseHook> hooks;

    {
        std::lock_guard<std::mutex> guard(lock);
        std::swap(hooks, releaseHooks);
    }

    // the key has already expired here but still orders like the live one did
    auto const expiredKey = key();

    for (auto& [owner, hook] : hooks)
        hook(expiredKey);
}

void Identity::onRelease(void const* owner, ReleaseHook hook) const
{
    std::lock_guard<std::mutex> guard(lock);
    releaseHooks.insert_or_assign(owner, std::move(hook));
}
} // namespace detail

//=============================================================================
// Value implementations
//=============================================================================
Invalid& Value::kInvalid = std::invoke([] () -> auto&&
{
    static constexpr Invalid invld;
    return const_cast<Invalid&>(invld);
});

std::unique_ptr<Value> Invalid::clone() const
{
    return std::make_unique<Invalid>();
}

//=============================================================================
// AttributeStore implementations
//=============================================================================
AttributeStore::AttributeStore(AttributeStore const& o)
{
    for (auto const& [name, value] : o.attributes)
        attributes.emplace(name, value->clone());
}

AttributeStore& AttributeStore::operator=(AttributeStore const& o)
{
    if (this != &o)
    {
        AttributeStore copy(o);
        attributes = std::move(copy.attributes);
    }

    return *this;
}

Value const& AttributeStore::get(std::string_view name) const
{
    if (auto it = attributes.find(name); it != attributes.end())
        return *it->second;

    return Value::kInvalid;
}

Value& AttributeStore::get(std::string_view name)
{
    if (auto it = attributes.find(name); it != attributes.end())
        return *it->second;

    return Value::kInvalid;
}

void AttributeStore::set(std::string_view name, Value const& value)
{
    if (! value.isValid())
    {
        remove(name);
        return;
    }

    if (auto it = attributes.find(name); it != attributes.end())
    {
        if (it->second->assign(value))
            return;

        it->second = value.clone();
        return;
    }

    attributes.emplace(std::string(name), value.clone());
}

void AttributeStore::set(std::string_view name, std::unique_ptr<Value> value)
{
    if (value == nullptr || ! value->isValid())
    {
        remove(name);
        return;
    }

    if (auto it = attributes.find(name); it != attributes.end())
    {
        it->second = std::move(value);
        return;
    }

    attributes.emplace(std::string(name), std::move(value));
}

bool AttributeStore::contains(std::string_view name) const
{
    return attributes.find(name) != attributes.end();
}

bool AttributeStore::remove(std::string_view name)
{
    if (auto it = attributes.find(name); it != attributes.end())
    {
        attributes.erase(it);
        return true;
    }

    return false;
}

std::vector<std::string> AttributeStore::names() const
{
    std::vector<std::string> returnValue;
    returnValue.reserve(attributes.size());

    for (auto const& [name, _] : attributes)
        returnValue.emplace_back(name);

    return returnValue;
}

bool operator==(AttributeStore const& a, AttributeStore const& b)
{
    return std::equal(a.attributes.begin(), a.attributes.end(), b.attributes.begin(), b.attributes.end(),
                      [] (auto const& x, auto const& y) { return x.first == y.first && x.second->equals(*y.second); });
}

//=============================================================================
// Dictionary implementations
//=============================================================================
Dictionary::Dictionary(AttributeStore entries_) : items(std::move(entries_)) {}

std::unique_ptr<Value> Dictionary::clone() const
{
    return std::make_unique<Dictionary>(items);
}

bool Dictionary::equals(Value const& other) const
{
    if (! other.isDictionary())
        return false;

    return items == static_cast<Dictionary const&>(other).items;
}

bool Dictionary::assign(Value const& other)
{
    if (! other.isDictionary())
        return false;

    if (this != &other)
        items = static_cast<Dictionary const&>(other).items;

    return true;
}

Validator<std::string> nonEmpty()
{
    return { [] (std::string const& s) { return ! s.empty(); }, "must not be empty" };
}

//=============================================================================
// Object implementations
//=============================================================================
thread_local std::size_t Object::depth = 0;

Object::Object() : id(std::make_shared<detail::Identity>()) {}

Object::Object(Object const& o)
    : store(o.store), id(std::make_shared<detail::Identity>()), reader(o.reader), writer(o.writer)
{}

Object::Object(Object&& o)
    : store(std::move(o.store)), id(std::make_shared<detail::Identity>()), reader(o.reader), writer(o.writer)
{}

Object& Object::operator=(Object const& o)
{
    store = o.store;
    reader = o.reader;
    writer = o.writer;
    return *this;
}

Object& Object::operator=(Object&& o)
{
    store = std::move(o.store);
    reader = o.reader;
    writer = o.writer;
    return *this;
}

Value const& Object::resolve(std::string_view name)
{
    // bookkeeping names are never intercepted
    if (AttributeStore::isReserved(name))
        return store.get(name);

    if (auto const* field = descriptor(name))
        return field->read(*this);

    if (reader == nullptr)
        return store.get(name);

    if (reader->fallbackOnly())
    {
        if (auto const& stored = store.get(name))
            return stored;
    }

    ++depth;
    auto raiiDecrementer = cxxutils::callAtEndOfScope(std::false_type(),
                                                      [] (std::false_type)
                                                      {
                                                          --depth;
                                                      });
    return reader->read(store, name);
}

Value const& Object::getattr(std::string_view name)
{
    auto const& value = resolve(name);

    if (! value)
        throw AttributeMissing(name);

    return value;
}

void Object::setattr(std::string_view name, Value const& value)
{
    if (! value)
        throw std::invalid_argument(std::format("'{}': value is invalid", name));

    if (AttributeStore::isReserved(name))
    {
        store.set(name, value);
        return;
    }

    if (auto const* field = descriptor(name))
    {
        if (writer != nullptr)
            writer->audit(store, name, value);

        field->write(*this, value);
        return;
    }

    if (writer != nullptr)
        writer->write(store, name, value);
    else
        store.set(name, value);
}

bool Object::hasattr(std::string_view name)
{
    try
    {
        return resolve(name).isValid();
    }
    catch (AttributeMissing const&)
    {
        return false;
    }
}

void Object::delattr(std::string_view name)
{
    if (auto const* field = descriptor(name))
    {
        if (! field->reset(*this))
            throw AttributeMissing(name);

        return;
    }

    if (! store.remove(name))
        throw AttributeMissing(name);
}

Value const& Object::fieldValue(std::string_view name) const
{
    auto const* field = descriptor(name);

    if (field == nullptr)
        throw AttributeMissing(name);

    return field->read(*this);
}

std::vector<std::string> Object::attributeNames() const
{
    std::vector<std::string> returnValue;

    for (auto const& field : descriptors())
    {
        if (field.get().isPopulated(*this))
            returnValue.emplace_back(field.get().fieldname());
    }

    for (auto& name : store.names())
    {
        if (! AttributeStore::isReserved(name))
            returnValue.emplace_back(std::move(name));
    }

    return returnValue;
}

//=============================================================================
// Interceptor implementations
//=============================================================================
LazyBinder::LazyBinder(Compute compute_) : compute(std::move(compute_)) {}

Value const& LazyBinder::read(AttributeStore& raw, std::string_view name) const
{
    if (auto const& existing = raw.get(name))
        return existing;

    auto computed = compute(name);

    if (computed == nullptr || ! computed->isValid())
    {
        INTERCEPT_LOG_DEBUG("intercept", "lazy attribute '%.*s' is unknown", static_cast<int>(name.size()), name.data());
        return Value::kInvalid;
    }

    INTERCEPT_LOG_DEBUG("intercept", "computed lazy attribute '%.*s'", static_cast<int>(name.size()), name.data());
    raw.set(name, std::move(computed));
    return raw.get(name);
}

FullInterceptor::FullInterceptor(Resolve resolve_) : resolve(std::move(resolve_)) {}

std::shared_ptr<FullInterceptor const> FullInterceptor::dictionaryBacked()
{
    return std::make_shared<FullInterceptor const>([] (AttributeStore const& raw, std::string_view name) -> Value const&
    {
        auto const& backing = raw.get(kBackingField);

        if (! backing.isDictionary())
            return Value::kInvalid;

        return static_cast<Dictionary const&>(backing)[name];
    });
}

Value const& FullInterceptor::read(AttributeStore& raw, std::string_view name) const
{
    if (auto const& stored = raw.get(name))
        return stored;

    if (AttributeStore::isReserved(name))
        return Value::kInvalid;

    INTERCEPT_LOG_DEBUG("intercept", "resolving '%.*s' through custom logic", static_cast<int>(name.size()), name.data());
    return resolve(std::as_const(raw), name);
}

WriteInterceptor::WriteInterceptor(SideEffect sideEffect_) : sideEffect(std::move(sideEffect_)) {}

void WriteInterceptor::audit(AttributeStore const& raw, std::string_view name, Value const& value) const
{
    if (sideEffect)
        sideEffect(raw, name, value);
}

void WriteInterceptor::write(AttributeStore& raw, std::string_view name, Value const& value) const
{
    audit(raw, name, value);

    INTERCEPT_LOG_DEBUG("intercept", "committing audited write of '%.*s'", static_cast<int>(name.size()), name.data());
    raw.set(name, value);
}

//=============================================================================
// Stream output operators
//=============================================================================
std::ostream& operator<<(std::ostream& o, Value const& x)
{
    x.visit(cxxutils::multilambda(
        [&o] (Invalid const& v) { o << v; },
        [&o] (Dictionary const& v) { o << v; },
        [&o] (std::string const& v) { o << std::quoted(v); },
        [&o] (bool v) { o << (v ? "true" : "false"); },
        [&o] (std::int8_t v) { o << static_cast<int>(v); },
        [&o] <typename T> (T const& v) requires std::is_arithmetic_v<T> { o << v; }
    ));

    return o;
}

std::ostream& operator<<(std::ostream& o, Invalid const&)
{
    return o << "<missing>";
}

std::ostream& operator<<(std::ostream& o, Dictionary const& x)
{
    auto const names = x.entries().names();

    o << "{";
    for (std::size_t i = 0; i < names.size(); ++i)
        o << (i == 0 ? "" : ", ") << std::quoted(names[i]) << ": " << x[names[i]];

    return o << "}";
}

std::ostream& operator<<(std::ostream& o, Object const& x)
{
    auto const names = x.attributeNames();

    o << "{";
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        auto const* field = x.descriptor(names[i]);
        auto const& value = field != nullptr ? field->read(x) : x.attributes().get(names[i]);
        o << (i == 0 ? "" : ", ") << std::quoted(names[i]) << ": " << value;
    }

    return o << "}";
}
} // namespace intercept
