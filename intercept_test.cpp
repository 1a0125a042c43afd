#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "intercept.hpp"
#include <format>
#include <sstream>
#include <thread>

using namespace intercept;

//=============================================================================
// Test schema definitions
//=============================================================================

struct ExamFields {
    ValidatedField<int32_t, "math_grade">    math_grade    { inRange(0, 100) };
    ValidatedField<int32_t, "writing_grade"> writing_grade { inRange(0, 100) };
    ValidatedField<int32_t, "science_grade"> science_grade { inRange(0, 100) };
};

using Exam = Record<ExamFields>;

struct ResistorFields {
    ValidatedField<double, "ohms">    ohms { positive<double>() };
    ValidatedField<double, "voltage"> voltage;
    ValidatedField<double, "current"> current;
};

struct BoundedResistance : Record<ResistorFields> {
    explicit BoundedResistance(double ohms) { schema().ohms.set(*this, ohms); }
};

struct FixedFields {
    ValidatedField<double, "ohms"> ohms { {}, 0.0, Mutability::writeOnce };
};

using FixedResistance = Record<FixedFields>;

struct LabelFields {
    ValidatedField<std::string, "label"> label { nonEmpty(), "unnamed" };
};

struct CounterFields {
    ValidatedField<int64_t, "count"> count;
};

int64_t bucketQuota(Object const& bucket)
{
    return bucket.fieldValue<int64_t>("max_quota") - bucket.fieldValue<int64_t>("quota_consumed");
}

void setBucketQuota(Object& bucket, int64_t amount)
{
    auto const maxQuota = bucket.fieldValue<int64_t>("max_quota");
    auto const consumed = bucket.fieldValue<int64_t>("quota_consumed");
    auto const delta = maxQuota - amount;

    if (amount == 0)
    {
        // new period
        bucket.setattr("quota_consumed", int64_t(0));
        bucket.setattr("max_quota", int64_t(0));
    }
    else if (delta < 0)
    {
        if (consumed != 0)
            throw ValidationError("quota", "cannot refill a partially consumed bucket");

        bucket.setattr("max_quota", amount);
    }
    else
    {
        bucket.setattr("quota_consumed", consumed + delta);
    }
}

struct BucketFields {
    ValidatedField<int64_t, "max_quota">      max_quota      { inRange<int64_t>(0, 1000) };
    ValidatedField<int64_t, "quota_consumed"> quota_consumed { inRange<int64_t>(0, 1000) };
    ComputedField<int64_t, "quota">           quota          { bucketQuota, setBucketQuota };
};

using Bucket = Record<BucketFields>;

void fill(Bucket& bucket, int64_t amount)
{
    bucket("quota"_fld) = bucket("quota"_fld)() + amount;
}

bool deduct(Bucket& bucket, int64_t amount)
{
    if (bucket("quota"_fld)() < amount)
        return false;

    bucket("quota"_fld) = bucket("quota"_fld)() - amount;
    return true;
}

struct RectangleFields {
    ValidatedField<double, "width">  width  { positive<double>(), 1.0 };
    ValidatedField<double, "height"> height { positive<double>(), 1.0 };
    ComputedField<double, "area">    area   { [] (Object const& r) { return r.fieldValue<double>("width") * r.fieldValue<double>("height"); } };
};

struct CountingFallback : ReadInterceptor {
    mutable int reads = 0;

    Value const& read(AttributeStore&, std::string_view) const override
    {
        ++reads;
        return Value::kInvalid;
    }

    bool fallbackOnly() const override { return true; }
};

//=============================================================================
// Value tests
//=============================================================================

TEST_SUITE("Value") {

TEST_CASE("kInvalid is not valid") {
    CHECK_FALSE(Value::kInvalid.isValid());
    CHECK_FALSE(static_cast<bool>(static_cast<Value const&>(Value::kInvalid)));
    CHECK(Value::kInvalid.type() == typeid(void));
}

TEST_CASE("assign to kInvalid fails") {
    Fundamental<int32_t> x(3);
    CHECK_FALSE(Value::kInvalid.assign(x));
}

TEST_CASE("fundamental accessors") {
    Fundamental<int32_t> x(42);
    CHECK(x() == 42);
    CHECK(static_cast<int32_t>(x) == 42);
    CHECK(x.type() == typeid(int32_t));

    x = 7;
    CHECK(x() == 7);
}

TEST_CASE("Fundamental<bool> converts to its value") {
    Fundamental<bool> flag(false);
    CHECK(flag.isValid());
    CHECK_FALSE(static_cast<bool>(flag));
}

TEST_CASE("clone and equals") {
    Fundamental<std::string> s("hello");
    auto copy = s.clone();

    CHECK(copy->equals(s));
    CHECK(copy->as<std::string>() == "hello");
    CHECK_FALSE(copy->equals(Fundamental<int32_t>(1)));
}

TEST_CASE("float equality uses epsilon") {
    Fundamental<double> a(0.1 + 0.2);
    Fundamental<double> b(0.3);
    CHECK(a.equals(b));
}

TEST_CASE("assign between same types") {
    Fundamental<int64_t> a(1);
    Fundamental<int64_t> b(2);
    CHECK(a.assign(b));
    CHECK(a() == 2);
    CHECK_FALSE(a.assign(Fundamental<float>(1.0f)));
}

TEST_CASE("as with wrong type throws") {
    Fundamental<int32_t> x(1);
    Value const& v = x;
    CHECK_THROWS_AS(v.as<double>(), std::bad_cast);
}

TEST_CASE("makeValue stores string literals as std::string") {
    auto v = makeValue("abc");
    CHECK(v->type() == typeid(std::string));
    CHECK(v->as<std::string>() == "abc");

    auto n = makeValue(std::int8_t(4));
    CHECK(n->type() == typeid(std::int8_t));
}

TEST_CASE("visit") {
    Fundamental<int32_t> x(21);
    Value& v = x;

    auto doubled = v.visit([] (int32_t& i) { i *= 2; return i; });
    CHECK(doubled == 42);
    CHECK(x() == 42);

    bool sawInvalid = false;
    Value::kInvalid.visit(cxxutils::multilambda(
        [&sawInvalid] (Invalid const&) { sawInvalid = true; },
        [] (std::string const&) {}
    ));
    CHECK(sawInvalid);
}

TEST_CASE("visit with unsupported type throws when a result is needed") {
    Fundamental<std::string> s("text");
    Value const& v = s;
    CHECK_THROWS_AS(v.visit([] (int32_t const& i) { return i; }), std::bad_variant_access);
}

TEST_CASE("stream output and std::format") {
    Fundamental<std::string> s("hi");
    Fundamental<std::int8_t> small(5);
    Fundamental<bool> flag(true);

    std::ostringstream ss;
    ss << static_cast<Value const&>(s) << " " << static_cast<Value const&>(small) << " " << static_cast<Value const&>(flag);
    CHECK(ss.str() == "\"hi\" 5 true");

    CHECK(std::format("{}", static_cast<Value const&>(Value::kInvalid)) == "<missing>");
}

} // TEST_SUITE("Value")

//=============================================================================
// AttributeStore tests
//=============================================================================

TEST_SUITE("AttributeStore") {

TEST_CASE("missing name yields kInvalid") {
    AttributeStore store;
    CHECK_FALSE(store.get("nothing").isValid());
    CHECK_FALSE(store.contains("nothing"));
    CHECK(store.empty());
}

TEST_CASE("set and get") {
    AttributeStore store;
    store.set("count", 3);
    store.set("name", "widget");

    CHECK(store.size() == 2);
    CHECK(store.get("count").as<int32_t>() == 3);
    CHECK(store.get("name").as<std::string>() == "widget");
}

TEST_CASE("overwriting with another type replaces the value") {
    AttributeStore store;
    store.set("x", 1);
    store.set("x", 2.5);

    CHECK(store.get("x").type() == typeid(double));
    CHECK(store.size() == 1);
}

TEST_CASE("setting an invalid value removes the name") {
    AttributeStore store;
    store.set("x", 1);
    store.set("x", Value::kInvalid);
    CHECK_FALSE(store.contains("x"));

    store.set("y", 1);
    store.set("y", std::unique_ptr<Value>());
    CHECK(store.empty());
}

TEST_CASE("names are sorted") {
    AttributeStore store;
    store.set("b", 1);
    store.set("a", 2);
    store.set("c", 3);
    CHECK(store.names() == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("remove") {
    AttributeStore store;
    store.set("a", 1);
    CHECK(store.remove("a"));
    CHECK_FALSE(store.remove("a"));
}

TEST_CASE("copies are deep") {
    AttributeStore original;
    original.set("a", 1);

    AttributeStore copy(original);
    CHECK(copy == original);

    copy.set("a", 2);
    CHECK(original.get("a").as<int32_t>() == 1);
    CHECK_FALSE(copy == original);
}

TEST_CASE("reserved names") {
    CHECK(AttributeStore::isReserved("__backing"));
    CHECK_FALSE(AttributeStore::isReserved("_private"));
    CHECK_FALSE(AttributeStore::isReserved("name"));
}

TEST_CASE("dictionary values") {
    Dictionary dict;
    dict.entries().set("k", 1);

    AttributeStore store;
    store.set("dict", dict);

    auto const& stored = store.get("dict");
    REQUIRE(stored.isDictionary());
    CHECK(static_cast<Dictionary const&>(stored)["k"].as<int32_t>() == 1);
    CHECK(stored.equals(dict));

    std::ostringstream ss;
    ss << stored;
    CHECK(ss.str() == "{\"k\": 1}");
}

} // TEST_SUITE("AttributeStore")

//=============================================================================
// ValidatedField tests
//=============================================================================

TEST_SUITE("ValidatedField") {

TEST_CASE("accepted write is read back") {
    Exam exam;
    exam("math_grade"_fld) = 95;
    CHECK(exam("math_grade"_fld)() == 95);
}

TEST_CASE("rejected write keeps the previous value") {
    Exam exam;
    exam("math_grade"_fld) = 95;

    CHECK_THROWS_AS(exam("math_grade"_fld) = 150, ValidationError);
    CHECK(exam("math_grade"_fld)() == 95);
}

TEST_CASE("rejected first write keeps the default") {
    Exam exam;
    CHECK_THROWS_AS(exam("science_grade"_fld) = -3, ValidationError);
    CHECK(exam("science_grade"_fld)() == 0);
    CHECK_FALSE(Exam::schema().science_grade.isPopulated(exam));
}

TEST_CASE("error carries field name and reason") {
    Exam exam;
    CHECK_THROWS_WITH_AS(exam("writing_grade"_fld) = 101, "'writing_grade': must be between 0 and 100", ValidationError);

    try
    {
        exam("writing_grade"_fld) = -1;
    }
    catch (ValidationError const& e)
    {
        CHECK(e.fieldname() == "writing_grade");
        CHECK(e.reason() == "must be between 0 and 100");
    }
}

TEST_CASE("records are isolated") {
    Exam first;
    Exam second;

    first("writing_grade"_fld) = 82;
    second("writing_grade"_fld) = 75;

    CHECK(first("writing_grade"_fld)() == 82);
    CHECK(second("writing_grade"_fld)() == 75);

    Exam third;
    CHECK(third("writing_grade"_fld)() == 0);
}

TEST_CASE("fields of one record are independent") {
    Exam exam;
    exam("math_grade"_fld) = 10;
    exam("writing_grade"_fld) = 20;

    CHECK(exam("math_grade"_fld)() == 10);
    CHECK(exam("science_grade"_fld)() == 0);
}

TEST_CASE("one descriptor instance per field and type") {
    Exam a;
    Exam b;
    CHECK(&std::get<0>(Exam::fields()) == &Exam::schema().math_grade);
    CHECK(&a("math_grade"_fld).descriptor() == &b("math_grade"_fld).descriptor());
}

TEST_CASE("type-erased writes check the value type") {
    Exam exam;
    exam.setattr("math_grade", 88);
    CHECK(exam.getattr("math_grade").as<int32_t>() == 88);

    CHECK_THROWS_WITH_AS(exam.setattr("math_grade", "high"), "'math_grade': expected a value of type int32_t", ValidationError);
    CHECK(exam.get<int32_t>("math_grade") == 88);

    CHECK_THROWS_AS(exam.setattr("math_grade", 300), ValidationError);
    CHECK(exam.get<int32_t>("math_grade") == 88);
}

TEST_CASE("custom default value") {
    Record<LabelFields> labelled;
    CHECK(labelled("label"_fld)() == "unnamed");

    CHECK_THROWS_WITH_AS(labelled("label"_fld) = "", "'label': must not be empty", ValidationError);
    labelled("label"_fld) = "resistor";
    CHECK(labelled("label"_fld)() == "resistor");
}

TEST_CASE("write-once field rejects the second write") {
    FixedResistance r;
    r("ohms"_fld) = 1e3;

    CHECK_THROWS_WITH_AS(r("ohms"_fld) = 2e3, "'ohms': field is immutable", ValidationError);
    CHECK(r("ohms"_fld)() == doctest::Approx(1e3));

    FixedResistance other;
    other("ohms"_fld) = 47.0;
    CHECK(other("ohms"_fld)() == doctest::Approx(47.0));
}

TEST_CASE("assignment cannot overwrite a write-once field") {
    FixedResistance a;
    a("ohms"_fld) = 1e3;

    FixedResistance b;
    b("ohms"_fld) = 2e3;
    b.setattr("note", "from b");

    CHECK_THROWS_WITH_AS(a = b, "'ohms': field is immutable", ValidationError);
    CHECK(a("ohms"_fld)() == doctest::Approx(1e3));
    CHECK_FALSE(a.attributes().contains("note"));

    FixedResistance empty;
    CHECK_THROWS_AS(a = empty, ValidationError);
    CHECK(Record<FixedFields>::schema().ohms.isPopulated(a));

    FixedResistance unset;
    unset = b;
    CHECK(unset("ohms"_fld)() == doctest::Approx(2e3));

    FixedResistance copy(a);
    CHECK(copy("ohms"_fld)() == doctest::Approx(1e3));

    a = a;
    CHECK(a("ohms"_fld)() == doctest::Approx(1e3));
}

TEST_CASE("reset restores the default") {
    Exam exam;
    auto const& field = Exam::schema().math_grade;

    CHECK_FALSE(field.reset(exam));
    exam("math_grade"_fld) = 50;
    CHECK(field.isPopulated(exam));
    CHECK(field.reset(exam));
    CHECK_FALSE(field.isPopulated(exam));
    CHECK(exam("math_grade"_fld)() == 0);
}

TEST_CASE("entries are released with their record") {
    auto const& field = Record<CounterFields>::schema().count;
    auto const before = field.size();

    {
        Record<CounterFields> a;
        Record<CounterFields> b;
        a("count"_fld) = 1;
        b("count"_fld) = 2;
        CHECK(field.size() == before + 2);
    }

    CHECK(field.size() == before);
    CHECK(field.collect() == 0);
}

} // TEST_SUITE("ValidatedField")

//=============================================================================
// Record tests
//=============================================================================

TEST_SUITE("Record") {

TEST_CASE("kFieldNames") {
    CHECK(Exam::kFieldNames.size() == 3);
    CHECK(Exam::kFieldNames[0] == "math_grade");
    CHECK(Exam::kFieldNames[1] == "writing_grade");
    CHECK(Exam::kFieldNames[2] == "science_grade");
}

TEST_CASE("visitFields") {
    std::vector<std::string> names;
    Exam::visitFields([&names] (std::string_view name, auto const& field)
    {
        CHECK(field.fieldname() == name);
        names.emplace_back(name);
    });

    CHECK(names == std::vector<std::string>{"math_grade", "writing_grade", "science_grade"});
}

TEST_CASE("descriptor lookup") {
    Exam exam;
    REQUIRE(exam.descriptor("writing_grade") != nullptr);
    CHECK(exam.descriptor("writing_grade")->type() == typeid(int32_t));
    CHECK(exam.descriptor("comment") == nullptr);
    CHECK(exam.descriptors().size() == 3);

    Object plain;
    CHECK(plain.descriptor("writing_grade") == nullptr);
}

TEST_CASE("declared fields read their default through getattr") {
    Exam exam;
    CHECK(exam.hasattr("math_grade"));
    CHECK(exam.get<int32_t>("math_grade") == 0);
}

TEST_CASE("undeclared attributes live in the store") {
    Exam exam;
    exam.setattr("comment", "good");

    CHECK(exam.attributes().contains("comment"));
    CHECK(exam.get<std::string>("comment") == "good");
    CHECK_THROWS_AS(exam.getattr("missing"), AttributeMissing);
    CHECK_FALSE(exam.hasattr("missing"));
}

TEST_CASE("AttributeMissing names the attribute") {
    Object record;
    CHECK_THROWS_WITH_AS(record.getattr("foo"), "'foo' is missing", AttributeMissing);

    try
    {
        record.getattr("bar");
    }
    catch (AttributeMissing const& e)
    {
        CHECK(e.name() == "bar");
    }
}

TEST_CASE("attributeNames lists populated declared fields first") {
    Exam exam;
    exam.setattr("comment", "ok");
    exam("science_grade"_fld) = 70;
    exam.attributes().set("__hidden", 1);

    CHECK(exam.attributeNames() == std::vector<std::string>{"science_grade", "comment"});
}

TEST_CASE("delattr") {
    Exam exam;
    exam("math_grade"_fld) = 60;
    exam.setattr("comment", "ok");

    exam.delattr("math_grade");
    CHECK(exam("math_grade"_fld)() == 0);
    CHECK_THROWS_AS(exam.delattr("math_grade"), AttributeMissing);

    exam.delattr("comment");
    CHECK_FALSE(exam.hasattr("comment"));
    CHECK_THROWS_AS(exam.delattr("comment"), AttributeMissing);
}

TEST_CASE("setattr rejects invalid values") {
    Object record;
    CHECK_THROWS_WITH_AS(record.setattr("x", Value::kInvalid), "'x': value is invalid", std::invalid_argument);
    CHECK(record.attributes().empty());

    try
    {
        record.setattr("x", Value::kInvalid);
    }
    catch (std::invalid_argument const& e)
    {
        CHECK(dynamic_cast<ValidationError const*>(&e) == nullptr);
    }
}

TEST_CASE("descriptor lookup returns the schema member") {
    Exam exam;
    CHECK(exam.descriptor("math_grade") == &Exam::schema().math_grade);
    CHECK(exam.descriptor("science_grade") == &Exam::schema().science_grade);
    CHECK(&exam.descriptors()[1].get() == &Exam::schema().writing_grade);
}

TEST_CASE("copies get their own identity and values") {
    Exam original;
    original("math_grade"_fld) = 90;
    original.setattr("comment", "first");

    Exam copy(original);
    CHECK(&copy.identity() != &original.identity());
    CHECK(copy("math_grade"_fld)() == 90);
    CHECK(copy.get<std::string>("comment") == "first");

    copy("math_grade"_fld) = 10;
    CHECK(original("math_grade"_fld)() == 90);

    Exam assigned;
    assigned("writing_grade"_fld) = 5;
    assigned = original;
    CHECK(assigned("math_grade"_fld)() == 90);
    CHECK_FALSE(Exam::schema().writing_grade.isPopulated(assigned));
}

TEST_CASE("moved records keep their values") {
    Exam original;
    original("math_grade"_fld) = 77;

    Exam moved(std::move(original));
    CHECK(moved("math_grade"_fld)() == 77);
}

TEST_CASE("construction-time validation") {
    auto const& ohms = BoundedResistance::schema().ohms;
    auto const before = ohms.size();

    BoundedResistance r(1e3);
    CHECK(r("ohms"_fld)() == doctest::Approx(1e3));

    CHECK_THROWS_WITH_AS(BoundedResistance(-5.0), "'ohms': must be > 0", ValidationError);
    CHECK(ohms.size() == before + 1);

    CHECK_THROWS_AS(r("ohms"_fld) = 0.0, ValidationError);
    CHECK(r("ohms"_fld)() == doctest::Approx(1e3));
}

TEST_CASE("stream output") {
    Exam exam;
    exam("math_grade"_fld) = 95;
    exam.setattr("comment", "ok");

    CHECK(std::format("{}", static_cast<Object const&>(exam)) == "{\"math_grade\": 95, \"comment\": \"ok\"}");
}

} // TEST_SUITE("Record")

//=============================================================================
// ComputedField tests
//=============================================================================

TEST_SUITE("ComputedField") {

TEST_CASE("quota derives from sibling fields") {
    Bucket bucket;
    CHECK(bucket("quota"_fld)() == 0);

    fill(bucket, 100);
    CHECK(bucket("max_quota"_fld)() == 100);
    CHECK(bucket("quota_consumed"_fld)() == 0);

    CHECK(deduct(bucket, 99));
    CHECK(bucket("max_quota"_fld)() == 100);
    CHECK(bucket("quota_consumed"_fld)() == 99);

    CHECK_FALSE(deduct(bucket, 3));
    CHECK(bucket("quota"_fld)() == 1);

    bucket("quota"_fld) = 0;
    CHECK(bucket("max_quota"_fld)() == 0);
    CHECK(bucket("quota_consumed"_fld)() == 0);
}

TEST_CASE("setter errors leave the record unchanged") {
    Bucket bucket;
    fill(bucket, 10);
    CHECK(deduct(bucket, 4));

    CHECK_THROWS_WITH_AS(fill(bucket, 10), "'quota': cannot refill a partially consumed bucket", ValidationError);
    CHECK(bucket("quota"_fld)() == 6);

    CHECK_THROWS_AS(bucket("quota"_fld) = 5000, ValidationError);
    CHECK(bucket("max_quota"_fld)() == 10);
}

TEST_CASE("getattr and setattr go through the computed field") {
    Bucket bucket;
    bucket.setattr("quota", int64_t(50));

    CHECK(bucket.get<int64_t>("quota") == 50);
    CHECK(bucket.get<int64_t>("max_quota") == 50);
    CHECK_FALSE(bucket.attributes().contains("quota"));
    CHECK(bucket.attributeNames() == std::vector<std::string>{"max_quota", "quota"});

    CHECK_THROWS_WITH_AS(bucket.setattr("quota", 1), "'quota': expected a value of type int64_t", ValidationError);
    CHECK_THROWS_AS(bucket.delattr("quota"), AttributeMissing);
}

TEST_CASE("read-only computed field") {
    Record<RectangleFields> rect;
    CHECK(rect("area"_fld)() == doctest::Approx(1.0));

    rect("width"_fld) = 3.0;
    rect("height"_fld) = 2.0;
    CHECK(rect("area"_fld)() == doctest::Approx(6.0));
    CHECK(rect.get<double>("area") == doctest::Approx(6.0));

    CHECK(Record<RectangleFields>::schema().area.isReadOnly());
    CHECK_THROWS_WITH_AS(rect("area"_fld) = 2.0, "'area': field is read-only", ValidationError);
}

TEST_CASE("fieldValue only reads declared fields") {
    Bucket bucket;
    bucket.setattr("note", "undeclared");

    CHECK(bucket.fieldValue<int64_t>("max_quota") == 0);
    CHECK_THROWS_AS(bucket.fieldValue("note"), AttributeMissing);
}

TEST_CASE("cached reads are released with their record") {
    auto const& area = Record<RectangleFields>::schema().area;
    auto const before = area.size();

    {
        Record<RectangleFields> rect;
        CHECK(rect.get<double>("area") == doctest::Approx(1.0));
        CHECK(area.size() == before + 1);
    }

    CHECK(area.size() == before);
}

} // TEST_SUITE("ComputedField")

//=============================================================================
// LazyBinder tests
//=============================================================================

TEST_SUITE("LazyBinder") {

TEST_CASE("missing attribute is computed once") {
    int calls = 0;
    Object record;
    record.intercept(std::make_shared<LazyBinder const>([&calls] (std::string_view name)
    {
        ++calls;
        return makeValue(std::format("Value for {}", name));
    }));

    CHECK(record.get<std::string>("foo") == "Value for foo");
    CHECK(record.attributes().contains("foo"));
    CHECK(record.get<std::string>("foo") == "Value for foo");
    CHECK(calls == 1);
}

TEST_CASE("existing attributes are not computed") {
    int calls = 0;
    Object record;
    record.setattr("exists", 5);
    record.intercept(std::make_shared<LazyBinder const>([&calls] (std::string_view)
    {
        ++calls;
        return makeValue(0);
    }));

    CHECK(record.get<int32_t>("exists") == 5);
    CHECK(calls == 0);
}

TEST_CASE("hasattr triggers the computation") {
    int calls = 0;
    Object record;
    record.intercept(std::make_shared<LazyBinder const>([&calls] (std::string_view)
    {
        ++calls;
        return makeValue(true);
    }));

    CHECK(record.hasattr("flag"));
    CHECK(record.attributes().contains("flag"));
    CHECK(record.get<bool>("flag"));
    CHECK(calls == 1);
}

TEST_CASE("unknown names stay missing") {
    Object record;
    record.intercept(std::make_shared<LazyBinder const>([] (std::string_view name) -> std::unique_ptr<Value>
    {
        if (name == "known")
            return makeValue(1);

        return nullptr;
    }));

    CHECK(record.hasattr("known"));
    CHECK_FALSE(record.hasattr("unknown"));
    CHECK_THROWS_AS(record.getattr("unknown"), AttributeMissing);
    CHECK_FALSE(record.attributes().contains("unknown"));
}

TEST_CASE("compute function may signal a missing attribute by throwing") {
    Object record;
    record.intercept(std::make_shared<LazyBinder const>([] (std::string_view name) -> std::unique_ptr<Value>
    {
        throw AttributeMissing(name);
    }));

    CHECK_FALSE(record.hasattr("anything"));
    CHECK_THROWS_AS(record.getattr("anything"), AttributeMissing);
}

TEST_CASE("declared fields are not computed") {
    int calls = 0;
    Exam exam;
    exam.intercept(std::make_shared<LazyBinder const>([&calls] (std::string_view)
    {
        ++calls;
        return makeValue(-1);
    }));

    CHECK(exam.get<int32_t>("math_grade") == 0);
    CHECK(exam.get<int32_t>("notes") == -1);
    CHECK(calls == 1);
}

TEST_CASE("stored names never reach a fallback-only interceptor") {
    auto fallback = std::make_shared<CountingFallback>();

    Object record;
    record.setattr("present", 1);
    record.intercept(std::shared_ptr<ReadInterceptor const>(fallback));

    CHECK(record.get<int32_t>("present") == 1);
    CHECK(record.hasattr("present"));
    CHECK(fallback->reads == 0);

    CHECK_FALSE(record.hasattr("absent"));
    CHECK(fallback->reads == 1);
}

TEST_CASE("one binder can be shared") {
    auto binder = std::make_shared<LazyBinder const>([] (std::string_view name) { return makeValue(std::string(name)); });

    Object a;
    Object b;
    a.intercept(binder);
    b.intercept(binder);

    CHECK(a.get<std::string>("x") == "x");
    CHECK_FALSE(b.attributes().contains("x"));
    CHECK(a.readInterceptor() == b.readInterceptor());
}

} // TEST_SUITE("LazyBinder")

//=============================================================================
// FullInterceptor tests
//=============================================================================

TEST_SUITE("FullInterceptor") {

TEST_CASE("dictionary backed record") {
    Dictionary data;
    data.entries().set("foo", 3);

    Object record;
    record.attributes().set(FullInterceptor::kBackingField, data);
    record.intercept(FullInterceptor::dictionaryBacked());

    CHECK(record.get<int32_t>("foo") == 3);
    CHECK_THROWS_AS(record.getattr("bar"), AttributeMissing);
    CHECK(record.getattr(FullInterceptor::kBackingField).isDictionary());
    CHECK(record.attributeNames().empty());
}

TEST_CASE("store is consulted before the custom logic") {
    int calls = 0;
    Object record;
    record.setattr("local", 1);
    record.intercept(std::make_shared<FullInterceptor const>([&calls] (AttributeStore const&, std::string_view) -> Value const&
    {
        ++calls;
        return Value::kInvalid;
    }));

    CHECK(record.get<int32_t>("local") == 1);
    CHECK(calls == 0);

    CHECK_FALSE(record.hasattr("remote"));
    CHECK(calls == 1);
}

TEST_CASE("custom logic is consulted on every read") {
    int calls = 0;
    Fundamental<int32_t> answer(42);

    Object record;
    record.intercept(std::make_shared<FullInterceptor const>([&calls, &answer] (AttributeStore const&, std::string_view) -> Value const&
    {
        ++calls;
        return answer;
    }));

    CHECK(record.get<int32_t>("x") == 42);
    CHECK(record.get<int32_t>("x") == 42);
    CHECK(calls == 2);
    CHECK_FALSE(record.attributes().contains("x"));
}

TEST_CASE("reading the backing field does not recurse") {
    std::size_t observedDepth = 0;

    Object record;
    record.attributes().set(FullInterceptor::kBackingField, Dictionary());
    record.intercept(std::make_shared<FullInterceptor const>([&observedDepth] (AttributeStore const& raw, std::string_view) -> Value const&
    {
        observedDepth = Object::interceptionDepth();
        return raw.get(FullInterceptor::kBackingField);
    }));

    CHECK(record.getattr("anything").isDictionary());
    CHECK(observedDepth == 1);
    CHECK(Object::interceptionDepth() == 0);
}

TEST_CASE("reserved names never reach the custom logic") {
    int calls = 0;
    Object record;
    record.intercept(std::make_shared<FullInterceptor const>([&calls] (AttributeStore const&, std::string_view) -> Value const&
    {
        ++calls;
        return Value::kInvalid;
    }));

    CHECK_FALSE(record.hasattr("__backing"));
    CHECK(calls == 0);
}

TEST_CASE("removing the interceptor") {
    Dictionary data;
    data.entries().set("foo", 3);

    Object record;
    record.attributes().set(FullInterceptor::kBackingField, data);
    record.intercept(FullInterceptor::dictionaryBacked());
    CHECK(record.hasattr("foo"));

    record.intercept(std::shared_ptr<ReadInterceptor const>());
    CHECK(record.readInterceptor() == nullptr);
    CHECK_FALSE(record.hasattr("foo"));
}

} // TEST_SUITE("FullInterceptor")

//=============================================================================
// WriteInterceptor tests
//=============================================================================

TEST_SUITE("WriteInterceptor") {

TEST_CASE("side effect sees every write in order") {
    std::vector<std::string> audit;

    Object record;
    record.intercept(std::make_shared<WriteInterceptor const>([&audit] (AttributeStore const& raw, std::string_view name, Value const& value)
    {
        audit.emplace_back(std::format("{}: {} -> {}", name, raw.get(name), value));
    }));

    record.setattr("a", 1);
    record.setattr("a", 2);
    record.setattr("b", "x");

    CHECK(audit == std::vector<std::string>{"a: <missing> -> 1", "a: 1 -> 2", "b: <missing> -> \"x\""});
    CHECK(record.get<int32_t>("a") == 2);
    CHECK(record.get<std::string>("b") == "x");
}

TEST_CASE("throwing side effect commits nothing") {
    Object record;
    record.intercept(std::make_shared<WriteInterceptor const>([] (AttributeStore const&, std::string_view name, Value const&)
    {
        if (name == "forbidden")
            throw std::runtime_error("denied");
    }));

    CHECK_THROWS_AS(record.setattr("forbidden", 1), std::runtime_error);
    CHECK_FALSE(record.attributes().contains("forbidden"));

    record.setattr("allowed", 1);
    CHECK(record.attributes().contains("allowed"));
}

TEST_CASE("declared fields are audited before validation") {
    std::vector<std::string> audit;
    Exam exam;
    exam.intercept(std::make_shared<WriteInterceptor const>([&audit] (AttributeStore const&, std::string_view name, Value const& value)
    {
        audit.emplace_back(std::format("{}={}", name, value));
    }));

    exam.setattr("math_grade", 40);
    CHECK(audit == std::vector<std::string>{"math_grade=40"});
    CHECK(exam("math_grade"_fld)() == 40);
    CHECK_FALSE(exam.attributes().contains("math_grade"));

    CHECK_THROWS_AS(exam.setattr("math_grade", 400), ValidationError);
    CHECK(audit.size() == 2);
    CHECK(exam("math_grade"_fld)() == 40);

    exam.setattr("comment", "audited");
    CHECK(audit.size() == 3);
}

TEST_CASE("reserved names bypass the write interceptor") {
    int calls = 0;
    Exam exam;
    exam.intercept(std::make_shared<WriteInterceptor const>([&calls] (AttributeStore const&, std::string_view, Value const&) { ++calls; }));

    exam.setattr("__internal", 1);
    CHECK(calls == 0);
    CHECK(exam.attributes().contains("__internal"));
}

TEST_CASE("throwing side effect blocks declared writes") {
    Exam exam;
    exam.intercept(std::make_shared<WriteInterceptor const>([] (AttributeStore const&, std::string_view name, Value const&)
    {
        if (name == "science_grade")
            throw std::runtime_error("denied");
    }));

    CHECK_THROWS_AS(exam.setattr("science_grade", 50), std::runtime_error);
    CHECK_FALSE(Exam::schema().science_grade.isPopulated(exam));
}

TEST_CASE("raw writes are not audited") {
    int calls = 0;
    Object record;
    record.intercept(std::make_shared<WriteInterceptor const>([&calls] (AttributeStore const&, std::string_view, Value const&) { ++calls; }));

    record.attributes().set("raw", 1);
    CHECK(calls == 0);
    CHECK(record.writeInterceptor() != nullptr);
}

} // TEST_SUITE("WriteInterceptor")

//=============================================================================
// Concurrency tests
//=============================================================================

TEST_SUITE("Concurrency") {

TEST_CASE("writes to different records do not interfere") {
    constexpr std::size_t kThreads = 8;
    constexpr int64_t kWrites = 1000;

    auto const& field = Record<CounterFields>::schema().count;
    auto const before = field.size();

    std::vector<Record<CounterFields>> records(kThreads);
    std::vector<std::thread> threads;

    for (std::size_t t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&records, t]
        {
            for (int64_t i = 0; i < kWrites; ++i)
                records[t]("count"_fld) = static_cast<int64_t>(t) * kWrites + i;
        });
    }

    for (auto& thread : threads)
        thread.join();

    for (std::size_t t = 0; t < kThreads; ++t)
        CHECK(records[t]("count"_fld)() == static_cast<int64_t>(t) * kWrites + kWrites - 1);

    CHECK(field.size() == before + kThreads);
}

TEST_CASE("records created and destroyed on many threads") {
    constexpr std::size_t kThreads = 4;

    auto const& field = Record<LabelFields>::schema().label;
    auto const before = field.size();

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([t]
        {
            for (int i = 0; i < 100; ++i)
            {
                Record<LabelFields> r;
                r("label"_fld) = std::format("{}-{}", t, i);
            }
        });
    }

    for (auto& thread : threads)
        thread.join();

    CHECK(field.size() == before);
}

} // TEST_SUITE("Concurrency")

//=============================================================================
// Logging tests
//=============================================================================

TEST_SUITE("Logging") {

TEST_CASE("log level can be changed at runtime") {
    auto const previous = get_log_level();

    set_log_level(log_level::debug);
    CHECK(get_log_level() == log_level::debug);

    set_log_level(log_level::off);
    CHECK(get_log_level() == log_level::off);

    set_log_level(previous);
}

TEST_CASE("default log level") {
    CHECK(static_cast<int>(log_level::off) == 0);
    CHECK(static_cast<int>(get_log_level()) <= static_cast<int>(log_level::debug));
}

} // TEST_SUITE("Logging")
