#include <iostream>
#include <memory>
#include "intercept.hpp"

// Example usage
using namespace intercept;

struct ExamFields
{
    ValidatedField<int32_t, "math_grade">    math_grade    { inRange(0, 100) };
    ValidatedField<int32_t, "writing_grade"> writing_grade { inRange(0, 100) };
    ValidatedField<int32_t, "science_grade"> science_grade { inRange(0, 100) };
};

struct ResistorFields
{
    ValidatedField<double, "ohms">    ohms    { positive<double>() };
    ValidatedField<double, "voltage"> voltage;
    ValidatedField<double, "current"> current;
};

struct Resistor : Record<ResistorFields>
{
    explicit Resistor(double ohms) { schema().ohms.set(*this, ohms); }
};

void validatedFieldExamples()
{
    std::cout << "=== Validated fields ===\n\n";

    Record<ExamFields> first, second;

    first("writing_grade"_fld) = 82;
    first("math_grade"_fld) = 95;
    second("writing_grade"_fld) = 75;

    std::cout << "first:  " << first << "\n";
    std::cout << "second: " << second << "\n";

    try
    {
        first("science_grade"_fld) = 150;
    }
    catch (ValidationError const& e)
    {
        std::cout << "rejected: " << e.what() << "\n";
    }

    std::cout << "science_grade is still " << first("science_grade"_fld)() << "\n";

    for (auto const& name : Record<ExamFields>::kFieldNames)
        std::cout << "  declared: " << name << "\n";

    try
    {
        Resistor broken(-5.0);
    }
    catch (ValidationError const& e)
    {
        std::cout << "cannot build resistor: " << e.what() << "\n";
    }

    Resistor r(1e3);
    r("voltage"_fld) = 10.0;
    r("current"_fld) = r("voltage"_fld)() / r("ohms"_fld)();
    std::cout << "resistor: " << r << "\n";
}

void lazyExamples()
{
    std::cout << "\n=== Lazy attributes ===\n\n";

    Object record;
    record.setattr("exists", 5);
    record.intercept(std::make_shared<LazyBinder const>([] (std::string_view name)
    {
        std::cout << "  computing " << name << "\n";
        return makeValue(std::format("Value for {}", name));
    }));

    std::cout << "exists: " << record.getattr("exists") << "\n";
    std::cout << "foo:    " << record.getattr("foo") << "\n";
    std::cout << "foo:    " << record.getattr("foo") << "\n";
    std::cout << "stored: " << record << "\n";
}

void interceptedExamples()
{
    std::cout << "\n=== Full interception ===\n\n";

    Dictionary data;
    data.entries().set("foo", 3);

    Object record;
    record.attributes().set(FullInterceptor::kBackingField, data);
    record.intercept(FullInterceptor::dictionaryBacked());

    std::cout << "foo: " << record.getattr("foo") << "\n";
    std::cout << "has bar: " << std::boolalpha << record.hasattr("bar") << "\n";

    record.intercept(std::make_shared<WriteInterceptor const>([] (AttributeStore const& raw, std::string_view name, Value const& value)
    {
        std::cout << "  setting " << name << ": " << raw.get(name) << " -> " << value << "\n";
    }));

    record.setattr("foo", 7);
    record.setattr("foo", 8);
    std::cout << "foo: " << record.getattr("foo") << "\n";
}

int main()
{
    set_log_level(log_level::debug);

    validatedFieldExamples();
    lazyExamples();
    interceptedExamples();

    return 0;
}
