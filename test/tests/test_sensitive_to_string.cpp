#include <gtest/gtest.h>
#include "veil/util/sensitive_to_string.hpp"
#include "veil/formatter/builtin_formatters.hpp"
#include <memory>

namespace {
    struct Customer {
        int id;
        std::string name;
        std::string cpf;
        std::string phone;
        std::shared_ptr<std::string> nickname;
    };

    struct Person {
        std::string name;
    };

    struct Employee : Person {
        std::string badge;
    };

    veil::ObjectDescriptor<Customer> customerDescriptor() {
        veil::ObjectDescriptor<Customer> desc("Customer");
        desc.field("id", [](const Customer &c) { return c.id; })
            .sensitive("name", [](const Customer &c) { return c.name; },
                       veil::SensitiveSpec::of(veil::DataCategory::NAME))
            .sensitive("cpf", [](const Customer &c) { return c.cpf; },
                       veil::SensitiveSpec::of(veil::DataCategory::CPF))
            .sensitive("phone", [](const Customer &c) { return c.phone; },
                       veil::SensitiveSpec::partial(2, 2))
            .field("nickname", [](const Customer &c) { return c.nickname; });
        return desc;
    }
}

class SensitiveToStringTest : public ::testing::Test {
protected:
    veil::FormatterRegistry registry;
    Customer customer;

    void SetUp() override {
        for (const auto &f : veil::builtinFormatters()) {
            registry.registerByName(f->name(), f);
        }
        customer.id = 7;
        customer.name = "Maria Souza";
        customer.cpf = "12345678909";
        customer.phone = "11987654321";
    }
};

TEST_F(SensitiveToStringTest, RendersWithRegisteredFormatters) {
    auto desc = customerDescriptor();
    EXPECT_EQ(desc.render(customer, registry),
              "Customer[id=7, name=M**** S****, cpf=***456789**, phone=11*******21]");
}

TEST_F(SensitiveToStringTest, WithoutFormattersCategoryMembersGetFixedMask) {
    auto desc = customerDescriptor();
    EXPECT_EQ(desc.render(customer),
              "Customer[id=7, name=***, cpf=***, phone=11*******21]");
}

TEST_F(SensitiveToStringTest, JsonFormat) {
    auto desc = customerDescriptor();
    desc.jsonFormat(true);
    EXPECT_EQ(desc.render(customer, registry),
              R"({"id": 7, "name": "M**** S****", "cpf": "***456789**", "phone": "11*******21"})");
}

TEST_F(SensitiveToStringTest, NullMembersSkippedUnlessRequested) {
    auto desc = customerDescriptor();
    desc.exclude("name").exclude("cpf").exclude("phone");
    EXPECT_EQ(desc.render(customer), "Customer[id=7]");

    desc.includeNulls(true);
    EXPECT_EQ(desc.render(customer), "Customer[id=7, nickname=null]");

    desc.jsonFormat(true);
    EXPECT_EQ(desc.render(customer), R"({"id": 7, "nickname": null})");
}

TEST_F(SensitiveToStringTest, PointerValuesAreDereferenced) {
    auto desc = customerDescriptor();
    desc.exclude("name").exclude("cpf").exclude("phone");
    customer.nickname = std::make_shared<std::string>("Mari");
    EXPECT_EQ(desc.render(customer), "Customer[id=7, nickname=Mari]");
}

TEST_F(SensitiveToStringTest, NullObjectRendersNull) {
    auto desc = customerDescriptor();
    EXPECT_EQ(desc.render(static_cast<const Customer *>(nullptr), registry), "null");
}

TEST_F(SensitiveToStringTest, FormatterByNameAndFixedMask) {
    veil::ObjectDescriptor<Customer> desc("Customer");
    desc.sensitive("cpf", [](const Customer &c) { return c.cpf; },
                   veil::SensitiveSpec::formatter("documentFormatter"))
        .sensitive("phone", [](const Customer &c) { return c.phone; },
                   veil::SensitiveSpec::masked("<hidden>"));

    EXPECT_EQ(desc.render(customer, registry), "Customer[cpf=123.***.***-09, phone=<hidden>]");
}

TEST_F(SensitiveToStringTest, EmptySensitiveValueGetsMask) {
    customer.cpf.clear();
    auto desc = customerDescriptor();
    desc.exclude("name").exclude("phone");
    EXPECT_EQ(desc.render(customer, registry), "Customer[id=7, cpf=***]");
}

TEST_F(SensitiveToStringTest, InheritedMembersComeFirst) {
    veil::ObjectDescriptor<Person> person("Person");
    person.sensitive("name", [](const Person &p) { return p.name; },
                     veil::SensitiveSpec::of(veil::DataCategory::NAME));

    veil::ObjectDescriptor<Employee> employee("Employee");
    employee.field("badge", [](const Employee &e) { return e.badge; })
        .inherit(person);

    Employee e;
    e.name = "Ana Lima";
    e.badge = "B-1";
    EXPECT_EQ(employee.render(e, registry), "Employee[name=A** L***, badge=B-1]");
    EXPECT_EQ(employee.members().size(), 2u);
    EXPECT_EQ(employee.typeName(), "Employee");
}

TEST_F(SensitiveToStringTest, JsonEscapesStrings) {
    veil::ObjectDescriptor<Customer> desc("Customer");
    desc.field("name", [](const Customer &c) { return c.name; }).jsonFormat(true);
    customer.name = "say \"hi\"\n";
    EXPECT_EQ(desc.render(customer), R"({"name": "say \"hi\"\n"})");
}

TEST_F(SensitiveToStringTest, BuilderWithRegistry) {
    std::string result = veil::SensitiveToStringBuilder("Payment", &registry)
        .append("amount", 10.5)
        .appendSensitive("card", std::string("4111111111111111"), veil::DataCategory::CREDIT_CARD)
        .appendMasked("cvv", std::string("123"), "***")
        .build();
    EXPECT_EQ(result, "Payment[amount=10.5, card=************1111, cvv=***]");
}

TEST_F(SensitiveToStringTest, BuilderWithoutRegistry) {
    std::string result = veil::SensitiveToStringBuilder("Payment")
        .appendSensitive("cpf", "12345678909", veil::DataCategory::CPF)
        .appendSensitive("conta", "12345678909", veil::SensitiveSpec::partial(3, 2))
        .append("approved", true)
        .build();
    EXPECT_EQ(result, "Payment[cpf=***, conta=123******09, approved=true]");
}

TEST_F(SensitiveToStringTest, BuilderJsonAndNulls) {
    const char *missing = nullptr;
    std::string result = veil::SensitiveToStringBuilder("Payment")
        .jsonFormat(true)
        .append("amount", 10)
        .appendMasked("cvv", missing, "***")
        .append("note", missing)
        .build();
    EXPECT_EQ(result, R"({"amount": 10, "cvv": null, "note": null})");
}
