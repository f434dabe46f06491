#include "veil.hpp"
#include <iostream>

struct Customer {
    int id;
    std::string name;
    std::string cpf;
    std::string phone;
};

int main() {
    veil::FormatterRegistry registry;
    for (const auto &f : veil::builtinFormatters()) {
        registry.registerByName(f->name(), f);
    }

    veil::ObjectDescriptor<Customer> desc("Customer");
    desc.field("id", [](const Customer &c) { return c.id; })
        .sensitive("name", [](const Customer &c) { return c.name; },
                   veil::SensitiveSpec::of(veil::DataCategory::NAME))
        .sensitive("cpf", [](const Customer &c) { return c.cpf; },
                   veil::SensitiveSpec::of(veil::DataCategory::CPF))
        .sensitive("phone", [](const Customer &c) { return c.phone; },
                   veil::SensitiveSpec::partial(2, 2));

    Customer customer{7, "Maria Souza", "12345678909", "11987654321"};
    std::cout << desc.render(customer, registry) << std::endl;

    desc.jsonFormat(true);
    std::cout << desc.render(customer, registry) << std::endl;

    std::cout << veil::SensitiveToStringBuilder("Payment", &registry)
        .append("amount", 10.5)
        .appendSensitive("card", std::string("4111111111111111"), veil::DataCategory::CREDIT_CARD)
        .appendMasked("cvv", std::string("123"), "***")
        .build() << std::endl;

    return 0;
}
