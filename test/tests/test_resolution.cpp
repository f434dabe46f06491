#include <gtest/gtest.h>
#include "veil/engine/resolution.hpp"
#include "veil/formatter/builtin_formatters.hpp"
#include "veil/obfuscator/partial_obfuscator.hpp"
#include <cctype>
#include <stdexcept>

namespace {
    class ThrowingFormatter : public veil::IFormatter {
    public:
        explicit ThrowingFormatter(veil::DataCategory category = veil::DataCategory::GENERIC)
            : m_category(category) {}

        std::string format(const std::string &) const override {
            throw std::runtime_error("formatter failure");
        }
        std::string name() const override { return "throwing"; }
        veil::DataCategory category() const override { return m_category; }

    private:
        veil::DataCategory m_category;
    };

    class ThrowingObfuscator : public veil::IObfuscator {
    public:
        std::string obfuscate(const std::string &) const override {
            throw std::runtime_error("obfuscator failure");
        }
    };

    std::shared_ptr<veil::IFormatter> upperFormatter() {
        return veil::makeFormatter("upper", [](const std::string &v) {
            std::string out(v);
            for (auto &c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return out;
        });
    }
}

class ResolverTest : public ::testing::Test {
protected:
    veil::FormatterRegistry formatters;
    veil::ObfuscatorRegistry obfuscators;

    veil::Resolver resolver(char maskChar = '*', const std::string &defaultMask = "***") const {
        return veil::Resolver(formatters.snapshot(), obfuscators.snapshot(), maskChar, defaultMask);
    }
};

TEST_F(ResolverTest, FieldWithoutAnyTierGetsDefaultMask) {
    veil::SensitiveFieldConfig field("senha");
    EXPECT_EQ(resolver().resolveField("hunter2", field), "***");
    EXPECT_EQ(resolver('*', "[REDACTED]").resolveField("hunter2", field), "[REDACTED]");
}

TEST_F(ResolverTest, OverrideFormatterComesFirst) {
    formatters.registerByName("upper", upperFormatter());
    formatters.registerByName("cpfFormatter", std::make_shared<veil::CpfFormatter>());
    veil::SensitiveFieldConfig field("nome", veil::DataCategory::CPF);
    field.withFormatter("UPPER");

    EXPECT_EQ(resolver().resolveField("joao", field), "JOAO");
}

TEST_F(ResolverTest, MissingOverrideFallsToCategoryFormatter) {
    formatters.registerByName("cpfFormatter", std::make_shared<veil::CpfFormatter>());
    veil::SensitiveFieldConfig field("cpf", veil::DataCategory::CPF);
    field.withFormatter("doesNotExist");

    EXPECT_EQ(resolver().resolveField("12345678909", field), "***456789**");
}

TEST_F(ResolverTest, PartialMaskWhenNoFormatterApplies) {
    veil::SensitiveFieldConfig field("cpf", veil::DataCategory::CPF);
    field.visible(3, 2);
    EXPECT_EQ(resolver().resolveField("12345678909", field), "123******09");
    EXPECT_EQ(resolver('#').resolveField("12345678909", field), "123######09");
}

TEST_F(ResolverTest, CategoryFormatterBeatsPartialMask) {
    formatters.registerByCategory(veil::DataCategory::CPF, std::make_shared<veil::CpfFormatter>());
    veil::SensitiveFieldConfig field("cpf", veil::DataCategory::CPF);
    field.visible(3, 2);
    EXPECT_EQ(resolver().resolveField("12345678909", field), "***456789**");
}

TEST_F(ResolverTest, ThrowingFormatterGoesToDefaultObfuscator) {
    formatters.registerByCategory(veil::DataCategory::CPF,
                                  std::make_shared<ThrowingFormatter>(veil::DataCategory::CPF));
    veil::SensitiveFieldConfig field("cpf", veil::DataCategory::CPF);
    field.visible(3, 2);

    EXPECT_EQ(resolver().resolveField("12345678909", field), "***");
}

TEST_F(ResolverTest, NonStandardExceptionIsNotCaught) {
    formatters.registerByName("broken", veil::makeFormatter("broken", [](const std::string &) -> std::string {
        throw 42;
    }));
    veil::SensitiveFieldConfig field("x");
    field.withFormatter("broken");

    EXPECT_THROW(resolver().resolveField("v", field), int);
}

TEST_F(ResolverTest, EmptyFormatterOutputGoesToDefaultObfuscator) {
    formatters.registerByName("blank", veil::makeFormatter("blank", [](const std::string &) {
        return std::string();
    }));
    veil::SensitiveFieldConfig field("token");
    field.withFormatter("blank");

    EXPECT_EQ(resolver().resolveField("abc", field), "***");
}

TEST_F(ResolverTest, RegistryDefaultObfuscatorReplacesBuiltIn) {
    obfuscators.setDefaultObfuscator(std::make_shared<veil::DefaultObfuscator>('#', "[hidden]"));
    EXPECT_EQ(resolver().resolveField("x", veil::SensitiveFieldConfig("senha")), "[hidden]");
}

TEST_F(ResolverTest, FailingDefaultObfuscatorUsesMaskChars) {
    obfuscators.setDefaultObfuscator(std::make_shared<ThrowingObfuscator>());
    EXPECT_EQ(resolver('#').resolveField("x", veil::SensitiveFieldConfig("senha")), "###");
}

TEST_F(ResolverTest, CategoryValueUsesFormatterThenObfuscator) {
    obfuscators.registerByCategory(veil::DataCategory::EMAIL, std::make_shared<veil::PartialObfuscator>(2, 4));
    EXPECT_EQ(resolver().resolveByCategory("joao@x.com", veil::DataCategory::EMAIL), "jo****.com");

    formatters.registerByCategory(veil::DataCategory::EMAIL, std::make_shared<veil::EmailFormatter>());
    EXPECT_EQ(resolver().resolveByCategory("joao@empresa.com", veil::DataCategory::EMAIL), "jo***@emp***.com");
}

TEST_F(ResolverTest, CategoryValueWithoutPluginsGetsDefault) {
    EXPECT_EQ(resolver().resolveByCategory("10.0.0.1", veil::DataCategory::IP_ADDRESS), "***");
}

TEST_F(ResolverTest, ThrowingCategoryObfuscatorGetsDefault) {
    obfuscators.registerByCategory(veil::DataCategory::IP_ADDRESS, std::make_shared<ThrowingObfuscator>());
    EXPECT_EQ(resolver().resolveByCategory("10.0.0.1", veil::DataCategory::IP_ADDRESS), "***");
}

TEST_F(ResolverTest, ResolverIsUnaffectedByLaterRegistryChanges) {
    auto frozen = resolver();
    formatters.registerByCategory(veil::DataCategory::CPF, std::make_shared<veil::CpfFormatter>());

    veil::SensitiveFieldConfig field("cpf", veil::DataCategory::CPF);
    EXPECT_EQ(frozen.resolveField("12345678909", field), "***");
    EXPECT_EQ(resolver().resolveField("12345678909", field), "***456789**");
}
