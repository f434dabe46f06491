#include <gtest/gtest.h>
#include "veil/registry/formatter_registry.hpp"
#include "veil/registry/obfuscator_registry.hpp"
#include "veil/formatter/builtin_formatters.hpp"
#include "veil/obfuscator/default_obfuscator.hpp"
#include "veil/obfuscator/partial_obfuscator.hpp"
#include <stdexcept>

class FormatterRegistryTest : public ::testing::Test {
protected:
    veil::FormatterRegistry registry;
};

TEST_F(FormatterRegistryTest, EmptyRegistryFindsNothing) {
    EXPECT_EQ(registry.findByName("cpfFormatter"), nullptr);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), nullptr);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(FormatterRegistryTest, RegisterByNameIndexesOwnCategory) {
    auto cpf = std::make_shared<veil::CpfFormatter>();
    registry.registerByName("myCpf", cpf);

    EXPECT_EQ(registry.findByName("myCpf"), cpf);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), cpf);
}

TEST_F(FormatterRegistryTest, NamesAreCaseInsensitive) {
    auto cpf = std::make_shared<veil::CpfFormatter>();
    registry.registerByName("CpfFormatter", cpf);

    EXPECT_EQ(registry.findByName("cpfformatter"), cpf);
    EXPECT_EQ(registry.findByName("CPFFORMATTER"), cpf);
}

TEST_F(FormatterRegistryTest, GenericFormatterIsNotIndexedByCategory) {
    registry.registerByName("doc", std::make_shared<veil::DocumentFormatter>());
    EXPECT_NE(registry.findByName("doc"), nullptr);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::GENERIC), nullptr);
}

TEST_F(FormatterRegistryTest, RegisterByCategoryIndexesOwnName) {
    auto email = std::make_shared<veil::EmailFormatter>();
    registry.registerByCategory(veil::DataCategory::EMAIL, email);

    EXPECT_EQ(registry.findByCategory(veil::DataCategory::EMAIL), email);
    EXPECT_EQ(registry.findByName("emailFormatter"), email);
}

TEST_F(FormatterRegistryTest, LastRegistrationWins) {
    auto first = std::make_shared<veil::CpfFormatter>();
    auto second = std::make_shared<veil::CpfFormatter>('#');
    registry.registerByName("cpf", first);
    registry.registerByName("cpf", second);

    EXPECT_EQ(registry.findByName("cpf"), second);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), second);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(FormatterRegistryTest, RejectsBlankNameAndNull) {
    EXPECT_THROW(registry.registerByName("", std::make_shared<veil::CpfFormatter>()), std::invalid_argument);
    EXPECT_THROW(registry.registerByName("  ", std::make_shared<veil::CpfFormatter>()), std::invalid_argument);
    EXPECT_THROW(registry.registerByName("cpf", nullptr), std::invalid_argument);
    EXPECT_THROW(registry.registerByCategory(veil::DataCategory::CPF, nullptr), std::invalid_argument);
    EXPECT_EQ(registry.findByName(""), nullptr);
}

TEST_F(FormatterRegistryTest, UnregisterByNameDropsMatchingCategoryEntry) {
    auto cpf = std::make_shared<veil::CpfFormatter>();
    registry.registerByName("cpf", cpf);
    registry.unregister("CPF");

    EXPECT_EQ(registry.findByName("cpf"), nullptr);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), nullptr);
}

TEST_F(FormatterRegistryTest, UnregisterByNameKeepsOtherCategoryEntry) {
    auto named = std::make_shared<veil::CpfFormatter>();
    auto byCategory = std::make_shared<veil::CpfFormatter>('#');
    registry.registerByName("cpf", named);
    registry.registerByCategory(veil::DataCategory::CPF, byCategory);
    registry.unregister("cpf");

    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), byCategory);
}

TEST_F(FormatterRegistryTest, UnregisterByCategoryAndClear) {
    registry.registerByName("cpf", std::make_shared<veil::CpfFormatter>());
    registry.unregister(veil::DataCategory::CPF);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), nullptr);
    EXPECT_NE(registry.findByName("cpf"), nullptr);

    registry.clear();
    EXPECT_EQ(registry.findByName("cpf"), nullptr);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(FormatterRegistryTest, SnapshotIsIndependentCopy) {
    registry.registerByName("cpf", std::make_shared<veil::CpfFormatter>());
    auto table = registry.snapshot();
    registry.clear();

    EXPECT_NE(table.findByName("cpf"), nullptr);
    EXPECT_NE(table.findByCategory(veil::DataCategory::CPF), nullptr);
}

class ObfuscatorRegistryTest : public ::testing::Test {
protected:
    veil::ObfuscatorRegistry registry;
};

TEST_F(ObfuscatorRegistryTest, RegisterAndFind) {
    auto partial = std::make_shared<veil::PartialObfuscator>();
    registry.registerByName("Partial", partial);
    registry.registerByCategory(veil::DataCategory::EMAIL, partial);

    EXPECT_EQ(registry.findByName("partial"), partial);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::EMAIL), partial);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ObfuscatorRegistryTest, NoCrossIndexing) {
    registry.registerByCategory(veil::DataCategory::EMAIL, std::make_shared<veil::PartialObfuscator>());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ObfuscatorRegistryTest, RejectsInvalidRegistrations) {
    EXPECT_THROW(registry.registerByName("", std::make_shared<veil::DefaultObfuscator>()), std::invalid_argument);
    EXPECT_THROW(registry.registerByName("x", nullptr), std::invalid_argument);
    EXPECT_THROW(registry.registerByCategory(veil::DataCategory::CPF, nullptr), std::invalid_argument);
}

TEST_F(ObfuscatorRegistryTest, DefaultObfuscatorIsClearedWithRegistry) {
    auto fallback = std::make_shared<veil::DefaultObfuscator>('#');
    registry.setDefaultObfuscator(fallback);
    EXPECT_EQ(registry.defaultObfuscator(), fallback);
    EXPECT_EQ(registry.snapshot().defaultObfuscator, fallback);

    registry.clear();
    EXPECT_EQ(registry.defaultObfuscator(), nullptr);
}

TEST_F(ObfuscatorRegistryTest, Unregister) {
    registry.registerByName("p", std::make_shared<veil::PartialObfuscator>());
    registry.registerByCategory(veil::DataCategory::CPF, std::make_shared<veil::PartialObfuscator>());
    registry.unregister("P");
    registry.unregister(veil::DataCategory::CPF);

    EXPECT_EQ(registry.findByName("p"), nullptr);
    EXPECT_EQ(registry.findByCategory(veil::DataCategory::CPF), nullptr);
}
