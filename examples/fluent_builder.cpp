#include "veil.hpp"
#include <cctype>
#include <iostream>

int main() {
    auto upper = veil::makeFormatter("upper", [](const std::string &value) {
        std::string out(value);
        for (auto &c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return out;
    });

    std::shared_ptr<veil::MaskingEngine> engine;
    try {
        engine = veil::MaskingConfiguration()
            .withBuiltinFormatters()
            .defaultMask("[REDACTED]")
            .sensitiveField("cpf", veil::DataCategory::CPF)
            .sensitiveField("email", veil::DataCategory::EMAIL)
            .sensitiveField(veil::SensitiveFieldConfig("apelido").withFormatter("upper"))
            .formatter("upper", upper)
            .obfuscator(veil::DataCategory::IP_ADDRESS, std::make_shared<veil::PartialObfuscator>(3, 0))
            .fromEnvironment()
            .build();
    } catch (const veil::ConfigurationError &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument &e) {
        std::cerr << "bad environment: " << e.what() << std::endl;
        return 1;
    }

    std::cout << engine->sanitize("cpf=12345678909 email=joao@empresa.com") << std::endl;
    std::cout << engine->sanitize("apelido=joaozinho token=abc") << std::endl;
    std::cout << engine->sanitize("client 192.168.10.20 connected") << std::endl;

    return 0;
}
