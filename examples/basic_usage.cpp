#include "veil.hpp"
#include <iostream>

int main() {
    veil::MaskingEngine engine;

    veil::EngineConfig config;
    config.addField(veil::SensitiveFieldConfig("cpf", veil::DataCategory::CPF));
    config.addField(veil::SensitiveFieldConfig("telefone").visible(2, 3));
    config.addField(veil::SensitiveFieldConfig("senha"));
    engine.configure(config);

    // Key/value shapes
    std::cout << engine.sanitize(R"({"cpf": "12345678909", "status": "ok"})") << std::endl;
    std::cout << engine.sanitize("Pessoa[cpf=12345678909, telefone='11987654321']") << std::endl;
    std::cout << engine.sanitize("login ok senha: hunter2") << std::endl;

    // URLs
    std::cout << engine.sanitize("GET /api?telefone=6378273937&page=2") << std::endl;

    // Bare values found by category
    std::cout << engine.sanitize("client 10.0.0.12 sent mail to joao@empresa.com") << std::endl;

    return 0;
}
