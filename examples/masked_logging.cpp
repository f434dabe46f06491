#include "veil.hpp"

int main() {
    auto engine = veil::MaskingConfiguration()
        .withBuiltinFormatters()
        .sensitiveField("cpf", veil::DataCategory::CPF)
        .sensitiveField("senha")
        .build();

    veil::Logger logger(veil::LogLevel::DEBUG);

    // Entry-level masking: message, arguments and context.
    logger.addMaskedSink(engine, veil::detail::make_unique<veil::ConsoleSink>());

    // Line-level masking on a JSON sink.
    auto json = veil::detail::make_unique<veil::ConsoleSink>(veil::ConsoleStream::StdErr);
    json->setLayout(veil::detail::make_unique<veil::MaskingLayout>(
        veil::detail::make_unique<veil::JsonLayout>(), engine));
    logger.addSink(std::move(json));

    logger.setContext("session", "senha=s3cr3t");
    logger.info("Customer {cpf} created order {id}", "12345678909", 42);
    logger.debug("Login attempt cpf=98765432100 senha=hunter2");
    logger.warn("Escaped braces {{kept}} and {value}", "plain");
    logger.flush();

    return 0;
}
