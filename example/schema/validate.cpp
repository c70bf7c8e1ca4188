#include "jsv/schema/error_tree.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/human_errors.hpp"
#include "jsv/schema/validator.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>

using namespace jsv::schema;

int main() {
    spdlog::set_level(spdlog::level::debug);

    // Define a JSON schema
    json schema = json::parse(R"({
        "$schema": "https://json-schema.org/draft/2020-12/schema",
        "type": "object",
        "properties": {
            "name": {"type": "string"},
            "age": {"type": "integer", "minimum": 0},
            "email": {"type": "string", "format": "email"},
            "tags": {"type": "array", "items": {"type": "string"}}
        },
        "required": ["name", "age"],
        "unevaluatedProperties": false
    })");

    // A minimal stand-in for an e-mail checker
    auto formats = std::make_shared<FormatChecker>();
    formats->registerFormat("email", [](const json& instance) {
        return !instance.is_string() ||
               instance.get_ref<const std::string&>().find('@') !=
                   std::string::npos;
    });

    CompileOptions options;
    options.formatChecker = formats;
    Validator validator = [&] {
        try {
            return compile(schema, options);
        } catch (const SchemaError& e) {
            std::cerr << "Invalid schema: " << e.error().toString()
                      << std::endl;
            throw;
        }
    }();

    // Define a JSON instance that conforms to the schema
    json validInstance = {{"name", "John Doe"},
                          {"age", 30},
                          {"email", "john.doe@example.com"},
                          {"tags", {"developer", "blogger"}}};

    std::cout << "Valid instance is valid: " << std::boolalpha
              << validator.isValid(validInstance) << std::endl;

    // Define a JSON instance that does not conform to the schema
    json invalidInstance = {{"name", "John Doe"},
                            {"age", -5},
                            {"email", "john.doe.example"},
                            {"tags", {"developer", 123}},
                            {"nickname", "JD"}};

    std::cout << "Invalid instance is valid: " << std::boolalpha
              << validator.isValid(invalidInstance) << std::endl;

    // Print every error, then the most relevant one
    auto errors = validator.errors(invalidInstance);
    std::cout << "Validation errors:" << std::endl;
    for (const auto& error : errors) {
        std::cout << "Error: " << error.message
                  << ", Path: " << error.jsonPath() << std::endl;
    }
    if (auto best = bestMatch(errors)) {
        std::cout << "\nBest match:\n" << best->toString() << std::endl;
    }

    // The same errors worded for end users
    std::cout << "\nFor the user:" << std::endl;
    for (const auto& message :
         HumanErrors::defaults().messages(validator, invalidInstance)) {
        std::cout << "- " << message << std::endl;
    }

    // Errors indexed by instance location
    ErrorTree tree(errors);
    std::cout << "Errors under \"tags\": "
              << tree[std::string("tags")].totalErrors() << std::endl;

    try {
        validator.validate(invalidInstance);
    } catch (const ValidationException& e) {
        std::cout << "validate() threw: " << e.error().toJson().dump(2)
                  << std::endl;
    }

    return 0;
}
