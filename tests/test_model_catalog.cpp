// Tests for provider model list parsing

#include "model_catalog.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

using namespace voxchord;
using json = nlohmann::json;

const char* CAMEL_BODY = R"({
    "data": [
        {"id": "anthropic/claude-sonnet-4", "name": "Claude Sonnet 4",
         "description": "Balanced", "pricing": {"prompt": "0.000003", "completion": "0.000015"},
         "contextLength": 200000},
        {"id": "openai/gpt-4o", "name": "GPT-4o",
         "pricing": {"prompt": 0.0000025, "completion": 0.00001}, "contextLength": 128000}
    ]
})";

const char* SNAKE_BODY = R"({
    "data": [
        {"id": "anthropic/claude-sonnet-4", "name": "Claude Sonnet 4",
         "description": "Balanced", "pricing": {"prompt": "0.000003", "completion": "0.000015"},
         "context_length": 200000},
        {"id": "openai/gpt-4o", "name": "GPT-4o",
         "pricing": {"prompt": 0.0000025, "completion": 0.00001}, "context_length": 128000}
    ]
})";

const char* PASCAL_BODY = R"({
    "Data": [
        {"Id": "anthropic/claude-sonnet-4", "Name": "Claude Sonnet 4",
         "Description": "Balanced", "Pricing": {"Prompt": "0.000003", "Completion": "0.000015"},
         "ContextLength": 200000},
        {"Id": "openai/gpt-4o", "Name": "GPT-4o",
         "Pricing": {"Prompt": 0.0000025, "Completion": 0.00001}, "ContextLength": 128000}
    ]
})";

void test_conventions_parse_identically() {
    std::cout << "Testing naming conventions..." << std::endl;

    std::string camel_used, snake_used, pascal_used;
    auto camel = parse_model_list(CAMEL_BODY, &camel_used);
    auto snake = parse_model_list(SNAKE_BODY, &snake_used);
    auto pascal = parse_model_list(PASCAL_BODY, &pascal_used);

    assert(camel.size() == 2);
    assert(camel == snake);
    assert(camel == pascal);
    assert(camel_used == "camelCase");
    assert(snake_used == "snake_case");
    assert(pascal_used == "PascalCase");

    const ModelDescriptor& sonnet = camel[0];
    assert(sonnet.id == "anthropic/claude-sonnet-4");
    assert(sonnet.description == "Balanced");
    assert(sonnet.prompt_price == 0.000003 && "String prices are converted");
    assert(sonnet.completion_price == 0.000015);
    assert(sonnet.context_length == 200000);
    assert(camel[1].description.empty());

    std::cout << "  PASS: Three spellings give the same models" << std::endl;
}

void test_convention_mismatch_rejected() {
    std::cout << "Testing convention mismatch..." << std::endl;

    json snake = json::parse(SNAKE_BODY);
    assert(!parse_models(snake, NamingConvention::CamelCase));
    assert(!parse_models(snake, NamingConvention::PascalCase));
    assert(parse_models(snake, NamingConvention::SnakeCase));

    json pascal = json::parse(PASCAL_BODY);
    assert(!parse_models(pascal, NamingConvention::CamelCase));

    // Mixed spelling only fits the loose pass
    json mixed = json::parse(R"({"Data": [{"id": "x/y", "Context_Length": 8000}]})");
    assert(!parse_models(mixed, NamingConvention::CamelCase));
    assert(!parse_models(mixed, NamingConvention::SnakeCase));
    assert(!parse_models(mixed, NamingConvention::PascalCase));
    auto loose = parse_models(mixed, NamingConvention::CaseInsensitive);
    assert(loose && loose->size() == 1);
    assert((*loose)[0].context_length == 8000);

    std::cout << "  PASS: Payload only accepted under its own convention" << std::endl;
}

void test_defaults_and_bad_entries() {
    std::cout << "Testing missing fields..." << std::endl;

    auto models = parse_model_list(R"({"data": [
        {"id": "  meta/llama  ", "contextLength": 0},
        {"id": "", "name": "no id"},
        {"name": "also no id"},
        "not an object",
        {"id": "mistral/small", "pricing": {"prompt": "n/a"}, "contextLength": -5}
    ]})");

    assert(models.size() == 2);
    assert(models[0].id == "meta/llama");
    assert(models[0].name == "meta/llama" && "Name falls back to the id");
    assert(models[0].context_length == 4096);
    assert(models[1].prompt_price == 0.0);
    assert(models[1].context_length == 4096);

    assert(parse_model_list("not json").empty());
    assert(parse_model_list(R"({"data": []})").empty());
    assert(parse_model_list(R"({"items": [{"id": "a"}]})").empty());

    auto listed = parse_model_list(R"({"Models": [{"Id": "qwen/qwen3", "ContextLength": 32768}]})");
    assert(listed.size() == 1 && "Array may be named models");
    assert(listed[0].context_length == 32768);

    std::cout << "  PASS: Entries without ids skipped, context defaults to 4096" << std::endl;
}

void test_out_of_range_numbers() {
    std::cout << "Testing out of range numbers..." << std::endl;

    auto models = parse_model_list(R"({"data": [
        {"id": "huge/context", "context_length": 1e12},
        {"id": "text/huge", "context_length": "1e20"},
        {"id": "text/inf", "context_length": "inf", "pricing": {"prompt": "nan", "completion": "inf"}},
        {"id": "exact/max", "context_length": 2147483647}
    ]})");

    assert(models.size() == 4);
    assert(models[0].context_length == std::numeric_limits<int>::max() && "Clamped, not wrapped");
    assert(models[1].context_length == std::numeric_limits<int>::max());
    assert(models[2].context_length == 4096 && "Infinite length uses the default");
    assert(models[2].prompt_price == 0.0);
    assert(models[2].completion_price == 0.0);
    assert(models[3].context_length == std::numeric_limits<int>::max());

    std::cout << "  PASS: Oversized and non-finite values stay in range" << std::endl;
}

void test_default_model() {
    std::cout << "Testing default model..." << std::endl;

    ModelDescriptor model = default_model();
    assert(model.id == "anthropic/claude-sonnet-4");
    assert(model.context_length == 200000);

    json j = model;
    assert(j.get<ModelDescriptor>() == model);

    std::cout << "  PASS: Built-in model available" << std::endl;
}

int main() {
    std::cout << "=== Model Catalog Test Suite ===" << std::endl;

    test_conventions_parse_identically();
    test_convention_mismatch_rejected();
    test_defaults_and_bad_entries();
    test_out_of_range_numbers();
    test_default_model();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
