#include <catch2/catch_test_macros.hpp>
#include "serde/document_writer.hpp"
#include "docs/document_generator.hpp"
#include "docs/docs_registration.hpp"
#include "mocks/mock_document_provider.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace apidoc;
using namespace apidoc::testing;

namespace {

Schema typed(std::string type) {
    Schema schema;
    schema.type = std::move(type);
    return schema;
}

Schema ref_to(const std::string& name) {
    Schema schema;
    schema.ref = "#/components/schemas/" + name;
    return schema;
}

} // anonymous namespace

TEST_CASE("DocumentWriter: top-level layout", "[writer]") {
    Document doc;
    doc.info.title = "Widgets API";
    doc.info.version = "v1";
    doc.add_operation("/widgets", HttpMethod::GET, make_operation("WidgetsController", "List"));

    const auto out = DocumentWriter::to_json(doc);
    REQUIRE(out["openapi"] == "3.0.1");
    REQUIRE(out["info"]["title"] == "Widgets API");
    REQUIRE(out["info"]["version"] == "v1");
    REQUIRE(out["paths"]["/widgets"].contains("get"));
    REQUIRE(out["paths"]["/widgets"]["get"]["responses"]["200"]["description"] == "OK");
    REQUIRE_FALSE(out.contains("components"));
}

TEST_CASE("DocumentWriter: source metadata and markers are not written", "[writer]") {
    auto doc = make_widgets_document();
    const std::string text = DocumentWriter::serialize(doc);

    REQUIRE(text.find("WidgetsController") == std::string::npos);
    REQUIRE(text.find("CancellationToken") == std::string::npos);
    REQUIRE(text.find("ExcludeFromDocs") == std::string::npos);
    REQUIRE(text.find("source") == std::string::npos);
}

TEST_CASE("DocumentWriter: parameters", "[writer]") {
    Operation op;
    Parameter id;
    id.name = "id";
    id.location = ParameterLocation::PATH;
    id.schema.type = "integer";
    id.schema.format = "int32";
    op.parameters.push_back(id);

    Parameter top;
    top.name = "top";
    top.description = "page size";
    top.schema.type = "integer";
    top.schema.nullable = true;
    top.schema.default_value = 30;
    op.parameters.push_back(top);

    const auto out = DocumentWriter::write_operation(op);
    const auto& params = out["parameters"];
    REQUIRE(params.size() == 2);
    REQUIRE(params[0]["in"] == "path");
    REQUIRE(params[0]["required"] == true);
    REQUIRE(params[0]["schema"]["format"] == "int32");
    REQUIRE(params[1]["in"] == "query");
    REQUIRE(params[1]["required"] == false);
    REQUIRE(params[1]["description"] == "page size");
    REQUIRE(params[1]["schema"]["nullable"] == true);
    REQUIRE(params[1]["schema"]["default"] == 30);
}

TEST_CASE("DocumentWriter: duplicate response codes keep the first entry", "[writer]") {
    const auto problem = ref_to("ValidationProblem");

    Operation op;
    op.operation_id = "Widgets_Create";
    op.responses.push_back({"400", Response{"Validation failed", problem}});
    op.responses.push_back({"200", Response{"OK", std::nullopt}});
    op.responses.push_back({"400", Response{"BadRequest", std::nullopt}});

    const auto out = DocumentWriter::write_operation(op);
    REQUIRE(out["responses"].size() == 2);
    REQUIRE(out["responses"]["400"]["description"] == "Validation failed");
    REQUIRE(out["responses"]["400"]["content"]["application/json"]["schema"]["$ref"] ==
            "#/components/schemas/ValidationProblem");
}

TEST_CASE("DocumentWriter: host 400 body survives the injected security responses", "[writer]") {
    Schema problem;
    problem.type = "object";
    problem.properties.push_back({"errors", typed("string")});

    Document doc;
    auto create = make_operation("WidgetsController", "Create");
    create.responses.push_back({"400", Response{"Validation failed", ref_to("ValidationProblem")}});
    doc.add_operation("/widgets", HttpMethod::POST, std::move(create));
    doc.add_schema("ValidationProblem", problem);

    const auto registration = DocsRegistrationBuilder()
        .with_name("widgets")
        .with_token_url(kTestTokenUrl)
        .build();
    const DocumentGenerator generator(registration, std::make_shared<MockDocumentProvider>(std::move(doc)));

    const auto generated = generator.generate();
    const auto* op = generated.find_operation("/widgets", HttpMethod::POST);
    REQUIRE(op != nullptr);
    REQUIRE(op->count_responses("400") == 2);

    const auto out = DocumentWriter::to_json(generated);
    const auto& responses = out["paths"]["/widgets"]["post"]["responses"];
    REQUIRE(responses["400"]["description"] == "Validation failed");
    REQUIRE(responses["400"]["content"]["application/json"]["schema"]["$ref"] ==
            "#/components/schemas/ValidationProblem");
    REQUIRE(responses["401"]["description"] == "Unauthorized");
    REQUIRE(responses["403"]["description"] == "Forbidden");
    REQUIRE(out["components"]["schemas"].contains("ValidationProblem"));
}

TEST_CASE("DocumentWriter: references replace the schema object", "[writer]") {
    Schema schema;
    schema.ref = "#/components/schemas/Color";
    schema.type = "integer";
    schema.description = "ignored next to $ref";

    const auto out = DocumentWriter::write_schema(schema);
    REQUIRE(out.size() == 1);
    REQUIRE(out["$ref"] == "#/components/schemas/Color");
}

TEST_CASE("DocumentWriter: extensions, enums and nested schemas", "[writer]") {
    Schema color;
    color.type = "integer";
    color.enum_values = {0, 1};
    color.extensions["x-enumNames"] = nlohmann::json::array({"Red", "Green"});

    Schema list;
    list.type = "array";
    list.items.push_back(color);

    Schema widget;
    widget.type = "object";
    widget.properties.push_back({"colors", list});

    const auto out = DocumentWriter::write_schema(widget);
    const auto& items = out["properties"]["colors"]["items"];
    REQUIRE(items["enum"].size() == 2);
    REQUIRE(items["x-enumNames"][1] == "Green");
}

TEST_CASE("DocumentWriter: an array has at most one item schema", "[writer]") {
    Schema list;
    list.type = "array";
    list.items.push_back(typed("integer"));
    list.items.push_back(typed("string"));

    REQUIRE_THROWS_AS(DocumentWriter::write_schema(list), std::invalid_argument);

    Schema holder;
    holder.type = "object";
    holder.properties.push_back({"values", list});
    REQUIRE_THROWS_AS(DocumentWriter::write_schema(holder), std::invalid_argument);

    list.items.pop_back();
    REQUIRE(DocumentWriter::write_schema(list)["items"]["type"] == "integer");
}

TEST_CASE("DocumentWriter: OAuth2 password-flow scheme", "[writer]") {
    const auto scheme = DocsRegistrationBuilder::make_security_scheme([] {
        DocsConfig config;
        config.api_title = "Widgets API";
        config.api_name = "widgets";
        config.token_url = kTestTokenUrl;
        return config;
    }());

    const auto out = DocumentWriter::write_security_scheme(scheme);
    REQUIRE(out["type"] == "oauth2");
    REQUIRE(out["in"] == "header");
    REQUIRE(out["name"] == "Authentication");
    REQUIRE(out["scheme"] == "Bearer");
    REQUIRE(out["bearerFormat"] == "Bearer {token}");
    const auto& password = out["flows"]["password"];
    REQUIRE(password["tokenUrl"] == kTestTokenUrl);
    REQUIRE(password["refreshUrl"] == kTestTokenUrl);
    REQUIRE(password["scopes"]["widgets"] == "Widgets API");
}

TEST_CASE("DocumentWriter: security requirements", "[writer]") {
    Operation op;
    SecurityRequirement requirement;
    requirement["oauth2"] = {"widgets"};
    op.security.push_back(requirement);

    const auto out = DocumentWriter::write_operation(op);
    REQUIRE(out["security"].size() == 1);
    REQUIRE(out["security"][0]["oauth2"][0] == "widgets");
}

TEST_CASE("DocumentWriter: compact output", "[writer]") {
    Document doc;
    const auto text = DocumentWriter::serialize(doc, -1);
    REQUIRE(text.find('\n') == std::string::npos);
}
