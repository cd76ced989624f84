#include <catch2/catch_test_macros.hpp>
#include "serde/client_document.hpp"
#include "core/error.hpp"
#include "mocks/mock_document_provider.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace apidoc;
using namespace apidoc::testing;

namespace {

constexpr const char* kPetstore = R"({
  "openapi": "3.0.1",
  "info": {"title": "Pets", "version": "2"},
  "paths": {
    "/pets/{id}": {
      "parameters": [],
      "get": {
        "operationId": "Pets_Get",
        "tags": ["Pets"],
        "parameters": [
          {"name": "id", "in": "path", "required": true, "schema": {"type": "integer", "format": "int64"}},
          {"name": "expand", "in": "query", "schema": {"type": "array", "items": {"$ref": "#/components/schemas/Part"}}}
        ],
        "responses": {
          "200": {"description": "OK", "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}},
          "404": {"description": "Not found"}
        },
        "security": [{"oauth2": ["pets"]}]
      }
    }
  },
  "components": {
    "schemas": {
      "Pet": {"type": "object", "properties": {"id": {"type": "integer"}, "kind": {"$ref": "#/components/schemas/Kind"}}},
      "Kind": {"type": "integer", "enum": [0, 1], "x-enumNames": ["Cat", "Dog"]}
    },
    "securitySchemes": {
      "oauth2": {"type": "oauth2", "flows": {"password": {"tokenUrl": "https://t/token", "scopes": {"pets": "Pets"}}}}
    }
  }
})";

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("ClientDocument: operations", "[client]") {
    const auto doc = ClientDocument::parse(kPetstore);
    REQUIRE(doc.title() == "Pets");
    REQUIRE(doc.version() == "2");
    REQUIRE(doc.operations().size() == 1);

    const auto* op = doc.find_operation("Pets_Get");
    REQUIRE(op != nullptr);
    REQUIRE(op == doc.find_operation("/pets/{id}", HttpMethod::GET));
    REQUIRE(op->tags == std::vector<std::string>{"Pets"});

    REQUIRE(op->parameters.size() == 2);
    REQUIRE(op->parameters[0].location == ParameterLocation::PATH);
    REQUIRE(op->parameters[0].required);
    REQUIRE(op->parameters[0].type == "integer");
    REQUIRE(op->parameters[0].format == "int64");
    REQUIRE(op->parameters[1].type == "array<Part>");

    REQUIRE(op->find_response("200")->type == "Pet");
    REQUIRE(op->find_response("404")->type.empty());
    REQUIRE(op->security.at("oauth2") == std::vector<std::string>{"pets"});
}

TEST_CASE("ClientDocument: type definitions carry enum names", "[client]") {
    const auto doc = ClientDocument::parse(kPetstore);

    const auto* kind = doc.find_type("Kind");
    REQUIRE(kind != nullptr);
    REQUIRE(kind->is_enum());
    REQUIRE(kind->enum_values == std::vector<std::string>{"0", "1"});
    REQUIRE(kind->enum_names == std::vector<std::string>{"Cat", "Dog"});

    const auto* pet = doc.find_type("Pet");
    REQUIRE_FALSE(pet->is_enum());
    REQUIRE(pet->property_names == std::vector<std::string>{"id", "kind"});
}

TEST_CASE("ClientDocument: security schemes", "[client]") {
    const auto doc = ClientDocument::parse(kPetstore);
    REQUIRE(doc.security_schemes().size() == 1);
    const auto& scheme = doc.security_schemes()[0];
    REQUIRE(scheme.id == "oauth2");
    REQUIRE(scheme.token_url == "https://t/token");
    REQUIRE(scheme.refresh_url.empty());
    REQUIRE(scheme.scopes.at("pets") == "Pets");
}

TEST_CASE("ClientDocument: malformed input", "[client]") {
    REQUIRE_THROWS_AS(ClientDocument::parse("{not json"), ClientDocumentError);
    REQUIRE_THROWS_AS(ClientDocument::parse("[]"), ClientDocumentError);
    REQUIRE_THROWS_AS(ClientDocument::parse(R"({"openapi": "3.0.1"})"), ClientDocumentError);
    REQUIRE_THROWS_AS(ClientDocument::parse(
        R"({"openapi": "3.0.1", "paths": {"/a": {"get": {"parameters": [{"name": "x", "in": "body"}]}}}})"),
        ClientDocumentError);
}

// ============================================================================
// Serialize-then-reparse bridge
// ============================================================================

TEST_CASE("ClientDocumentGenerator: reparses the filtered document", "[client]") {
    const auto registration = DocsRegistrationBuilder()
        .with_title("Widgets API")
        .with_name("widgets")
        .with_token_url(kTestTokenUrl)
        .with_ignored_parameter_names({"secret"})
        .build();
    auto generator = std::make_shared<const DocumentGenerator>(
        registration, std::make_shared<MockDocumentProvider>());

    const ClientDocumentGenerator client(generator);
    const auto doc = client.generate();

    REQUIRE(doc.title() == "Widgets API");
    const auto* list = doc.find_operation("Widgets_List");
    REQUIRE(list != nullptr);
    REQUIRE(list->path == "/widgets/odata");
    REQUIRE(list->find_parameter("secret") == nullptr);
    REQUIRE(list->find_parameter("ct") != nullptr);
    REQUIRE(list->find_parameter("top") != nullptr);
    REQUIRE(list->security.at("oauth2") == std::vector<std::string>{"widgets"});

    const auto* create = doc.find_operation("Widgets_Create");
    REQUIRE(create->find_parameter("internal") == nullptr);
    REQUIRE(create->find_response("401")->description == "Unauthorized");

    const auto* color = doc.find_type("Color");
    REQUIRE(color->enum_names == std::vector<std::string>{"Red", "Green", "Blue"});
}

TEST_CASE("ClientDocumentGenerator: requires a generator", "[client]") {
    REQUIRE_THROWS_AS(ClientDocumentGenerator(nullptr), std::invalid_argument);
}
