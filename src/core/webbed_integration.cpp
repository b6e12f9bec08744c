#include "webbed_integration.hpp"
#include "core/trace.hpp"
#include "duckdb/catalog/catalog.hpp"
#include "duckdb/catalog/catalog_entry/scalar_function_catalog_entry.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/main/extension_helper.hpp"
#include "duckdb/main/prepared_statement.hpp"
#include "duckdb/main/query_result.hpp"

namespace duckdb {

constexpr const char *WebbedIntegration::EXTENSION_NAME;

bool WebbedIntegration::IsLoaded(ClientContext &context) {
	auto &catalog = Catalog::GetSystemCatalog(context);
	auto entry = catalog.GetEntry(context, CatalogType::SCALAR_FUNCTION_ENTRY, DEFAULT_SCHEMA, "xml_to_json",
	                              OnEntryNotFound::RETURN_NULL);
	return entry != nullptr;
}

void WebbedIntegration::EnsureLoaded(ClientContext &context) {
	if (IsLoaded(context)) {
		return;
	}
	VERDICT_TRACE("xml_to_json not in catalog, trying to autoload " << EXTENSION_NAME);
	if (!ExtensionHelper::TryAutoLoadExtension(context, EXTENSION_NAME) || !IsLoaded(context)) {
		throw InvalidInputException(MissingExtensionMessage());
	}
}

std::string WebbedIntegration::XmlToJson(ClientContext &context, const std::string &xml_content) {
	EnsureLoaded(context);

	// A separate connection; the calling context is mid-query
	Connection con(DatabaseInstance::GetDatabase(context));
	auto statement = con.Prepare("SELECT xml_to_json($1)");
	if (statement->HasError()) {
		throw InternalException("Preparing xml_to_json failed: %s", statement->GetError());
	}

	vector<Value> parameters {Value(xml_content)};
	auto result = statement->Execute(parameters, false);
	if (result->HasError()) {
		throw InvalidInputException("Malformed XML report: %s", result->GetError());
	}

	auto chunk = result->Fetch();
	if (!chunk || chunk->size() == 0) {
		throw InvalidInputException("Malformed XML report: xml_to_json produced no row");
	}
	auto json = chunk->GetValue(0, 0);
	if (json.IsNull()) {
		throw InvalidInputException("Malformed XML report: xml_to_json produced NULL");
	}
	return json.ToString();
}

std::string WebbedIntegration::MissingExtensionMessage() {
	return "Reading XML reports needs the 'webbed' extension:\n"
	       "  INSTALL webbed FROM community;\n"
	       "  LOAD webbed;";
}

} // namespace duckdb
