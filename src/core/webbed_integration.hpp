#pragma once

#include "duckdb.hpp"
#include "duckdb/main/client_context.hpp"
#include <string>

namespace duckdb {

// Bridge to the webbed community extension, which owns XML parsing
class WebbedIntegration {
public:
	static constexpr const char *EXTENSION_NAME = "webbed";

	// True once xml_to_json is in the system catalog
	static bool IsLoaded(ClientContext &context);

	// Autoloads webbed when it is installed; throws InvalidInputException otherwise
	static void EnsureLoaded(ClientContext &context);

	/**
	 * Run webbed's xml_to_json over a document. Loads webbed first if needed.
	 * Malformed XML is reported as InvalidInputException.
	 */
	static std::string XmlToJson(ClientContext &context, const std::string &xml_content);

	static std::string MissingExtensionMessage();
};

} // namespace duckdb
