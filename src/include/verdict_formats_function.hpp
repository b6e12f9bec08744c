#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"

namespace duckdb {

// Get the verdict_formats table function
TableFunction GetVerdictFormatsFunction();

} // namespace duckdb
