#include "parsers/base/parser_interface.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

PathStyle StringToPathStyle(const std::string& str) {
    auto lower = StringUtil::Lower(str);
    if (lower == "native" || lower == "auto") return PathStyle::NATIVE;
    if (lower == "unix" || lower == "posix") return PathStyle::UNIX;
    if (lower == "windows") return PathStyle::WINDOWS;
    throw InvalidInputException("Unknown path_style: '%s'. Supported: native, unix, windows", str);
}

std::string PathStyleToString(PathStyle style) {
    switch (style) {
        case PathStyle::NATIVE: return "native";
        case PathStyle::UNIX: return "unix";
        case PathStyle::WINDOWS: return "windows";
        default: return "native";
    }
}

static PathStyle ResolvePathStyle(PathStyle style) {
    if (style != PathStyle::NATIVE) {
        return style;
    }
#ifdef _WIN32
    return PathStyle::WINDOWS;
#else
    return PathStyle::UNIX;
#endif
}

std::string RenamePath(const std::string& path, PathStyle style) {
    if (ResolvePathStyle(style) == PathStyle::WINDOWS) {
        return StringUtil::Replace(path, "/", "\\");
    }
    return path;
}

} // namespace duckdb
