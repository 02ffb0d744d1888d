#pragma once

#include <string>

#include "util/Result.hpp"

namespace markdownd {

// Lexical canonical form of an absolute path: "//" collapsed, "." dropped,
// ".." applied to the preceding segment (never above "/"), no trailing slash.
// Symbolic links are not consulted.
std::string CleanPath(const std::string &path);

/**
 * Maps a decoded request path onto the document root.
 *
 * rootPath must be absolute, canonical and slash-terminated. Returns the
 * canonical filesystem path, or Err with the rejection reason when urlPath
 * carries "../" or a NUL byte, or when the canonical path does not keep
 * rootPath as a literal prefix. Nothing on disk is touched.
 *
 * An empty path becomes indexName; a path ending in '/' gets "index.md".
 */
Result<std::string, std::string> ResolveRequestPath(
    const std::string &rootPath, const std::string &urlPath,
    const std::string &indexName);

}  // namespace markdownd
