#pragma once

#include <istream>
#include <string>
#include <variant>

/**
 * @file source_file.h
 * @brief Snippet sources: in-memory code with a display name, or files loaded by the CLI.
 */

namespace examkit::source
{

/**
 * @brief Snippet text plus the name used in diagnostics.
 *
 * In-memory snippets use a label such as `<answer>` or `<distractor d1>` as `path`.
 */
struct SourceFile
{
    std::string path;
    std::string contents;
};

struct LoadError
{
    std::string message;
};

using LoadResult = std::variant<SourceFile, LoadError>;

LoadResult load_source_file(const std::string& path);

LoadResult load_source_stream(std::istream& in, const std::string& path);

} // namespace examkit::source
