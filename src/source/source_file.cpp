#include <examkit/source/source_file.h>
#include <fstream>
#include <sstream>

namespace examkit::source
{

LoadResult load_source_stream(std::istream& in, const std::string& path)
{
    std::ostringstream buffer;
    buffer << in.rdbuf();

    if (in.bad())
    {
        return LoadError{.message = "failed while reading '" + path + "'"};
    }

    return SourceFile{.path = path, .contents = buffer.str()};
}

LoadResult load_source_file(const std::string& path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
    {
        return LoadError{.message = "failed to open '" + path + "'"};
    }

    return load_source_stream(in, path);
}

} // namespace examkit::source
