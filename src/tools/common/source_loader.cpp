//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Read Pulse source files for the command-line driver.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned string owns its buffer.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace pulse::tools
{

namespace
{
constexpr const char *kIoErrorCode = "P0001";

support::Expected<std::string> ioError(std::string message)
{
    return support::Expected<std::string>(
        support::Diagnostic{support::Severity::Error, std::move(message), {}, kIoErrorCode});
}
} // namespace

support::Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return ioError("unable to open " + path);
    }

    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<std::size_t>(fileSize) > kMaxSourceBytes)
    {
        return ioError("source file too large: " + path + " (limit: 16 MB)");
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
        {
            return ioError("error reading " + path);
        }
        return support::Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + path);
    }
}

} // namespace pulse::tools
