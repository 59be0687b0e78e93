#ifndef QBATCH_UTIL_HH
#define QBATCH_UTIL_HH

#include <qbatch/Constants.h>
#include <qbatch/DLL.h>

#include <cstddef>
#include <string>

namespace qbatch::util
{
    // qbatch::util is a collection of file-name and file-system helpers for libqbatch internal
    // use. Functions that touch the file system report failure by throwing QPDFSystemError, as
    // QUtil does. Implementations are in Util.cc.

    inline constexpr bool
    is_space(char ch)
    {
        return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\v';
    }

    inline constexpr bool
    is_path_separator(char ch)
    {
#ifdef _WIN32
        return ch == '/' || ch == '\\';
#else
        return ch == '/';
#endif
    }

    QBATCH_DLL
    std::string trim(std::string const&);
    QBATCH_DLL
    std::string to_lower(std::string const&);

    // Number of decimal digits needed to write n.
    QBATCH_DLL
    size_t digits(size_t n);

    // The last path component's extension including the leading ".", lower-cased. A leading
    // "." in the file name (".profile") does not start an extension.
    QBATCH_DLL
    std::string path_extension(std::string const& filename);

    // The last path component without its extension.
    QBATCH_DLL
    std::string path_stem(std::string const& filename);

    QBATCH_DLL
    std::string path_join(std::string const& dir, std::string const& name);
    QBATCH_DLL
    std::string absolute_path(std::string const& filename);

    QBATCH_DLL
    bool exists(std::string const& path);
    QBATCH_DLL
    bool is_regular_file(std::string const& path);
    QBATCH_DLL
    bool is_directory(std::string const& path);

    // Create the directory and any missing parents.
    QBATCH_DLL
    void make_directories(std::string const& path);

    // Return path if nothing exists there. Otherwise insert "_1", "_2", ... before the
    // extension and return the first name that is free.
    QBATCH_DLL
    std::string unique_path(std::string const& path);

    // Map an errno value from a failed output operation to a qbatch error code.
    QBATCH_DLL
    qbatch_error_code_e output_error_code(int err);
} // namespace qbatch::util

#endif // QBATCH_UTIL_HH
