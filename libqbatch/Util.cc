#include <qbatch/Util.hh>

#include <qpdf/QUtil.hh>

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <sys/stat.h>
#include <sys/types.h>

#ifdef _WIN32
# include <direct.h>
#else
# include <climits>
# include <unistd.h>
#endif

std::string
qbatch::util::trim(std::string const& s)
{
    size_t first = 0;
    size_t last = s.length();
    while (first < last && is_space(s.at(first))) {
        ++first;
    }
    while (last > first && is_space(s.at(last - 1))) {
        --last;
    }
    return s.substr(first, last - first);
}

std::string
qbatch::util::to_lower(std::string const& s)
{
    std::string result = s;
    for (auto& ch: result) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    return result;
}

size_t
qbatch::util::digits(size_t n)
{
    size_t result = 1;
    while (n >= 10) {
        n /= 10;
        ++result;
    }
    return result;
}

std::string
qbatch::util::path_extension(std::string const& filename)
{
    std::string base = QUtil::path_basename(filename);
    auto dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return to_lower(base.substr(dot));
}

std::string
qbatch::util::path_stem(std::string const& filename)
{
    std::string base = QUtil::path_basename(filename);
    auto dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return base;
    }
    return base.substr(0, dot);
}

std::string
qbatch::util::path_join(std::string const& dir, std::string const& name)
{
    if (dir.empty()) {
        return name;
    }
    if (is_path_separator(dir.back())) {
        return dir + name;
    }
    return dir + "/" + name;
}

std::string
qbatch::util::absolute_path(std::string const& filename)
{
#ifdef _WIN32
    char buf[_MAX_PATH];
    if (_fullpath(buf, filename.c_str(), _MAX_PATH) == nullptr) {
        QUtil::throw_system_error("get full path of " + filename);
    }
    return buf;
#else
    std::unique_ptr<char, decltype(&free)> resolved(realpath(filename.c_str(), nullptr), &free);
    if (resolved) {
        return resolved.get();
    }
    if (!filename.empty() && filename.at(0) == '/') {
        return filename;
    }
    char cwd[PATH_MAX];
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        QUtil::throw_system_error("get current directory");
    }
    return path_join(cwd, filename);
#endif
}

bool
qbatch::util::exists(std::string const& path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool
qbatch::util::is_regular_file(std::string const& path)
{
    struct stat st;
    return (stat(path.c_str(), &st) == 0) && ((st.st_mode & S_IFMT) == S_IFREG);
}

bool
qbatch::util::is_directory(std::string const& path)
{
    struct stat st;
    return (stat(path.c_str(), &st) == 0) && ((st.st_mode & S_IFMT) == S_IFDIR);
}

void
qbatch::util::make_directories(std::string const& path)
{
    if (path.empty() || is_directory(path)) {
        return;
    }
    std::string parent = path;
    while (!parent.empty() && is_path_separator(parent.back())) {
        parent.pop_back();
    }
    auto sep = parent.find_last_of(
#ifdef _WIN32
        "/\\"
#else
        "/"
#endif
    );
    if (sep != std::string::npos && sep > 0) {
        make_directories(parent.substr(0, sep));
    }
#ifdef _WIN32
    int status = _mkdir(parent.c_str());
#else
    int status = mkdir(parent.c_str(), 0777);
#endif
    if (status == -1 && errno == EEXIST && is_directory(parent)) {
        return;
    }
    QUtil::os_wrapper("create directory " + parent, status);
}

std::string
qbatch::util::unique_path(std::string const& path)
{
    if (!exists(path)) {
        return path;
    }
    std::string ext;
    std::string prefix = path;
    std::string base = QUtil::path_basename(path);
    auto dot = base.rfind('.');
    if (dot != std::string::npos && dot != 0) {
        ext = base.substr(dot);
        prefix = path.substr(0, path.length() - ext.length());
    }
    for (unsigned long long counter = 1;; ++counter) {
        std::string candidate = prefix + "_" + QUtil::uint_to_string(counter) + ext;
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

qbatch_error_code_e
qbatch::util::output_error_code(int err)
{
    switch (err) {
    case EACCES:
    case EPERM:
    case EROFS:
        return qbatch_e_write_permission;
    default:
        return qbatch_e_system;
    }
}
