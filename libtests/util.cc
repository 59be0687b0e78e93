#include <qbatch/assert_test.h>

#include "test_files.hh"

#include <qpdf/QPDFSystemError.hh>

#include <cerrno>
#include <iostream>
#include <sys/stat.h>

using namespace test_files;
using namespace qbatch;

static std::string dir;

static void
test_output_error_code()
{
    assert(util::output_error_code(EACCES) == qbatch_e_write_permission);
    assert(util::output_error_code(EPERM) == qbatch_e_write_permission);
    assert(util::output_error_code(EROFS) == qbatch_e_write_permission);
    assert(util::output_error_code(ENOENT) == qbatch_e_system);
    assert(util::output_error_code(ENOSPC) == qbatch_e_system);
    assert(util::output_error_code(EIO) == qbatch_e_system);
    assert(util::output_error_code(0) == qbatch_e_system);
}

static void
test_names()
{
    assert(util::trim("  a b\t\n") == "a b");
    assert(util::trim(" \t ").empty());
    assert(util::to_lower("Report.PDF") == "report.pdf");
    assert(util::digits(0) == 1);
    assert(util::digits(9) == 1);
    assert(util::digits(10) == 2);
    assert(util::digits(1000) == 4);
    assert(util::path_extension("dir.d/Scan.TIFF") == ".tiff");
    assert(util::path_extension("dir.d/noext").empty());
    assert(util::path_extension(".profile").empty());
    assert(util::path_stem("dir/archive.tar.gz") == "archive.tar");
    assert(util::path_stem(".profile") == ".profile");
    assert(util::path_join("out", "a.jpg") == "out/a.jpg");
    assert(util::path_join("out/", "a.jpg") == "out/a.jpg");
    assert(util::path_join("", "a.jpg") == "a.jpg");
}

static void
test_files_on_disk()
{
    std::string nested = dir + "/one/two/three";
    util::make_directories(nested);
    assert(util::is_directory(nested));
    // Already there
    util::make_directories(nested + "/");

    std::string file = nested + "/page.jpg";
    assert(util::unique_path(file) == file);
    write_file(file, "x");
    assert(util::exists(file));
    assert(util::is_regular_file(file));
    assert(!util::is_directory(file));
    assert(util::unique_path(file) == nested + "/page_1.jpg");
    write_file(nested + "/page_1.jpg", "x");
    assert(util::unique_path(file) == nested + "/page_2.jpg");
    assert(util::absolute_path(file).at(0) == '/');

    try {
        util::make_directories(file + "/below");
        assert(false);
    } catch (QPDFSystemError& e) {
        std::cout << "  " << e.what() << std::endl;
        assert(util::output_error_code(e.getErrno()) == qbatch_e_system);
    }

    // Permission checks don't apply to root.
    if (geteuid() != 0) {
        std::string readonly = dir + "/readonly";
        util::make_directories(readonly);
        QUtil::os_wrapper("chmod " + readonly, chmod(readonly.c_str(), 0555));
        int err = 0;
        try {
            util::make_directories(readonly + "/sub");
        } catch (QPDFSystemError& e) {
            err = e.getErrno();
        }
        QUtil::os_wrapper("chmod " + readonly, chmod(readonly.c_str(), 0755));
        assert(err == EACCES);
        assert(util::output_error_code(err) == qbatch_e_write_permission);
    }
}

int
main()
{
    try {
        dir = scratch_dir("util");
        std::cout << "---- output error codes" << std::endl;
        test_output_error_code();
        std::cout << "---- names" << std::endl;
        test_names();
        std::cout << "---- files" << std::endl;
        test_files_on_disk();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "util tests done" << std::endl;
    return 0;
}
