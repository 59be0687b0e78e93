#include <qbatch/assert_test.h>

#include "test_files.hh"

#include <qbatch/QBatchJob.hh>
#include <qbatch/QBatchUsage.hh>

#include <qpdf/Pl_String.hh>

#include <iostream>

using namespace test_files;

static std::string dir;

namespace
{
    struct Captured
    {
        std::string info;
        std::string warn;
        std::string error;
    };
} // namespace

// Run a job with the given arguments and return its exit code.
static int
run_job(std::vector<std::string> const& args, Captured& c)
{
    std::vector<char const*> argv{"qbatch"};
    for (auto const& arg: args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    auto log = QPDFLogger::create();
    log->setInfo(std::make_shared<Pl_String>("info", nullptr, c.info));
    log->setWarn(std::make_shared<Pl_String>("warn", nullptr, c.warn));
    log->setError(std::make_shared<Pl_String>("error", nullptr, c.error));
    QBatchJob j;
    j.setLogger(log);
    j.initializeFromArgv(argv.data());
    j.run();
    return j.getExitCode();
}

static void
expect_usage(std::vector<std::string> const& args, std::string const& wanted)
{
    Captured c;
    try {
        run_job(args, c);
        assert(false);
    } catch (QBatchUsage& e) {
        std::cout << "  usage: " << e.what() << std::endl;
        assert(std::string(e.what()).find(wanted) != std::string::npos);
    }
}

static void
test_usage()
{
    expect_usage({}, "no files or commands");
    expect_usage({"--potato"}, "unrecognized argument --potato");

    // Only arguments that start with "--" and have more after it are options.
    Captured files;
    assert(run_job({"--", "-"}, files) == QBatchJob::EXIT_WARNING);
    assert(files.warn.find("qbatch: --: ") != std::string::npos);
    assert(files.warn.find("qbatch: -: ") != std::string::npos);
    expect_usage({"a.pdf", "--dpi=high"}, "--dpi must be a number");
    expect_usage({"a.pdf", "--merge"}, "--merge requires a value");
    expect_usage({"a.pdf", "--move=1"}, "separated by a comma");
    expect_usage({"a.pdf", "--move=1,x"}, "new position must be a number");
    expect_usage({"a.pdf", "--remove=first"}, "--remove must be a number");

    write_file(dir + "/bad-commands", "list\n# comment\nshuffle 1 2\n");
    expect_usage(
        {"--commands=" + dir + "/bad-commands"}, "bad-commands:3: unknown command shuffle");
    write_file(dir + "/bad-commands", "move 1\n");
    expect_usage({"--commands=" + dir + "/bad-commands"}, "usage: move N M");

    Captured c;
    assert(run_job({"--version"}, c) == 0);
    assert(c.info.find("qbatch version " QBATCH_VERSION "\n") == 0);
    assert(run_job({"--help"}, c) == 0);
    assert(c.info.find("Usage: qbatch") != std::string::npos);
}

static void
test_arguments()
{
    Captured c;
    int code = run_job(
        {dir + "/a.pdf",
         dir + "/b.pdf",
         "--move=2,1",
         "--rename=1,first",
         "--list",
         "--merge=" + dir + "/argv-out"},
        c);
    assert(code == 0);
    assert(c.warn.empty() && c.error.empty());
    assert((page_widths(dir + "/argv-out.pdf") == std::vector<int>{300, 100, 200}));
    assert(c.info.find("1. first.pdf (PDF, ") != std::string::npos);
    assert(c.info.find("2. a.pdf (PDF, ") != std::string::npos);
}

static void
test_commands()
{
    std::string out = dir + "/commands-out.pdf";
    std::string export_dir = dir + "/commands-export";
    write_file(
        dir + "/commands",
        "# build a batch\n"
        "add " + dir + "/a.pdf " + dir + "/b.pdf " + dir + "/c.jpg\n"
        "\n"
        "down 1\n"
        "rename 3 cover page\n"
        "up 3\n"
        "list\n"
        "merge " + out + "\n"
        "export " + export_dir + "\n");
    Captured c;
    assert(run_job({"--commands=" + dir + "/commands", "--dpi=36", "--progress"}, c) == 0);
    assert((page_widths(out) == std::vector<int>{300, 20, 100, 200}));
    assert(
        (list_directory(export_dir) ==
         std::vector<std::string>{
             "001_b_001.jpg", "002_cover page.jpg", "003_a_001.jpg", "003_a_002.jpg"}));
    assert(c.info.find("2. cover page.jpg (JPG, ") != std::string::npos);
    assert(c.info.find("qbatch: merge progress: 4/4\n") != std::string::npos);
    assert(c.info.find("qbatch: export progress: 3/3\n") != std::string::npos);
}

static void
test_exit_codes()
{
    // Files that can't be added are warnings.
    Captured c;
    assert(run_job({dir + "/a.pdf", dir + "/missing.pdf", "--list"}, c) == QBatchJob::EXIT_WARNING);
    assert(c.warn.find("missing.pdf") != std::string::npos);
    assert(c.info.find("1. a.pdf") != std::string::npos);

    // A failed edit is an error, but later actions still run.
    Captured c2;
    int code = run_job({dir + "/a.pdf", "--remove=5", "--merge=" + dir + "/after-error.pdf"}, c2);
    assert(code == QBatchJob::EXIT_ERROR);
    assert(c2.error.find("there is no entry at position 5") != std::string::npos);
    assert((page_widths(dir + "/after-error.pdf") == std::vector<int>{100, 200}));

    // Export failures are warnings.
    write_file(dir + "/garbage.pdf", "this is not a PDF file\n");
    Captured c3;
    code = run_job({dir + "/garbage.pdf", dir + "/c.jpg", "--export=" + dir + "/warn-export"}, c3);
    assert(code == QBatchJob::EXIT_WARNING);
    assert(c3.warn.find("garbage.pdf") != std::string::npos);
    assert((list_directory(dir + "/warn-export") == std::vector<std::string>{"002_c.jpg"}));

    // A failed merge is an error.
    Captured c4;
    code = run_job({dir + "/garbage.pdf", "--merge=" + dir + "/bad-merge.pdf"}, c4);
    assert(code == QBatchJob::EXIT_ERROR);
    assert(!qbatch::util::exists(dir + "/bad-merge.pdf"));
}

int
main()
{
    try {
        dir = scratch_dir("job");
        make_pdf(dir + "/a.pdf", {100, 200});
        make_pdf(dir + "/b.pdf", {300});
        make_jpg(dir + "/c.jpg", 20, 20);
        std::cout << "---- usage" << std::endl;
        test_usage();
        std::cout << "---- arguments" << std::endl;
        test_arguments();
        std::cout << "---- commands" << std::endl;
        test_commands();
        std::cout << "---- exit codes" << std::endl;
        test_exit_codes();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "job tests done" << std::endl;
    return 0;
}
