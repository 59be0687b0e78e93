#include <qbatch/QBatchJob.hh>
#include <qbatch/QBatchUsage.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

static char const* whoami = nullptr;

static void
usageExit(std::string const& msg)
{
    std::cerr << "\n"
              << whoami << ": " << msg << "\n"
              << "\n"
              << "For help:\n"
              << "  " << whoami << " --help\n"
              << "\n";
    exit(QBatchJob::EXIT_ERROR);
}

int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);
    QUtil::setLineBuf(stdout);

    // Remove prefix added by libtool for consistency during testing.
    if (strncmp(whoami, "lt-", 3) == 0) {
        whoami += 3;
    }

    QBatchJob j;
    j.setMessagePrefix(whoami);
    try {
        j.initializeFromArgv(argv);
        j.run();
    } catch (QBatchUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << "\n";
        return QBatchJob::EXIT_ERROR;
    }
    return j.getExitCode();
}

#ifdef WINDOWS_WMAIN

extern "C" int
wmain(int argc, wchar_t* argv[])
{
    return QUtil::call_main_from_wmain(argc, argv, realmain);
}

#else

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}

#endif
