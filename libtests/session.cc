#include <qbatch/assert_test.h>

#include "test_files.hh"

#include <qbatch/QBatchSession.hh>

#include <qpdf/Pl_String.hh>

#include <chrono>
#include <future>
#include <iostream>
#include <thread>

using namespace test_files;

static std::string dir;

namespace
{
    // An operation that waits until the test releases it so that the test controls what happens
    // while it is in flight.
    class GateOperation: public QBatchOperation
    {
      public:
        GateOperation(std::vector<QBatchEntry> const& entries) :
            QBatchOperation(entries),
            release_future(release.get_future())
        {
        }
        ~GateOperation() override = default;

        QBatchResult
        run() override
        {
            getLogger()->info("gate: started\n");
            doIfVerbose([](Pipeline& v, std::string const& prefix) {
                v << prefix << ": verbose from worker\n";
            });
            reportProgress(0, 1);
            if (wait_for_cancel) {
                for (int i = 0; i < 10000 && !isCancelled(); ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                saw_cancel = isCancelled();
            } else {
                release_future.wait();
            }
            if (fail) {
                throw std::runtime_error("gate failed");
            }
            QBatchResult result;
            if (isCancelled()) {
                result.status = qbatch_s_cancelled;
            } else {
                for (auto const& entry: getEntries()) {
                    result.succeeded.push_back(entry.getId());
                }
                getLogger()->warn("gate: finished\n");
                reportProgress(1, 1);
            }
            finished.set_value();
            return result;
        }

        std::string
        getDescription() const override
        {
            return "gate";
        }

        std::promise<void> release;
        std::future<void> release_future;
        std::promise<void> finished;
        bool fail{false};
        bool wait_for_cancel{false};
        bool saw_cancel{false};
    };

    struct Captured
    {
        std::string info;
        std::string warn;
        std::string error;
    };
} // namespace

static std::shared_ptr<QPDFLogger>
capture(Captured& c)
{
    auto log = QPDFLogger::create();
    log->setInfo(std::make_shared<Pl_String>("info", nullptr, c.info));
    log->setWarn(std::make_shared<Pl_String>("warn", nullptr, c.warn));
    log->setError(std::make_shared<Pl_String>("error", nullptr, c.error));
    return log;
}

static qbatch_error_code_e
error_of(std::function<void()> fn)
{
    try {
        fn();
    } catch (QBatchExc& e) {
        return e.getErrorCode();
    }
    return qbatch_e_success;
}

static void
test_merge()
{
    Captured c;
    QBatchSession session;
    session.setLogger(capture(c));
    auto r = session.addFiles({dir + "/a.pdf", dir + "/b.pdf", dir + "/x.doc", dir + "/a.pdf"});
    assert(r.added.size() == 2);
    assert(c.warn.find("x.doc") != std::string::npos);
    assert(c.warn.find("already in the batch") != std::string::npos);

    std::vector<std::pair<size_t, size_t>> progress;
    int completions = 0;
    session.setProgressHandler(
        [&progress](size_t current, size_t total) { progress.emplace_back(current, total); });
    session.setCompletionHandler([&completions, &session](QBatchResult const& result) {
        ++completions;
        assert(result.status == qbatch_s_completed);
        assert(!session.getBatch().isLocked());
    });
    session.startMerge(dir + "/merged");
    assert(session.isRunning());
    assert(session.getBatch().isLocked());
    auto result = session.wait();
    assert(!session.isRunning());
    assert(!session.getBatch().isLocked());
    assert(completions == 1);
    assert(result.pages == 3);
    assert((page_widths(dir + "/merged.pdf") == std::vector<int>{100, 200, 300}));
    assert((progress == std::vector<std::pair<size_t, size_t>>{{1, 3}, {2, 3}, {3, 3}}));

    progress.clear();
    session.startExport(dir + "/exported", QBatchExporter::Options());
    result = session.wait();
    assert(completions == 2);
    assert(result.pages == 3);
    assert((progress == std::vector<std::pair<size_t, size_t>>{{1, 2}, {2, 2}}));
    assert(list_directory(dir + "/exported").size() == 3);
}

static void
test_locking()
{
    Captured c;
    QBatchSession session;
    session.setLogger(capture(c));
    session.setVerbose(true);
    session.setMessagePrefix("session-test");
    auto r = session.addFiles({dir + "/a.pdf", dir + "/b.pdf"});
    QBatch& batch = session.getBatch();

    auto op = std::make_shared<GateOperation>(batch.getEntries());
    std::vector<size_t> progress;
    session.setProgressHandler(
        [&progress](size_t current, size_t) { progress.push_back(current); });
    session.start(op);
    assert(batch.isLocked());
    assert(error_of([&]() { batch.remove(r.added.at(0)); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { batch.reorder(r.added.at(0), 1); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { batch.rename(r.added.at(0), "n"); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { session.addFiles({dir + "/c.jpg"}); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { session.startMerge(dir + "/other.pdf"); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { session.startExport(dir + "/other"); }) == qbatch_e_batch_locked);
    assert(batch.size() == 2);

    // The operation has finished, but the batch stays locked until its completion is delivered.
    op->release.set_value();
    op->finished.get_future().wait();
    assert(batch.isLocked());
    assert(session.isRunning());
    while (session.isRunning()) {
        session.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(!batch.isLocked());
    assert((progress == std::vector<size_t>{0, 1}));
    assert(c.info.find("gate: started\n") != std::string::npos);
    assert(c.info.find("session-test: verbose from worker\n") != std::string::npos);
    assert(c.warn.find("gate: finished\n") != std::string::npos);

    batch.reorder(r.added.at(0), 1);
    assert(batch.getEntry(r.added.at(0)).getPosition() == 1);
    try {
        session.wait();
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "  wait: " << e.what() << std::endl;
    }
}

static void
test_cancel_and_failure()
{
    Captured c;
    QBatchSession session;
    session.setLogger(capture(c));
    session.addFiles({dir + "/a.pdf"});

    auto op = std::make_shared<GateOperation>(session.getBatch().getEntries());
    session.start(op);
    session.cancel();
    op->release.set_value();
    auto result = session.wait();
    assert(result.status == qbatch_s_cancelled);
    assert(!session.getBatch().isLocked());

    auto failing = std::make_shared<GateOperation>(session.getBatch().getEntries());
    failing->fail = true;
    session.start(failing);
    failing->release.set_value();
    result = session.wait();
    assert(result.status == qbatch_s_failed);
    assert(result.failures.size() == 1);
    assert(result.failures.at(0).getErrorCode() == qbatch_e_internal);
    assert(c.error.find("gate failed") != std::string::npos);

    write_file(dir + "/garbage.pdf", "this is not a PDF file\n");
    session.addFiles({dir + "/garbage.pdf"});
    session.startMerge(dir + "/failed.pdf");
    result = session.wait();
    assert(result.status == qbatch_s_failed);
    assert(result.failures.at(0).getErrorCode() == qbatch_e_corrupt_source);
    assert(result.failures.at(0).getEntry() == "garbage.pdf");
    assert(c.error.find("merge into " + dir + "/failed.pdf failed") != std::string::npos);
    assert(!qbatch::util::exists(dir + "/failed.pdf"));
}

static void
test_destroy_running()
{
    auto op = std::shared_ptr<GateOperation>();
    {
        Captured c;
        QBatchSession session;
        session.setLogger(capture(c));
        session.addFiles({dir + "/a.pdf"});
        op = std::make_shared<GateOperation>(session.getBatch().getEntries());
        op->wait_for_cancel = true;
        session.start(op);
    }
    assert(op->saw_cancel);
}

int
main()
{
    try {
        dir = scratch_dir("session");
        make_pdf(dir + "/a.pdf", {100, 200});
        make_pdf(dir + "/b.pdf", {300});
        make_jpg(dir + "/c.jpg", 20, 20);
        write_file(dir + "/x.doc", "not supported\n");
        std::cout << "---- merge and export" << std::endl;
        test_merge();
        std::cout << "---- locking" << std::endl;
        test_locking();
        std::cout << "---- cancel and failure" << std::endl;
        test_cancel_and_failure();
        std::cout << "---- destroy while running" << std::endl;
        test_destroy_running();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "session tests done" << std::endl;
    return 0;
}
