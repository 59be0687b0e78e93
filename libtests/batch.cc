#include <qbatch/assert_test.h>

#include "test_files.hh"

#include <qbatch/QBatch.hh>

#include <iostream>

using namespace test_files;

static std::string dir;

static std::string
touch(std::string const& name)
{
    std::string path = dir + "/" + name;
    write_file(path, "not really a document\n");
    return path;
}

static std::vector<std::string>
names(QBatch const& batch)
{
    std::vector<std::string> result;
    for (auto const& entry: batch.getEntries()) {
        result.push_back(entry.getDisplayName());
    }
    return result;
}

static void
check_positions(QBatch const& batch)
{
    size_t expected = 0;
    for (auto const& entry: batch.getEntries()) {
        assert(entry.getPosition() == expected);
        ++expected;
    }
    assert(expected == batch.size());
}

static qbatch_error_code_e
error_of(std::function<void()> fn)
{
    try {
        fn();
    } catch (QBatchExc& e) {
        std::cout << "  " << QBatchExc::errorCodeName(e.getErrorCode()) << ": " << e.what()
                  << std::endl;
        return e.getErrorCode();
    }
    return qbatch_e_success;
}

static void
test_add()
{
    QBatch batch;
    auto a = touch("a.pdf");
    auto b = touch("b.TIFF");
    auto c = touch("c.jpeg");
    auto d = touch("d.tif");
    auto r = batch.addFiles({a, b, c, d});
    assert(r.added.size() == 4);
    assert(r.rejected.empty() && r.skipped.empty());
    assert(batch.size() == 4);
    check_positions(batch);
    assert(batch.getEntry(r.added.at(0)).getKind() == qbatch_k_pdf);
    assert(batch.getEntry(r.added.at(1)).getKind() == qbatch_k_tiff);
    assert(batch.getEntry(r.added.at(2)).getKind() == qbatch_k_jpg);
    assert(batch.getEntry(r.added.at(3)).getKind() == qbatch_k_tiff);
    assert((names(batch) == std::vector<std::string>{"a.pdf", "b.TIFF", "c.jpeg", "d.tif"}));
    assert(batch.getEntry(r.added.at(0)).getSourcePath() == qbatch::util::absolute_path(a));

    // Rejected and skipped files don't prevent others from being added.
    auto e = touch("e.png");
    auto f = touch("f.pdf");
    r = batch.addFiles({e, dir + "/missing.pdf", a, f});
    assert(r.added.size() == 1);
    assert(r.rejected.size() == 2);
    assert(r.rejected.at(0).getErrorCode() == qbatch_e_unsupported_format);
    assert(r.rejected.at(1).getErrorCode() == qbatch_e_source_missing);
    assert((r.skipped == std::vector<std::string>{a}));
    assert(batch.size() == 5);
    assert(batch.getEntries().back().getDisplayName() == "f.pdf");
    check_positions(batch);

    // A directory is not a readable file.
    r = batch.addFiles({dir + "/sub.pdf"});
    assert(r.rejected.size() == 1);
    assert(r.rejected.at(0).getErrorCode() == qbatch_e_source_missing);
}

static void
test_unique_names()
{
    QBatch batch;
    qbatch::util::make_directories(dir + "/one");
    qbatch::util::make_directories(dir + "/two");
    qbatch::util::make_directories(dir + "/three");
    auto r = batch.addFiles(
        {touch("one/report.pdf"), touch("two/report.pdf"), touch("three/REPORT.pdf")});
    assert(r.added.size() == 3);
    assert(
        (names(batch) ==
         std::vector<std::string>{"report.pdf", "report_1.pdf", "REPORT_2.pdf"}));
    assert(batch.findByName("Report_1.PDF")->getId() == r.added.at(1));
    assert(batch.findByName("nothing.pdf") == nullptr);
}

static void
test_reorder_remove()
{
    QBatch batch;
    auto r = batch.addFiles({touch("a.pdf"), touch("b.pdf"), touch("c.pdf"), touch("d.pdf")});
    int a = r.added.at(0);
    int c = r.added.at(2);
    int d = r.added.at(3);

    batch.reorder(d, 0);
    assert((names(batch) == std::vector<std::string>{"d.pdf", "a.pdf", "b.pdf", "c.pdf"}));
    check_positions(batch);
    batch.reorder(d, 3);
    assert((names(batch) == std::vector<std::string>{"a.pdf", "b.pdf", "c.pdf", "d.pdf"}));
    batch.reorder(a, 2);
    assert((names(batch) == std::vector<std::string>{"b.pdf", "c.pdf", "a.pdf", "d.pdf"}));

    batch.remove(c);
    assert((names(batch) == std::vector<std::string>{"b.pdf", "a.pdf", "d.pdf"}));
    check_positions(batch);
    assert(batch.getEntry(a).getPosition() == 1);
    assert(!batch.contains(c));

    assert(error_of([&]() { batch.reorder(a, 3); }) == qbatch_e_out_of_range);
    assert(error_of([&]() { batch.reorder(a, -1); }) == qbatch_e_out_of_range);
    assert(error_of([&]() { batch.reorder(c, 0); }) == qbatch_e_not_found);
    assert(error_of([&]() { batch.remove(c); }) == qbatch_e_not_found);
    assert(error_of([&]() { batch.getEntry(99); }) == qbatch_e_not_found);
    assert((names(batch) == std::vector<std::string>{"b.pdf", "a.pdf", "d.pdf"}));

    // Ids are not reused.
    r = batch.addFiles({touch("e.pdf")});
    assert(r.added.at(0) == 5);
}

static void
test_rename()
{
    QBatch batch;
    auto r = batch.addFiles({touch("a.pdf"), touch("b.pdf"), touch("c.tif")});
    int a = r.added.at(0);
    int c = r.added.at(2);

    assert(error_of([&]() { batch.rename(a, "B.PDF"); }) == qbatch_e_duplicate_name);
    assert(error_of([&]() { batch.rename(a, "b"); }) == qbatch_e_duplicate_name);
    assert(error_of([&]() { batch.rename(a, "   "); }) == qbatch_e_invalid_name);
    assert(error_of([&]() { batch.rename(a, "x/y.pdf"); }) == qbatch_e_invalid_name);
    assert(error_of([&]() { batch.rename(a, "a.jpg"); }) == qbatch_e_unsupported_format);
    assert(error_of([&]() { batch.rename(a, "a.txt"); }) == qbatch_e_unsupported_format);
    assert(error_of([&]() { batch.rename(99, "z.pdf"); }) == qbatch_e_not_found);
    assert((names(batch) == std::vector<std::string>{"a.pdf", "b.pdf", "c.tif"}));

    batch.rename(a, "  first page ");
    assert(batch.getEntry(a).getDisplayName() == "first page.pdf");
    batch.rename(a, "First Page.PDF");
    assert(batch.getEntry(a).getDisplayName() == "First Page.PDF");
    batch.rename(c, "scan.tiff");
    assert(batch.getEntry(c).getDisplayName() == "scan.tiff");
    assert(batch.getEntry(c).getKind() == qbatch_k_tiff);
}

static void
test_move_entries()
{
    QBatch batch;
    auto r = batch.addFiles({touch("a.pdf"), touch("b.pdf"), touch("c.pdf"), touch("d.pdf")});
    int a = r.added.at(0);
    int b = r.added.at(1);
    int c = r.added.at(2);
    int d = r.added.at(3);

    batch.moveEntries({c, b}, -1);
    assert((names(batch) == std::vector<std::string>{"b.pdf", "c.pdf", "a.pdf", "d.pdf"}));
    batch.moveEntries({b, c}, -1);
    // b is already at the top; c moves into its place.
    assert((names(batch) == std::vector<std::string>{"c.pdf", "b.pdf", "a.pdf", "d.pdf"}));
    batch.moveEntries({a, d}, 1);
    assert((names(batch) == std::vector<std::string>{"c.pdf", "b.pdf", "d.pdf", "a.pdf"}));
    batch.moveEntries({c}, 2);
    assert((names(batch) == std::vector<std::string>{"b.pdf", "d.pdf", "c.pdf", "a.pdf"}));
    check_positions(batch);

    assert(error_of([&]() { batch.moveEntries({a, 99}, -1); }) == qbatch_e_not_found);
    assert((names(batch) == std::vector<std::string>{"b.pdf", "d.pdf", "c.pdf", "a.pdf"}));
}

static void
test_events()
{
    QBatch batch;
    std::vector<QBatchEvent> events;
    batch.setChangeHandler([&events](QBatchEvent const& e) { events.push_back(e); });
    auto r = batch.addFiles({touch("a.pdf"), touch("b.pdf")});
    int a = r.added.at(0);
    int b = r.added.at(1);
    assert(events.size() == 2);
    assert(events.at(0).type == QBatchEvent::ev_added && events.at(0).entry_id == a);
    assert(events.at(1).new_position == 1);

    batch.reorder(b, 0);
    assert(events.size() == 3);
    assert(events.at(2).type == QBatchEvent::ev_moved);
    assert(events.at(2).old_position == 1 && events.at(2).new_position == 0);

    batch.reorder(b, 0);
    batch.rename(a, "a.pdf");
    assert(events.size() == 3);

    batch.rename(a, "z");
    assert(events.size() == 4);
    assert(events.at(3).type == QBatchEvent::ev_renamed);
    assert(events.at(3).old_name == "a.pdf" && events.at(3).new_name == "z.pdf");

    error_of([&]() { batch.rename(a, "b.pdf"); });
    assert(events.size() == 4);

    batch.remove(b);
    assert(events.size() == 5);
    assert(events.at(4).type == QBatchEvent::ev_removed && events.at(4).entry_id == b);
}

static void
test_lock()
{
    QBatch batch;
    auto r = batch.addFiles({touch("a.pdf"), touch("b.pdf")});
    int a = r.added.at(0);
    batch.lock();
    assert(batch.isLocked());
    assert(error_of([&]() { batch.addFiles({touch("c.pdf")}); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { batch.remove(a); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { batch.reorder(a, 1); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { batch.rename(a, "x.pdf"); }) == qbatch_e_batch_locked);
    assert(error_of([&]() { batch.moveEntries({a}, 1); }) == qbatch_e_batch_locked);
    assert(batch.size() == 2);
    batch.unlock();
    batch.reorder(a, 1);
    assert(batch.getEntry(a).getPosition() == 1);
}

int
main()
{
    try {
        dir = scratch_dir("batch");
        qbatch::util::make_directories(dir + "/sub.pdf");
        std::cout << "---- add" << std::endl;
        test_add();
        std::cout << "---- unique names" << std::endl;
        test_unique_names();
        std::cout << "---- reorder/remove" << std::endl;
        test_reorder_remove();
        std::cout << "---- rename" << std::endl;
        test_rename();
        std::cout << "---- move entries" << std::endl;
        test_move_entries();
        std::cout << "---- events" << std::endl;
        test_events();
        std::cout << "---- lock" << std::endl;
        test_lock();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "batch tests done" << std::endl;
    return 0;
}
