#include <qbatch/assert_test.h>

#include "test_files.hh"

#include <qbatch/QBatch.hh>
#include <qbatch/QBatchExporter.hh>

#include <qpdf/Pl_DCT.hh>
#include <qpdf/Pl_String.hh>

#include <iostream>
#include <sys/stat.h>

using namespace test_files;

static std::string dir;

// Number of bytes of RGB samples in a JPEG file
static size_t
decoded_size(std::string const& path)
{
    std::string samples;
    Pl_String ps("samples", nullptr, samples);
    Pl_DCT dct("decode", &ps);
    dct.writeString(read_file(path));
    dct.finish();
    return samples.size();
}

static void
test_names()
{
    QBatch batch;
    auto r = batch.addFiles({dir + "/a3.pdf", dir + "/c.jpg"});
    std::string out = dir + "/names";
    QBatchExporter::Options options;
    options.dpi = 72;
    QBatchExporter exporter(batch.getEntries(), out, options);
    std::vector<std::pair<size_t, size_t>> progress;
    exporter.setProgressReporter(
        [&progress](size_t current, size_t total) { progress.emplace_back(current, total); });
    auto result = exporter.run();
    assert(result.status == qbatch_s_completed);
    assert(result.failures.empty());
    assert(result.pages == 4);
    assert(result.succeeded == r.added);
    assert(
        (list_directory(out) ==
         std::vector<std::string>{
             "001_a3_001.jpg", "001_a3_002.jpg", "001_a3_003.jpg", "002_c.jpg"}));
    assert(result.outputs.size() == 4);
    assert(result.outputs.at(0) == out + "/001_a3_001.jpg");
    assert(result.outputs.at(3) == out + "/002_c.jpg");
    assert((progress == std::vector<std::pair<size_t, size_t>>{{1, 2}, {2, 2}}));

    // Pages are rendered at the requested resolution; JPG files are copied.
    assert(decoded_size(out + "/001_a3_001.jpg") == 100 * 792 * 3);
    assert(decoded_size(out + "/001_a3_003.jpg") == 300 * 792 * 3);
    assert(read_file(out + "/002_c.jpg") == read_file(dir + "/c.jpg"));

    options.dpi = 36;
    QBatchExporter low(batch.getEntries(), dir + "/low", options);
    low.run();
    assert(decoded_size(dir + "/low/001_a3_002.jpg") == 100 * 396 * 3);

    // Display names, not file names, are used for output names.
    batch.rename(r.added.at(1), "cover");
    batch.reorder(r.added.at(1), 0);
    QBatchExporter renamed(batch.getEntries(), dir + "/renamed");
    renamed.run();
    assert(
        (list_directory(dir + "/renamed") ==
         std::vector<std::string>{
             "001_cover.jpg", "002_a3_001.jpg", "002_a3_002.jpg", "002_a3_003.jpg"}));
}

static void
test_tiff()
{
    QBatch batch;
    batch.addFiles({tiff_fixture()});
    std::string out = dir + "/tiff";
    QBatchExporter exporter(batch.getEntries(), out);
    auto result = exporter.run();
    assert(result.pages == 3);
    assert(
        (list_directory(out) ==
         std::vector<std::string>{
             "001_three-frames_001.jpg", "001_three-frames_002.jpg", "001_three-frames_003.jpg"}));
    assert(decoded_size(out + "/001_three-frames_001.jpg") == 40 * 30 * 3);
    assert(decoded_size(out + "/001_three-frames_003.jpg") == 30 * 10 * 3);
}

static void
test_collisions()
{
    QBatch batch;
    batch.addFiles({dir + "/c.jpg", dir + "/b.pdf"});
    std::string out = dir + "/collide";
    QBatchExporter first(batch.getEntries(), out);
    first.run();
    QBatchExporter second(batch.getEntries(), out);
    auto result = second.run();
    assert(
        (result.outputs ==
         std::vector<std::string>{out + "/001_c_1.jpg", out + "/002_b_001_1.jpg"}));
    assert(
        (list_directory(out) ==
         std::vector<std::string>{"001_c.jpg", "001_c_1.jpg", "002_b_001.jpg", "002_b_001_1.jpg"}));

    QBatchExporter::Options options;
    options.collision = qbatch_c_overwrite;
    QBatchExporter third(batch.getEntries(), out, options);
    result = third.run();
    assert(
        (result.outputs ==
         std::vector<std::string>{out + "/001_c.jpg", out + "/002_b_001.jpg"}));
    assert(list_directory(out).size() == 4);
}

static void
test_failures()
{
    write_file(dir + "/garbage.pdf", "this is not a PDF file\n");
    write_file(dir + "/vanishing.tif", read_file(tiff_fixture()));

    QBatch batch;
    auto r = batch.addFiles({dir + "/garbage.pdf", dir + "/c.jpg", dir + "/vanishing.tif"});
    QUtil::remove_file((dir + "/vanishing.tif").c_str());
    std::string out = dir + "/partial";
    QBatchExporter exporter(batch.getEntries(), out);
    auto result = exporter.run();
    assert(result.status == qbatch_s_completed);
    assert((result.succeeded == std::vector<int>{r.added.at(1)}));
    assert(result.failures.size() == 2);
    assert(result.failures.at(0).getErrorCode() == qbatch_e_corrupt_source);
    assert(result.failures.at(0).getEntry() == "garbage.pdf");
    assert(result.failures.at(1).getErrorCode() == qbatch_e_source_missing);
    assert(result.failures.at(1).getEntry() == "vanishing.tif");
    assert((list_directory(out) == std::vector<std::string>{"002_c.jpg"}));

    // Fatal errors
    QBatch empty;
    try {
        QBatchExporter(empty.getEntries(), dir + "/empty").run();
        assert(false);
    } catch (QBatchExc& e) {
        assert(e.getErrorCode() == qbatch_e_not_found);
    }

    QBatch good;
    good.addFiles({dir + "/c.jpg"});
    write_file(dir + "/plain-file", "not a directory\n");
    try {
        QBatchExporter(good.getEntries(), dir + "/plain-file").run();
        assert(false);
    } catch (QBatchExc& e) {
        std::cout << "  " << e.what() << std::endl;
        assert(e.getErrorCode() == qbatch_e_system);
    }

    QBatchExporter::Options options;
    options.dpi = 0;
    try {
        QBatchExporter(good.getEntries(), dir + "/x", options);
        assert(false);
    } catch (QBatchExc& e) {
        assert(e.getErrorCode() == qbatch_e_out_of_range);
    }
    options.dpi = 200;
    options.quality = 101;
    try {
        QBatchExporter(good.getEntries(), dir + "/x", options);
        assert(false);
    } catch (QBatchExc& e) {
        assert(e.getErrorCode() == qbatch_e_out_of_range);
    }

    // Permission checks don't apply to root.
    if (geteuid() != 0) {
        std::string readonly = dir + "/readonly";
        qbatch::util::make_directories(readonly);
        QUtil::os_wrapper("chmod " + readonly, chmod(readonly.c_str(), 0555));
        auto denied = QBatchExporter(good.getEntries(), readonly).run();
        QUtil::os_wrapper("chmod " + readonly, chmod(readonly.c_str(), 0755));
        assert(denied.status == qbatch_s_completed);
        assert(denied.succeeded.empty());
        assert(denied.failures.size() == 1);
        assert(denied.failures.at(0).getErrorCode() == qbatch_e_write_permission);
        assert(list_directory(readonly).empty());
    }

    // Parent directories are created.
    QBatchExporter nested(good.getEntries(), dir + "/nested/deeper");
    nested.run();
    assert((list_directory(dir + "/nested/deeper") == std::vector<std::string>{"001_c.jpg"}));
}

static void
test_cancel()
{
    QBatch batch;
    batch.addFiles({dir + "/a3.pdf", dir + "/c.jpg", tiff_fixture()});
    std::string out = dir + "/cancel";
    QBatchExporter exporter(batch.getEntries(), out);
    size_t calls = 0;
    exporter.setProgressReporter([&exporter, &calls](size_t current, size_t) {
        ++calls;
        if (current == 1) {
            exporter.cancel();
        }
    });
    auto result = exporter.run();
    assert(result.status == qbatch_s_cancelled);
    assert(calls == 1);
    assert(result.succeeded.size() == 1);
    assert(
        (list_directory(out) ==
         std::vector<std::string>{"001_a3_001.jpg", "001_a3_002.jpg", "001_a3_003.jpg"}));

    // Cancelled before starting: nothing is written, not even the directory.
    QBatchExporter early(batch.getEntries(), dir + "/early");
    early.cancel();
    result = early.run();
    assert(result.status == qbatch_s_cancelled);
    assert(result.succeeded.empty());
    assert(result.outputs.empty());
    assert(!qbatch::util::exists(dir + "/early"));
}

int
main()
{
    try {
        dir = scratch_dir("jpg_export");
        make_pdf(dir + "/a3.pdf", {100, 200, 300});
        make_pdf(dir + "/b.pdf", {50});
        make_jpg(dir + "/c.jpg", 60, 40);
        std::cout << "---- names" << std::endl;
        test_names();
        std::cout << "---- tiff" << std::endl;
        test_tiff();
        std::cout << "---- collisions" << std::endl;
        test_collisions();
        std::cout << "---- failures" << std::endl;
        test_failures();
        std::cout << "---- cancel" << std::endl;
        test_cancel();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "jpg export tests done" << std::endl;
    return 0;
}
