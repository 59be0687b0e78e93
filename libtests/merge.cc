#include <qbatch/assert_test.h>

#include "test_files.hh"

#include <qbatch/QBatch.hh>
#include <qbatch/QBatchMerger.hh>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <cstring>
#include <iostream>
#include <sys/stat.h>

using namespace test_files;

static std::string dir;

static void
check_no_output(std::string const& outfile)
{
    assert(!qbatch::util::exists(outfile));
    assert(!qbatch::util::exists(outfile + ".~qbatch-temp#"));
}

static qbatch_error_code_e
merge_error(QBatch const& batch, std::string const& outfile)
{
    QBatchMerger merger(batch.getEntries(), outfile);
    try {
        merger.run();
    } catch (QBatchExc& e) {
        std::cout << "  " << QBatchExc::errorCodeName(e.getErrorCode()) << ": " << e.what()
                  << std::endl;
        return e.getErrorCode();
    }
    return qbatch_e_success;
}

static void
test_normalize()
{
    assert(QBatchMerger::normalizeOutputFilename("out") == "out.pdf");
    assert(QBatchMerger::normalizeOutputFilename("out.PDF") == "out.PDF");
    assert(QBatchMerger::normalizeOutputFilename("out.jpg") == "out.pdf");
    assert(QBatchMerger::normalizeOutputFilename("dir.d/out") == "dir.d/out.pdf");
    try {
        QBatchMerger::normalizeOutputFilename(" ");
        assert(false);
    } catch (QBatchExc& e) {
        assert(e.getErrorCode() == qbatch_e_invalid_name);
    }
}

static void
test_pdf_order()
{
    QBatch batch;
    auto r = batch.addFiles({dir + "/a.pdf", dir + "/b.pdf"});
    batch.reorder(r.added.at(1), 0);

    std::vector<std::pair<size_t, size_t>> progress;
    QBatchMerger merger(batch.getEntries(), dir + "/ordered");
    merger.setProgressReporter(
        [&progress](size_t current, size_t total) { progress.emplace_back(current, total); });
    auto result = merger.run();
    std::string outfile = dir + "/ordered.pdf";
    assert(merger.getOutputFilename() == outfile);
    assert(result.status == qbatch_s_completed);
    assert(result.pages == 3);
    assert(result.failures.empty());
    assert((result.succeeded == std::vector<int>{r.added.at(1), r.added.at(0)}));
    assert((result.outputs == std::vector<std::string>{outfile}));
    assert((page_widths(outfile) == std::vector<int>{300, 100, 200}));
    assert(!qbatch::util::exists(outfile + ".~qbatch-temp#"));
    assert((progress ==
            std::vector<std::pair<size_t, size_t>>{{1, 3}, {2, 3}, {3, 3}}));

    // Changing the batch after creating an operation doesn't affect it.
    QBatchMerger snapshot(batch.getEntries(), dir + "/snapshot.pdf");
    batch.remove(r.added.at(0));
    assert(snapshot.run().pages == 3);
}

static void
test_mixed_kinds()
{
    QBatch batch;
    auto r = batch.addFiles({dir + "/a.pdf", dir + "/c.jpg", tiff_fixture(), dir + "/b.pdf"});
    assert(r.added.size() == 4);
    std::string outfile = dir + "/mixed.pdf";
    QBatchMerger merger(batch.getEntries(), outfile);
    auto result = merger.run();
    assert(result.status == qbatch_s_completed);
    assert(result.pages == 7);
    assert((page_widths(outfile) == std::vector<int>{100, 200, 60, 40, 20, 30, 300}));

    // The JPEG data is embedded without being decoded.
    QPDF pdf;
    pdf.processFile(outfile.c_str());
    auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
    auto images = pages.at(2).getImages();
    assert(images.size() == 1);
    auto image = images.begin()->second;
    assert(image.getDict().getKey("/Filter").isNameAndEquals("/DCTDecode"));
    assert(image.getDict().getKey("/Width").getIntValue() == 60);
    auto raw = image.getRawStreamData();
    std::string jpg = read_file(dir + "/c.jpg");
    assert(raw->getSize() == jpg.size());
    assert(memcmp(raw->getBuffer(), jpg.data(), jpg.size()) == 0);

    // TIFF frames are RGB images of their own size.
    images = pages.at(4).getImages();
    assert(images.size() == 1);
    image = images.begin()->second;
    assert(image.getDict().getKey("/ColorSpace").isNameAndEquals("/DeviceRGB"));
    assert(image.getDict().getKey("/Width").getIntValue() == 20);
    assert(image.getDict().getKey("/Height").getIntValue() == 20);
    auto samples = image.getStreamData();
    assert(samples->getSize() == 20 * 20 * 3);
    unsigned char const* green = samples->getBuffer();
    assert(green[0] == 0 && green[1] == 255 && green[2] == 0);
}

static void
test_failures()
{
    write_file(dir + "/garbage.pdf", "this is not a PDF file\n");
    write_file(dir + "/garbage.jpg", "this is not a JPEG file\n");
    write_file(dir + "/vanishing.pdf", read_file(dir + "/b.pdf"));

    QBatch empty;
    assert(merge_error(empty, dir + "/empty.pdf") == qbatch_e_not_found);
    check_no_output(dir + "/empty.pdf");

    QBatch batch;
    batch.addFiles({dir + "/a.pdf", dir + "/garbage.pdf"});
    assert(merge_error(batch, dir + "/corrupt.pdf") == qbatch_e_corrupt_source);
    check_no_output(dir + "/corrupt.pdf");

    QBatch jpg_batch;
    jpg_batch.addFiles({dir + "/garbage.jpg"});
    assert(merge_error(jpg_batch, dir + "/corrupt-jpg.pdf") == qbatch_e_corrupt_source);
    check_no_output(dir + "/corrupt-jpg.pdf");

    QBatch missing;
    missing.addFiles({dir + "/a.pdf", dir + "/vanishing.pdf"});
    QUtil::remove_file((dir + "/vanishing.pdf").c_str());
    QBatchMerger merger(missing.getEntries(), dir + "/missing.pdf");
    try {
        merger.run();
        assert(false);
    } catch (QBatchExc& e) {
        assert(e.getErrorCode() == qbatch_e_source_missing);
        assert(e.getEntry() == "vanishing.pdf");
    }
    check_no_output(dir + "/missing.pdf");

    // The output can't be created in a directory that doesn't exist.
    QBatch good;
    good.addFiles({dir + "/a.pdf"});
    std::string outfile = dir + "/no/such/dir/out.pdf";
    assert(merge_error(good, outfile) == qbatch_e_system);
    check_no_output(outfile);

    // Permission checks don't apply to root.
    if (geteuid() != 0) {
        std::string readonly = dir + "/readonly";
        qbatch::util::make_directories(readonly);
        QUtil::os_wrapper("chmod " + readonly, chmod(readonly.c_str(), 0555));
        outfile = readonly + "/out.pdf";
        auto code = merge_error(good, outfile);
        QUtil::os_wrapper("chmod " + readonly, chmod(readonly.c_str(), 0755));
        assert(code == qbatch_e_write_permission);
        check_no_output(outfile);
    }
}

static void
test_cancel()
{
    QBatch batch;
    batch.addFiles({dir + "/a.pdf", dir + "/b.pdf", dir + "/c.jpg"});
    std::string outfile = dir + "/existing.pdf";
    write_file(outfile, "previous contents\n");

    QBatchMerger merger(batch.getEntries(), outfile);
    size_t calls = 0;
    merger.setProgressReporter([&merger, &calls](size_t, size_t) {
        ++calls;
        merger.cancel();
    });
    auto result = merger.run();
    assert(result.status == qbatch_s_cancelled);
    assert(calls == 1);
    assert(result.outputs.empty());
    assert(read_file(outfile) == "previous contents\n");
    assert(!qbatch::util::exists(outfile + ".~qbatch-temp#"));

    // Cancelled before starting
    QBatchMerger early(batch.getEntries(), dir + "/early.pdf");
    early.cancel();
    assert(early.isCancelled());
    assert(early.run().status == qbatch_s_cancelled);
    check_no_output(dir + "/early.pdf");

    // A failure leaves an existing output file alone too.
    write_file(dir + "/garbage.pdf", "this is not a PDF file\n");
    QBatch bad;
    bad.addFiles({dir + "/a.pdf", dir + "/garbage.pdf"});
    assert(merge_error(bad, outfile) == qbatch_e_corrupt_source);
    assert(read_file(outfile) == "previous contents\n");
}

int
main()
{
    try {
        dir = scratch_dir("merge");
        make_pdf(dir + "/a.pdf", {100, 200});
        make_pdf(dir + "/b.pdf", {300});
        make_jpg(dir + "/c.jpg", 60, 40);
        std::cout << "---- normalize" << std::endl;
        test_normalize();
        std::cout << "---- pdf order" << std::endl;
        test_pdf_order();
        std::cout << "---- mixed kinds" << std::endl;
        test_mixed_kinds();
        std::cout << "---- failures" << std::endl;
        test_failures();
        std::cout << "---- cancel" << std::endl;
        test_cancel();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "merge tests done" << std::endl;
    return 0;
}
