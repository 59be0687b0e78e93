#ifndef QBATCH_TEST_FILES_HH
#define QBATCH_TEST_FILES_HH

// Helpers for creating input files and inspecting output files in the libqbatch tests. Every
// test works in its own scratch directory under the current directory.

#include <qbatch/Util.hh>

#include <qpdf/Pl_DCT.hh>
#include <qpdf/Pl_StdioFile.hh>
#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <dirent.h>
#include <unistd.h>
#include <string>
#include <vector>

#ifndef QBATCH_TEST_DATA
# define QBATCH_TEST_DATA "qtest/batch"
#endif

namespace test_files
{
    inline std::vector<std::string>
    list_directory(std::string const& dir)
    {
        std::vector<std::string> result;
        DIR* d = opendir(dir.c_str());
        if (d == nullptr) {
            return result;
        }
        while (struct dirent* e = readdir(d)) {
            std::string name = e->d_name;
            if (name != "." && name != "..") {
                result.push_back(name);
            }
        }
        closedir(d);
        std::sort(result.begin(), result.end());
        return result;
    }

    inline void
    remove_contents(std::string const& dir)
    {
        for (auto const& file: list_directory(dir)) {
            std::string path = dir + "/" + file;
            if (qbatch::util::is_directory(path)) {
                remove_contents(path);
                QUtil::os_wrapper("remove " + path, rmdir(path.c_str()));
            } else {
                QUtil::remove_file(path.c_str());
            }
        }
    }

    // Create an empty directory for a test, removing anything left from an earlier run.
    inline std::string
    scratch_dir(std::string const& name)
    {
        std::string dir = "test-output/" + name;
        if (qbatch::util::is_directory(dir)) {
            remove_contents(dir);
        }
        qbatch::util::make_directories(dir);
        return dir;
    }

    inline void
    write_file(std::string const& path, std::string const& data)
    {
        QUtil::FileCloser fc(QUtil::safe_fopen(path.c_str(), "wb"));
        Pl_StdioFile out("test file", fc.f);
        out.writeString(data);
        out.finish();
    }

    inline std::string
    read_file(std::string const& path)
    {
        std::string data;
        Pl_String ps("test file", nullptr, data);
        QUtil::pipe_file(path.c_str(), &ps);
        return data;
    }

    // Write a PDF file with one page for each width. Pages are 792 points high.
    inline void
    make_pdf(std::string const& path, std::vector<int> const& widths)
    {
        QPDF pdf;
        pdf.emptyPDF();
        QPDFPageDocumentHelper dh(pdf);
        for (int width: widths) {
            auto page = pdf.makeIndirectObject("<< /Type /Page /Resources << >> >>"_qpdf);
            page.replaceKey(
                "/MediaBox",
                QPDFObjectHandle::newFromRectangle(QPDFObjectHandle::Rectangle(0, 0, width, 792)));
            page.replaceKey("/Contents", pdf.newStream("0 0 1 rg 10 10 50 50 re f\n"));
            dh.addPage(page, false);
        }
        QPDFWriter w(pdf, path.c_str());
        w.setStaticID(true);
        w.write();
    }

    // Write a solid-color RGB JPEG file.
    inline void
    make_jpg(std::string const& path, unsigned int width, unsigned int height)
    {
        std::string samples;
        for (unsigned int i = 0; i < width * height; ++i) {
            samples += "\xc0\x40\x20";
        }
        QUtil::FileCloser fc(QUtil::safe_fopen(path.c_str(), "wb"));
        Pl_StdioFile out("jpg file", fc.f);
        Pl_DCT dct("jpg encoder", &out, width, height, 3, JCS_RGB);
        dct.write(reinterpret_cast<unsigned char const*>(samples.data()), samples.size());
        dct.finish();
    }

    // MediaBox widths of the pages of a PDF file
    inline std::vector<int>
    page_widths(std::string const& path)
    {
        QPDF pdf;
        pdf.processFile(path.c_str());
        std::vector<int> result;
        for (auto& page: QPDFPageDocumentHelper(pdf).getAllPages()) {
            auto box = page.getMediaBox().getArrayAsRectangle();
            result.push_back(static_cast<int>(box.urx - box.llx + 0.5));
        }
        return result;
    }

    inline std::string
    tiff_fixture()
    {
        return std::string(QBATCH_TEST_DATA) + "/three-frames.tif";
    }
} // namespace test_files

#endif // QBATCH_TEST_FILES_HH
