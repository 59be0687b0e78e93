#include <qbatch/QBatchMerger.hh>

#include <qbatch/JPEGInfo.hh>
#include <qbatch/Rasterizer.hh>
#include <qbatch/Util.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QIntC.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFSystemError.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

using namespace qbatch;

class QBatchMerger::Members
{
  public:
    Members(std::string const& outfile) :
        outfile(outfile)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::string outfile;
    // Source files must stay open until the output has been written since page content is
    // copied from them during the write.
    std::vector<std::unique_ptr<QPDF>> page_heap;
};

QBatchMerger::QBatchMerger(std::vector<QBatchEntry> const& entries, std::string const& outfile) :
    QBatchOperation(entries),
    m(std::make_unique<Members>(normalizeOutputFilename(outfile)))
{
}

QBatchMerger::~QBatchMerger() = default;

std::string
QBatchMerger::normalizeOutputFilename(std::string const& filename)
{
    std::string result = util::trim(filename);
    if (result.empty()) {
        throw QBatchExc(qbatch_e_invalid_name, "", "", "output file name is empty");
    }
    std::string ext = util::path_extension(result);
    if (ext == ".pdf") {
        return result;
    }
    return result.substr(0, result.size() - ext.size()) + ".pdf";
}

std::string const&
QBatchMerger::getOutputFilename() const
{
    return m->outfile;
}

std::string
QBatchMerger::getDescription() const
{
    return "merge into " + m->outfile;
}

// Add a page that shows image scaled to width by height points.
static void
add_image_page(QPDF& pdf, QPDFObjectHandle image, double width, double height)
{
    std::string w = QUtil::double_to_string(width, 4);
    std::string h = QUtil::double_to_string(height, 4);
    QPDFObjectHandle contents = pdf.newStream("q " + w + " 0 0 " + h + " 0 0 cm /Im1 Do Q\n");

    QPDFObjectHandle xobject = QPDFObjectHandle::newDictionary();
    xobject.replaceKey("/Im1", image);
    QPDFObjectHandle resources = "<< /ProcSet [/PDF /ImageB /ImageC] >>"_qpdf;
    resources.replaceKey("/XObject", xobject);

    QPDFObjectHandle page = pdf.makeIndirectObject("<< /Type /Page >>"_qpdf);
    page.replaceKey(
        "/MediaBox",
        QPDFObjectHandle::newFromRectangle(QPDFObjectHandle::Rectangle(0, 0, width, height)));
    page.replaceKey("/Contents", contents);
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(page, false);
}

size_t
QBatchMerger::addPDF(QPDF& pdf, QBatchEntry const& entry)
{
    auto source = std::make_unique<QPDF>();
    source->setLogger(getLogger());
    source->processFile(entry.getSourcePath().c_str());
    QPDFPageDocumentHelper dh(pdf);
    size_t count = 0;
    for (auto& page: QPDFPageDocumentHelper(*source).getAllPages()) {
        dh.addPage(page, false);
        ++count;
    }
    m->page_heap.push_back(std::move(source));
    return count;
}

size_t
QBatchMerger::addJPG(QPDF& pdf, QBatchEntry const& entry)
{
    std::string data;
    Pl_String ps("jpeg data", nullptr, data);
    QUtil::pipe_file(entry.getSourcePath().c_str(), &ps);
    JPEGInfo info = JPEGInfo::read(data);

    QPDFObjectHandle image = pdf.newStream();
    auto image_dict = "<< /Type /XObject /Subtype /Image >>"_qpdf;
    image_dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(info.colorSpaceName()));
    image_dict.replaceKey(
        "/BitsPerComponent", QPDFObjectHandle::newInteger(info.bits_per_component));
    image_dict.replaceKey("/Width", QPDFObjectHandle::newInteger(info.width));
    image_dict.replaceKey("/Height", QPDFObjectHandle::newInteger(info.height));
    if (info.adobe_inverted) {
        image_dict.replaceKey("/Decode", "[1 0 1 0 1 0 1 0]"_qpdf);
    }
    image.replaceDict(image_dict);
    // The JPEG data is embedded as is.
    image.replaceStreamData(
        data, QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());
    add_image_page(pdf, image, info.pointWidth(), info.pointHeight());
    return 1;
}

size_t
QBatchMerger::addTIFF(QPDF& pdf, QBatchEntry const& entry)
{
    Rasterizer frames(entry.getSourcePath(), qbatch_k_tiff);
    int count = frames.getCount();
    for (int i = 0; i < count; ++i) {
        RGBImage frame = frames.render(i, 72.0);
        QPDFObjectHandle image = pdf.newStream();
        auto image_dict =
            "<< /Type /XObject /Subtype /Image /ColorSpace /DeviceRGB /BitsPerComponent 8 >>"_qpdf;
        image_dict.replaceKey("/Width", QPDFObjectHandle::newInteger(frame.width));
        image_dict.replaceKey("/Height", QPDFObjectHandle::newInteger(frame.height));
        image.replaceDict(image_dict);
        // QPDFWriter compresses this with /FlateDecode.
        image.replaceStreamData(
            frame.samples, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
        add_image_page(
            pdf, image, frame.width * 72.0 / frame.xres, frame.height * 72.0 / frame.yres);
    }
    return QIntC::to_size(count);
}

size_t
QBatchMerger::addEntry(QPDF& pdf, QBatchEntry const& entry)
{
    auto const& path = entry.getSourcePath();
    auto const& name = entry.getDisplayName();
    if (!(util::is_regular_file(path) && QUtil::file_can_be_opened(path.c_str()))) {
        throw QBatchExc(
            qbatch_e_source_missing, path, name, "file no longer exists or can't be read");
    }
    try {
        switch (entry.getKind()) {
        case qbatch_k_pdf:
            return addPDF(pdf, entry);
        case qbatch_k_jpg:
            return addJPG(pdf, entry);
        case qbatch_k_tiff:
            return addTIFF(pdf, entry);
        }
    } catch (QPDFSystemError& e) {
        throw QBatchExc(qbatch_e_system, path, name, e.what());
    } catch (QPDFExc& e) {
        if (e.getErrorCode() == qpdf_e_password) {
            throw QBatchExc(
                qbatch_e_corrupt_source, path, name, "file is encrypted and requires a password");
        }
        throw QBatchExc(qbatch_e_corrupt_source, path, name, e.getMessageDetail());
    } catch (std::runtime_error& e) {
        throw QBatchExc(qbatch_e_corrupt_source, path, name, e.what());
    }
    throw std::logic_error("QBatchMerger: unknown entry kind");
}

void
QBatchMerger::write(QPDF& pdf)
{
    // Append to the path to generate a temporary name so it is in the same directory as the
    // output and can be renamed.
    std::string temp = m->outfile + ".~qbatch-temp#";
    auto discard_temp = [this, &temp]() {
        if (!util::exists(temp)) {
            return;
        }
        try {
            QUtil::remove_file(temp.c_str());
        } catch (QPDFSystemError& e) {
            *getLogger()->getError() << getMessagePrefix() << ": unable to remove temporary file "
                                     << temp << " (" << e.what() << ")\n";
        }
    };
    try {
        {
            // QPDFWriter must have block scope so the output file will be closed after write()
            // finishes.
            QPDFWriter w(pdf);
            w.setOutputFilename(temp.c_str());
            w.write();
        }
        // We must close the inputs before we can rename files.
        for (auto& source: m->page_heap) {
            source->closeInputSource();
        }
        QUtil::rename_file(temp.c_str(), m->outfile.c_str());
    } catch (QPDFSystemError& e) {
        discard_temp();
        throw QBatchExc(util::output_error_code(e.getErrno()), m->outfile, "", e.what());
    } catch (QPDFExc& e) {
        // Page content from a source file could not be read.
        discard_temp();
        std::string name;
        for (auto const& entry: getEntries()) {
            if (entry.getSourcePath() == e.getFilename()) {
                name = entry.getDisplayName();
            }
        }
        throw QBatchExc(qbatch_e_corrupt_source, e.getFilename(), name, e.getMessageDetail());
    } catch (std::exception&) {
        discard_temp();
        throw;
    }
}

// A cancelled merge writes nothing, so nothing counts as merged.
static QBatchResult
cancelled()
{
    QBatchResult result;
    result.status = qbatch_s_cancelled;
    return result;
}

QBatchResult
QBatchMerger::run()
{
    auto const& entries = getEntries();
    if (entries.empty()) {
        throw QBatchExc(qbatch_e_not_found, m->outfile, "", "there are no files to merge");
    }
    m->page_heap.clear();
    size_t total = entries.size() + 1;
    QBatchResult result;

    QPDF pdf;
    pdf.setLogger(getLogger());
    pdf.emptyPDF();
    size_t done = 0;
    for (auto const& entry: entries) {
        if (isCancelled()) {
            return cancelled();
        }
        doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": adding " << entry.getDisplayName() << " ("
              << QBatchEntry::kindName(entry.getKind()) << ")\n";
        });
        result.pages += addEntry(pdf, entry);
        result.succeeded.push_back(entry.getId());
        reportProgress(++done, total);
    }
    if (isCancelled()) {
        return cancelled();
    }
    write(pdf);
    doIfVerbose([&](Pipeline& v, std::string const& prefix) {
        v << prefix << ": wrote file " << m->outfile << " (" << result.pages << " pages)\n";
    });
    result.outputs.push_back(m->outfile);
    reportProgress(total, total);
    return result;
}
