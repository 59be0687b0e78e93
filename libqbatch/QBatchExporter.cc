#include <qbatch/QBatchExporter.hh>

#include <qbatch/Rasterizer.hh>
#include <qbatch/Util.hh>

#include <qpdf/Pl_DCT.hh>
#include <qpdf/Pl_StdioFile.hh>
#include <qpdf/Pl_String.hh>
#include <qpdf/QIntC.hh>
#include <qpdf/QPDFSystemError.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>

using namespace qbatch;

class QBatchExporter::Members
{
  public:
    Members(std::string const& directory, Options const& options) :
        directory(directory),
        options(options)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::string directory;
    Options options;
};

QBatchExporter::QBatchExporter(
    std::vector<QBatchEntry> const& entries, std::string const& directory) :
    QBatchExporter(entries, directory, Options())
{
}

QBatchExporter::QBatchExporter(
    std::vector<QBatchEntry> const& entries, std::string const& directory, Options const& options) :
    QBatchOperation(entries),
    m(std::make_unique<Members>(directory, options))
{
    if (util::trim(directory).empty()) {
        throw QBatchExc(qbatch_e_invalid_name, "", "", "destination directory is empty");
    }
    if (options.dpi < 1 || options.dpi > max_dpi) {
        throw QBatchExc(
            qbatch_e_out_of_range,
            "",
            "",
            "resolution must be between 1 and " + std::to_string(max_dpi) + " dpi");
    }
    if (options.quality < 1 || options.quality > 100) {
        throw QBatchExc(qbatch_e_out_of_range, "", "", "JPEG quality must be between 1 and 100");
    }
}

QBatchExporter::~QBatchExporter() = default;

std::string
QBatchExporter::getDescription() const
{
    return "export to " + m->directory;
}

std::string const&
QBatchExporter::getDirectory() const
{
    return m->directory;
}

QBatchExporter::Options const&
QBatchExporter::getOptions() const
{
    return m->options;
}

std::string
QBatchExporter::targetPath(std::string const& name) const
{
    std::string path = util::path_join(m->directory, name);
    if (m->options.collision == qbatch_c_overwrite) {
        return path;
    }
    return util::unique_path(path);
}

void
QBatchExporter::encode(RGBImage const& image, Pipeline* p) const
{
    int quality = m->options.quality;
    auto xres = QIntC::to_ushort(static_cast<int>(image.xres + 0.5));
    auto yres = QIntC::to_ushort(static_cast<int>(image.yres + 0.5));
    auto config = Pl_DCT::make_compress_config([quality, xres, yres](jpeg_compress_struct* cinfo) {
        jpeg_set_quality(cinfo, quality, TRUE);
        cinfo->write_JFIF_header = TRUE;
        cinfo->density_unit = 1;
        cinfo->X_density = xres;
        cinfo->Y_density = yres;
    });
    Pl_DCT dct("jpg encoder", p, image.width, image.height, 3, JCS_RGB, config.get());
    dct.write(reinterpret_cast<unsigned char const*>(image.samples.data()), image.samples.size());
    dct.finish();
}

void
QBatchExporter::writeOutput(
    QBatchEntry const& entry, std::string const& target, std::function<void(Pipeline*)> fn)
{
    bool created = false;
    auto discard_partial = [this, &created, &target]() {
        if (!(created && util::exists(target))) {
            return;
        }
        try {
            QUtil::remove_file(target.c_str());
        } catch (QPDFSystemError& e) {
            *getLogger()->getError() << getMessagePrefix() << ": unable to remove partial file "
                                     << target << " (" << e.what() << ")\n";
        }
    };
    try {
        QUtil::FileCloser fc(QUtil::safe_fopen(target.c_str(), "wb"));
        created = true;
        Pl_StdioFile out("jpg output", fc.f);
        fn(&out);
    } catch (QPDFSystemError& e) {
        discard_partial();
        throw QBatchExc(
            util::output_error_code(e.getErrno()), target, entry.getDisplayName(), e.what());
    } catch (std::runtime_error& e) {
        discard_partial();
        throw QBatchExc(qbatch_e_system, target, entry.getDisplayName(), e.what());
    }
}

void
QBatchExporter::exportEntry(
    QBatchEntry const& entry, std::string const& prefix, QBatchResult& result)
{
    auto const& path = entry.getSourcePath();
    auto const& name = entry.getDisplayName();
    if (!(util::is_regular_file(path) && QUtil::file_can_be_opened(path.c_str()))) {
        throw QBatchExc(
            qbatch_e_source_missing, path, name, "file no longer exists or can't be read");
    }

    if (entry.getKind() == qbatch_k_jpg) {
        std::string data;
        try {
            Pl_String ps("jpg data", nullptr, data);
            QUtil::pipe_file(path.c_str(), &ps);
        } catch (QPDFSystemError& e) {
            throw QBatchExc(qbatch_e_system, path, name, e.what());
        }
        std::string target = targetPath(prefix + ".jpg");
        writeOutput(entry, target, [&data](Pipeline* p) {
            p->writeString(data);
            p->finish();
        });
        result.outputs.push_back(target);
        ++result.pages;
        return;
    }

    std::unique_ptr<Rasterizer> source;
    try {
        source = std::make_unique<Rasterizer>(path, entry.getKind());
    } catch (std::runtime_error& e) {
        throw QBatchExc(qbatch_e_corrupt_source, path, name, e.what());
    }
    size_t count = QIntC::to_size(source->getCount());
    int width = QIntC::to_int(std::max(size_t(3), util::digits(count)));
    for (size_t i = 0; i < count; ++i) {
        RGBImage image;
        try {
            image = source->render(QIntC::to_int(i), m->options.dpi);
        } catch (std::runtime_error& e) {
            throw QBatchExc(
                qbatch_e_corrupt_source,
                path,
                name,
                (entry.getKind() == qbatch_k_pdf ? "page " : "frame ") +
                    QUtil::uint_to_string(i + 1) + ": " + e.what());
        }
        std::string target =
            targetPath(prefix + "_" + QUtil::uint_to_string(i + 1, width) + ".jpg");
        writeOutput(entry, target, [this, &image](Pipeline* p) { encode(image, p); });
        result.outputs.push_back(target);
        ++result.pages;
        doIfVerbose([&](Pipeline& v, std::string const& msg_prefix) {
            v << msg_prefix << ": wrote file " << target << "\n";
        });
    }
}

QBatchResult
QBatchExporter::run()
{
    auto const& entries = getEntries();
    if (entries.empty()) {
        throw QBatchExc(qbatch_e_not_found, m->directory, "", "there are no files to export");
    }
    QBatchResult result;
    if (isCancelled()) {
        result.status = qbatch_s_cancelled;
        return result;
    }
    try {
        util::make_directories(m->directory);
    } catch (QPDFSystemError& e) {
        throw QBatchExc(util::output_error_code(e.getErrno()), m->directory, "", e.what());
    }

    size_t total = entries.size();
    int width = QIntC::to_int(std::max(size_t(3), util::digits(total)));
    for (size_t i = 0; i < total; ++i) {
        if (isCancelled()) {
            result.status = qbatch_s_cancelled;
            break;
        }
        auto const& entry = entries.at(i);
        doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": exporting " << entry.getDisplayName() << "\n";
        });
        std::string prefix =
            QUtil::uint_to_string(i + 1, width) + "_" + util::path_stem(entry.getDisplayName());
        try {
            exportEntry(entry, prefix, result);
            result.succeeded.push_back(entry.getId());
        } catch (QBatchExc& e) {
            getLogger()->warn(getMessagePrefix() + ": " + e.what() + "\n");
            result.failures.push_back(e);
        }
        reportProgress(i + 1, total);
    }
    return result;
}
