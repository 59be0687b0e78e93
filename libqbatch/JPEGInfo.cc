#include <qbatch/JPEGInfo.hh>

#include <qpdf/QIntC.hh>

#include <csetjmp>
#include <cstdio>
#include <stdexcept>

#include <jpeglib.h>

namespace
{
    struct qbatch_jpeg_error_mgr
    {
        struct jpeg_error_mgr pub;
        jmp_buf jmpbuf;
        std::string msg;
    };
} // namespace

static void
error_handler(j_common_ptr cinfo)
{
    auto* jerr = reinterpret_cast<qbatch_jpeg_error_mgr*>(cinfo->err);
    char buf[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buf);
    jerr->msg = buf;
    longjmp(jerr->jmpbuf, 1);
}

static void
read_header(jpeg_decompress_struct* cinfo, std::string const& data, JPEGInfo& info)
{
#if ((defined(__GNUC__) && ((__GNUC__ * 100) + __GNUC_MINOR__) >= 406) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    jpeg_create_decompress(cinfo);
#if ((defined(__GNUC__) && ((__GNUC__ * 100) + __GNUC_MINOR__) >= 406) || defined(__clang__))
# pragma GCC diagnostic pop
#endif
    jpeg_mem_src(
        cinfo,
        reinterpret_cast<unsigned char const*>(data.data()),
        QIntC::to_ulong(data.size()));
    (void)jpeg_read_header(cinfo, TRUE);

    info.width = cinfo->image_width;
    info.height = cinfo->image_height;
    info.components = cinfo->num_components;
    info.bits_per_component = cinfo->data_precision;
    info.adobe_inverted = (cinfo->num_components == 4) && cinfo->saw_Adobe_marker;
    if (cinfo->saw_JFIF_marker && cinfo->X_density > 0 && cinfo->Y_density > 0) {
        if (cinfo->density_unit == 1) {
            info.x_dpi = cinfo->X_density;
            info.y_dpi = cinfo->Y_density;
        } else if (cinfo->density_unit == 2) {
            info.x_dpi = cinfo->X_density * 2.54;
            info.y_dpi = cinfo->Y_density * 2.54;
        }
    }
}

JPEGInfo
JPEGInfo::read(std::string const& data)
{
    if (data.empty()) {
        throw std::runtime_error("empty JPEG data");
    }
    JPEGInfo info;
    struct jpeg_decompress_struct cinfo;
    struct qbatch_jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&(jerr.pub));
    jerr.pub.error_exit = error_handler;

    bool error = false;
    if (setjmp(jerr.jmpbuf) == 0) {
        read_header(&cinfo, data, info);
    } else {
        error = true;
    }
    jpeg_destroy_decompress(&cinfo);
    if (error) {
        throw std::runtime_error(jerr.msg);
    }
    if (!(info.components == 1 || info.components == 3 || info.components == 4)) {
        throw std::runtime_error(
            "JPEG images with " + std::to_string(info.components) +
            " components are not supported");
    }
    return info;
}

char const*
JPEGInfo::colorSpaceName() const
{
    switch (components) {
    case 1:
        return "/DeviceGray";
    case 4:
        return "/DeviceCMYK";
    default:
        return "/DeviceRGB";
    }
}

double
JPEGInfo::pointWidth() const
{
    return width * 72.0 / x_dpi;
}

double
JPEGInfo::pointHeight() const
{
    return height * 72.0 / y_dpi;
}
