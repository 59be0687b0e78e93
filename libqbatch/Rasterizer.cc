#include <qbatch/Rasterizer.hh>

#include <qpdf/QIntC.hh>

#include <stdexcept>

extern "C" {
#include <mupdf/fitz.h>
}

class Rasterizer::Members
{
  public:
    Members(std::string const& filename, qbatch_entry_kind_e kind) :
        filename(filename),
        kind(kind)
    {
    }
    Members(Members const&) = delete;
    ~Members()
    {
        if (ctx) {
            fz_drop_document(ctx, doc);
            fz_drop_buffer(ctx, data);
            fz_drop_context(ctx);
        }
    }

    std::string filename;
    qbatch_entry_kind_e kind;
    fz_context* ctx{nullptr};
    fz_document* doc{nullptr};
    fz_buffer* data{nullptr};
    int count{0};
};

// Copy an RGB pixmap without alpha into an RGBImage, dropping any row padding.
static RGBImage
copy_pixmap(fz_context* ctx, fz_pixmap* pix)
{
    RGBImage image;
    image.width = QIntC::to_uint(fz_pixmap_width(ctx, pix));
    image.height = QIntC::to_uint(fz_pixmap_height(ctx, pix));
    size_t row_size = QIntC::to_size(image.width) * 3;
    auto stride = QIntC::to_size(fz_pixmap_stride(ctx, pix));
    unsigned char const* samples = fz_pixmap_samples(ctx, pix);
    image.samples.reserve(row_size * image.height);
    for (size_t row = 0; row < image.height; ++row) {
        image.samples.append(reinterpret_cast<char const*>(samples + row * stride), row_size);
    }
    return image;
}

Rasterizer::Rasterizer(std::string const& filename, qbatch_entry_kind_e kind) :
    m(std::make_unique<Members>(filename, kind))
{
    if (kind == qbatch_k_jpg) {
        throw std::logic_error("Rasterizer called for a JPG file");
    }
    m->ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m->ctx) {
        throw std::runtime_error("unable to create MuPDF context");
    }
    fz_context* ctx = m->ctx;
    bool encrypted = false;
    fz_var(encrypted);
    fz_try (ctx) {
        if (kind == qbatch_k_pdf) {
            fz_register_document_handlers(ctx);
            m->doc = fz_open_document(ctx, filename.c_str());
            if (fz_needs_password(ctx, m->doc)) {
                encrypted = true;
            } else {
                m->count = fz_count_pages(ctx, m->doc);
            }
        } else {
            m->data = fz_read_file(ctx, filename.c_str());
            unsigned char* bytes = nullptr;
            size_t len = fz_buffer_storage(ctx, m->data, &bytes);
            m->count = fz_load_tiff_subimage_count(ctx, bytes, len);
        }
    }
    fz_catch (ctx) {
        throw std::runtime_error(fz_caught_message(ctx));
    }
    if (encrypted) {
        throw std::runtime_error("file is encrypted and requires a password");
    }
    if (m->count < 1) {
        throw std::runtime_error("file contains no pages");
    }
}

Rasterizer::~Rasterizer() = default;

int
Rasterizer::getCount() const
{
    return m->count;
}

RGBImage
Rasterizer::render(int index, double dpi)
{
    if (index < 0 || index >= m->count) {
        throw std::logic_error(
            "Rasterizer::render: index " + std::to_string(index) + " is out of range");
    }
    fz_context* ctx = m->ctx;
    fz_pixmap* pix = nullptr;
    fz_pixmap* rgb = nullptr;
    fz_var(pix);
    fz_var(rgb);
    fz_try (ctx) {
        if (m->kind == qbatch_k_pdf) {
            float zoom = static_cast<float>(dpi / 72.0);
            pix = fz_new_pixmap_from_page_number(
                ctx, m->doc, index, fz_scale(zoom, zoom), fz_device_rgb(ctx), 0);
        } else {
            unsigned char* bytes = nullptr;
            size_t len = fz_buffer_storage(ctx, m->data, &bytes);
            pix = fz_load_tiff_subimage(ctx, bytes, len, index);
            if (!(fz_pixmap_colorspace(ctx, pix) == fz_device_rgb(ctx) &&
                  !fz_pixmap_alpha(ctx, pix))) {
                rgb = fz_convert_pixmap(
                    ctx, pix, fz_device_rgb(ctx), nullptr, nullptr, fz_default_color_params, 0);
            }
        }
    }
    fz_catch (ctx) {
        fz_drop_pixmap(ctx, rgb);
        fz_drop_pixmap(ctx, pix);
        throw std::runtime_error(fz_caught_message(ctx));
    }
    std::shared_ptr<fz_pixmap> pix_ph(pix, [ctx](fz_pixmap* p) { fz_drop_pixmap(ctx, p); });
    std::shared_ptr<fz_pixmap> rgb_ph(rgb, [ctx](fz_pixmap* p) { fz_drop_pixmap(ctx, p); });

    RGBImage image = copy_pixmap(ctx, rgb ? rgb : pix);
    if (m->kind == qbatch_k_pdf) {
        image.xres = dpi;
        image.yres = dpi;
    } else if (pix->xres > 0 && pix->yres > 0) {
        image.xres = pix->xres;
        image.yres = pix->yres;
    }
    return image;
}
