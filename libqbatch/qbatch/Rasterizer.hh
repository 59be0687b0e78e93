#ifndef QBATCH_RASTERIZER_HH
#define QBATCH_RASTERIZER_HH

#include <qbatch/Constants.h>

#include <memory>
#include <string>

// Eight-bit RGB samples, three bytes per pixel, rows packed with no padding.
struct RGBImage
{
    unsigned int width{0};
    unsigned int height{0};
    // Resolution in dots per inch
    double xres{72.0};
    double yres{72.0};
    std::string samples;
};

// Rasterizer turns pages of a PDF file or frames of a TIFF file into RGBImage objects using
// MuPDF. Each Rasterizer has its own MuPDF context and may be used from any one thread at a
// time. All MuPDF errors are thrown as std::runtime_error with MuPDF's message.
class Rasterizer
{
  public:
    Rasterizer(std::string const& filename, qbatch_entry_kind_e kind);
    Rasterizer(Rasterizer const&) = delete;
    Rasterizer& operator=(Rasterizer const&) = delete;
    ~Rasterizer();

    // Number of pages or frames
    int getCount() const;

    // Render a zero-based page at dpi, or decode a zero-based frame. Frames are decoded at
    // their native size, and dpi is ignored for them.
    RGBImage render(int index, double dpi);

  private:
    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCH_RASTERIZER_HH
