#ifndef QBATCH_JPEGINFO_HH
#define QBATCH_JPEGINFO_HH

#include <string>

// Header information from a JPEG file, read with libjpeg without decoding any scan data.
struct JPEGInfo
{
    // Throws std::runtime_error with libjpeg's message if data is not a readable JPEG header.
    static JPEGInfo read(std::string const& data);

    // PDF color space name for the image's components: /DeviceGray, /DeviceRGB, or /DeviceCMYK.
    char const* colorSpaceName() const;

    // Size of the image in PDF points (1/72 inch) using the JFIF density when it is given in
    // dots per inch or per centimeter, and 72 dpi otherwise.
    double pointWidth() const;
    double pointHeight() const;

    unsigned int width{0};
    unsigned int height{0};
    int components{0};
    int bits_per_component{8};

    // Adobe applications write CMYK JPEGs with inverted samples.
    bool adobe_inverted{false};

    double x_dpi{72.0};
    double y_dpi{72.0};
};

#endif // QBATCH_JPEGINFO_HH
