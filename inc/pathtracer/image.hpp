#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/types.hpp"

// 8-bit RGB raster, row 0 at the top of the picture
class Image
{
public:
	Image(int width, int height);

	int width() const { return m_width; }
	int height() const { return m_height; }

	opixel& at(int x, int y)
	{
		return m_pixels[size_t(y) * m_width + x];
	}
	opixel const& at(int x, int y) const
	{
		return m_pixels[size_t(y) * m_width + x];
	}

	std::vector<opixel> const& pixels() const { return m_pixels; }

private:
	int m_width, m_height;
	std::vector<opixel> m_pixels;
};

// Encodes an image to a file. The target only appears once the whole image
// has been written; a failure throws std::runtime_error and leaves no file
class ImageWriter
{
public:
	virtual ~ImageWriter() = default;
	void write(Image const& image, std::filesystem::path const& path) const;

protected:
	virtual void encode(Image const& image, std::filesystem::path const& path) const = 0;
};

// ASCII "P3" portable pixmap
class PpmWriter : public ImageWriter
{
protected:
	void encode(Image const& image, std::filesystem::path const& path) const override;
};

class PngWriter : public ImageWriter
{
protected:
	void encode(Image const& image, std::filesystem::path const& path) const override;
};

// P3 header, "<width> <height>", 255, then one "<r> <g> <b>" line per pixel
void write_ppm(std::ostream& os, Image const& image);

// Picks the encoder from the extension: .png, anything else is PPM
std::unique_ptr<ImageWriter> make_writer(std::filesystem::path const& path);
