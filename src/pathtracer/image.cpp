#include "pathtracer/image.hpp"
#include "pathtracer/utility.hpp"

Image::Image(int width, int height)
	:m_width(width), m_height(height)
{
	iassert(width > 0 and height > 0, "Bad image dimensions {}x{}", width, height);
	m_pixels.resize(size_t(width) * height);
}

void ImageWriter::write(Image const& image, std::filesystem::path const& path) const
{
	auto temp_path = path;
	temp_path += ".part";

	try {
		encode(image, temp_path);
		std::filesystem::rename(temp_path, path);
	} catch (const std::exception& e) {
		std::error_code ec;
		std::filesystem::remove(temp_path, ec);
		throw std::runtime_error(std::format("Couldn't write image {}: {}", path.string(), e.what()));
	}

	std::error_code ec;
	const auto size = std::filesystem::file_size(path, ec);
	if (ec)
		spdlog::info("Image written to {}", path.string());
	else
		spdlog::info("Image written to {} ({} bytes)", path.string(), size);
}

void write_ppm(std::ostream& os, Image const& image)
{
	std::print(os, "P3\n{} {}\n255\n", image.width(), image.height());
	for (auto const& pixel : image.pixels())
		std::print(os, "{} {} {}\n", int(pixel.r), int(pixel.g), int(pixel.b));
}

void PpmWriter::encode(Image const& image, std::filesystem::path const& path) const
{
	std::ofstream file(path);
	if (!file)
		throw std::runtime_error(std::format("Couldn't create {}", path.string()));

	write_ppm(file, image);

	file.close();
	if (!file)
		throw std::runtime_error(std::format("Failed writing {}", path.string()));
}

void PngWriter::encode(Image const& image, std::filesystem::path const& path) const
{
	auto surface = Cairo::ImageSurface::create(Cairo::Surface::Format::RGB24, image.width(), image.height());
	surface->flush();

	auto data = surface->get_data();
	const auto stride = surface->get_stride();
	for (int y = 0; y < image.height(); y++)
	{
		auto row = reinterpret_cast<uint32_t*>(data + size_t(y) * stride);
		for (int x = 0; x < image.width(); x++)
		{
			auto const& pixel = image.at(x, y);
			row[x] = uint32_t(pixel.r) << 16 | uint32_t(pixel.g) << 8 | uint32_t(pixel.b);
		}
	}

	surface->mark_dirty();
	surface->write_to_png(path.string());
}

std::unique_ptr<ImageWriter> make_writer(std::filesystem::path const& path)
{
	if (path.extension() == ".png")
		return std::make_unique<PngWriter>();
	return std::make_unique<PpmWriter>();
}
