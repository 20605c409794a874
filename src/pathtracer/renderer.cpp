#include "pathtracer/renderer.hpp"
#include "pathtracer/material.hpp"
#include "pathtracer/random.hpp"
#include "pathtracer/utility.hpp"

Renderer::Renderer(RenderSettings const& settings)
	:m_settings(settings)
{
	iassert(m_settings.samples > 0, "Need at least one sample per pixel, got {}", m_settings.samples);
	iassert(m_settings.max_depth >= 0, "Negative max depth {}", m_settings.max_depth);
	iassert(m_settings.t_min >= 0, "Negative t_min {}", m_settings.t_min);
}

ocolor Renderer::color(Hittable const& world, Ray const& r, int depth) const
{
	HitRecord rec;
	if (!world.hit(r, m_settings.t_min, oinfinity, rec))
		return background(r);

	if (depth >= m_settings.max_depth)
		return ocolor(0, 0, 0);

	Ray scattered;
	ocolor attenuation;
	if (!rec.material->scatter(r, rec, attenuation, scattered))
		return ocolor(0, 0, 0);

	return attenuation * color(world, scattered, depth + 1);
}

ocolor Renderer::background(Ray const& r)
{
	const auto unit_direction = unit(r.direction());
	const auto a = oreal(0.5) * (unit_direction.y + oreal(1.0));
	return (oreal(1.0) - a) * ocolor(1, 1, 1) + a * ocolor(0.5, 0.7, 1.0);
}

opixel Renderer::quantize(ocolor const& averaged)
{
	auto corrected = glm::sqrt(averaged);
	corrected = glm::clamp(corrected, ocolor(0, 0, 0), ocolor(1, 1, 1));
	return opixel(oreal(255.99) * corrected);
}

Image Renderer::render(Scene const& scene) const
{
	using namespace std::chrono;

	iassert(scene.camera, "Scene has no camera");

	const int width = scene.width, height = scene.height;
	const auto& camera = *scene.camera;
	Image image(width, height);

	spdlog::info("Rendering {}x{}, {} samples per pixel, depth {}, {} surfaces",
		width, height, m_settings.samples, m_settings.max_depth, scene.world.size());

	auto begin = high_resolution_clock::now();

	// j runs up the image plane, the image stores the top row first
	for (int j = height - 1; j >= 0; j--)
	{
		for (int i = 0; i < width; i++)
		{
			ocolor sum(0, 0, 0);
			for (int s = 0; s < m_settings.samples; s++)
			{
				const auto u = (oreal(i) + uniform01()) / oreal(width);
				const auto v = (oreal(j) + uniform01()) / oreal(height);
				sum += color(scene.world, camera.get_ray(u, v), 0);
			}

			image.at(i, height - 1 - j) = quantize(sum / oreal(m_settings.samples));
		}

		spdlog::debug("{:.1f}% ({} scanlines remaining)", 100.f * (height - j) / height, j);
	}

	auto end = high_resolution_clock::now();
	spdlog::info("Rendered in {:.3f} s", duration_cast<nanoseconds>(end - begin).count() / 1e9);

	return image;
}
