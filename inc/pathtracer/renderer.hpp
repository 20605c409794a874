#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/types.hpp"
#include "pathtracer/ray.hpp"
#include "pathtracer/hittable.hpp"
#include "pathtracer/image.hpp"
#include "pathtracer/scene.hpp"

struct RenderSettings
{
	int samples = 100;     // rays averaged per pixel
	int max_depth = 50;    // bounces before a path counts as absorbed
	oreal t_min = 0.001f;  // keeps bounced rays from hitting their own origin
};

class Renderer
{
public:
	explicit Renderer(RenderSettings const& settings = {});

	// Radiance arriving along r. Paths still bouncing at max_depth contribute black
	ocolor color(Hittable const& world, Ray const& r, int depth) const;

	// Samples every pixel of the scene, top row first
	Image render(Scene const& scene) const;

	RenderSettings const& settings() const { return m_settings; }

	// Sky gradient, white at the horizon to light blue overhead
	static ocolor background(Ray const& r);

	// Gamma 2, clamped to [0, 1], then scaled to a byte
	static opixel quantize(ocolor const& averaged);

private:
	RenderSettings m_settings;
};
