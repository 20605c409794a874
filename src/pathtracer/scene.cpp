#include "pathtracer/scene.hpp"
#include "pathtracer/material.hpp"
#include "pathtracer/sphere.hpp"
#include "pathtracer/random.hpp"
#include "pathtracer/utility.hpp"

namespace {

void resolve_dimensions(Scene& scene, int width, int height, int default_width, int default_height)
{
	scene.width = width != 0 ? width : default_width;
	scene.height = height != 0 ? height : default_height;
	iassert(scene.width > 0 and scene.height > 0, "Bad image dimensions {}x{}", scene.width, scene.height);
}

void use_fixed_camera(Scene& scene)
{
	iassert(scene.width == 2 * scene.height, "The fixed camera needs a 2:1 image, got {}x{}", scene.width, scene.height);
	scene.camera = std::make_shared<FixedCamera>();
}

// Looks at the middle sphere from above and to the right, focused on it
void use_lens_camera(Scene& scene)
{
	const ovec3 look_from(2, 2, 0), look_at(0, 0, -1), up(0, 1, 0);
	const auto focus_dist = glm::length(look_from - look_at);
	const auto aspect = scene.width / oreal(scene.height);
	scene.camera = std::make_shared<ThinLensCamera>(look_from, look_at, up, oreal(20), aspect, oreal(0.1), focus_dist);
}

} // namespace

Scene simple_scene(int width, int height)
{
	Scene scene;
	resolve_dimensions(scene, width, height, 200, 100);
	use_fixed_camera(scene);

	auto& world = scene.world;
	world.add(std::make_shared<Sphere>(ovec3(0, 0, -1), oreal(0.5),
		std::make_shared<Lambertian>(ocolor(0.8, 0.3, 0.3))));
	world.add(std::make_shared<Sphere>(ovec3(0, -100.5, -1), oreal(100),
		std::make_shared<Lambertian>(ocolor(0.8, 0.8, 0.0))));
	world.add(std::make_shared<Sphere>(ovec3(1, 0, -1), oreal(0.5),
		std::make_shared<Metal>(ocolor(0.8, 0.6, 0.2), oreal(0.2))));
	world.add(std::make_shared<Sphere>(ovec3(-1, 0, -1), oreal(0.5),
		std::make_shared<Metal>(ocolor(0.8, 0.8, 0.8), oreal(0.8))));

	return scene;
}

Scene single_sphere_scene(int width, int height)
{
	Scene scene;
	resolve_dimensions(scene, width, height, 200, 100);
	use_fixed_camera(scene);

	scene.world.add(std::make_shared<Sphere>(ovec3(0, 0, -1), oreal(0.5),
		std::make_shared<Lambertian>(ocolor(0.5, 0.5, 0.5))));

	return scene;
}

Scene default_scene(int width, int height)
{
	Scene scene;
	resolve_dimensions(scene, width, height, 200, 100);

	use_lens_camera(scene);

	auto glass = std::make_shared<Dielectric>(oreal(1.5));

	auto& world = scene.world;
	world.add(std::make_shared<Sphere>(ovec3(0, 0, -1), oreal(0.5),
		std::make_shared<Lambertian>(ocolor(0.1, 0.2, 0.5))));
	world.add(std::make_shared<Sphere>(ovec3(0, -100.5, -1), oreal(100),
		std::make_shared<Lambertian>(ocolor(0.8, 0.8, 0.0))));
	world.add(std::make_shared<Sphere>(ovec3(1, 0, -1), oreal(0.5),
		std::make_shared<Metal>(ocolor(0.8, 0.6, 0.2), oreal(0.2))));
	world.add(std::make_shared<Sphere>(ovec3(-1, 0, -1), oreal(0.5), glass));
	// same locus, inward normal: turns the glass ball into a bubble
	world.add(std::make_shared<Sphere>(ovec3(-1, 0, -1), oreal(-0.45), glass));

	return scene;
}

Scene random_scene(int width, int height)
{
	Scene scene;
	resolve_dimensions(scene, width, height, 1024, 512);

	use_lens_camera(scene);

	auto glass = std::make_shared<Dielectric>(oreal(1.5));

	auto& world = scene.world;
	world.add(std::make_shared<Sphere>(ovec3(0, -1000, 0), oreal(1000),
		std::make_shared<Lambertian>(ocolor(0.5, 0.5, 0.5))));

	for (int a = -11; a < 11; a++)
	{
		for (int b = -11; b < 11; b++)
		{
			const auto choose_material = uniform01();
			const ovec3 center(a + oreal(0.9) * uniform01(), oreal(0.2), b + oreal(0.9) * uniform01());
			if (glm::length(center - ovec3(4, 0.2, 0)) <= oreal(0.9))
				continue;

			if (choose_material < oreal(0.8))
			{
				const auto albedo = glm::linearRand(ocolor(0), ocolor(1)) * glm::linearRand(ocolor(0), ocolor(1));
				world.add(std::make_shared<Sphere>(center, oreal(0.2), std::make_shared<Lambertian>(albedo)));
			}
			else if (choose_material < oreal(0.95))
			{
				const auto albedo = oreal(0.5) * (ocolor(1) + glm::linearRand(ocolor(0), ocolor(1)) * glm::linearRand(ocolor(0), ocolor(1)));
				const auto fuzz = oreal(0.5) * uniform01();
				world.add(std::make_shared<Sphere>(center, oreal(0.2), std::make_shared<Metal>(albedo, fuzz)));
			}
			else
			{
				world.add(std::make_shared<Sphere>(center, oreal(0.2), glass));
			}
		}
	}

	world.add(std::make_shared<Sphere>(ovec3(0, 1, 0), oreal(1), glass));
	world.add(std::make_shared<Sphere>(ovec3(-4, 1, 0), oreal(1),
		std::make_shared<Lambertian>(ocolor(0.4, 0.2, 0.1))));
	world.add(std::make_shared<Sphere>(ovec3(4, 1, 0), oreal(1),
		std::make_shared<Metal>(ocolor(0.7, 0.6, 0.5), oreal(0))));

	return scene;
}

Scene build_scene(std::string_view name, int width, int height)
{
	Scene scene;
	if (name == "simple")
		scene = simple_scene(width, height);
	else if (name == "single")
		scene = single_sphere_scene(width, height);
	else if (name == "default")
		scene = default_scene(width, height);
	else if (name == "random")
		scene = random_scene(width, height);
	else
		throw std::runtime_error(std::format("Unknown scene '{}'. Available: simple, single, default, random", name));

	spdlog::debug("Scene '{}': {}x{}, {} surfaces", name, scene.width, scene.height, scene.world.size());
	return scene;
}
