#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/camera.hpp"
#include "pathtracer/hittable_list.hpp"

// Everything a render reads. Built once, then only passed around as const
struct Scene
{
	std::shared_ptr<const Camera> camera;
	HittableList world;
	int width = 0, height = 0;
};

// Built-in scenes. A width or height of 0 keeps the scene's own size.
// Scenes on the fixed camera require width == 2 * height
Scene simple_scene(int width = 0, int height = 0);
Scene single_sphere_scene(int width = 0, int height = 0);
Scene default_scene(int width = 0, int height = 0);
// Draws from the process-wide random stream; seed first to reproduce it
Scene random_scene(int width = 0, int height = 0);

// Looks a built-in scene up by name: simple, single, default or random
Scene build_scene(std::string_view name, int width = 0, int height = 0);
