#pragma once

#include "pathtracer/types.hpp"
#include "pathtracer/ray.hpp"

class Material;

// Filled by a successful intersection and consumed within the same bounce.
// normal is the geometric normal as the surface defines it, not flipped
// towards the ray, so refraction can tell entering from exiting
struct HitRecord
{
	ovec3 p;
	ovec3 normal;
	oreal t;
	Material const* material = nullptr;
};

class Hittable
{
public:
	virtual ~Hittable() = default;
	virtual bool hit(Ray const& r, oreal ray_tmin, oreal ray_tmax, HitRecord& record) const = 0;
};
