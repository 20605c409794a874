#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/hittable.hpp"
#include "pathtracer/material.hpp"
#include "pathtracer/utility.hpp"

// A negative radius keeps the same intersection points but turns the normal
// inwards, which makes a glass sphere hollow when nested in a larger one
class Sphere : public Hittable
{
public:
	Sphere(ovec3 const& center, oreal radius, std::shared_ptr<const Material> material)
		:center(center), radius(radius), material(std::move(material))
	{
		iassert(radius != oreal(0), "Sphere at ({}, {}, {}) has no extent", center.x, center.y, center.z);
		iassert(this->material, "Sphere needs a material");
	}

	bool hit(Ray const& r, oreal ray_tmin, oreal ray_tmax, HitRecord& rec) const override
	{
		ovec3 oc = center - r.origin();
		auto a = glm::length2(r.direction());
		auto h = glm::dot(r.direction(), oc);
		auto c = glm::length2(oc) - radius * radius;

		auto discriminant = h * h - a * c;
		if (discriminant <= 0)
			return false;

		auto sqrtd = glm::sqrt(discriminant);

		auto root = (h - sqrtd) / a;
		if (root <= ray_tmin or ray_tmax <= root)
		{
			root = (h + sqrtd) / a;
			if (root <= ray_tmin or ray_tmax <= root)
				return false;
		}

		rec.t = root;
		rec.p = r.at(rec.t);
		rec.normal = (rec.p - center) / radius;
		rec.material = material.get();

		return true;
	}

private:
	ovec3 center;
	oreal radius;
	std::shared_ptr<const Material> material;
};
