#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/hittable.hpp"

// The world: every surface of a scene, scanned linearly per ray
class HittableList : public Hittable
{
public:
	std::vector<std::shared_ptr<Hittable>> objects;

	void add(std::shared_ptr<Hittable> object)
	{
		objects.push_back(std::move(object));
	}

	auto size() const
	{
		return objects.size();
	}

	bool hit(Ray const& r, oreal ray_tmin, oreal ray_tmax, HitRecord& rec) const override
	{
		HitRecord temp;
		bool hit_anything = false;
		auto closest_so_far = ray_tmax;

		for (auto const& object : objects)
		{
			if (object->hit(r, ray_tmin, closest_so_far, temp))
			{
				hit_anything = true;
				closest_so_far = temp.t;
				rec = temp;
			}
		}

		return hit_anything;
	}
};
