#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/types.hpp"
#include "pathtracer/ray.hpp"
#include "pathtracer/random.hpp"

// Maps image plane coordinates (s, t) in [0, 1], (0, 0) being the lower left
// corner, to a primary ray. Ray directions are not normalized
class Camera
{
public:
	virtual ~Camera() = default;
	virtual Ray get_ray(oreal s, oreal t) const = 0;
};

// Pinhole at the world origin looking down -z onto a 4x2 viewport, so only
// 2:1 images come out undistorted
class FixedCamera : public Camera
{
public:
	Ray get_ray(oreal s, oreal t) const override
	{
		return Ray(origin, lower_left_corner + s * horizontal + t * vertical - origin);
	}

private:
	ovec3 origin {0, 0, 0};
	ovec3 lower_left_corner {-2, -1, -1};
	ovec3 horizontal {4, 0, 0};
	ovec3 vertical {0, 2, 0};
};

// Positionable camera with a thin lens. Points at focus_dist from look_from
// are sharp; aperture 0 degenerates into a pinhole
class ThinLensCamera : public Camera
{
public:
	ThinLensCamera(ovec3 const& look_from, ovec3 const& look_at, ovec3 const& up,
		oreal vfov, oreal aspect, oreal aperture, oreal focus_dist)
	{
		const auto theta = glm::radians(vfov);
		const auto half_height = glm::tan(theta / oreal(2));
		const auto half_width = aspect * half_height;

		w = unit(look_from - look_at);
		u = unit(glm::cross(up, w));
		v = glm::cross(w, u);

		origin = look_from;
		lower_left_corner = origin
			- half_width * focus_dist * u
			- half_height * focus_dist * v
			- focus_dist * w;
		horizontal = oreal(2) * half_width * focus_dist * u;
		vertical = oreal(2) * half_height * focus_dist * v;
		lens_radius = aperture / oreal(2);
	}

	Ray get_ray(oreal s, oreal t) const override
	{
		const auto rd = lens_radius * random_in_unit_disk();
		const auto offset = u * rd.x + v * rd.y;
		return Ray(
			origin + offset,
			lower_left_corner + s * horizontal + t * vertical - origin - offset);
	}

private:
	ovec3 origin;
	ovec3 lower_left_corner;
	ovec3 horizontal, vertical;
	ovec3 u, v, w;
	oreal lens_radius;
};
