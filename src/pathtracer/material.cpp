#include "pathtracer/material.hpp"
#include "pathtracer/random.hpp"
#include "pathtracer/utility.hpp"

ovec3 reflect(ovec3 const& v, ovec3 const& n)
{
	return glm::reflect(v, n);
}

bool refract(ovec3 const& v, ovec3 const& n, oreal ni_over_nt, ovec3& refracted)
{
	const auto uv = unit(v);
	const auto dt = glm::dot(uv, n);
	const auto discriminant = oreal(1) - ni_over_nt * ni_over_nt * (oreal(1) - dt * dt);
	if (discriminant <= 0)
		return false;

	refracted = glm::refract(uv, n, ni_over_nt);
	return true;
}

oreal schlick(oreal cosine, oreal refractive_index)
{
	auto r0 = (oreal(1) - refractive_index) / (oreal(1) + refractive_index);
	r0 = r0 * r0;
	return r0 + (oreal(1) - r0) * glm::pow(oreal(1) - cosine, oreal(5));
}

bool Lambertian::scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const
{
	const auto target = rec.p + rec.normal + random_in_unit_sphere();
	scattered = Ray(rec.p, target - rec.p);
	attenuation = albedo;
	return true;
}

Metal::Metal(ocolor const& albedo, oreal fuzz)
	:albedo(albedo), fuzz(fuzz)
{
	iassert(fuzz >= 0 and fuzz <= 1, "Metal fuzz {} outside [0, 1]", fuzz);
}

bool Metal::scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const
{
	const auto reflected = reflect(unit(r_in.direction()), rec.normal);
	scattered = Ray(rec.p, reflected + fuzz * random_in_unit_sphere());
	attenuation = albedo;
	// fuzz may push the ray below the surface
	return glm::dot(scattered.direction(), rec.normal) > 0;
}

bool Dielectric::scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const
{
	const auto& direction = r_in.direction();
	const auto d_dot_n = glm::dot(direction, rec.normal);

	ovec3 outward_normal;
	oreal ni_over_nt, cosine;
	if (d_dot_n > 0)
	{
		// leaving the medium
		outward_normal = -rec.normal;
		ni_over_nt = refractive_index;
		cosine = refractive_index * d_dot_n / glm::length(direction);
	}
	else
	{
		outward_normal = rec.normal;
		ni_over_nt = oreal(1) / refractive_index;
		cosine = -d_dot_n / glm::length(direction);
	}

	attenuation = this->attenuation;

	const auto reflected = reflect(direction, rec.normal);
	ovec3 refracted;
	if (refract(direction, outward_normal, ni_over_nt, refracted)
		and uniform01() >= schlick(cosine, refractive_index))
	{
		scattered = Ray(rec.p, refracted);
	}
	else
	{
		scattered = Ray(rec.p, reflected);
	}

	return true;
}
