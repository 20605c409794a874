#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/types.hpp"
#include "pathtracer/ray.hpp"
#include "pathtracer/hittable.hpp"

// Decides what happens to a ray arriving at a hit point. Returns false when
// the ray is absorbed, otherwise fills in the continuing ray and how much of
// each channel survives the bounce. Materials are immutable once built and
// shared between all the surfaces using them
class Material
{
public:
	virtual ~Material() = default;
	virtual bool scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const = 0;
};

// Ideal diffuse surface, never absorbs
class Lambertian : public Material
{
public:
	explicit Lambertian(ocolor const& albedo)
		:albedo(albedo)
	{}

	bool scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const override;

private:
	ocolor albedo;
};

// Mirror reflection blurred by fuzz; 0 is a perfect mirror
class Metal : public Material
{
public:
	Metal(ocolor const& albedo, oreal fuzz);

	bool scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const override;

private:
	ocolor albedo;
	oreal fuzz;
};

// Clear refractive material such as glass or water
class Dielectric : public Material
{
public:
	explicit Dielectric(oreal refractive_index, ocolor const& attenuation = ocolor(1, 1, 1))
		:refractive_index(refractive_index), attenuation(attenuation)
	{}

	bool scatter(Ray const& r_in, HitRecord const& rec, ocolor& attenuation, Ray& scattered) const override;

private:
	oreal refractive_index;
	ocolor attenuation;
};

ovec3 reflect(ovec3 const& v, ovec3 const& n);

// Snell's law for v crossing a surface with normal n, ni_over_nt being the
// ratio of the indices of refraction. false on total internal reflection
bool refract(ovec3 const& v, ovec3 const& n, oreal ni_over_nt, ovec3& refracted);

// Schlick's approximation of the Fresnel reflectance
oreal schlick(oreal cosine, oreal refractive_index);
