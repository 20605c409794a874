#include <gtest/gtest.h>

#include "pathtracer/sphere.hpp"
#include "pathtracer/utility.hpp"

namespace {

auto gray()
{
	return std::make_shared<Lambertian>(ocolor(0.5f, 0.5f, 0.5f));
}

} // namespace

TEST(Sphere, HitThroughCenter)
{
	const Sphere sphere(ovec3(0, 0, 0), 1, gray());
	const Ray r(ovec3(0, 0, 5), ovec3(0, 0, -1));

	HitRecord rec;
	ASSERT_TRUE(sphere.hit(r, 0.001f, oinfinity, rec));
	EXPECT_FLOAT_EQ(rec.t, 4.f);
	EXPECT_EQ(rec.p, ovec3(0, 0, 1));
	EXPECT_EQ(rec.normal, ovec3(0, 0, 1));
	EXPECT_NE(rec.material, nullptr);
}

TEST(Sphere, MissWhenRayPassesBy)
{
	const Sphere sphere(ovec3(0, 0, 0), 1, gray());
	const Ray r(ovec3(5, 5, 5), ovec3(0, 0, -1));

	HitRecord rec;
	EXPECT_FALSE(sphere.hit(r, 0.001f, oinfinity, rec));
}

TEST(Sphere, TangentRayDoesNotHit)
{
	const Sphere sphere(ovec3(0, 0, 0), 1, gray());
	const Ray r(ovec3(1, 0, 5), ovec3(0, 0, -1));

	HitRecord rec;
	EXPECT_FALSE(sphere.hit(r, 0.001f, oinfinity, rec));
}

TEST(Sphere, FarRootWhenStartingInside)
{
	const Sphere sphere(ovec3(0, 0, 0), 2, gray());
	const Ray r(ovec3(0, 0, 0), ovec3(1, 0, 0));

	HitRecord rec;
	ASSERT_TRUE(sphere.hit(r, 0.001f, oinfinity, rec));
	EXPECT_FLOAT_EQ(rec.t, 2.f);
	EXPECT_EQ(rec.normal, ovec3(1, 0, 0));
}

TEST(Sphere, RespectsTheInterval)
{
	const Sphere sphere(ovec3(0, 0, 0), 1, gray());
	const Ray r(ovec3(0, 0, 5), ovec3(0, 0, -1));

	HitRecord rec;
	// the near root (4) is cut off, the far one (6) is not
	ASSERT_TRUE(sphere.hit(r, 4.5f, oinfinity, rec));
	EXPECT_FLOAT_EQ(rec.t, 6.f);

	EXPECT_FALSE(sphere.hit(r, 0.001f, 3.f, rec));
	EXPECT_FALSE(sphere.hit(r, 6.5f, oinfinity, rec));
	// bounds are exclusive
	EXPECT_FALSE(sphere.hit(r, 0.001f, 4.f, rec));
	EXPECT_FALSE(sphere.hit(r, 6.f, oinfinity, rec));
}

TEST(Sphere, NonUnitDirection)
{
	const Sphere sphere(ovec3(0, 0, -10), 1, gray());
	const Ray r(ovec3(0, 0, 0), ovec3(0, 0, -3));

	HitRecord rec;
	ASSERT_TRUE(sphere.hit(r, 0.001f, oinfinity, rec));
	EXPECT_FLOAT_EQ(rec.t, 3.f);
	EXPECT_EQ(rec.p, ovec3(0, 0, -9));
}

TEST(Sphere, NegativeRadiusFlipsNormal)
{
	const Sphere outer(ovec3(1, 2, 3), 0.5f, gray());
	const Sphere inner(ovec3(1, 2, 3), -0.5f, gray());
	const Ray r(ovec3(1, 2, 10), ovec3(0.01f, 0, -1));

	HitRecord a, b;
	ASSERT_TRUE(outer.hit(r, 0.001f, oinfinity, a));
	ASSERT_TRUE(inner.hit(r, 0.001f, oinfinity, b));

	EXPECT_FLOAT_EQ(a.t, b.t);
	EXPECT_EQ(a.p, b.p);
	EXPECT_EQ(a.normal, -b.normal);
	EXPECT_LT(glm::dot(a.normal, r.direction()), 0.f);
	EXPECT_GT(glm::dot(b.normal, r.direction()), 0.f);
}

TEST(Sphere, ZeroRadiusIsRejected)
{
	EXPECT_THROW({ Sphere sphere(ovec3(0, 0, 0), 0, gray()); }, assertion);
}

TEST(Sphere, CarriesItsMaterial)
{
	auto material = gray();
	const Sphere sphere(ovec3(0, 0, -1), 0.5f, material);

	HitRecord rec;
	ASSERT_TRUE(sphere.hit(Ray(ovec3(0, 0, 0), ovec3(0, 0, -1)), 0.001f, oinfinity, rec));
	EXPECT_EQ(rec.material, material.get());
}
