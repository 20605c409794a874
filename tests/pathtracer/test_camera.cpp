#include <gtest/gtest.h>

#include "pathtracer/camera.hpp"

namespace {

void expect_vec_near(ovec3 const& a, ovec3 const& b, oreal eps = 1e-4f)
{
	EXPECT_NEAR(a.x, b.x, eps);
	EXPECT_NEAR(a.y, b.y, eps);
	EXPECT_NEAR(a.z, b.z, eps);
}

} // namespace

TEST(FixedCamera, SpansTheViewport)
{
	const FixedCamera camera;

	auto r = camera.get_ray(0, 0);
	EXPECT_EQ(r.origin(), ovec3(0, 0, 0));
	EXPECT_EQ(r.direction(), ovec3(-2, -1, -1));

	r = camera.get_ray(1, 1);
	EXPECT_EQ(r.direction(), ovec3(2, 1, -1));

	r = camera.get_ray(0.5f, 0.5f);
	EXPECT_EQ(r.direction(), ovec3(0, 0, -1));
}

TEST(ThinLensCamera, PinholeLooksAtTarget)
{
	const ovec3 from(3, 2, 1), at(0, 0, -1);
	const auto focus = glm::length(from - at);
	const ThinLensCamera camera(from, at, ovec3(0, 1, 0), 40, 2, 0, focus);

	const auto r = camera.get_ray(0.5f, 0.5f);
	expect_vec_near(r.origin(), from);
	// the image plane sits at the focus distance
	expect_vec_near(r.direction(), at - from);
}

TEST(ThinLensCamera, FieldOfViewAndAspect)
{
	// vfov 90 gives half_height 1 at unit focus distance
	const ThinLensCamera camera(ovec3(0, 0, 0), ovec3(0, 0, -1), ovec3(0, 1, 0), 90, 2, 0, 1);

	expect_vec_near(camera.get_ray(0, 0).direction(), ovec3(-2, -1, -1));
	expect_vec_near(camera.get_ray(1, 1).direction(), ovec3(2, 1, -1));
	expect_vec_near(camera.get_ray(1, 0).direction(), ovec3(2, -1, -1));
}

TEST(ThinLensCamera, ApertureJittersOriginOnly)
{
	seed_random(5);
	const ovec3 from(0, 0, 0), at(0, 0, -4);
	const ThinLensCamera camera(from, at, ovec3(0, 1, 0), 30, 1.5f, 2, 4);

	bool moved = false;
	for (int i = 0; i < 100; i++)
	{
		const auto r = camera.get_ray(0.5f, 0.5f);
		// lens offset stays within the lens, in the plane facing the target
		EXPECT_LT(glm::length(r.origin() - from), 1.f);
		EXPECT_NEAR(r.origin().z, 0.f, 1e-5f);
		// every ray through the lens still meets the focus point
		expect_vec_near(r.at(1), at);
		moved = moved or glm::length(r.origin() - from) > 1e-3f;
	}
	EXPECT_TRUE(moved);
}
