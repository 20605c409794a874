#include <gtest/gtest.h>

#include "pathtracer/scene.hpp"
#include "pathtracer/random.hpp"
#include "pathtracer/utility.hpp"

TEST(Scene, BuiltInSizes)
{
	seed_random(41);

	auto scene = build_scene("simple");
	EXPECT_EQ(scene.width, 200);
	EXPECT_EQ(scene.height, 100);
	EXPECT_EQ(scene.world.size(), 4u);

	scene = build_scene("single");
	EXPECT_EQ(scene.world.size(), 1u);

	scene = build_scene("default");
	EXPECT_EQ(scene.world.size(), 5u);
	ASSERT_NE(scene.camera, nullptr);

	scene = build_scene("random");
	EXPECT_EQ(scene.width, 1024);
	EXPECT_EQ(scene.height, 512);
	// ground, three big spheres, and at most 22 x 22 small ones
	EXPECT_GT(scene.world.size(), 4u + 400u);
	EXPECT_LE(scene.world.size(), 4u + 22u * 22u);
}

TEST(Scene, DimensionOverride)
{
	const auto scene = build_scene("default", 64, 48);
	EXPECT_EQ(scene.width, 64);
	EXPECT_EQ(scene.height, 48);

	// the middle of the picture still looks at the target
	const auto r = scene.camera->get_ray(0.5f, 0.5f);
	const auto to_target = unit(ovec3(0, 0, -1) - ovec3(2, 2, 0));
	EXPECT_GT(glm::dot(unit(r.direction()), to_target), 0.999f);
}

TEST(Scene, FixedCameraNeedsTwoToOne)
{
	EXPECT_NO_THROW(build_scene("simple", 40, 20));
	EXPECT_THROW(build_scene("simple", 40, 30), assertion);
	EXPECT_THROW(build_scene("single", 30, 10), assertion);
}

TEST(Scene, UnknownName)
{
	EXPECT_THROW(build_scene("cornell"), std::runtime_error);
}

TEST(Scene, RandomSceneIsSeeded)
{
	seed_random(99);
	const auto a = random_scene(8, 4);
	seed_random(99);
	const auto b = random_scene(8, 4);
	EXPECT_EQ(a.world.size(), b.world.size());
}

TEST(Scene, DefaultSceneSharesGlass)
{
	const auto scene = default_scene();

	// the bubble: the ray passes the outer and inner glass surfaces of the
	// left sphere, both made of the same material
	HitRecord outer, inner;
	const Ray r(ovec3(-1, 0, 1), ovec3(0, 0, -1));
	ASSERT_TRUE(scene.world.hit(r, 0.001f, oinfinity, outer));
	ASSERT_TRUE(scene.world.hit(r, outer.t, oinfinity, inner));
	EXPECT_NEAR(outer.t, 1.5f, 1e-5f);
	EXPECT_NEAR(inner.t, 1.55f, 1e-5f);
	EXPECT_EQ(outer.material, inner.material);
	// outer normal faces the ray, the shell's faces away from it
	EXPECT_LT(glm::dot(outer.normal, r.direction()), 0.f);
	EXPECT_GT(glm::dot(inner.normal, r.direction()), 0.f);
}
