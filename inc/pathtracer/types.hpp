#pragma once

#include "pathtracer/pch.hpp"

using oreal = float;
using ovec2 = glm::tvec2<oreal>;
using ovec3 = glm::tvec3<oreal>;
using ocolor = ovec3;  // r, g, b aliased onto x, y, z
using opixel = glm::u8vec3;

constexpr oreal oinfinity = std::numeric_limits<oreal>::infinity();

// v must not be the zero vector
inline ovec3 unit(ovec3 const& v)
{
	return v / glm::length(v);
}

inline oreal squared_length(ovec3 const& v)
{
	return glm::length2(v);
}
