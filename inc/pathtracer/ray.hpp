#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/types.hpp"

// Half-line origin + t * direction. The direction is not kept normalized
class Ray
{
public:
	Ray() {}

	Ray(ovec3 const& origin, ovec3 const& direction)
		:m_origin(origin), m_direction(direction)
	{}

	ovec3 const& origin() const { return m_origin; }
	ovec3 const& direction() const { return m_direction; }

	ovec3 at(oreal t) const
	{
		return m_origin + m_direction * t;
	}

private:
	ovec3 m_origin {}, m_direction {};
};
