#include "pathtracer/random.hpp"

void seed_random(unsigned seed)
{
	std::srand(seed);
}

oreal uniform01()
{
	// glm::linearRand is closed on both ends, so scale by RAND_MAX + 1 instead.
	// The float division can still round up to 1 for the largest draws
	const oreal r = oreal(std::rand()) / (oreal(RAND_MAX) + oreal(1));
	return r < oreal(1) ? r : std::nextafter(oreal(1), oreal(0));
}

ovec3 random_in_unit_sphere()
{
	ovec3 p;
	do {
		p = oreal(2) * ovec3(uniform01(), uniform01(), uniform01()) - ovec3(1, 1, 1);
	} while (squared_length(p) >= oreal(1));
	return p;
}

ovec3 random_in_unit_disk()
{
	ovec3 p;
	do {
		p = oreal(2) * ovec3(uniform01(), uniform01(), 0) - ovec3(1, 1, 0);
	} while (glm::dot(p, p) >= oreal(1));
	return p;
}
