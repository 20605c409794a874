#pragma once

#include "pathtracer/pch.hpp"

// Command line settings. process() fills them in from argv
struct Args
{
	enum class ArgType {
		boolean, integer, string
	};

	bool help = false;

	std::string output = "image.ppm";
	std::string scene = "default";
	int width = 0, height = 0;
	int samples = 100;
	int depth = 50;
	int seed = -1;
	bool verbose = false;
	bool silent = false;

	struct Desc {
		std::string_view str;
		std::string_view str_desc;
		ArgType type;
		void* ptr;
	} const desc[10] {
		{"--help", "b: Self explanatory", ArgType::boolean, &help},
		{"--output", "s: Image to write, .png or .ppm", ArgType::string, &output},
		{"--scene", "s: Built-in scene: simple, single, default or random", ArgType::string, &scene},
		{"--width", "i: Image width, 0 for the scene's own", ArgType::integer, &width},
		{"--height", "i: Image height, 0 for the scene's own", ArgType::integer, &height},
		{"--samples", "i: Samples per pixel", ArgType::integer, &samples},
		{"--depth", "i: Maximum bounces per path", ArgType::integer, &depth},
		{"--seed", "i: Seed of the random stream, negative to seed from the clock", ArgType::integer, &seed},
		{"--verbose", "b: Log debug messages", ArgType::boolean, &verbose},
		{"--silent", "b: Only log warnings and errors", ArgType::boolean, &silent},
	};
	const size_t desc_size = sizeof(desc) / sizeof(*desc);

	Args() = default;
	Args(Args const&) = delete;
	Args& operator=(Args const&) = delete;

	// Throws std::runtime_error on unknown flags and missing or malformed values
	void process(int argc, char** argv);
	void print_help() const;
};
