#include "pathtracer/pch.hpp"
#include "pathtracer/args.hpp"
#include "pathtracer/image.hpp"
#include "pathtracer/random.hpp"
#include "pathtracer/renderer.hpp"
#include "pathtracer/scene.hpp"
#include "pathtracer/utility.hpp"

static void log_usage()
{
	rusage usage;
	if (getrusage(RUSAGE_SELF, &usage) == 0) {
		spdlog::debug("Peak self RSS usage: {:.3f} MiB", usage.ru_maxrss / 1024.0);
		spdlog::debug("User CPU time: {:.3f} s", usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6f);
		spdlog::debug("System CPU time: {:.3f} s", usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6f);
	}
}

int main(int argc, char** argv)
{
	auto stderr_logger = spdlog::stderr_color_mt("stderr_logger");
	spdlog::set_default_logger(stderr_logger);

	spdlog::set_level(spdlog::level::info);
	spdlog::set_pattern("[%^%l%$ +%o] %v");

	try {
		Args args;
		args.process(argc, argv);
		if (args.help) {
			args.print_help();
			return 1;
		}

		if (args.verbose)
			spdlog::set_level(spdlog::level::debug);
		else if (args.silent)
			spdlog::set_level(spdlog::level::warn);

		const unsigned seed = args.seed >= 0 ? unsigned(args.seed) : unsigned(time(nullptr));
		seed_random(seed);
		spdlog::debug("Random seed: {}", seed);

		const Scene scene = build_scene(args.scene, args.width, args.height);
		const Renderer renderer({.samples = args.samples, .max_depth = args.depth});

		auto image = renderer.render(scene);
		make_writer(args.output)->write(image, args.output);

		log_usage();
	} catch (const assertion&) {
		return 1;
	} catch (const std::exception& e) {
		std::println(stderr, "Fatal std::exception: {}", e.what());
		return 2;
	}
}
