#include "pathtracer/args.hpp"
#include "pathtracer/utility.hpp"

void Args::process(int argc, char** argv)
{
	for (int i=1; i < argc; i++)
	{
		const std::string_view arg(argv[i]);

		auto desc = std::find_if(this->desc, this->desc + desc_size, [arg](const auto& desc) {
			return desc.str == arg;
		});

		if (desc == this->desc + desc_size)
			throw std::runtime_error(std::format("Unknown argument: {}", arg));

		switch (desc->type)
		{
		case ArgType::boolean:
			*static_cast<bool*>(desc->ptr) = true;
			break;

		case ArgType::integer:
			i++;
			if (i >= argc)
				throw std::runtime_error(std::format("Provide the integer {} is expecting", arg));
			try {
				*static_cast<int*>(desc->ptr) = std::stoi(argv[i]);
			} catch (const std::logic_error&) {
				throw std::runtime_error(std::format("{} expects an integer, got '{}'", arg, argv[i]));
			}
			break;

		case ArgType::string:
			i++;
			if (i >= argc)
				throw std::runtime_error(std::format("Provide the string {} is expecting", arg));
			*static_cast<std::string*>(desc->ptr) = argv[i];
			break;

		default:
			iassert(false, "Case {} left uncovered", static_cast<int>(desc->type));
			break;
		}
	}

	if (help)
		return;

	if (output.empty())
		throw std::runtime_error("--output can't be empty");
	if (samples <= 0)
		throw std::runtime_error(std::format("--samples must be positive, got {}", samples));
	if (depth < 0)
		throw std::runtime_error(std::format("--depth can't be negative, got {}", depth));
	if (width < 0 or height < 0)
		throw std::runtime_error(std::format("Image dimensions can't be negative, got {}x{}", width, height));
	if (verbose and silent)
		throw std::runtime_error("--verbose and --silent are exclusive");
}

void Args::print_help() const
{
	std::println(stderr, "Options:");
	for (auto const& d : desc)
		std::println(stderr, "  {}: {}", d.str, d.str_desc);
}
