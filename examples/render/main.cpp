#include <iostream>
#include <map>

#include <argparse/argparse.hpp>

#include "shir.hpp"

using namespace shir;
using namespace shir::ir;

MODULE(shir-render);

// Vertex shader scaling a position by a lit intensity:
//
//   U0: time, U1: light (direction, color)
//   A0: position
//   V0: color
Program demonstration()
{
	Type light { .main = structure, .sub = { { .main = vec3 }, { .main = vec3 } } };

	// Accumulate a few pulses of the time uniform
	Block pulses {
		.statements = {
			branch(binary(greater_than, reference(uniform, 0), reference(local, 1)),
				Block {
					.statements = {
						assign(reference(local, 0),
							binary(addition, reference(local, 0), numeric(0.25))),
					},
				},
				Block { .statements = { jump(stop) } }),
		},
	};

	Block body {
		.locals = { { .main = f32 } },
		.statements = {
			assign(reference(local, 0), numeric(0)),
			loop(0, 4, 1, pulses),
			assign(reference(varying, 0),
				binary(multiplication, reference(local, 0), reference(attribute, 0))),
		},
	};

	return Program {
		.uniforms = { { .main = f32 }, light },
		.attributes = { { .main = vec2 } },
		.varyings = { { .main = vec2 } },
		.funcs = { { .name = "main", .block = body } },
	};
}

int main(int argc, char *argv[])
{
	argparse::ArgumentParser program("shir-render");

	program.add_argument("--profile")
		.help("target profile: plain, 110, 120 or es100")
		.default_value(std::string("plain"));

	program.add_argument("--output")
		.help("file to write the generated source to");

	try {
		program.parse_args(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << e.what() << std::endl;
		std::cerr << program;
		return 1;
	}

	static const std::map <std::string, profiles::glsl_version> targets {
		{ "plain", profiles::glsl_plain },
		{ "110", profiles::glsl_110 },
		{ "120", profiles::glsl_120 },
		{ "es100", profiles::glsl_es_100 },
	};

	auto name = program.get <std::string> ("--profile");
	if (!targets.count(name)) {
		SHIR_ERROR("unknown profile \"{}\"", name);
		return 1;
	}

	std::string glsl;
	{
		SHIR_STAGE();
		glsl = demonstration().generate_glsl(targets.at(name));
	}

	if (auto output = program.present("--output")) {
		io::write_lines(output.value(), glsl);
		SHIR_INFO("wrote {} profile source to {}", name, output.value());
	} else {
		io::display_lines("GLSL", glsl);
	}

	return 0;
}
