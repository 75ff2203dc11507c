#pragma once

namespace shir::profiles {

// Preamble of the generated source
//
//   version: emitted as #version <version> when not null
//   precision: default float precision (GLSL ES) when not null
struct glsl_version {
	const char *version;
	const char *precision;
} static glsl_plain(nullptr, nullptr),
	 glsl_110("110", nullptr),
	 glsl_120("120", nullptr),
	 glsl_es_100("100", "highp");

} // namespace shir::profiles
