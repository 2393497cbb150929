#pragma once

#include <cstdint>

#include "math.hpp"
#include "color.hpp"
#include "texture.hpp"


namespace egr::rdr {


inline constexpr float grid_size            = 8.0f;
inline constexpr float grid_line_half_width = 0.5f;

static_assert(grid_size > 0.0f, "grid_size must be nonzero");


/*
	Per-pass configuration of the grid overlay. Read-only for every fragment
	of one GridPass::execute(); the host rebinds it between passes.

	texture  - sampled for on-line pixels, nullptr samples as opaque white
	tint     - carried for the host, not applied to the output
	offset   - pixel-space shift of the grid origin
	zoom_exp - effective zoom is 2^-zoom_exp
	size     - pixel extent the [0,1] texture coordinates span
*/
struct GridUniforms
{
	const Texture* texture  {nullptr};
	SamplerDesc    sampler  {};
	vec4           tint     {1.0f, 1.0f, 1.0f, 1.0f};
	vec2           offset   {0.0f, 0.0f};
	float          zoom_exp {0.0f};
	vec2           size     {1280.0f, 720.0f};
};


// interpolated per-fragment inputs
struct FragmentInput
{
	vec2 tex_coord {0.0f, 0.0f};
	vec4 color     {1.0f, 1.0f, 1.0f, 1.0f};
};


struct GridPassStats
{
	uint64_t line_pixels  {0};
	uint64_t blank_pixels {0};
};


} // egr::rdr
