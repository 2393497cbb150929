#pragma once

#include "math.hpp"
#include "grid_data.hpp"


namespace egr::rdr {


[[nodiscard]] float zoom_from_exp(float zoom_exp);

// position inside the current grid cell, each component in [0, grid_size)
[[nodiscard]] vec2 grid_relative(const vec2& tex_coord, const GridUniforms& uniforms);

[[nodiscard]] bool is_grid_line(const vec2& grid_rel);

// pixel-space distance after which the pattern repeats
[[nodiscard]] float grid_period(float zoom_exp);

// shade_grid_fragment with the line test already done by the caller
[[nodiscard]] vec4 shade_classified_fragment(bool on_grid_line, const FragmentInput& fragment, const GridUniforms& uniforms);

/*
	One fragment of the overlay: the sampled texel when the fragment lies on
	a grid line, transparent black otherwise. fragment.color and
	uniforms.tint do not contribute.
*/
[[nodiscard]] vec4 shade_grid_fragment(const FragmentInput& fragment, const GridUniforms& uniforms);


} // egr::rdr
