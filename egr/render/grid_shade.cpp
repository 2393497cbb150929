#include "grid_shade.hpp"

#include <cmath>

#include "color.hpp"
#include "texture.hpp"


namespace egr::rdr {


float zoom_from_exp(float zoom_exp)
{
	return 1.0f / std::exp2(zoom_exp);
}


vec2 grid_relative(const vec2& tex_coord, const GridUniforms& uniforms)
{
	const float zoom = zoom_from_exp(uniforms.zoom_exp);

	return math::glsl_mod((tex_coord * uniforms.size - uniforms.offset) * zoom, vec2(grid_size));
}


bool is_grid_line(const vec2& grid_rel)
{
	return grid_rel.x < grid_line_half_width || grid_rel.y < grid_line_half_width;
}


float grid_period(float zoom_exp)
{
	return grid_size / zoom_from_exp(zoom_exp);
}


vec4 shade_classified_fragment(bool on_grid_line, const FragmentInput& fragment, const GridUniforms& uniforms)
{
	if (!on_grid_line)
		return transparent_black;

	return uniforms.texture
		? sample(*uniforms.texture, uniforms.sampler, fragment.tex_coord)
		: opaque_white;
}


vec4 shade_grid_fragment(const FragmentInput& fragment, const GridUniforms& uniforms)
{
	const vec2 grid_rel = grid_relative(fragment.tex_coord, uniforms);

	return shade_classified_fragment(is_grid_line(grid_rel), fragment, uniforms);
}


} // egr::rdr
