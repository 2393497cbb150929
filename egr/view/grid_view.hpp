#pragma once

#include <cstdint>

#include "math.hpp"
#include "grid_data.hpp"
#include "texture.hpp"


namespace egr::view {


struct GridViewParams
{
	float zoom_exp_min {-3.0f};
	float zoom_exp_max { 2.0f};
	float pan_speed    { 5.0f};
};


/*
	Pan/zoom state of an editor viewport and the source of the overlay's
	offset and zoom_exp uniforms. camera_target is the world point at the
	top-left corner of the viewport; one world unit spans 2^zoom_exp pixels.
*/
class GridView
{
public:

	GridView(uint32_t width, uint32_t height, GridViewParams params = {});

	void set_camera(const vec2& camera_target, float zoom_exp);

	// origin: viewport pixel that stays fixed while zooming
	void zoom_and_pan(const vec2& origin, const vec2& pan, float zoom_delta);

	void resize(int32_t width, int32_t height);

	float camera_zoom() const;

	vec2 screen_to_world(const vec2& screen_px) const;
	vec2 world_to_screen(const vec2& world) const;

	rdr::GridUniforms grid_uniforms(const rdr::Texture* texture, const rdr::SamplerDesc& sampler) const;

	bool consume_dirty();

	bool is_dirty() const
	{ return m_dirty; }

	const vec2& camera_target() const
	{ return m_camera_target; }

	float zoom_exp() const
	{ return m_zoom_exp; }

	const vec2& viewport_size() const
	{ return m_viewport_size; }

	const GridViewParams& params() const
	{ return m_params; }

private:

	GridViewParams m_params;

	vec2  m_camera_target {0.0f, 0.0f};
	float m_zoom_exp      {0.0f};
	vec2  m_viewport_size {1280.0f, 720.0f};

	bool m_dirty {true};
};


// truncates toward zero onto a multiple of grid_step
[[nodiscard]] ivec2 snap_to_grid(const ivec2& cell, int32_t grid_step);


} // egr::view
