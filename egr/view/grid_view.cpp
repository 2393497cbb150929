#include "grid_view.hpp"

#include <cmath>
#include <limits>
#include <algorithm>

#include "log.hpp"
#include "panic.hpp"


namespace egr::view {


namespace {

	// largest floats that still convert to int32 without overflow
	const float pan_lo = std::nextafter(static_cast<float>(std::numeric_limits<int32_t>::min()), 0.0f);
	const float pan_hi = std::nextafter(static_cast<float>(std::numeric_limits<int32_t>::max()), 0.0f);

	uint32_t clamp_extent(int32_t extent)
	{
		return extent <= 0 ? 1U : static_cast<uint32_t>(extent);
	}

} // anon


GridView::GridView(uint32_t width, uint32_t height, GridViewParams params)
	: m_params        {params}
	, m_viewport_size {
		static_cast<float>(width  == 0 ? 1U : width),
		static_cast<float>(height == 0 ? 1U : height)
	}
{
	if (m_params.zoom_exp_min > m_params.zoom_exp_max) {
		EGR_WARN(
			log::LogCategory::view,
			"[grid_view] zoom range inverted, swapping [min %.2f][max %.2f]",
			m_params.zoom_exp_min,
			m_params.zoom_exp_max
		);
		std::swap(m_params.zoom_exp_min, m_params.zoom_exp_max);
	}

	m_zoom_exp = std::clamp(0.0f, m_params.zoom_exp_min, m_params.zoom_exp_max);
}


void GridView::set_camera(const vec2& camera_target, float zoom_exp)
{
	const vec2 new_target {
		std::clamp(camera_target.x, pan_lo, pan_hi),
		std::clamp(camera_target.y, pan_lo, pan_hi)
	};
	const float new_zoom_exp = std::clamp(zoom_exp, m_params.zoom_exp_min, m_params.zoom_exp_max);

	if (new_target != m_camera_target || new_zoom_exp != m_zoom_exp) {
		m_camera_target = new_target;
		m_zoom_exp      = new_zoom_exp;
		m_dirty         = true;
	}
}


void GridView::zoom_and_pan(const vec2& origin, const vec2& pan, float zoom_delta)
{
	if (zoom_delta != 0.0f) {

		const float new_zoom_exp = std::clamp(m_zoom_exp + zoom_delta, m_params.zoom_exp_min, m_params.zoom_exp_max);

		if (new_zoom_exp != m_zoom_exp) {
			m_camera_target += origin / std::exp2(m_zoom_exp);
			m_zoom_exp = new_zoom_exp;
			m_camera_target -= origin / std::exp2(m_zoom_exp);
			m_dirty = true;

			EGR_TRACE(log::LogCategory::view, "[grid_view][zoom] [zoom_exp %.2f]", m_zoom_exp);
		}
	}

	if (math::length_sq(pan) > 0.0f) {

		const float pan_step = m_params.pan_speed * std::exp2(-m_zoom_exp);

		const vec2 new_target {
			std::clamp(m_camera_target.x + pan.x * pan_step, pan_lo, pan_hi),
			std::clamp(m_camera_target.y + pan.y * pan_step, pan_lo, pan_hi)
		};

		if (new_target != m_camera_target) {
			m_camera_target = new_target;
			m_dirty = true;

			EGR_TRACE(
				log::LogCategory::view,
				"[grid_view][pan] [target %.2f %.2f]",
				m_camera_target.x,
				m_camera_target.y
			);
		}
	}
}


void GridView::resize(int32_t width, int32_t height)
{
	const vec2 new_size {
		static_cast<float>(clamp_extent(width)),
		static_cast<float>(clamp_extent(height))
	};

	if (new_size != m_viewport_size) {
		m_viewport_size = new_size;
		m_dirty = true;

		EGR_DEBUG(
			log::LogCategory::view,
			"[grid_view][resize] [size %.0fx%.0f]",
			m_viewport_size.x,
			m_viewport_size.y
		);
	}
}


float GridView::camera_zoom() const
{
	return std::exp2(m_zoom_exp);
}


vec2 GridView::screen_to_world(const vec2& screen_px) const
{
	return m_camera_target + screen_px / camera_zoom();
}


vec2 GridView::world_to_screen(const vec2& world) const
{
	return (world - m_camera_target) * camera_zoom();
}


rdr::GridUniforms GridView::grid_uniforms(const rdr::Texture* texture, const rdr::SamplerDesc& sampler) const
{
	rdr::GridUniforms uniforms {};

	uniforms.texture  = texture;
	uniforms.sampler  = sampler;
	uniforms.offset   = m_camera_target;
	uniforms.zoom_exp = m_zoom_exp;
	uniforms.size     = m_viewport_size;

	return uniforms;
}


bool GridView::consume_dirty()
{
	const bool was_dirty = m_dirty;
	m_dirty = false;
	return was_dirty;
}


ivec2 snap_to_grid(const ivec2& cell, int32_t grid_step)
{
	EGR_ASSERT_MSG(grid_step > 0, "[snap_to_grid] grid_step <= 0");

	return ivec2 {
		cell.x - (cell.x % grid_step),
		cell.y - (cell.y % grid_step)
	};
}


} // egr::view
