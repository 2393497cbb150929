#pragma once

#include <cstdint>
#include <cstddef>

#include "log.hpp"
#include "math.hpp"
#include "panic.hpp"
#include "mtp_memory.hpp"


namespace egr::rdr {


// float RGBA color target, row-major, row 0 at tex_coord.y ~ 0
class Framebuffer
{
public:

	Framebuffer() = default;

	bool resize(uint32_t width, uint32_t height)
	{
		if (width == 0 || height == 0) {
			EGR_ERROR(
				log::LogCategory::render,
				"[framebuffer][resize] zero extent [width %u][height %u]",
				width,
				height
			);
			return false;
		}

		if (width == m_width && height == m_height)
			return true;

		const size_t count = static_cast<size_t>(width) * static_cast<size_t>(height);

		m_pixels.clear();
		m_pixels.reserve(count);

		for (size_t pixel_index = 0; pixel_index < count; ++pixel_index)
			m_pixels.emplace_back(0.0f, 0.0f, 0.0f, 0.0f);

		m_width  = width;
		m_height = height;

		return true;
	}

	void clear(const vec4& color)
	{
		const size_t count = pixel_count();
		for (size_t pixel_index = 0; pixel_index < count; ++pixel_index)
			m_pixels[pixel_index] = color;
	}

	vec4& at(uint32_t x, uint32_t y)
	{
		EGR_ASSERT_MSG(x < m_width && y < m_height, "[framebuffer] pixel out of range");
		return m_pixels[static_cast<size_t>(y) * m_width + x];
	}

	const vec4& at(uint32_t x, uint32_t y) const
	{
		EGR_ASSERT_MSG(x < m_width && y < m_height, "[framebuffer] pixel out of range");
		return m_pixels[static_cast<size_t>(y) * m_width + x];
	}

	uint32_t width() const
	{ return m_width; }

	uint32_t height() const
	{ return m_height; }

	size_t pixel_count() const
	{ return static_cast<size_t>(m_width) * static_cast<size_t>(m_height); }

private:

	uint32_t m_width  {0};
	uint32_t m_height {0};

	mtp::vault<vec4, mtp::default_set> m_pixels;
};


} // egr::rdr
