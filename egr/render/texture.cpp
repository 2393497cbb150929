#include "texture.hpp"

#include <cmath>

#include "log.hpp"
#include "color.hpp"
#include "panic.hpp"


namespace egr::rdr {


namespace {


	int64_t wrap_index(int64_t index, int64_t extent, SamplerWrap wrap)
	{
		switch (wrap) {

		case SamplerWrap::clamp_to_edge:
			if (index < 0)
				return 0;
			if (index >= extent)
				return extent - 1;
			return index;

		case SamplerWrap::mirrored_repeat: {
			const int64_t period = extent * 2;
			int64_t folded = index % period;
			if (folded < 0)
				folded += period;
			return (folded < extent) ? folded : (period - 1 - folded);
		}

		case SamplerWrap::repeat:
		default: {
			int64_t folded = index % extent;
			if (folded < 0)
				folded += extent;
			return folded;
		}
		}
	}


	// non-finite coordinates land on texel 0 instead of overflowing the cast
	int64_t texel_floor(float texel_coord)
	{
		if (!std::isfinite(texel_coord))
			return 0;

		constexpr double limit = 1.0e15;
		const double clamped = std::fmax(-limit, std::fmin(limit, static_cast<double>(texel_coord)));

		return static_cast<int64_t>(std::floor(clamped));
	}

} // anon


bool Texture::create(uint32_t width, uint32_t height)
{
	if (width == 0 || height == 0) {
		EGR_ERROR(
			log::LogCategory::render,
			"[texture][create] zero extent [width %u][height %u]",
			width,
			height
		);
		return false;
	}

	const size_t texel_count = static_cast<size_t>(width) * static_cast<size_t>(height);

	m_texels.clear();
	m_texels.reserve(texel_count);

	for (size_t texel_index = 0; texel_index < texel_count; ++texel_index)
		m_texels.emplace_back(0U);

	m_width  = width;
	m_height = height;

	EGR_DEBUG(
		log::LogCategory::render,
		"[texture][create] ok [width %u][height %u]",
		width,
		height
	);

	return true;
}


void Texture::release()
{
	m_texels.clear();
	m_width  = 0;
	m_height = 0;
}


void Texture::set_texel(uint32_t x, uint32_t y, uint32_t rgba8)
{
	EGR_ASSERT_MSG(x < m_width && y < m_height, "[texture] texel out of range");
	m_texels[static_cast<size_t>(y) * m_width + x] = rgba8;
}


uint32_t Texture::texel(uint32_t x, uint32_t y) const
{
	EGR_ASSERT_MSG(x < m_width && y < m_height, "[texture] texel out of range");
	return m_texels[static_cast<size_t>(y) * m_width + x];
}


vec4 Texture::fetch(uint32_t x, uint32_t y) const
{
	return rgba_from_u32(texel(x, y));
}


bool make_checker_texture(
	Texture&  texture,
	uint32_t  width,
	uint32_t  height,
	uint32_t  cell_px,
	uint32_t  rgba8_even,
	uint32_t  rgba8_odd
)
{
	if (cell_px == 0) {
		EGR_ERROR(log::LogCategory::render, "[texture][checker] cell_px == 0");
		return false;
	}

	if (!texture.create(width, height))
		return false;

	for (uint32_t y = 0; y < height; ++y) {
		for (uint32_t x = 0; x < width; ++x) {
			const bool is_odd = (((x / cell_px) + (y / cell_px)) & 1U) != 0;
			texture.set_texel(x, y, is_odd ? rgba8_odd : rgba8_even);
		}
	}

	return true;
}


vec4 sample(const Texture& texture, const SamplerDesc& sampler, const vec2& tex_coord)
{
	if (texture.empty())
		return transparent_black;

	const int64_t width  = texture.width();
	const int64_t height = texture.height();

	const float texel_u = tex_coord.x * static_cast<float>(width);
	const float texel_v = tex_coord.y * static_cast<float>(height);

	if (sampler.filter == SamplerFilter::nearest) {

		const int64_t x = wrap_index(texel_floor(texel_u), width,  sampler.wrap_u);
		const int64_t y = wrap_index(texel_floor(texel_v), height, sampler.wrap_v);

		return texture.fetch(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
	}

	// texel centers sit at i + 0.5
	const float center_u = texel_u - 0.5f;
	const float center_v = texel_v - 0.5f;

	const int64_t x_base = texel_floor(center_u);
	const int64_t y_base = texel_floor(center_v);

	const float frac_u = std::isfinite(center_u) ? center_u - static_cast<float>(x_base) : 0.0f;
	const float frac_v = std::isfinite(center_v) ? center_v - static_cast<float>(y_base) : 0.0f;

	const auto x0 = static_cast<uint32_t>(wrap_index(x_base,     width,  sampler.wrap_u));
	const auto x1 = static_cast<uint32_t>(wrap_index(x_base + 1, width,  sampler.wrap_u));
	const auto y0 = static_cast<uint32_t>(wrap_index(y_base,     height, sampler.wrap_v));
	const auto y1 = static_cast<uint32_t>(wrap_index(y_base + 1, height, sampler.wrap_v));

	const vec4 row_0 = glm::mix(texture.fetch(x0, y0), texture.fetch(x1, y0), frac_u);
	const vec4 row_1 = glm::mix(texture.fetch(x0, y1), texture.fetch(x1, y1), frac_u);

	return glm::mix(row_0, row_1, frac_v);
}


const char* filter_name(SamplerFilter filter)
{
	switch (filter) {
	case SamplerFilter::nearest: return "nearest";
	case SamplerFilter::linear:  return "linear";
	}
	return "unknown";
}


const char* wrap_name(SamplerWrap wrap)
{
	switch (wrap) {
	case SamplerWrap::repeat:          return "repeat";
	case SamplerWrap::clamp_to_edge:   return "clamp_to_edge";
	case SamplerWrap::mirrored_repeat: return "mirrored_repeat";
	}
	return "unknown";
}


} // egr::rdr
