#pragma once

#include <cstdint>

#include "math.hpp"
#include "mtp_memory.hpp"


namespace egr::rdr {


enum class SamplerFilter : uint8_t
{
	nearest = 0,
	linear
};


enum class SamplerWrap : uint8_t
{
	repeat = 0,
	clamp_to_edge,
	mirrored_repeat
};


struct SamplerDesc
{
	SamplerFilter filter {SamplerFilter::nearest};
	SamplerWrap   wrap_u {SamplerWrap::repeat};
	SamplerWrap   wrap_v {SamplerWrap::repeat};
};


// RGBA8 image, row 0 at v = 0
class Texture
{
public:

	Texture() = default;

	bool create(uint32_t width, uint32_t height);
	void release();

	uint32_t width() const
	{ return m_width; }

	uint32_t height() const
	{ return m_height; }

	bool empty() const
	{ return m_width == 0 || m_height == 0; }

	void     set_texel(uint32_t x, uint32_t y, uint32_t rgba8);
	uint32_t texel(uint32_t x, uint32_t y) const;

	vec4 fetch(uint32_t x, uint32_t y) const;

private:

	uint32_t m_width  {0};
	uint32_t m_height {0};

	mtp::vault<uint32_t, mtp::default_set> m_texels;
};


[[nodiscard]] bool make_checker_texture(
	Texture&  texture,
	uint32_t  width,
	uint32_t  height,
	uint32_t  cell_px,
	uint32_t  rgba8_even,
	uint32_t  rgba8_odd
);


[[nodiscard]] vec4 sample(const Texture& texture, const SamplerDesc& sampler, const vec2& tex_coord);


const char* filter_name(SamplerFilter filter);
const char* wrap_name(SamplerWrap wrap);


} // egr::rdr
