#pragma once

#include <cstdint>

#include "math.hpp"


namespace egr {


inline const vec4 transparent_black {0.0f, 0.0f, 0.0f, 0.0f};
inline const vec4 opaque_white      {1.0f, 1.0f, 1.0f, 1.0f};


inline uint32_t color_to_byte(float color_value)
{
	if (color_value <= 0.f)
		return 0U;
	if (color_value >= 1.f)
		return 255U;

	return static_cast<uint32_t>(color_value * 255.f + 0.5f);
}


// r in the low byte, a in the high byte (GL_RGBA / GL_UNSIGNED_BYTE memory order)
inline uint32_t rgba_to_u32(const vec4& rgba)
{
	uint32_t r = color_to_byte(rgba.r);
	uint32_t g = color_to_byte(rgba.g);
	uint32_t b = color_to_byte(rgba.b);
	uint32_t a = color_to_byte(rgba.a);

	return r | (g << 8) | (b << 16) | (a << 24);
}


inline vec4 rgba_from_u32(uint32_t rgba)
{
	constexpr float inv_255 = 1.0f / 255.0f;

	float r = static_cast<float>( rgba        & 0xFF) * inv_255;
	float g = static_cast<float>((rgba >> 8)  & 0xFF) * inv_255;
	float b = static_cast<float>((rgba >> 16) & 0xFF) * inv_255;
	float a = static_cast<float>((rgba >> 24) & 0xFF) * inv_255;

	return vec4(r, g, b, a);
}

} // egr
