#pragma once

#include <cmath>
#include <cstdint>

#define GLM_FORCE_RADIANS

#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>


namespace egr {


using vec2  = glm::vec2;
using vec4  = glm::vec4;
using ivec2 = glm::ivec2;

} // egr


namespace egr::math {


// GLSL mod(): x - y * floor(x / y), result takes the sign of y
[[nodiscard]] inline float glsl_mod(float value, float divisor)
{
	return value - divisor * std::floor(value / divisor);
}


[[nodiscard]] inline vec2 glsl_mod(const vec2& value, const vec2& divisor)
{
	return vec2 {
		glsl_mod(value.x, divisor.x),
		glsl_mod(value.y, divisor.y)
	};
}


[[nodiscard]] inline float length_sq(const vec2& vec)
{
	return glm::dot(vec, vec);
}


} // egr::math
