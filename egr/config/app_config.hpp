#pragma once

#include <string>
#include <cstdint>

#include "log.hpp"
#include "math.hpp"
#include "texture.hpp"
#include "grid_view.hpp"


namespace egr::cfg {


// largest framebuffer edge the runtime will allocate
inline constexpr float max_target_extent = 16384.0f;


struct GridConfig
{
	vec2  offset   {0.0f, 0.0f};
	float zoom_exp {0.0f};
	vec2  size     {1280.0f, 720.0f};
	vec4  tint     {1.0f, 1.0f, 1.0f, 1.0f};
};


struct JobsConfig
{
	uint32_t worker_count {0}; // 0: hardware concurrency
	uint32_t row_grain    {16};
};


struct LogConfig
{
	log::LogLevel level {log::LogLevel::info};
	std::string   file_path;
};


// startup pan/zoom step applied by the runtime before the first frame
struct StartupConfig
{
	vec2  zoom_origin {0.0f, 0.0f};
	vec2  pan         {0.0f, 0.0f};
	float zoom_delta  {0.0f};
};


struct AppConfig
{
	GridConfig           grid    {};
	rdr::SamplerDesc     sampler {};
	view::GridViewParams view    {};
	StartupConfig        startup {};
	JobsConfig           jobs    {};
	LogConfig            log     {};
};


} // egr::cfg
