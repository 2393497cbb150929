#include <cstdio>
#include <memory>

#include "mtp_memory.hpp"

#include "log.hpp"
#include "color.hpp"
#include "texture.hpp"
#include "grid_pass.hpp"
#include "grid_view.hpp"
#include "scheduler.hpp"
#include "framebuffer.hpp"
#include "config_io.hpp"
#include "app_config.hpp"


namespace {


struct GlobalContext
{
	egr::cfg::AppConfig  config;
	egr::job::Scheduler  scheduler;
	egr::rdr::Texture    texture;
	egr::rdr::Framebuffer framebuffer;
};


void apply_log_config(const egr::cfg::LogConfig& log_config)
{
	egr::log::set_level(log_config.level);

	if (!log_config.file_path.empty() && !egr::log::open_file(log_config.file_path.c_str())) {
		EGR_WARN(
			egr::log::LogCategory::core,
			"[entry] log file open fail, stderr only [path %s]",
			log_config.file_path.c_str()
		);
	}
}


int run(GlobalContext& ctx)
{
	using namespace egr;

	const cfg::AppConfig& config = ctx.config;

	const uint32_t worker_count = config.jobs.worker_count != 0
		? config.jobs.worker_count
		: job::default_worker_count();

	ctx.scheduler.init(worker_count);

	const auto width  = static_cast<uint32_t>(config.grid.size.x);
	const auto height = static_cast<uint32_t>(config.grid.size.y);

	constexpr uint32_t checker_extent = 64;
	constexpr uint32_t checker_cell   = 8;

	if (!rdr::make_checker_texture(
		ctx.texture,
		checker_extent,
		checker_extent,
		checker_cell,
		rgba_to_u32(vec4 {0.34f, 0.36f, 0.40f, 1.0f}),
		rgba_to_u32(vec4 {0.22f, 0.23f, 0.26f, 1.0f})
	)) {
		EGR_ERROR(log::LogCategory::core, "[entry] checker texture fail");
		return 1;
	}

	if (!ctx.framebuffer.resize(width, height)) {
		EGR_ERROR(log::LogCategory::core, "[entry] framebuffer fail [size %ux%u]", width, height);
		return 1;
	}

	view::GridView grid_view {width, height, config.view};

	grid_view.set_camera(config.grid.offset, config.grid.zoom_exp);
	grid_view.zoom_and_pan(config.startup.zoom_origin, config.startup.pan, config.startup.zoom_delta);

	rdr::GridPass grid_pass {ctx.scheduler};
	grid_pass.set_row_grain(config.jobs.row_grain);

	if (grid_view.consume_dirty()) {

		rdr::GridUniforms uniforms = grid_view.grid_uniforms(&ctx.texture, config.sampler);
		uniforms.tint = config.grid.tint;

		const rdr::GridPassStats stats = grid_pass.execute(uniforms, ctx.framebuffer);

		const double line_ratio = static_cast<double>(stats.line_pixels) /
			static_cast<double>(ctx.framebuffer.pixel_count());

		EGR_INFO(
			log::LogCategory::render,
			"[entry] grid frame [size %ux%u][workers %u][offset %.2f %.2f][zoom_exp %.2f][period %.2f px][line %.1f%%]",
			width,
			height,
			worker_count,
			uniforms.offset.x,
			uniforms.offset.y,
			uniforms.zoom_exp,
			rdr::grid_period(uniforms.zoom_exp),
			line_ratio * 100.0
		);
	}

	return 0;
}

} // anon


int main(int argc, char** argv)
{
	mtp::init_tls<mtp::default_set>();
	egr::log::initialize(egr::log::LogLevel::info);

	auto global_ctx = std::make_unique<GlobalContext>();

	if (argc > 1) {
		if (!egr::cfg::io::read_config_file(argv[1], global_ctx->config)) {
			EGR_WARN(egr::log::LogCategory::core, "[entry] config load fail, using defaults [path %s]", argv[1]);
			global_ctx->config = egr::cfg::AppConfig {};
		}
	}

	apply_log_config(global_ctx->config.log);

	const int exit_code = run(*global_ctx);

	global_ctx->scheduler.shutdown();
	global_ctx.reset();

	mtp::get_tls_allocator<mtp::default_set>().reset();

	egr::log::shutdown();

	return exit_code;
}
