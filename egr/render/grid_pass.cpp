#include "grid_pass.hpp"

#include <chrono>

#include "log.hpp"
#include "panic.hpp"
#include "job_latch.hpp"
#include "grid_shade.hpp"


namespace egr::rdr {


GridPass::GridPass(job::Scheduler& scheduler)
	: m_scheduler {scheduler}
{}


bool GridPass::set_row_grain(uint32_t row_grain)
{
	if (row_grain == 0) {
		EGR_WARN(log::LogCategory::render, "[grid_pass][set_row_grain] rejected 0, keeping %u", m_row_grain);
		return false;
	}

	m_row_grain = row_grain;
	return true;
}


void GridPass::shade_rows(void* job_fn_input)
{
	auto* slice = static_cast<RowSlice*>(job_fn_input);

	const GridUniforms& uniforms = *slice->input->uniforms;
	Framebuffer&        target   = *slice->input->target;

	const uint32_t width  = target.width();
	const uint32_t height = target.height();

	const float inv_width  = 1.0f / static_cast<float>(width);
	const float inv_height = 1.0f / static_cast<float>(height);

	GridPassStats stats {};

	for (uint32_t y = slice->begin; y < slice->end; ++y) {

		FragmentInput fragment {};
		fragment.tex_coord.y = (static_cast<float>(y) + 0.5f) * inv_height;

		for (uint32_t x = 0; x < width; ++x) {

			fragment.tex_coord.x = (static_cast<float>(x) + 0.5f) * inv_width;

			const bool on_grid_line = is_grid_line(grid_relative(fragment.tex_coord, uniforms));
			if (on_grid_line)
				++stats.line_pixels;
			else
				++stats.blank_pixels;

			target.at(x, y) = shade_classified_fragment(on_grid_line, fragment, uniforms);
		}
	}

	slice->stats = stats;
}


GridPassStats GridPass::execute(const GridUniforms& uniforms, Framebuffer& target)
{
	m_last_stats = {};

	const uint32_t height = target.height();
	if (height == 0 || target.width() == 0) {
		EGR_WARN(log::LogCategory::render, "[grid_pass][execute] empty target, nothing to shade");
		return m_last_stats;
	}

	if (!uniforms.texture && !m_warned_unbound) {
		EGR_WARN(log::LogCategory::render, "[grid_pass][execute] no texture bound, sampling opaque white");
		m_warned_unbound = true;
	}

	const auto time_beg = std::chrono::steady_clock::now();

	const PassInput pass_input {
		.uniforms = &uniforms,
		.target   = &target
	};

	const uint32_t slice_count = (height + m_row_grain - 1) / m_row_grain;

	m_slices.clear();
	m_slices.reserve(slice_count);

	for (uint32_t slice_index = 0; slice_index < slice_count; ++slice_index) {
		m_slices.emplace_back(RowSlice {
			.begin = 0,
			.end   = 0,
			.input = &pass_input,
			.stats = {}
		});
	}

	job::JobLatch latch;
	m_scheduler.dispatch_range(latch, &GridPass::shade_rows, height, m_row_grain, &m_slices[0]);
	latch.wait();

	for (uint32_t slice_index = 0; slice_index < slice_count; ++slice_index) {
		m_last_stats.line_pixels  += m_slices[slice_index].stats.line_pixels;
		m_last_stats.blank_pixels += m_slices[slice_index].stats.blank_pixels;
	}

	const auto time_end = std::chrono::steady_clock::now();
	const double elapsed_ms = std::chrono::duration<double, std::milli>(time_end - time_beg).count();

	EGR_DEBUG(
		log::LogCategory::render,
		"[grid_pass][execute] ok [size %ux%u][slices %u][line %llu][blank %llu][%.3f ms]",
		target.width(),
		height,
		slice_count,
		static_cast<unsigned long long>(m_last_stats.line_pixels),
		static_cast<unsigned long long>(m_last_stats.blank_pixels),
		elapsed_ms
	);

	return m_last_stats;
}


} // egr::rdr
