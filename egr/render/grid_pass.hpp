#pragma once

#include <cstdint>

#include "grid_data.hpp"
#include "framebuffer.hpp"
#include "scheduler.hpp"
#include "mtp_memory.hpp"


namespace egr::rdr {


class GridPass
{
public:

	static constexpr uint32_t default_row_grain = 16;

	explicit GridPass(job::Scheduler& scheduler);

	GridPass(const GridPass&) = delete;
	GridPass& operator=(const GridPass&) = delete;

	bool set_row_grain(uint32_t row_grain);

	uint32_t row_grain() const
	{ return m_row_grain; }

	// blocks until every row of target is shaded
	GridPassStats execute(const GridUniforms& uniforms, Framebuffer& target);

	const GridPassStats& last_stats() const
	{ return m_last_stats; }

private:

	struct PassInput
	{
		const GridUniforms* uniforms;
		Framebuffer*        target;
	};

	struct RowSlice
	{
		uint32_t         begin;
		uint32_t         end;
		const PassInput* input;
		GridPassStats    stats;
	};

	static void shade_rows(void* job_fn_input);

private:

	job::Scheduler& m_scheduler;

	uint32_t m_row_grain {default_row_grain};

	mtp::vault<RowSlice, mtp::default_set> m_slices;

	GridPassStats m_last_stats {};

	bool m_warned_unbound {false};
};


} // egr::rdr
