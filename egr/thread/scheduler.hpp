#pragma once

#include <array>
#include <mutex>
#include <thread>
#include <atomic>
#include <cstdint>
#include <condition_variable>

#include "log.hpp"
#include "panic.hpp"

#include "job_latch.hpp"
#include "mpmc_ring.hpp"


namespace egr::job {


using JobFn = void (*)(void* job_fn_input);


struct JobEntry
{
	JobFn     function;
	void*     fn_input;
	JobLatch* latch;
};


namespace cfg {


inline constexpr uint32_t max_workers        = 32U;
inline constexpr uint32_t injection_capacity = 4096U;

} // egr::job::cfg


inline uint32_t default_worker_count()
{
	const uint32_t hardware_count = std::thread::hardware_concurrency();

	if (hardware_count == 0)
		return 1U;
	if (hardware_count > cfg::max_workers)
		return cfg::max_workers;

	return hardware_count;
}


class Scheduler
{
public:

	Scheduler() = default;

	~Scheduler()
	{
		shutdown();
	}

	Scheduler(const Scheduler&) = delete;
	Scheduler& operator=(const Scheduler&) = delete;

private:

	struct Worker
	{
		std::mutex              mutex;
		std::condition_variable condition;

		std::atomic<uint32_t>   has_work {0};
	};

public:

	void init(uint32_t worker_count)
	{
		EGR_ASSERT_MSG(worker_count > 0,
			"[scheduler] worker count == 0");
		EGR_ASSERT_MSG(worker_count <= cfg::max_workers,
			"[scheduler] worker count > max workers");

		shutdown();

		m_worker_count = worker_count;

		for (uint32_t worker_index = 0; worker_index < m_worker_count; ++worker_index) {

			m_worker_threads[worker_index] = std::thread(
				[this, worker_index] {
					worker_loop(worker_index);
				}
			);
		}

		EGR_DEBUG(log::LogCategory::job, "[scheduler][init] ok [workers %u]", m_worker_count);
	}


	void shutdown()
	{
		if (m_worker_count == 0) {
			return;
		}

		m_shutdown_requested.store(true, std::memory_order_release);

		for (uint32_t worker_index = 0; worker_index < m_worker_count; ++worker_index) {
			wake(worker_index);
		}

		for (uint32_t worker_index = 0; worker_index < m_worker_count; ++worker_index) {
			if (m_worker_threads[worker_index].joinable()) {
				m_worker_threads[worker_index].join();
			}
			m_workers[worker_index].has_work.store(0, std::memory_order_relaxed);
		}

		m_injection_queue.reset();

		EGR_DEBUG(log::LogCategory::job, "[scheduler][shutdown] ok [workers %u]", m_worker_count);

		m_worker_count = 0;

		m_shutdown_requested.store(false, std::memory_order_relaxed);
		m_submit_counter.store(0, std::memory_order_relaxed);
	}


	uint32_t worker_count() const
	{ return m_worker_count; }


	void submit(JobLatch& job_latch, JobFn job_fn, void* job_fn_input)
	{
		EGR_ASSERT_MSG(m_worker_count > 0,
			"[scheduler] submit before init");

		job_latch.add(1);
		enqueue(JobEntry {
			.function = job_fn,
			.fn_input = job_fn_input,
			.latch    = &job_latch
		});
	}


	// job_input_slices must hold ceil(job_input_count / job_input_grain) entries
	// and stay alive until job_latch.wait() returns
	template <typename JobInputSlice>
	void dispatch_range(
		JobLatch&      job_latch,
		JobFn          job_fn,
		uint32_t       job_input_count,
		uint32_t       job_input_grain,
		JobInputSlice* job_input_slices
	)
	{
		EGR_ASSERT_MSG(job_input_grain != 0,
			"[scheduler] job_input_grain == 0");

		if (job_input_count == 0 || job_input_grain == 0) {
			return;
		}

		EGR_ASSERT_MSG(m_worker_count > 0,
			"[scheduler] dispatch before init");

		const uint32_t job_count =
			(job_input_count + job_input_grain - 1) / job_input_grain;

		job_latch.add(job_count);

		for (uint32_t job_index = 0; job_index < job_count; ++job_index) {

			const uint32_t job_input_beg = job_index * job_input_grain;

			const uint32_t job_input_end =
				(job_input_beg + job_input_grain < job_input_count)
					? (job_input_beg + job_input_grain)
					: job_input_count;

			job_input_slices[job_index].begin = job_input_beg;
			job_input_slices[job_index].end   = job_input_end;

			enqueue(JobEntry {
				.function = job_fn,
				.fn_input = &job_input_slices[job_index],
				.latch    = &job_latch
			});
		}
	}

private:

	void enqueue(const JobEntry& job_entry)
	{
		if (!m_injection_queue.push(job_entry)) {
			// ring saturated: run on the submitting thread so the latch still drains
			EGR_WARN(log::LogCategory::job,
				"[scheduler][enqueue] injection ring full, running inline [capacity %u]",
				cfg::injection_capacity);

			run(job_entry);
			return;
		}

		const uint32_t submit_index = m_submit_counter.fetch_add(1, std::memory_order_relaxed);
		wake(submit_index % m_worker_count);
	}


	void wake(uint32_t worker_index)
	{
		Worker& worker = m_workers[worker_index];
		{
			std::lock_guard<std::mutex> lock(worker.mutex);
			worker.has_work.store(1, std::memory_order_release);
		}
		worker.condition.notify_one();
	}


	static void run(const JobEntry& job_entry)
	{
		job_entry.function(job_entry.fn_input);
		job_entry.latch->done();
	}


	void worker_loop(uint32_t worker_index)
	{
		auto& worker = m_workers[worker_index];

		for (;;) {

			JobEntry job_entry {};

			if (m_injection_queue.pop(job_entry)) {
				run(job_entry);
				continue;
			}

			std::unique_lock<std::mutex> lock(worker.mutex);
			worker.condition.wait(lock,
				[this, &worker] {
					return m_shutdown_requested.load(std::memory_order_relaxed) ||
						worker.has_work.load(std::memory_order_acquire) != 0;
				}
			);

			worker.has_work.store(0, std::memory_order_relaxed);

			if (m_shutdown_requested.load(std::memory_order_relaxed)) {
				return;
			}
		}
	}

private:

	uint32_t m_worker_count {0};

	std::atomic<uint32_t> m_submit_counter     {0};
	std::atomic<bool>     m_shutdown_requested {false};

	std::array<Worker,      cfg::max_workers> m_workers;
	std::array<std::thread, cfg::max_workers> m_worker_threads;

	MpmcRing<JobEntry, cfg::injection_capacity> m_injection_queue;
};


} // egr::job
