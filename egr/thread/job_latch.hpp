#pragma once

#include <cstdint>
#include <mutex>
#include <atomic>
#include <condition_variable>


namespace egr::job {


class JobLatch
{
public:

	JobLatch() = default;

	JobLatch(const JobLatch&) = delete;
	JobLatch& operator=(const JobLatch&) = delete;

	void add(uint32_t additional_count)
	{
		m_pending_count.fetch_add(additional_count, std::memory_order_relaxed);
	}

	// count reaches 0 only under m_mutex; wait() returns after done() releases it
	void done()
	{
		std::lock_guard<std::mutex> lock(m_mutex);

		if (m_pending_count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
			m_condition.notify_all();
		}
	}

	void wait()
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		m_condition.wait(lock,
			[this] {
				return m_pending_count.load(std::memory_order_acquire) == 0;
			}
		);
	}

	uint32_t pending() const
	{
		return m_pending_count.load(std::memory_order_acquire);
	}

private:

	std::atomic<uint32_t>   m_pending_count {0};
	std::mutex              m_mutex;
	std::condition_variable m_condition;
};


} // egr::job
