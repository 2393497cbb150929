#include <gtest/gtest.h>

#include "mtp_memory.hpp"

#include "log.hpp"


int main(int argc, char** argv)
{
	mtp::init_tls<mtp::default_set>();

	egr::log::initialize(egr::log::LogLevel::warn);

	::testing::InitGoogleTest(&argc, argv);
	const int result = RUN_ALL_TESTS();

	mtp::get_tls_allocator<mtp::default_set>().reset();
	egr::log::shutdown();

	return result;
}
