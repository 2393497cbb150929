#include <gtest/gtest.h>

#include "color.hpp"
#include "texture.hpp"
#include "grid_pass.hpp"
#include "grid_shade.hpp"
#include "scheduler.hpp"
#include "framebuffer.hpp"


using namespace egr;
using namespace egr::rdr;


namespace {

	class GridPassTest : public ::testing::Test
	{
	protected:

		void SetUp() override
		{
			scheduler.init(4);

			ASSERT_TRUE(make_checker_texture(
				texture, 16, 16, 2,
				rgba_to_u32(vec4 {0.9f, 0.8f, 0.7f, 1.0f}),
				rgba_to_u32(vec4 {0.1f, 0.2f, 0.3f, 1.0f})
			));
		}

		void TearDown() override
		{
			scheduler.shutdown();
		}

		// per-pixel reference at the same centers the pass uses
		void expect_matches_reference(const GridUniforms& uniforms, const Framebuffer& target)
		{
			const float width  = static_cast<float>(target.width());
			const float height = static_cast<float>(target.height());

			for (uint32_t y = 0; y < target.height(); ++y) {
				for (uint32_t x = 0; x < target.width(); ++x) {

					FragmentInput fragment {};
					fragment.tex_coord = vec2 {
						(static_cast<float>(x) + 0.5f) * (1.0f / width),
						(static_cast<float>(y) + 0.5f) * (1.0f / height)
					};

					ASSERT_EQ(target.at(x, y), shade_grid_fragment(fragment, uniforms))
						<< "pixel " << x << "," << y;
				}
			}
		}

		job::Scheduler scheduler;
		Texture        texture;
	};

} // anon


TEST_F(GridPassTest, matches_per_pixel_evaluation)
{
	Framebuffer target;
	ASSERT_TRUE(target.resize(97, 61));

	GridUniforms uniforms {};
	uniforms.texture  = &texture;
	uniforms.size     = vec2 {97.0f, 61.0f};
	uniforms.offset   = vec2 {3.5f, -11.0f};
	uniforms.zoom_exp = -1.0f;

	GridPass grid_pass {scheduler};

	for (uint32_t row_grain : {1u, 7u, 16u, 1000u}) {
		target.clear(vec4 {0.5f});

		ASSERT_TRUE(grid_pass.set_row_grain(row_grain));
		const GridPassStats stats = grid_pass.execute(uniforms, target);

		EXPECT_EQ(stats.line_pixels + stats.blank_pixels, target.pixel_count());
		expect_matches_reference(uniforms, target);
	}
}


TEST_F(GridPassTest, line_counts_for_aligned_grid)
{
	Framebuffer target;
	ASSERT_TRUE(target.resize(64, 48));

	GridUniforms uniforms {};
	uniforms.texture = &texture;
	uniforms.size    = vec2 {64.0f, 48.0f};
	// pixel centers land at rel 0.25 on every 8th column/row
	uniforms.offset  = vec2 {0.25f, 0.25f};

	GridPass grid_pass {scheduler};
	const GridPassStats stats = grid_pass.execute(uniforms, target);

	// 8 columns * 48 + 6 rows * 64 - 8 * 6 crossings
	EXPECT_EQ(stats.line_pixels, 720u);
	EXPECT_EQ(stats.blank_pixels, 64u * 48u - 720u);

	EXPECT_EQ(grid_pass.last_stats().line_pixels, stats.line_pixels);

	EXPECT_NE(target.at(0, 0),  transparent_black);
	EXPECT_NE(target.at(8, 3),  transparent_black);
	EXPECT_NE(target.at(5, 16), transparent_black);
	EXPECT_EQ(target.at(4, 4),  transparent_black);
	EXPECT_EQ(target.at(63, 47), transparent_black);
}


TEST_F(GridPassTest, unbound_texture_writes_white_lines)
{
	Framebuffer target;
	ASSERT_TRUE(target.resize(16, 16));

	GridUniforms uniforms {};
	uniforms.size   = vec2 {16.0f, 16.0f};
	uniforms.offset = vec2 {0.25f, 0.25f};

	GridPass grid_pass {scheduler};
	grid_pass.execute(uniforms, target);

	EXPECT_EQ(target.at(0, 5), opaque_white);
	EXPECT_EQ(target.at(3, 3), transparent_black);
}


TEST_F(GridPassTest, zero_row_grain_is_rejected)
{
	GridPass grid_pass {scheduler};

	EXPECT_EQ(grid_pass.row_grain(), GridPass::default_row_grain);
	EXPECT_FALSE(grid_pass.set_row_grain(0));
	EXPECT_EQ(grid_pass.row_grain(), GridPass::default_row_grain);
}


TEST_F(GridPassTest, empty_target_is_a_no_op)
{
	Framebuffer target;

	GridPass grid_pass {scheduler};
	const GridPassStats stats = grid_pass.execute(GridUniforms {}, target);

	EXPECT_EQ(stats.line_pixels, 0u);
	EXPECT_EQ(stats.blank_pixels, 0u);
}


TEST(framebuffer, resize_and_clear)
{
	Framebuffer target;

	EXPECT_FALSE(target.resize(0, 4));
	ASSERT_TRUE(target.resize(3, 2));

	EXPECT_EQ(target.width(), 3u);
	EXPECT_EQ(target.height(), 2u);
	EXPECT_EQ(target.pixel_count(), 6u);
	EXPECT_EQ(target.at(2, 1), transparent_black);

	target.clear(opaque_white);
	EXPECT_EQ(target.at(1, 0), opaque_white);

	target.at(1, 0) = transparent_black;
	EXPECT_EQ(target.at(1, 0), transparent_black);
	EXPECT_EQ(target.at(0, 0), opaque_white);
}
