#include <limits>

#include <gtest/gtest.h>

#include "color.hpp"
#include "texture.hpp"


using namespace egr;
using namespace egr::rdr;


namespace {

	const vec4 red  {1.0f, 0.0f, 0.0f, 1.0f};
	const vec4 blue {0.0f, 0.0f, 1.0f, 1.0f};

	// 2x1: red | blue
	void fill_strip(Texture& texture)
	{
		ASSERT_TRUE(texture.create(2, 1));
		texture.set_texel(0, 0, rgba_to_u32(red));
		texture.set_texel(1, 0, rgba_to_u32(blue));
	}

	void expect_color_near(const vec4& actual, const vec4& expected)
	{
		EXPECT_NEAR(actual.r, expected.r, 1e-5f);
		EXPECT_NEAR(actual.g, expected.g, 1e-5f);
		EXPECT_NEAR(actual.b, expected.b, 1e-5f);
		EXPECT_NEAR(actual.a, expected.a, 1e-5f);
	}

	SamplerDesc make_sampler(SamplerFilter filter, SamplerWrap wrap)
	{
		return SamplerDesc {filter, wrap, wrap};
	}

} // anon


TEST(texture, create_rejects_zero_extent)
{
	Texture texture;

	EXPECT_FALSE(texture.create(0, 4));
	EXPECT_FALSE(texture.create(4, 0));
	EXPECT_TRUE(texture.empty());

	EXPECT_TRUE(texture.create(3, 2));
	EXPECT_EQ(texture.width(), 3u);
	EXPECT_EQ(texture.height(), 2u);
	EXPECT_EQ(texture.texel(2, 1), 0u);

	texture.release();
	EXPECT_TRUE(texture.empty());
}


TEST(texture, rgba8_packing)
{
	EXPECT_EQ(rgba_to_u32(vec4 {1.0f, 0.0f, 0.0f, 0.0f}), 0x000000FFu);
	EXPECT_EQ(rgba_to_u32(vec4 {0.0f, 0.0f, 0.0f, 1.0f}), 0xFF000000u);
	EXPECT_EQ(rgba_to_u32(vec4 {2.0f, -1.0f, 0.5f, 1.0f}), 0xFF8000FFu);

	expect_color_near(rgba_from_u32(0xFF0000FFu), red);
}


TEST(texture, empty_texture_samples_transparent)
{
	Texture texture;
	EXPECT_EQ(sample(texture, SamplerDesc {}, vec2 {0.5f, 0.5f}), transparent_black);
}


TEST(texture, nearest_picks_containing_texel)
{
	Texture texture;
	fill_strip(texture);

	const SamplerDesc sampler = make_sampler(SamplerFilter::nearest, SamplerWrap::clamp_to_edge);

	expect_color_near(sample(texture, sampler, vec2 {0.0f,  0.5f}), red);
	expect_color_near(sample(texture, sampler, vec2 {0.49f, 0.5f}), red);
	expect_color_near(sample(texture, sampler, vec2 {0.5f,  0.5f}), blue);
	expect_color_near(sample(texture, sampler, vec2 {0.99f, 0.5f}), blue);
}


TEST(texture, nearest_wrap_modes)
{
	Texture texture;
	fill_strip(texture);

	const SamplerDesc repeat   = make_sampler(SamplerFilter::nearest, SamplerWrap::repeat);
	const SamplerDesc clamp    = make_sampler(SamplerFilter::nearest, SamplerWrap::clamp_to_edge);
	const SamplerDesc mirrored = make_sampler(SamplerFilter::nearest, SamplerWrap::mirrored_repeat);

	expect_color_near(sample(texture, repeat, vec2 {1.25f, 0.5f}), red);
	expect_color_near(sample(texture, repeat, vec2 {-0.25f, 0.5f}), blue);

	expect_color_near(sample(texture, clamp, vec2 {-0.25f, 0.5f}), red);
	expect_color_near(sample(texture, clamp, vec2 {7.0f, 0.5f}), blue);

	expect_color_near(sample(texture, mirrored, vec2 {-0.25f, 0.5f}), red);
	expect_color_near(sample(texture, mirrored, vec2 {1.25f, 0.5f}), blue);
	expect_color_near(sample(texture, mirrored, vec2 {1.75f, 0.5f}), red);
}


TEST(texture, linear_interpolates_between_centers)
{
	Texture texture;
	fill_strip(texture);

	const SamplerDesc sampler = make_sampler(SamplerFilter::linear, SamplerWrap::clamp_to_edge);

	expect_color_near(sample(texture, sampler, vec2 {0.25f, 0.5f}), red);
	expect_color_near(sample(texture, sampler, vec2 {0.75f, 0.5f}), blue);
	expect_color_near(sample(texture, sampler, vec2 {0.5f,  0.5f}), vec4 {0.5f, 0.0f, 0.5f, 1.0f});
	expect_color_near(sample(texture, sampler, vec2 {0.375f, 0.5f}), vec4 {0.75f, 0.0f, 0.25f, 1.0f});

	// clamped edge keeps the border texel
	expect_color_near(sample(texture, sampler, vec2 {0.0f, 0.5f}), red);
}


TEST(texture, linear_repeat_wraps_across_edge)
{
	Texture texture;
	fill_strip(texture);

	const SamplerDesc sampler = make_sampler(SamplerFilter::linear, SamplerWrap::repeat);

	// u = 0 sits halfway between the last and first texel centers
	expect_color_near(sample(texture, sampler, vec2 {0.0f, 0.5f}), vec4 {0.5f, 0.0f, 0.5f, 1.0f});
}


TEST(texture, non_finite_coordinates_are_safe)
{
	Texture texture;
	fill_strip(texture);

	const float nan = std::numeric_limits<float>::quiet_NaN();
	const float inf = std::numeric_limits<float>::infinity();

	for (SamplerFilter filter : {SamplerFilter::nearest, SamplerFilter::linear}) {
		const SamplerDesc sampler = make_sampler(filter, SamplerWrap::repeat);

		const vec4 nan_sample = sample(texture, sampler, vec2 {nan, 0.5f});
		const vec4 inf_sample = sample(texture, sampler, vec2 {inf, -inf});

		EXPECT_GE(nan_sample.a, 0.0f);
		EXPECT_LE(inf_sample.a, 1.0f);
	}
}


TEST(texture, checker_pattern)
{
	Texture texture;

	const uint32_t even = rgba_to_u32(red);
	const uint32_t odd  = rgba_to_u32(blue);

	EXPECT_FALSE(make_checker_texture(texture, 8, 8, 0, even, odd));
	ASSERT_TRUE(make_checker_texture(texture, 8, 8, 4, even, odd));

	EXPECT_EQ(texture.texel(0, 0), even);
	EXPECT_EQ(texture.texel(3, 3), even);
	EXPECT_EQ(texture.texel(4, 0), odd);
	EXPECT_EQ(texture.texel(0, 4), odd);
	EXPECT_EQ(texture.texel(7, 7), even);
}


TEST(texture, enum_names)
{
	EXPECT_STREQ(filter_name(SamplerFilter::linear), "linear");
	EXPECT_STREQ(wrap_name(SamplerWrap::mirrored_repeat), "mirrored_repeat");
}
