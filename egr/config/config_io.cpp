#include "config_io.hpp"

#include <cmath>
#include <cstdio>
#include <cstdint>

#define TOML_HEADER_ONLY 1
#define TOML_EXCEPTIONS 0

#include <toml++/toml.hpp>

#include "math.hpp"
#include "panic.hpp"
#include "scheduler.hpp"


namespace egr::cfg::io {


namespace {


	bool read_float_array_exact(const toml::table& table, const char* key, float* out_values, size_t expected_count)
	{
		EGR_ASSERT_MSG(key, "key == null");
		EGR_ASSERT_MSG(out_values, "out_values == null");
		EGR_ASSERT_MSG(expected_count > 0, "expected_count == 0");

		const toml::array* array_node = table[key].as_array();
		if (!array_node || array_node->size() != expected_count) {
			return false;
		}

		float values[4] {};
		EGR_ASSERT_MSG(expected_count <= 4, "expected_count > 4");

		for (size_t element_index = 0; element_index < expected_count; ++element_index) {
			auto value_opt = (*array_node)[element_index].value<float>();
			if (!value_opt || !std::isfinite(*value_opt)) {
				return false;
			}
			values[element_index] = *value_opt;
		}

		for (size_t element_index = 0; element_index < expected_count; ++element_index) {
			out_values[element_index] = values[element_index];
		}
		return true;
	}


	void read_vec2(const toml::table& table, const char* section, const char* key, const char* source_name, vec2& out_value)
	{
		if (!table.contains(key))
			return;

		if (!read_float_array_exact(table, key, glm::value_ptr(out_value), 2)) {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] %s.%s invalid, keeping default [source %s][expected 2 finite floats]",
				section,
				key,
				source_name
			);
		}
	}


	void read_vec4(const toml::table& table, const char* section, const char* key, const char* source_name, vec4& out_value)
	{
		if (!table.contains(key))
			return;

		if (!read_float_array_exact(table, key, glm::value_ptr(out_value), 4)) {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] %s.%s invalid, keeping default [source %s][expected 4 finite floats]",
				section,
				key,
				source_name
			);
		}
	}


	void read_float(const toml::table& table, const char* section, const char* key, const char* source_name, float& out_value)
	{
		if (!table.contains(key))
			return;

		if (auto value_opt = table[key].value<float>()) {
			if (std::isfinite(*value_opt)) {
				out_value = *value_opt;
				return;
			}
		}

		EGR_WARN(
			log::LogCategory::config,
			"[config_io][parse] %s.%s not a finite number, keeping default [source %s]",
			section,
			key,
			source_name
		);
	}


	void read_u32(const toml::table& table, const char* section, const char* key, const char* source_name, uint32_t& out_value)
	{
		if (!table.contains(key))
			return;

		if (auto value_opt = table[key].value<int64_t>()) {
			if (*value_opt >= 0 && *value_opt <= static_cast<int64_t>(UINT32_MAX)) {
				out_value = static_cast<uint32_t>(*value_opt);
				return;
			}
		}

		EGR_WARN(
			log::LogCategory::config,
			"[config_io][parse] %s.%s not an unsigned integer, keeping default [source %s]",
			section,
			key,
			source_name
		);
	}


	template <typename Enum, typename ParseFn>
	void read_enum(const toml::table& table, const char* section, const char* key, const char* source_name, ParseFn parse_fn, Enum& out_value)
	{
		if (!table.contains(key))
			return;

		if (auto name_opt = table[key].value<std::string>()) {
			if (auto parsed_opt = parse_fn(*name_opt)) {
				out_value = *parsed_opt;
				return;
			}
		}

		EGR_WARN(
			log::LogCategory::config,
			"[config_io][parse] %s.%s unrecognized, keeping default [source %s]",
			section,
			key,
			source_name
		);
	}


	void read_grid(const toml::table& grid_table, const char* source_name, GridConfig& grid_config)
	{
		read_vec2 (grid_table, "grid", "offset",   source_name, grid_config.offset);
		read_float(grid_table, "grid", "zoom_exp", source_name, grid_config.zoom_exp);
		read_vec2 (grid_table, "grid", "size",     source_name, grid_config.size);
		read_vec4 (grid_table, "grid", "tint",     source_name, grid_config.tint);

		if (grid_config.size.x < 1.0f || grid_config.size.y < 1.0f) {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] grid.size below 1 pixel, clamping [source %s][size %.2f %.2f]",
				source_name,
				grid_config.size.x,
				grid_config.size.y
			);
			grid_config.size = glm::max(grid_config.size, vec2(1.0f));
		}

		if (grid_config.size.x > max_target_extent || grid_config.size.y > max_target_extent) {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] grid.size above %.0f pixels, clamping [source %s][size %.2f %.2f]",
				max_target_extent,
				source_name,
				grid_config.size.x,
				grid_config.size.y
			);
			grid_config.size = glm::min(grid_config.size, vec2(max_target_extent));
		}
	}


	void read_sampler(const toml::table& sampler_table, const char* source_name, rdr::SamplerDesc& sampler)
	{
		read_enum(sampler_table, "sampler", "filter", source_name, parse_filter, sampler.filter);
		read_enum(sampler_table, "sampler", "wrap_u", source_name, parse_wrap,   sampler.wrap_u);
		read_enum(sampler_table, "sampler", "wrap_v", source_name, parse_wrap,   sampler.wrap_v);
	}


	void read_view(const toml::table& view_table, const char* source_name, view::GridViewParams& view_params)
	{
		read_float(view_table, "view", "zoom_exp_min", source_name, view_params.zoom_exp_min);
		read_float(view_table, "view", "zoom_exp_max", source_name, view_params.zoom_exp_max);
		read_float(view_table, "view", "pan_speed",    source_name, view_params.pan_speed);
	}


	void read_startup(const toml::table& startup_table, const char* source_name, StartupConfig& startup)
	{
		read_vec2 (startup_table, "startup", "zoom_origin", source_name, startup.zoom_origin);
		read_vec2 (startup_table, "startup", "pan",         source_name, startup.pan);
		read_float(startup_table, "startup", "zoom_delta",  source_name, startup.zoom_delta);
	}


	void read_jobs(const toml::table& jobs_table, const char* source_name, JobsConfig& jobs)
	{
		read_u32(jobs_table, "jobs", "worker_count", source_name, jobs.worker_count);
		read_u32(jobs_table, "jobs", "row_grain",    source_name, jobs.row_grain);

		if (jobs.worker_count > job::cfg::max_workers) {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] jobs.worker_count above max, clamping [source %s][value %u][max %u]",
				source_name,
				jobs.worker_count,
				job::cfg::max_workers
			);
			jobs.worker_count = job::cfg::max_workers;
		}
		if (jobs.row_grain == 0) {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] jobs.row_grain == 0, using 1 [source %s]",
				source_name
			);
			jobs.row_grain = 1;
		}
	}


	void read_log(const toml::table& log_table, const char* source_name, LogConfig& log_config)
	{
		read_enum(log_table, "log", "level", source_name, parse_log_level, log_config.level);

		if (!log_table.contains("file"))
			return;

		if (auto file_opt = log_table["file"].value<std::string>()) {
			log_config.file_path = *file_opt;
		}
		else {
			EGR_WARN(
				log::LogCategory::config,
				"[config_io][parse] log.file not a string, keeping default [source %s]",
				source_name
			);
		}
	}


	template <typename ReadFn, typename Section>
	void read_section(const toml::table& root_table, const char* name, const char* source_name, ReadFn read_fn, Section& out_section)
	{
		if (!root_table.contains(name))
			return;

		if (const toml::table* section_table = root_table[name].as_table()) {
			read_fn(*section_table, source_name, out_section);
			return;
		}

		EGR_WARN(
			log::LogCategory::config,
			"[config_io][parse] [%s] not a table, ignored [source %s]",
			name,
			source_name
		);
	}

} // anon


std::optional<std::string> read_stdio_file(const char* file_path)
{
	EGR_ASSERT_MSG(file_path, "file_path == null");

	FILE* file_handle = std::fopen(file_path, "rb");
	if (!file_handle) {
		EGR_ERROR(
			log::LogCategory::config,
			"[config_io][read_stdio_file] fopen fail [path %s]",
			file_path
		);
		return std::nullopt;
	}
	if (std::fseek(file_handle, 0, SEEK_END) != 0) {
		EGR_ERROR(
			log::LogCategory::config,
			"[config_io][read_stdio_file] fseek end fail [path %s]",
			file_path
		);
		std::fclose(file_handle);
		return std::nullopt;
	}
	long file_size_signed = std::ftell(file_handle);
	if (file_size_signed < 0) {
		EGR_ERROR(
			log::LogCategory::config,
			"[config_io][read_stdio_file] ftell fail [path %s]",
			file_path
		);
		std::fclose(file_handle);
		return std::nullopt;
	}
	if (std::fseek(file_handle, 0, SEEK_SET) != 0) {
		EGR_ERROR(
			log::LogCategory::config,
			"[config_io][read_stdio_file] fseek set fail [path %s]",
			file_path
		);
		std::fclose(file_handle);
		return std::nullopt;
	}

	size_t file_size = static_cast<size_t>(file_size_signed);
	std::string data;
	data.resize(file_size);

	size_t bytes_read = std::fread(data.data(), 1, file_size, file_handle);
	std::fclose(file_handle);

	if (bytes_read != file_size) {
		EGR_ERROR(
			log::LogCategory::config,
			"[config_io][read_stdio_file] fread short [path %s][bytes_read %zu][file_size %zu]",
			file_path,
			bytes_read,
			file_size
		);
		return std::nullopt;
	}

	return data;
}


bool parse_config(std::string_view text, const char* source_name, AppConfig& out_config)
{
	if (!source_name)
		source_name = "<memory>";

	auto parse_result = toml::parse(text, std::string_view {source_name});
	if (!parse_result) {
		const toml::parse_error& parse_error = parse_result.error();
		const std::string error_description {parse_error.description()};

		EGR_ERROR(
			log::LogCategory::config,
			"[config_io][parse] toml parse fail [source %s][line %u][err %s]",
			source_name,
			static_cast<unsigned>(parse_error.source().begin.line),
			error_description.c_str()
		);
		return false;
	}

	const toml::table& root_table = parse_result.table();

	read_section(root_table, "grid",    source_name, read_grid,    out_config.grid);
	read_section(root_table, "sampler", source_name, read_sampler, out_config.sampler);
	read_section(root_table, "view",    source_name, read_view,    out_config.view);
	read_section(root_table, "startup", source_name, read_startup, out_config.startup);
	read_section(root_table, "jobs",    source_name, read_jobs,    out_config.jobs);
	read_section(root_table, "log",     source_name, read_log,     out_config.log);

	return true;
}


bool read_config_file(const char* file_path, AppConfig& out_config)
{
	EGR_ASSERT_MSG(file_path, "file_path == null");

	EGR_INFO(
		log::LogCategory::config,
		"[config_io][read_config_file] begin... [path %s]",
		file_path
	);

	auto text_opt = read_stdio_file(file_path);
	if (!text_opt) {
		return false;
	}

	if (!parse_config(*text_opt, file_path, out_config)) {
		return false;
	}

	EGR_INFO(
		log::LogCategory::config,
		"[config_io][read_config_file] ok [path %s][size %.0fx%.0f][zoom_exp %.2f][filter %s]",
		file_path,
		out_config.grid.size.x,
		out_config.grid.size.y,
		out_config.grid.zoom_exp,
		rdr::filter_name(out_config.sampler.filter)
	);

	return true;
}


std::optional<log::LogLevel> parse_log_level(std::string_view name)
{
	if (name == "fatal") return log::LogLevel::fatal;
	if (name == "error") return log::LogLevel::error;
	if (name == "warn")  return log::LogLevel::warn;
	if (name == "info")  return log::LogLevel::info;
	if (name == "debug") return log::LogLevel::debug;
	if (name == "trace") return log::LogLevel::trace;
	return std::nullopt;
}


std::optional<rdr::SamplerFilter> parse_filter(std::string_view name)
{
	if (name == "nearest") return rdr::SamplerFilter::nearest;
	if (name == "linear")  return rdr::SamplerFilter::linear;
	return std::nullopt;
}


std::optional<rdr::SamplerWrap> parse_wrap(std::string_view name)
{
	if (name == "repeat")          return rdr::SamplerWrap::repeat;
	if (name == "clamp_to_edge")   return rdr::SamplerWrap::clamp_to_edge;
	if (name == "mirrored_repeat") return rdr::SamplerWrap::mirrored_repeat;
	return std::nullopt;
}


} // egr::cfg::io
