#pragma once

#include <string>
#include <optional>
#include <string_view>

#include "log.hpp"
#include "texture.hpp"
#include "app_config.hpp"


namespace egr::cfg::io {


[[nodiscard]] std::optional<std::string> read_stdio_file(const char* file_path);

/*
	Overlays values from TOML text onto out_config. Keys that are missing,
	unknown, or of the wrong type leave the existing value in place; only
	a TOML syntax error fails the call.
*/
bool parse_config(std::string_view text, const char* source_name, AppConfig& out_config);

bool read_config_file(const char* file_path, AppConfig& out_config);


[[nodiscard]] std::optional<log::LogLevel>     parse_log_level(std::string_view name);
[[nodiscard]] std::optional<rdr::SamplerFilter> parse_filter(std::string_view name);
[[nodiscard]] std::optional<rdr::SamplerWrap>   parse_wrap(std::string_view name);


} // egr::cfg::io
