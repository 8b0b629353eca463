#include "config.hpp"

#include "util/log.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

using namespace mender;

static std::string config_doc_general = R"foo(# General configuration for `mender`
#
# Configure default options. These can be overriden with command-line arguments.
#
#   dry_run         validate and describe the patches, but do not touch any file
#   verbose         print trace output while parsing and applying
#   color           color status words when writing to a terminal
#   summary         print the summary block after applying
#   root_directory  resolve relative patch paths against this directory
#)foo";

static std::string config_doc_style = R"foo(# Colors of the status words.
#
# Supported values are the palette names below, and hex RGB colors:
#   '#RGB' and '#RRGGBB'. I.e '#F00' or '#FF0000' for bright red.
#
# Available color names (16 color palette SGR colors):
#   black, red, green, yellow, blue, magenta, cyan, light_gray,
#   dark_gray, light_red, light_green, light_yellow, light_blue,
#   light_magenta, light_cyan, white
#)foo";

enum class ConfigVariableType {
    Bool,
    String,
    Color,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
mender::config_get_directory() {
    return fmt::format("{}/mender", sago::getConfigHome());
}

static ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return config_table.is_table() ? ConfigLoadResult::Ok : ConfigLoadResult::Invalid;
    }
    if (load_result.kind == ParseErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_path, Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        log_warning(fmt::format("could not create '{}': {}", config_root, ec.message()));
        return;
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        log_warning(fmt::format("failed to open '{}' for writing: {}", config_path, strerror(errno)));
        return;
    }

    std::string serialized = cfg_serialize(config_value);
    if (fwrite(serialized.c_str(), 1, serialized.size(), f) != serialized.size()) {
        log_warning(fmt::format("failed to write '{}'", config_path));
    }
    fclose(f);
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static void
config_sync_options(Value& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            auto& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (value.is_bool()) {
                        *((bool*) ptr) = value.as_bool();
                    } else {
                        log_warning(fmt::format("config: '{}' should be true or false", path));
                    }
                } break;
                case ConfigVariableType::String: {
                    if (value.is_string()) {
                        *((std::string*) ptr) = value.as_string();
                    } else {
                        log_warning(fmt::format("config: '{}' should be a string", path));
                    }
                } break;
                case ConfigVariableType::Color: {
                    if (auto color = TermColor::from_value(value); color) {
                        ((TermStyle*) ptr)->fg = *color;
                    } else {
                        log_warning(fmt::format("config: '{}' is not a color: {}", path, repr(value)));
                    }
                } break;
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, Value{Value::Bool{*(bool*) ptr}});
                } break;
                case ConfigVariableType::String: {
                    config.set_value_at(path, Value{Value::String{*(std::string*) ptr}});
                } break;
                case ConfigVariableType::Color: {
                    auto* style = (TermStyle*) ptr;
                    config.set_value_at(path, Value{Value::String{color_name(style->fg)}});
                } break;
            }
        }
    }
}

void
mender::config_apply_value(Value& config, ProgramOptions& program_options, OutputStyle& output_style) {
    // clang-format off
    const OptionVector options = {
        { "general.dry_run",        ConfigVariableType::Bool,   &program_options.dry_run },
        { "general.verbose",        ConfigVariableType::Bool,   &program_options.verbose },
        { "general.color",          ConfigVariableType::Bool,   &program_options.color },
        { "general.summary",        ConfigVariableType::Bool,   &program_options.summary },
        { "general.root_directory", ConfigVariableType::String, &program_options.root_directory },

        { "style.success",          ConfigVariableType::Color,  &output_style.success },
        { "style.failure",          ConfigVariableType::Color,  &output_style.failure },
        { "style.dry_run",          ConfigVariableType::Color,  &output_style.dry_run },
        { "style.header",           ConfigVariableType::Color,  &output_style.header },
    };
    // clang-format on

    config_sync_options(config, options);
}

void
mender::config_apply_options(ProgramOptions& program_options, OutputStyle& output_style) {
    const std::string config_file_name = "mender.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value;
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            log_error(fmt::format("{}\n\twhile parsing: {}", config_parse_result.error, config_path));
            config_file_table_value = Value{Value::Table{}};
        } break;
        case ConfigLoadResult::DoesNotExist: {
            log_warning(fmt::format("could not find default config. creating file:\n\t{}", config_path));
            config_file_table_value = Value{Value::Table{}};
            flush_config_to_disk = true;
        } break;
    };

    config_apply_value(config_file_table_value, program_options, output_style);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(config_doc_general);
        config_file_table_value["style"].key_comments.push_back(config_doc_style);
        config_save(config_root, config_path, config_file_table_value);
    }
}
