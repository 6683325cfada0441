/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "binstruct.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <charconv>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    std::size_t offset = 0;
    bool encode = false;
    bool pretty = false;
    bool debug = false;
    std::optional<fs::path> out_dir;
};

static void print_usage() {
    BINSTRUCT_LOG_INFO(
        "Usage:\n" \
        "    binstruct <schema.json> <file-or-dir> [--offset N] [--encode] [--pretty] [--out <dir>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a schema .json, second a file or directory\n" \
        "    --offset N    starts decoding N bytes into every input\n" \
        "    --encode      encodes .json records to .bin instead of decoding\n" \
        "    --pretty      indents the JSON output\n" \
        "    --out <dir>   output root (default: output/ next to the executable)\n" \
        "    --debug       enables extra logging\n"
    );
}

static std::optional<std::size_t> parse_offset(std::string_view text) {
    std::size_t v = 0;
    const auto* end = text.data() + text.size();
    const auto res = std::from_chars(text.data(), end, v);
    if (text.empty() || res.ec != std::errc() || res.ptr != end) {
        return std::nullopt;
    }
    return v;
}

static void decode_input(
    const binstruct::schema::Schema& schema,
    const fs::path& path,
    const fs::path& out_root,
    const Settings& settings
) {
    binstruct::DecodeOptions opt{};
    opt.offset = settings.offset;
    opt.debug = settings.debug;
    const auto res = binstruct::BinStruct::DecodeFile(schema, path, opt);
    if (!res.matched()) {
        BINSTRUCT_LOG_INFO("No match: %s", path.string().c_str());
        return;
    }

    const fs::path json_path = out_root / "json" / (path.stem().string() + ".json");
    const std::string text = res.record->dump(settings.pretty ? 2 : -1);
    binstruct::fs_utils::write_text_file(json_path, text);
    BINSTRUCT_LOG_INFO("Wrote: %s (%zu bytes decoded)", json_path.string().c_str(), res.bytes_consumed);
}

static void encode_input(
    const binstruct::schema::Schema& schema,
    const fs::path& path,
    const fs::path& out_root,
    const Settings& settings
) {
    const std::string text = binstruct::fs_utils::read_text_file(path);
    if (text.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto record = nlohmann::ordered_json::parse(text);

    binstruct::EncodeOptions opt{};
    opt.debug = settings.debug;
    const std::string base = path.stem().string();
    const auto res = binstruct::BinStruct::Encode(schema, record, opt, base);

    const fs::path bin_path = out_root / "bin" / (base + ".bin");
    binstruct::fs_utils::write_file(bin_path, res.bytes);
    BINSTRUCT_LOG_INFO("Wrote: %s (%zu bytes)", bin_path.string().c_str(), res.bytes_written);
}

static void process_file(
    const binstruct::schema::Schema& schema,
    const fs::path& path,
    const fs::path& out_root,
    const Settings& settings
) {
    const bool is_json = binstruct::fs_utils::has_extension(path, ".json");
    if (settings.encode != is_json) {
        BINSTRUCT_LOG_INFO("Skipped: %s", path.string().c_str());
        return;
    }
    try {
        if (settings.encode) {
            encode_input(schema, path, out_root, settings);
        } else {
            decode_input(schema, path, out_root, settings);
        }
    } catch (const std::exception& e) {
        BINSTRUCT_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
    }
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    const std::string_view schema_arg = argv[1];
    const std::string_view input_arg = argv[2];
    if ((!schema_arg.empty() && schema_arg[0] == '-') || (!input_arg.empty() && input_arg[0] == '-')) {
        BINSTRUCT_LOG_ERROR("First two arguments must be a schema file and a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path schema_path = fs::path(std::string(schema_arg));
    const fs::path input = fs::path(std::string(input_arg));

    Settings settings;
    for (int i = 3; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--encode") {
            settings.encode = true;
            continue;
        }
        if (arg == "--pretty") {
            settings.pretty = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--offset") {
            if (i + 1 >= argc) {
                BINSTRUCT_LOG_ERROR("Missing value for --offset");
                return 2;
            }
            const auto offset = parse_offset(argv[++i]);
            if (!offset.has_value()) {
                BINSTRUCT_LOG_ERROR("Invalid value for --offset: %s", argv[i]);
                return 2;
            }
            settings.offset = *offset;
            continue;
        }
        if (arg == "--out") {
            if (i + 1 >= argc) {
                BINSTRUCT_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.out_dir = fs::path(argv[++i]);
            continue;
        }
        BINSTRUCT_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (settings.debug) {
        binstruct::log::set_level(binstruct::log::Level::Debug);
    }
    if (!fs::exists(schema_path)) {
        BINSTRUCT_LOG_ERROR("Schema does not exist: %s", schema_path.string().c_str());
        return 2;
    }
    if (!fs::exists(input)) {
        BINSTRUCT_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    binstruct::schema::Schema schema;
    try {
        schema = binstruct::BinStruct::LoadSchemaFile(schema_path);
    } catch (const std::exception& e) {
        BINSTRUCT_LOG_ERROR("Invalid schema: %s (%s)", schema_path.string().c_str(), e.what());
        return 2;
    }
    BINSTRUCT_LOG_DEBUG("Schema: %s", schema.describe().dump().c_str());

    const fs::path out_root = settings.out_dir.value_or(binstruct::fs_utils::executable_dir() / "output");
    binstruct::fs_utils::ensure_dir(out_root);

    if (fs::is_directory(input)) {
        std::vector<std::string> extensions;
        if (settings.encode) {
            extensions.push_back(".json");
        }
        const auto inputs = binstruct::fs_utils::collect_inputs(input, extensions);
        BINSTRUCT_LOG_INFO("Found %zu files in %s", inputs.size(), input.string().c_str());
        for (const auto& p : inputs) {
            BINSTRUCT_LOG_DEBUG("Input: %s", binstruct::fs_utils::display_path(p, input).c_str());
            process_file(schema, p, out_root, settings);
        }
        return 0;
    }

    process_file(schema, input, out_root, settings);
    return 0;
}
