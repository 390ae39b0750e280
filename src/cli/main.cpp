/**
 * @file    main.cpp
 * @brief   dualmark command line front end
 * @license MIT
 *
 * @details
 * Usage:
 *   dualmark [--config FILE] [--verbose] <command> [options]
 *
 * Results are printed to stdout as one JSON object. Diagnostics go to
 * stderr through spdlog. Failures print {"error": {"kind", "detail"}} and
 * exit with status 2 (status 1 for usage errors).
 */

#include "core/errors.hpp"
#include "service/artifact_store.hpp"
#include "service/config.hpp"
#include "service/mark_service.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

void print_usage(const char* exe) {
    std::cerr
        << "DualMark Tool - invisible text and image marks\n\n"
        << "Usage: " << exe << " [--config FILE] [--verbose] <command> [options]\n\n"
        << "Commands:\n"
        << "  embed-image    --input IMG --payload TEXT [--key-image N] [--key-watermark N]\n"
        << "  extract-image  --input IMG --bit-length N [--key-image N] [--key-watermark N]\n"
        << "  attack         --input IMG --type cut|resize|bright|shelter|salt_pepper|rot\n"
        << "                 [--box X1,Y1,X2,Y2] [--relative-box X1,Y1,X2,Y2] [--scale S]\n"
        << "                 [--width W] [--height H] [--ratio R] [--count N] [--angle DEG]\n"
        << "                 [--seed N]\n"
        << "  estimate-crop  --original IMG --template IMG\n"
        << "  recover-crop   --template IMG --box X1,Y1,X2,Y2 --width W --height H\n"
        << "  embed-text     --input FILE --payload TEXT [--mode document|lines] [--output FILE]\n"
        << "  extract-text   --input FILE [--mode document|lines]\n"
        << "  cleanup        [--max-age-hours N]\n"
        << "  show-config\n";
}

/**
 * Options after the command name: "--name value" pairs only
 */
class CommandArgs {
public:
    static CommandArgs parse(int argc, char** argv, int first) {
        CommandArgs args;
        for (int i = first; i < argc; ++i) {
            std::string name = argv[i];
            if (name.rfind("--", 0) != 0) {
                throw dmt::ValidationError(fmt::format("unexpected argument '{}'", name));
            }
            if (i + 1 >= argc) {
                throw dmt::ValidationError(fmt::format("option {} needs a value", name));
            }
            args.values_[name.substr(2)] = argv[++i];
        }
        return args;
    }

    std::optional<std::string> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    std::string require(const std::string& name) const {
        auto v = get(name);
        if (!v) {
            throw dmt::ValidationError(fmt::format("missing required option --{}", name));
        }
        return *v;
    }

    std::optional<int> get_int(const std::string& name) const {
        auto v = get(name);
        if (!v) return std::nullopt;
        return parse_number<int>(name, *v);
    }

    std::optional<double> get_double(const std::string& name) const {
        auto v = get(name);
        if (!v) return std::nullopt;
        return parse_number<double>(name, *v);
    }

    template <typename T>
    static T parse_number(const std::string& name, std::string_view text) {
        T value{};
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc() || ptr != end) {
            throw dmt::ValidationError(fmt::format("--{}: '{}' is not a valid number", name, text));
        }
        return value;
    }

private:
    std::map<std::string, std::string> values_;
};

/**
 * Parse "a,b,c,d" into four numbers
 */
template <typename T>
std::array<T, 4> parse_quad(const std::string& name, const std::string& text) {
    std::array<T, 4> out{};
    std::size_t start = 0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        const std::size_t comma = text.find(',', start);
        const bool last = (i + 1 == out.size());
        if (last != (comma == std::string::npos)) {
            throw dmt::ValidationError(
                fmt::format("--{}: expected four comma-separated values, got '{}'", name, text));
        }
        const std::string_view part(text.data() + start,
                                    (last ? text.size() : comma) - start);
        out[i] = CommandArgs::parse_number<T>(name, part);
        start = comma + 1;
    }
    return out;
}

std::string read_text_file(const fs::path& path) {
    const auto bytes = dmt::read_file_bytes(path);
    return std::string(bytes.begin(), bytes.end());
}

void write_text_file(const fs::path& path, const std::string& text) {
    dmt::write_file_atomic(path, std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

// One node per line; line breaks are kept outside the nodes
std::vector<dmt::TextNode> split_lines(const std::string& text) {
    std::vector<dmt::TextNode> nodes;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        nodes.push_back(dmt::TextNode{line});
    }
    return nodes;
}

std::string join_lines(const std::vector<dmt::TextNode>& nodes) {
    std::string out;
    for (const auto& node : nodes) {
        out += node.text;
        out += '\n';
    }
    return out;
}

bool lines_mode(const CommandArgs& args) {
    const std::string mode = args.get("mode").value_or("document");
    if (mode != "document" && mode != "lines") {
        throw dmt::ValidationError(fmt::format("--mode: unknown mode '{}'", mode));
    }
    return mode == "lines";
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

nlohmann::json cmd_embed_image(dmt::MarkService& service, const CommandArgs& args) {
    dmt::EmbedImageRequest req;
    req.image = dmt::read_file_bytes(args.require("input"));
    req.payload_text = args.require("payload");
    req.key_image = args.get_int("key-image");
    req.key_watermark = args.get_int("key-watermark");
    return dmt::to_json(service.embed_image(req));
}

nlohmann::json cmd_extract_image(dmt::MarkService& service, const CommandArgs& args) {
    dmt::ExtractImageRequest req;
    req.image = dmt::read_file_bytes(args.require("input"));
    req.bit_length = CommandArgs::parse_number<int>("bit-length", args.require("bit-length"));
    req.key_image = args.get_int("key-image");
    req.key_watermark = args.get_int("key-watermark");
    return dmt::to_json(service.extract_image(req));
}

nlohmann::json cmd_attack(dmt::MarkService& service, const CommandArgs& args) {
    dmt::AttackRequest req;
    req.image = dmt::read_file_bytes(args.require("input"));
    req.attack_type = args.require("type");

    if (auto box = args.get("box")) {
        const auto v = parse_quad<int>("box", *box);
        req.params.box = dmt::CropBox{v[0], v[1], v[2], v[3]};
    }
    if (auto rel = args.get("relative-box")) {
        const auto v = parse_quad<double>("relative-box", *rel);
        req.params.relative_box = cv::Rect2d(v[0], v[1], v[2] - v[0], v[3] - v[1]);
    }
    req.params.scale = args.get_double("scale");
    req.params.width = args.get_int("width");
    req.params.height = args.get_int("height");
    req.params.ratio = args.get_double("ratio");
    req.params.count = args.get_int("count");
    req.params.angle = args.get_double("angle");
    if (auto seed = args.get("seed")) {
        req.params.seed = CommandArgs::parse_number<std::uint64_t>("seed", *seed);
    }
    return dmt::to_json(service.apply_attack(req));
}

nlohmann::json cmd_estimate_crop(dmt::MarkService& service, const CommandArgs& args) {
    dmt::EstimateCropRequest req;
    req.original = dmt::read_file_bytes(args.require("original"));
    req.templ = dmt::read_file_bytes(args.require("template"));
    return dmt::to_json(service.estimate_crop(req));
}

nlohmann::json cmd_recover_crop(dmt::MarkService& service, const CommandArgs& args) {
    dmt::RecoverCropRequest req;
    req.templ = dmt::read_file_bytes(args.require("template"));
    const auto v = parse_quad<int>("box", args.require("box"));
    req.box = dmt::CropBox{v[0], v[1], v[2], v[3]};
    req.shape.width = CommandArgs::parse_number<int>("width", args.require("width"));
    req.shape.height = CommandArgs::parse_number<int>("height", args.require("height"));
    return dmt::to_json(service.recover_crop(req));
}

nlohmann::json cmd_embed_text(dmt::MarkService& service, const CommandArgs& args) {
    const std::string input = read_text_file(args.require("input"));
    const std::string payload = args.require("payload");

    std::string marked;
    if (lines_mode(args)) {
        auto nodes = split_lines(input);
        service.embed_text_scope(nodes, payload);
        marked = join_lines(nodes);
    } else {
        marked = service.embed_text_document(input, payload);
    }

    if (auto output = args.get("output")) {
        write_text_file(*output, marked);
        return {{"output", dmt::to_utf8(fs::path(*output))}};
    }
    return {{"document", marked}};
}

nlohmann::json cmd_extract_text(dmt::MarkService& service, const CommandArgs& args) {
    const std::string input = read_text_file(args.require("input"));
    const std::string payload = lines_mode(args)
        ? service.extract_text_scope(split_lines(input))
        : service.extract_text_document(input);
    return {{"payload", payload}};
}

nlohmann::json cmd_cleanup(dmt::MarkService& service, const CommandArgs& args) {
    const int hours = args.get_int("max-age-hours").value_or(24);
    if (hours < 0) {
        throw dmt::ValidationError("--max-age-hours must not be negative");
    }
    const std::size_t removed = service.store().cleanup_older_than(std::chrono::hours(hours));
    return {{"removed", removed}};
}

// stdout carries the JSON result, so every log line goes to stderr
void setup_logging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("dualmark");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void print_json(const nlohmann::json& j) {
    std::cout << dmt::dump_json(j, 2) << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<fs::path> config_file;
    bool verbose = false;

    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = fs::path(argv[++i]);
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        } else {
            break;
        }
    }
    if (i >= argc) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    const std::string command = argv[i++];

    setup_logging(verbose);

    try {
        dmt::ServiceConfig config = dmt::ServiceConfig::load(config_file);
        if (!verbose) {
            spdlog::set_level(spdlog::level::from_str(config.log_level));
        }

        if (command == "show-config") {
            print_json(config.to_json());
            return kExitOk;
        }

        const CommandArgs args = CommandArgs::parse(argc, argv, i);
        dmt::MarkService service(std::move(config));

        nlohmann::json result;
        if (command == "embed-image") {
            result = cmd_embed_image(service, args);
        } else if (command == "extract-image") {
            result = cmd_extract_image(service, args);
        } else if (command == "attack") {
            result = cmd_attack(service, args);
        } else if (command == "estimate-crop") {
            result = cmd_estimate_crop(service, args);
        } else if (command == "recover-crop") {
            result = cmd_recover_crop(service, args);
        } else if (command == "embed-text") {
            result = cmd_embed_text(service, args);
        } else if (command == "extract-text") {
            result = cmd_extract_text(service, args);
        } else if (command == "cleanup") {
            result = cmd_cleanup(service, args);
        } else {
            std::cerr << "Unknown command: " << command << "\n\n";
            print_usage(argv[0]);
            return kExitUsage;
        }

        print_json(result);
        return kExitOk;

    } catch (const dmt::MarkError& e) {
        print_json(dmt::error_json(e));
        return kExitFailure;
    } catch (const std::exception& e) {
        print_json({{"error", {{"kind", "internal_error"}, {"detail", e.what()}}}});
        return kExitFailure;
    }
}
