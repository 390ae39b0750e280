/**
 * @file    mark_service.cpp
 * @brief   Request/response facade implementation
 * @license MIT
 */

#include "service/mark_service.hpp"
#include "core/dct_transform.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <exception>
#include <type_traits>
#include <utility>

namespace dmt {

namespace {

ServiceConfig checked(ServiceConfig config) {
    config.validate();
    return config;
}

std::shared_ptr<const TransformCapability> default_transform(const ServiceConfig& config) {
    return std::make_shared<DctQimTransform>(DctQimOptions{.step = config.qim_step});
}

std::shared_ptr<const TemplateMatcher> default_matcher(const ServiceConfig& config) {
    return std::make_shared<NccTemplateMatcher>(NccMatcherOptions{
        .confidence_floor = config.match_confidence_floor,
        .tolerance = config.match_tolerance,
        .scales = config.match_scales,
    });
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

}  // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

MarkService::MarkService(ServiceConfig config)
    : MarkService(config,
                  default_transform(config),
                  std::make_shared<OpenCvAttackSimulator>(),
                  default_matcher(config)) {}

MarkService::MarkService(ServiceConfig config,
                         std::shared_ptr<const TransformCapability> transform,
                         std::shared_ptr<const AttackSimulator> attacks,
                         std::shared_ptr<const TemplateMatcher> matcher)
    : config_(checked(std::move(config))),
      store_(config_.output_dir, config_.max_content_length, config_.allowed_extensions),
      oplog_(config_.log_dir),
      orchestrator_(std::move(transform), std::move(attacks)),
      resolver_(std::move(matcher), cv::Scalar::all(config_.neutral_fill)),
      text_embedder_(config_.closing_tag) {
    spdlog::debug("Mark service ready: output={}, log={}", config_.output_dir, config_.log_dir);
}

OperationContext MarkService::make_context(const std::atomic<bool>* cancel) const {
    std::optional<std::chrono::milliseconds> timeout;
    if (config_.timeout_ms > 0) {
        timeout = std::chrono::milliseconds(config_.timeout_ms);
    }
    return OperationContext(timeout, cancel);
}

template <typename Fn>
auto MarkService::logged(const char* operation, nlohmann::json extra, Fn&& fn) {
    OperationRecord rec;
    rec.operation = operation;
    rec.extra = std::move(extra);

    const auto start = std::chrono::steady_clock::now();
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, OperationRecord&>>) {
            fn(rec);
            rec.processing_ms = elapsed_ms(start);
            oplog_.record(rec);
        } else {
            auto result = fn(rec);
            rec.processing_ms = elapsed_ms(start);
            oplog_.record(rec);
            return result;
        }
    } catch (const MarkError& e) {
        rec.status = std::string(e.tag());
        rec.error = e.what();
        rec.processing_ms = elapsed_ms(start);
        oplog_.record(rec);
        spdlog::warn("{} failed ({}): {}", operation, e.tag(), e.what());
        throw;
    } catch (const std::exception& e) {
        rec.status = "internal_error";
        rec.error = e.what();
        rec.processing_ms = elapsed_ms(start);
        oplog_.record(rec);
        spdlog::error("{} failed: {}", operation, e.what());
        throw;
    }
}

// ---------------------------------------------------------------------------
// Image marks
// ---------------------------------------------------------------------------

EmbedImageResponse MarkService::embed_image(const EmbedImageRequest& req,
                                            const std::atomic<bool>* cancel) {
    return logged("embed_image", {{"input_bytes", req.image.size()}},
                  [&](OperationRecord& rec) {
        const Payload payload = payload_from_text(req.payload_text);
        const cv::Mat image = store_.decode_image(req.image, "image");

        const EmbeddedMark mark = orchestrator_.embed(
            image, payload,
            req.key_image.value_or(config_.default_key_image),
            req.key_watermark.value_or(config_.default_key_watermark),
            make_context(cancel));

        EmbedImageResponse resp;
        resp.output = store_.save_image(mark.image, "blind", config_.output_extension);
        resp.bit_length = mark.bit_length;

        rec.description = fmt::format("Embedded {}-byte payload", payload.size());
        rec.extra["bit_length"] = resp.bit_length;
        rec.extra["output"] = resp.output.id;
        return resp;
    });
}

ExtractImageResponse MarkService::extract_image(const ExtractImageRequest& req,
                                                const std::atomic<bool>* cancel) {
    return logged("extract_image",
                  {{"input_bytes", req.image.size()}, {"bit_length", req.bit_length}},
                  [&](OperationRecord& rec) {
        const cv::Mat image = store_.decode_image(req.image, "image");

        const Payload payload = orchestrator_.extract(
            image, req.bit_length,
            req.key_image.value_or(config_.default_key_image),
            req.key_watermark.value_or(config_.default_key_watermark),
            make_context(cancel));

        ExtractImageResponse resp;
        resp.payload_text = text_from_payload(payload);
        resp.plausibility = plausibility_ratio(payload);

        if (resp.plausibility < 0.5) {
            spdlog::warn("Extracted payload looks like noise ({:.0f}% printable); "
                         "check the bit length and keys", resp.plausibility * 100.0);
        }

        rec.description = fmt::format("Extracted {}-byte payload", payload.size());
        rec.extra["plausibility"] = resp.plausibility;
        return resp;
    });
}

AttackResponse MarkService::apply_attack(const AttackRequest& req,
                                         const std::atomic<bool>* cancel) {
    return logged("attack",
                  {{"input_bytes", req.image.size()}, {"attack_type", req.attack_type}},
                  [&](OperationRecord& rec) {
        const AttackType type = parse_attack_type(req.attack_type);
        const cv::Mat image = store_.decode_image(req.image, "image");

        const cv::Mat attacked = orchestrator_.attack(image, type, req.params,
                                                      make_context(cancel));

        AttackResponse resp;
        resp.attack_type = std::string(to_string(type));
        resp.output = store_.save_image(attacked, fmt::format("attacked_{}", resp.attack_type),
                                        config_.output_extension);

        rec.description = fmt::format("Applied {} attack", resp.attack_type);
        rec.extra["output"] = resp.output.id;
        rec.extra["output_size"] = {attacked.cols, attacked.rows};
        return resp;
    });
}

// ---------------------------------------------------------------------------
// Crop geometry
// ---------------------------------------------------------------------------

CropEstimate MarkService::estimate_crop(const EstimateCropRequest& req,
                                        const std::atomic<bool>* cancel) {
    return logged("estimate_crop",
                  {{"original_bytes", req.original.size()}, {"template_bytes", req.templ.size()}},
                  [&](OperationRecord& rec) {
        const cv::Mat original = store_.decode_image(req.original, "original");
        const cv::Mat templ = store_.decode_image(req.templ, "template");

        CropEstimate estimate = resolver_.estimate_crop(original, templ, make_context(cancel));

        rec.description = "Estimated crop position";
        rec.extra["box"] = to_json(estimate.box);
        rec.extra["score"] = estimate.score;
        return estimate;
    });
}

RecoverCropResponse MarkService::recover_crop(const RecoverCropRequest& req) {
    return logged("recover_crop",
                  {{"template_bytes", req.templ.size()}, {"box", to_json(req.box)},
                   {"shape", to_json(req.shape)}},
                  [&](OperationRecord& rec) {
        const cv::Mat templ = store_.decode_image(req.templ, "template");
        const cv::Mat canvas = resolver_.recover_crop(templ, req.box, req.shape);

        RecoverCropResponse resp;
        resp.output = store_.save_image(canvas, "recovered", config_.output_extension);

        rec.description = "Recovered crop onto original canvas";
        rec.extra["output"] = resp.output.id;
        return resp;
    });
}

// ---------------------------------------------------------------------------
// Text marks
// ---------------------------------------------------------------------------

void MarkService::embed_text_scope(std::vector<TextNode>& scope, const std::string& payload_text) {
    logged("embed_text", {{"nodes", scope.size()}}, [&](OperationRecord& rec) {
        const Payload payload = payload_from_text(payload_text);
        text_embedder_.embed_into_scope(scope, payload);
        rec.description = fmt::format("Embedded {}-byte payload into {} node(s)",
                                      payload.size(), scope.size());
    });
}

std::string MarkService::embed_text_document(const std::string& markup,
                                             const std::string& payload_text) {
    return logged("embed_text", {{"markup_bytes", markup.size()}}, [&](OperationRecord& rec) {
        const Payload payload = payload_from_text(payload_text);
        std::string marked = text_embedder_.embed_into_document(markup, payload);
        rec.description = fmt::format("Embedded {}-byte payload before {}",
                                      payload.size(), text_embedder_.closing_tag());
        return marked;
    });
}

std::string MarkService::extract_text_scope(const std::vector<TextNode>& scope) {
    return logged("extract_text", {{"nodes", scope.size()}}, [&](OperationRecord& rec) {
        const Payload payload = text_extractor_.extract_from_scope(scope);
        rec.description = fmt::format("Extracted {}-byte payload", payload.size());
        return text_from_payload(payload);
    });
}

std::string MarkService::extract_text_document(const std::string& markup) {
    return logged("extract_text", {{"markup_bytes", markup.size()}}, [&](OperationRecord& rec) {
        const Payload payload = text_extractor_.extract_from_document(markup);
        rec.description = fmt::format("Extracted {}-byte payload", payload.size());
        return text_from_payload(payload);
    });
}

// ---------------------------------------------------------------------------
// JSON views
// ---------------------------------------------------------------------------

nlohmann::json to_json(const ArtifactRef& ref) {
    return {{"id", ref.id}, {"path", to_utf8(ref.path)}};
}

nlohmann::json to_json(const CropBox& box) {
    return nlohmann::json::array({box.x1, box.y1, box.x2, box.y2});
}

nlohmann::json to_json(const CanvasShape& shape) {
    return {{"width", shape.width}, {"height", shape.height}};
}

nlohmann::json to_json(const CropEstimate& estimate) {
    return {
        {"box", to_json(estimate.box)},
        {"shape", to_json(estimate.shape)},
        {"score", estimate.score},
        {"scale", estimate.scale},
    };
}

nlohmann::json to_json(const EmbedImageResponse& resp) {
    return {{"output", to_json(resp.output)}, {"bit_length", resp.bit_length}};
}

nlohmann::json to_json(const ExtractImageResponse& resp) {
    return {{"payload", resp.payload_text}, {"plausibility", resp.plausibility}};
}

nlohmann::json to_json(const AttackResponse& resp) {
    return {{"output", to_json(resp.output)}, {"attack_type", resp.attack_type}};
}

nlohmann::json to_json(const RecoverCropResponse& resp) {
    return {{"output", to_json(resp.output)}};
}

nlohmann::json error_json(const MarkError& error) {
    nlohmann::json detail = {{"kind", std::string(error.tag())}, {"detail", error.what()}};
    if (const auto* no_match = dynamic_cast<const NoMatchError*>(&error)) {
        detail["best_score"] = no_match->best_score();
    }
    return {{"error", detail}};
}

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace dmt
