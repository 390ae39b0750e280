/**
 * @file    mark_service.hpp
 * @brief   Request/response facade over the mark subsystem
 * @license MIT
 *
 * @details
 * One call per external operation. Each call:
 *   - decodes its inputs (image bytes, payload text)
 *   - runs under a fresh OperationContext (configured timeout + optional
 *     caller cancel flag)
 *   - stores image outputs as uniquely named artifacts
 *   - writes one row to the operation log, success or failure
 *
 * Calls share no mutable state apart from the artifact sequence counter and
 * may run concurrently.
 */

#pragma once

#include "core/attack_simulator.hpp"
#include "core/crop_resolver.hpp"
#include "core/image_mark.hpp"
#include "core/template_matcher.hpp"
#include "core/text_mark.hpp"
#include "core/transform_capability.hpp"
#include "service/artifact_store.hpp"
#include "service/config.hpp"
#include "service/operation_log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dmt {

// ---------------------------------------------------------------------------
// Requests / responses
// ---------------------------------------------------------------------------

struct EmbedImageRequest {
    std::vector<std::uint8_t> image;
    std::string payload_text;
    std::optional<int> key_image;       // Config default when unset
    std::optional<int> key_watermark;
};

struct EmbedImageResponse {
    ArtifactRef output;
    int bit_length = 0;                 // Caller must keep this for extraction
};

struct ExtractImageRequest {
    std::vector<std::uint8_t> image;
    int bit_length = 0;
    std::optional<int> key_image;
    std::optional<int> key_watermark;
};

struct ExtractImageResponse {
    std::string payload_text;
    double plausibility = 0.0;          // Printable ratio; low hints at a wrong bit length
};

struct AttackRequest {
    std::vector<std::uint8_t> image;
    std::string attack_type;
    AttackParams params;
};

struct AttackResponse {
    ArtifactRef output;
    std::string attack_type;
};

struct EstimateCropRequest {
    std::vector<std::uint8_t> original;
    std::vector<std::uint8_t> templ;
};

struct RecoverCropRequest {
    std::vector<std::uint8_t> templ;
    CropBox box;
    CanvasShape shape;
};

struct RecoverCropResponse {
    ArtifactRef output;
};

// ---------------------------------------------------------------------------
// Service
// ---------------------------------------------------------------------------

class MarkService {
public:
    /**
     * Build with the reference capabilities (DCT/QIM transform, OpenCV
     * attacks, NCC matcher) configured from config
     */
    explicit MarkService(ServiceConfig config);

    /**
     * Build with caller-supplied capabilities
     * @throws ValidationError if any capability is null
     */
    MarkService(ServiceConfig config,
                std::shared_ptr<const TransformCapability> transform,
                std::shared_ptr<const AttackSimulator> attacks,
                std::shared_ptr<const TemplateMatcher> matcher);

    EmbedImageResponse embed_image(const EmbedImageRequest& req,
                                   const std::atomic<bool>* cancel = nullptr);

    ExtractImageResponse extract_image(const ExtractImageRequest& req,
                                       const std::atomic<bool>* cancel = nullptr);

    AttackResponse apply_attack(const AttackRequest& req,
                                const std::atomic<bool>* cancel = nullptr);

    CropEstimate estimate_crop(const EstimateCropRequest& req,
                               const std::atomic<bool>* cancel = nullptr);

    RecoverCropResponse recover_crop(const RecoverCropRequest& req);

    /**
     * Append the payload to every node of scope (mutated in place)
     */
    void embed_text_scope(std::vector<TextNode>& scope, const std::string& payload_text);

    /**
     * Return markup with the payload inserted before the configured closing tag
     */
    std::string embed_text_document(const std::string& markup, const std::string& payload_text);

    std::string extract_text_scope(const std::vector<TextNode>& scope);

    std::string extract_text_document(const std::string& markup);

    const ServiceConfig& config() const noexcept { return config_; }
    ArtifactStore& store() noexcept { return store_; }

private:
    ServiceConfig config_;
    ArtifactStore store_;
    OperationLog oplog_;
    InvisibleImageMarkOrchestrator orchestrator_;
    CropGeometryResolver resolver_;
    TextMarkEmbedder text_embedder_;
    TextMarkExtractor text_extractor_;

    OperationContext make_context(const std::atomic<bool>* cancel) const;

    template <typename Fn>
    auto logged(const char* operation, nlohmann::json extra, Fn&& fn);
};

// ---------------------------------------------------------------------------
// JSON views for CLI output
// ---------------------------------------------------------------------------

nlohmann::json to_json(const ArtifactRef& ref);
nlohmann::json to_json(const CropBox& box);
nlohmann::json to_json(const CanvasShape& shape);
nlohmann::json to_json(const CropEstimate& estimate);
nlohmann::json to_json(const EmbedImageResponse& resp);
nlohmann::json to_json(const ExtractImageResponse& resp);
nlohmann::json to_json(const AttackResponse& resp);
nlohmann::json to_json(const RecoverCropResponse& resp);

/**
 * {"error": {"kind": <tag>, "detail": <message>}}
 */
nlohmann::json error_json(const MarkError& error);

/**
 * Serialize j; invalid UTF-8 in strings is replaced with U+FFFD
 */
std::string dump_json(const nlohmann::json& j, int indent = -1);

}  // namespace dmt
