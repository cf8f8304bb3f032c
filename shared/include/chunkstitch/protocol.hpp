/**
 * ChunkStitch - Wire schema for chunk submission and its JSON serialization.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkstitch/error_codes.hpp"

namespace chunkstitch
{

    // Opaque key/value bag recorded when an upload starts (filename, content type, ...).
    using UploadMetadata = std::map<std::string, std::string>;

} // namespace chunkstitch

namespace chunkstitch::protocol
{

    enum class Command : std::uint8_t
    {
        UploadStart,
        UploadChunk,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct UploadStartRequest
    {
        std::optional<std::string> upload_id{};
        std::uint64_t total{};
        UploadMetadata metadata{};
    };

    void to_json(nlohmann::json &json, const UploadStartRequest &request);
    void from_json(const nlohmann::json &json, UploadStartRequest &request);

    struct UploadStartResponse
    {
        std::string upload_id;
        std::uint64_t total{};
    };

    void to_json(nlohmann::json &json, const UploadStartResponse &response);
    void from_json(const nlohmann::json &json, UploadStartResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t sequence{};
        std::uint64_t total{};
        std::string data_base64;
        std::optional<std::string> content_type{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    // Progress reported for every accepted chunk; the rejection fields are only
    // present on the submission that completed the upload and got vetoed.
    struct ProgressResponse
    {
        std::uint64_t have{};
        std::uint64_t want{};
        bool complete{};
        std::optional<std::string> error{};
        std::optional<int> status{};
    };

    void to_json(nlohmann::json &json, const ProgressResponse &response);
    void from_json(const nlohmann::json &json, ProgressResponse &response);

} // namespace chunkstitch::protocol
