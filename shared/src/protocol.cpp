#include "chunkstitch/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkstitch::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 3> kCommandMappings{{
            {Command::UploadStart, "UPLOAD_START"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        // Numeric fields must be non-negative integers; nlohmann would otherwise
        // silently wrap a negative number into a huge unsigned value.
        std::uint64_t read_count(const nlohmann::json &json, const char *key)
        {
            const auto &value = json.at(key);
            if (value.is_number_unsigned())
            {
                return value.get<std::uint64_t>();
            }
            if (value.is_number_integer() && value.get<std::int64_t>() >= 0)
            {
                return static_cast<std::uint64_t>(value.get<std::int64_t>());
            }
            throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
        }

        std::optional<std::string> read_optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const UploadStartRequest &request)
    {
        json = {
            {"total", request.total},
            {"metadata", request.metadata},
        };
        if (request.upload_id)
        {
            json["upload_id"] = *request.upload_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadStartRequest &request)
    {
        request.upload_id = read_optional_string(json, "upload_id");
        request.total = read_count(json, "total");
        request.metadata = json.value("metadata", UploadMetadata{});
    }

    void to_json(nlohmann::json &json, const UploadStartResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"total", response.total},
        };
    }

    void from_json(const nlohmann::json &json, UploadStartResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.total = read_count(json, "total");
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"sequence", request.sequence},
            {"total", request.total},
            {"data", request.data_base64},
        };
        if (request.content_type)
        {
            json["content_type"] = *request.content_type;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.sequence = read_count(json, "sequence");
        request.total = read_count(json, "total");
        request.data_base64 = json.at("data").get<std::string>();
        request.content_type = read_optional_string(json, "content_type");
    }

    void to_json(nlohmann::json &json, const ProgressResponse &response)
    {
        json = {
            {"have", response.have},
            {"want", response.want},
            {"complete", response.complete},
        };
        if (response.error)
        {
            json["error"] = *response.error;
        }
        if (response.status)
        {
            json["status"] = *response.status;
        }
    }

    void from_json(const nlohmann::json &json, ProgressResponse &response)
    {
        response.have = read_count(json, "have");
        response.want = read_count(json, "want");
        response.complete = json.value("complete", false);
        response.error = read_optional_string(json, "error");
        if (auto it = json.find("status"); it != json.end() && !it->is_null())
        {
            response.status = it->get<int>();
        }
        else
        {
            response.status.reset();
        }
    }

} // namespace chunkstitch::protocol
