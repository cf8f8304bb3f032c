#include <array>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkstitch/crypto.hpp"
#include "chunkstitch/encoding/base64.hpp"
#include "chunkstitch/error_codes.hpp"
#include "chunkstitch/framing.hpp"
#include "chunkstitch/protocol.hpp"

using namespace chunkstitch;
using namespace chunkstitch::protocol;

void run_server_component_tests();
void run_assembler_tests();

namespace
{

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> data;
        for (const char ch : text)
        {
            data.push_back(static_cast<std::byte>(ch));
        }
        return data;
    }

    void test_request_roundtrip()
    {
        UploadChunkRequest chunk{
            .upload_id = "photo-1",
            .sequence = 2,
            .total = 3,
            .data_base64 = "QzI=",
            .content_type = std::string("image/png"),
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadChunk;
        envelope.payload = chunk;
        envelope.request_id = std::string("req-7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_CHUNK");
        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::UploadChunk);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_chunk = decoded.payload.get<UploadChunkRequest>();
        assert(decoded_chunk.upload_id == "photo-1");
        assert(decoded_chunk.sequence == 2);
        assert(decoded_chunk.total == 3);
        assert(decoded_chunk.content_type == std::optional<std::string>("image/png"));
    }

    void test_unknown_command_rejected()
    {
        const auto json = nlohmann::json{{"cmd", "LIST"}, {"payload", nlohmann::json::object()}};
        bool caught = false;
        try
        {
            (void)json.get<RequestEnvelope>();
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_negative_numbers_rejected()
    {
        const auto json = nlohmann::json{{"upload_id", "a"}, {"sequence", -1}, {"total", 2}, {"data", "QQ=="}};
        bool caught = false;
        try
        {
            (void)json.get<UploadChunkRequest>();
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_start_request_metadata()
    {
        UploadStartRequest request{
            .upload_id = std::nullopt,
            .total = 4,
            .metadata = {{"filename", "report.pdf"}, {"content_type", "application/pdf"}},
        };
        const auto json = nlohmann::json(request);
        assert(!json.contains("upload_id"));
        const auto decoded = json.get<UploadStartRequest>();
        assert(!decoded.upload_id);
        assert(decoded.total == 4);
        assert(decoded.metadata.at("filename") == "report.pdf");

        const auto minimal = nlohmann::json{{"total", 1}}.get<UploadStartRequest>();
        assert(minimal.metadata.empty());
    }

    void test_progress_response_with_rejection()
    {
        ProgressResponse progress{.have = 3, .want = 3, .complete = true};
        auto json = nlohmann::json(progress);
        assert(!json.contains("error"));
        assert(!json.contains("status"));

        progress.error = std::string("bad format");
        progress.status = 400;
        json = nlohmann::json(progress);
        assert(json.at("have") == 3);
        assert(json.at("want") == 3);
        assert(json.at("error") == "bad format");
        const auto decoded = json.get<ProgressResponse>();
        assert(decoded.status == std::optional<int>(400));
        assert(decoded.complete);
    }

    void test_response_envelope()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::QuantityMismatch;
        envelope.message = "Cannot change expected number of chunks";
        envelope.request_id = std::string("req-1");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::QuantityMismatch);
        assert(decoded.message == envelope.message);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::InvalidRequest) == "invalid_request");
        assert(to_string(ErrorCode::StorageError) == "storage_error");
        assert(error_code_from_int(to_int(ErrorCode::QuantityMismatch)) == ErrorCode::QuantityMismatch);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_framing()
    {
        const nlohmann::json message = {{"cmd", "PING"}, {"payload", nlohmann::json::object()}};
        auto frame = encode_frame(message);
        const auto text = message.dump();
        assert(frame.size() == kFrameHeaderSize + text.size());

        assert(!try_decode_frame(std::span<const std::uint8_t>(frame).first(frame.size() - 1)));

        frame.push_back(0x00);
        const auto decoded = try_decode_frame(frame);
        assert(decoded);
        assert(decoded->message == message);
        assert(decoded->bytes_consumed == frame.size() - 1);

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)decode_frame_length(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_base64()
    {
        assert(encoding::encode_base64(bytes_of("")) == "");
        assert(encoding::encode_base64(bytes_of("C0")) == "QzA=");
        assert(encoding::encode_base64(bytes_of("chunk")) == "Y2h1bms=");

        const auto decoded = encoding::decode_base64("Y2h1\nbms=");
        assert(decoded);
        assert(*decoded == bytes_of("chunk"));

        std::vector<std::byte> binary;
        for (int value = 0; value < 256; ++value)
        {
            binary.push_back(static_cast<std::byte>(value));
        }
        assert(encoding::decode_base64(encoding::encode_base64(binary)) == binary);

        assert(!encoding::decode_base64("not*base64"));
        assert(!encoding::decode_base64("QQ==QQ=="));
    }

    void test_random_tokens()
    {
        const auto first = crypto::random_hex_token(16);
        const auto second = crypto::random_hex_token(16);
        assert(first.size() == 32);
        assert(first != second);
        assert(first.find_first_not_of("0123456789abcdef") == std::string::npos);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_command_rejected();
        test_negative_numbers_rejected();
        test_start_request_metadata();
        test_progress_response_with_rejection();
        test_response_envelope();
        test_error_codes();
        test_framing();
        test_base64();
        test_random_tokens();
        run_server_component_tests();
        run_assembler_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
