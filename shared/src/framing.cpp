#include "chunkstitch/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace chunkstitch::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t, kFrameHeaderSize> bytes)
        {
            std::uint32_t value = 0;
            for (const auto byte : bytes)
            {
                value = (value << 8) | static_cast<std::uint32_t>(byte);
            }
            return value;
        }

        void check_payload_size(std::size_t size)
        {
            if (size > kMaxFramePayload)
            {
                throw std::length_error("Frame payload of " + std::to_string(size) + " bytes exceeds limit");
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        check_payload_size(text.size());
        const auto size = static_cast<std::uint32_t>(text.size());

        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + text.size());
        for (int shift = 24; shift >= 0; shift -= 8)
        {
            frame.push_back(static_cast<std::uint8_t>((size >> shift) & 0xFF));
        }
        frame.insert(frame.end(), text.begin(), text.end());
        return frame;
    }

    std::uint32_t decode_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header)
    {
        const auto size = read_u32_be(header);
        check_payload_size(size);
        return size;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy_n(buffer.begin(), kFrameHeaderSize, header.begin());
        const auto payload_size = decode_frame_length(header);
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload = buffer.subspan(kFrameHeaderSize, payload_size);
        return DecodedFrame{
            .message = nlohmann::json::parse(payload.begin(), payload.end()),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

} // namespace chunkstitch::protocol
