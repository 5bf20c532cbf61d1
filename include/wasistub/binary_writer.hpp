#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace wasistub
{
class BinaryWriter
{
public:
    BinaryWriter() = default;

    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }

    std::vector<uint8_t> take() noexcept { return std::move(bytes_); }

    void write_u8(uint8_t value) { bytes_.push_back(value); }

    void write_u32(uint32_t value)
    {
        for (int i = 0; i < 4; ++i)
        {
            bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void write_varuint32(uint32_t value) { write_leb_unsigned(value); }
    void write_varuint64(uint64_t value) { write_leb_unsigned(value); }

    void write_varint32(int32_t value) { write_leb_signed(value); }
    void write_varint64(int64_t value) { write_leb_signed(value); }

    void write_bytes(std::span<const uint8_t> data) { bytes_.insert(bytes_.end(), data.begin(), data.end()); }

    void write_name(std::string_view name)
    {
        write_varuint32(static_cast<uint32_t>(name.size()));
        bytes_.insert(bytes_.end(), name.begin(), name.end());
    }

    // Length-prefixed payload, as used by sections and code entries.
    void write_sized(std::span<const uint8_t> payload)
    {
        write_varuint32(static_cast<uint32_t>(payload.size()));
        write_bytes(payload);
    }

private:
    template <typename T>
    void write_leb_unsigned(T value)
    {
        do
        {
            uint8_t byte = value & 0x7F;
            value >>= 7;
            if (value != 0)
            {
                byte |= 0x80;
            }
            bytes_.push_back(byte);
        } while (value != 0);
    }

    template <typename T>
    void write_leb_signed(T value)
    {
        bool more = true;
        while (more)
        {
            uint8_t byte = value & 0x7F;
            value >>= 7;
            if ((value == 0 && (byte & 0x40) == 0) || (value == -1 && (byte & 0x40) != 0))
            {
                more = false;
            }
            else
            {
                byte |= 0x80;
            }
            bytes_.push_back(byte);
        }
    }

    std::vector<uint8_t> bytes_;
};
} // namespace wasistub
