#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace wasistub
{
class BinaryReader
{
public:
    explicit BinaryReader(std::span<const uint8_t> data) noexcept
        : data_(data)
    {
    }

    [[nodiscard]] bool eof() const noexcept { return offset_ >= data_.size(); }

    [[nodiscard]] size_t offset() const noexcept { return offset_; }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - offset_; }

    [[nodiscard]] std::span<const uint8_t> data() const noexcept { return data_; }

    uint8_t read_u8()
    {
        ensure_available(1);
        return data_[offset_++];
    }

    uint32_t read_u32()
    {
        ensure_available(4);
        uint32_t value = data_[offset_] | (data_[offset_ + 1] << 8U) | (data_[offset_ + 2] << 16U) |
                         (data_[offset_ + 3] << 24U);
        offset_ += 4;
        return value;
    }

    uint32_t read_varuint32() { return read_leb_unsigned<uint32_t>(32); }
    uint64_t read_varuint64() { return read_leb_unsigned<uint64_t>(64); }

    int32_t read_varint32() { return read_leb_signed<int32_t>(32); }
    int64_t read_varint33() { return read_leb_signed<int64_t>(33); }
    int64_t read_varint64() { return read_leb_signed<int64_t>(64); }

    // Returns a view into the underlying buffer and advances past it.
    std::span<const uint8_t> read_bytes(size_t count)
    {
        ensure_available(count);
        auto bytes = data_.subspan(offset_, count);
        offset_ += count;
        return bytes;
    }

    std::string read_name()
    {
        auto length = read_varuint32();
        auto bytes = read_bytes(length);
        return std::string(bytes.begin(), bytes.end());
    }

    void skip_bytes(size_t count)
    {
        ensure_available(count);
        offset_ += count;
    }

private:
    // Both LEB readers cap the encoding at ceil(max_bits / 7) bytes. Bits of
    // the final byte beyond max_bits must be zero (unsigned) or copies of the
    // sign bit (signed).
    template <typename T>
    T read_leb_unsigned(int max_bits)
    {
        T result = 0;
        int shift = 0;
        while (true)
        {
            uint8_t byte = read_u8();
            const int used_bits = max_bits - shift;
            if (used_bits < 7 && (byte & 0x7FU) >> used_bits != 0)
            {
                throw std::runtime_error("LEB128 unused bits must be zero");
            }
            result |= static_cast<T>(byte & 0x7F) << shift;
            if ((byte & 0x80U) == 0)
            {
                break;
            }
            shift += 7;
            if (shift >= max_bits)
            {
                throw std::runtime_error("LEB128 overflow");
            }
        }
        return result;
    }

    template <typename T>
    T read_leb_signed(int max_bits)
    {
        T result = 0;
        int shift = 0;
        uint8_t byte;
        while (true)
        {
            byte = read_u8();
            const int used_bits = max_bits - shift;
            if (used_bits < 7)
            {
                // The sign bit and every unused bit above it must agree.
                const uint8_t high = static_cast<uint8_t>((byte & 0x7FU) >> (used_bits - 1));
                const uint8_t all_ones = static_cast<uint8_t>(0x7FU >> (used_bits - 1));
                if (high != 0 && high != all_ones)
                {
                    throw std::runtime_error("LEB128 unused bits must match the sign bit");
                }
            }
            if (shift < static_cast<int>(sizeof(T) * 8))
            {
                result |= static_cast<T>(static_cast<std::make_unsigned_t<T>>(byte & 0x7F) << shift);
            }
            shift += 7;
            if ((byte & 0x80U) == 0)
            {
                break;
            }
            if (shift >= max_bits)
            {
                throw std::runtime_error("LEB128 overflow");
            }
        }

        if (shift < static_cast<int>(sizeof(T) * 8) && (byte & 0x40U) != 0)
        {
            result |= static_cast<T>(static_cast<std::make_unsigned_t<T>>(-1) << shift);
        }
        return result;
    }

    void ensure_available(size_t count)
    {
        if (count > data_.size() - offset_)
        {
            throw std::out_of_range("BinaryReader::ensure_available");
        }
    }

    std::span<const uint8_t> data_;
    size_t offset_{0};
};
} // namespace wasistub
