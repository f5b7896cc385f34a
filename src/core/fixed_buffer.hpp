#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace lanpeer {

/**
 * FixedBuffer - Append-only byte buffer with a compile-time capacity.
 *
 * Appends are all-or-nothing: text that does not fit is rejected with
 * ErrorCode::Overflow and the buffer is left unchanged.
 */
template<std::size_t Capacity>
class FixedBuffer {
public:
    static_assert(Capacity > 0, "FixedBuffer needs a non-zero capacity");

    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return Capacity - size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    Result<void, Error> append(std::string_view bytes) {
        if (bytes.size() > remaining()) {
            return Result<void, Error>::err(Error{
                "buffer overflow: " + std::to_string(bytes.size()) + " bytes requested, " +
                    std::to_string(remaining()) + " of " + std::to_string(Capacity) + " available",
                ErrorCode::Overflow});
        }
        for (char c : bytes) {
            data_[size_++] = c;
        }
        return Result<void, Error>::ok();
    }

    void clear() noexcept { size_ = 0; }

    [[nodiscard]] const char* data() const noexcept { return data_.data(); }

    // Only the valid range; bytes past size() are never exposed.
    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(data_.data(), size_);
    }

private:
    std::array<char, Capacity> data_{};
    std::size_t size_ = 0;
};

} // namespace lanpeer
