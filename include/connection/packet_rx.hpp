#pragma once
#include "connection/wire_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace connection
{

  /**
   * @brief Stream decoder for back-to-back 22-byte 'PKT' frames.
   *
   * Bytes that do not start a 'PKT' magic are dropped one at a time until the
   * stream is back in sync. Keeps a read cursor and compacts occasionally instead
   * of erasing per frame.
   */
  class PacketRx
  {
  public:
    static constexpr size_t kMaxBufferBytes = 64 * 1024; // hard cap against junk streams
    static constexpr size_t kCompactThreshold = 4096;    // compact when read_pos exceeds this

    void push_bytes(const uint8_t *data, size_t n)
    {
      if (n == 0) return;

      // If the peer floods without valid frames, keep only the newest tail.
      if (available_bytes() + n > kMaxBufferBytes)
      {
        clear();
        if (n > kMaxBufferBytes)
        {
          data += (n - kMaxBufferBytes);
          n = kMaxBufferBytes;
        }
      }

      buf_.insert(buf_.end(), data, data + n);
    }

    /// Pop the next complete frame. Returns false when more bytes are needed.
    bool pop(core::Packet &out)
    {
      while (available_bytes() >= wire::kMagicSize)
      {
        const uint8_t *p = buf_.data() + read_pos_;
        if (p[0] == wire::kMagic[0] && p[1] == wire::kMagic[1] && p[2] == wire::kMagic[2])
          break;
        ++read_pos_;
        ++dropped_bytes_;
      }

      if (available_bytes() < core::kPacketSize)
      {
        maybe_compact();
        return false;
      }

      const std::span<const uint8_t> frame(buf_.data() + read_pos_, core::kPacketSize);
      const bool ok = wire::decode_packet(frame, out);
      read_pos_ += core::kPacketSize;
      maybe_compact();
      return ok;
    }

    void clear()
    {
      buf_.clear();
      read_pos_ = 0;
    }

    size_t available_bytes() const noexcept
    {
      return (read_pos_ <= buf_.size()) ? (buf_.size() - read_pos_) : 0;
    }

    size_t dropped_bytes() const noexcept { return dropped_bytes_; }

  private:
    void maybe_compact()
    {
      if (read_pos_ == buf_.size())
      {
        clear();
        return;
      }

      if (read_pos_ >= kCompactThreshold && read_pos_ > (buf_.size() / 2))
      {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
        read_pos_ = 0;
      }
    }

    std::vector<uint8_t> buf_;
    size_t read_pos_{0};
    size_t dropped_bytes_{0};
  };

} // namespace connection
