#pragma once

#include "upecho/core/status.hpp"
#include "upecho/util/branch.hpp"
#include "upecho/wire/error.hpp"
#include "upecho/wire/utf8.hpp"
#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/write.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// namespace wire: the frame format shared by client and server.
// A frame is a 2-byte big-endian byte count followed by that many bytes of
// UTF-8 text. There is no version byte, type tag or checksum. The codec does
// not interpret the text; the sentinel is a handler concern.
namespace upecho::wire {

namespace net = boost::asio;

inline constexpr std::size_t kHeaderSize = 2;
inline constexpr std::size_t kMaxPayload = 0xFFFF;

using Header = std::array<std::uint8_t, kHeaderSize>;

inline Header MakeHeader(std::size_t len) {
  return {static_cast<std::uint8_t>((len >> 8) & 0xFF),
          static_cast<std::uint8_t>(len & 0xFF)};
}

inline std::size_t ParseHeader(const Header &h) {
  return (static_cast<std::size_t>(h[0]) << 8) | h[1];
}

inline Status CheckPayload(std::string_view text) {
  if (UPECHO_UNLIKELY(text.size() > kMaxPayload)) {
    return std::unexpected(make_error_code(Errc::frame_too_large));
  }
  if (UPECHO_UNLIKELY(!IsValidUtf8(text))) {
    return std::unexpected(make_error_code(Errc::invalid_utf8));
  }
  return {};
}

// Encode returns the complete frame: header followed by payload.
inline Result<std::string> Encode(std::string_view text) {
  if (auto st = CheckPayload(text); !st) {
    return std::unexpected(st.error());
  }
  const Header h = MakeHeader(text.size());
  std::string frame;
  frame.reserve(kHeaderSize + text.size());
  frame.push_back(static_cast<char>(h[0]));
  frame.push_back(static_cast<char>(h[1]));
  frame.append(text);
  return frame;
}

// Maps a short read to the frame-level error. A clean end of stream before
// the first header byte is the peer going away and stays `eof`.
inline error_code MapReadError(const error_code &ec, std::size_t got,
                               bool in_payload) {
  if (ec == net::error::eof && (in_payload || got > 0)) {
    return make_error_code(Errc::truncated_frame);
  }
  return ec;
}

inline Result<std::string> FinishPayload(std::string payload) {
  if (UPECHO_UNLIKELY(!IsValidUtf8(payload))) {
    return std::unexpected(make_error_code(Errc::invalid_utf8));
  }
  return payload;
}

// Blocking decode of exactly one frame from any SyncReadStream.
template <typename SyncReadStream>
Result<std::string> Decode(SyncReadStream &stream) {
  Header header{};
  error_code ec;
  std::size_t got = net::read(stream, net::buffer(header), ec);
  if (UPECHO_UNLIKELY(ec)) {
    return std::unexpected(MapReadError(ec, got, false));
  }
  std::string payload(ParseHeader(header), '\0');
  if (!payload.empty()) {
    got = net::read(stream, net::buffer(payload), ec);
    if (UPECHO_UNLIKELY(ec)) {
      return std::unexpected(MapReadError(ec, got, true));
    }
  }
  return FinishPayload(std::move(payload));
}

// Encodes and writes one frame to any SyncWriteStream.
template <typename SyncWriteStream>
Status WriteFrame(SyncWriteStream &stream, std::string_view text) {
  auto frame = Encode(text);
  if (!frame) {
    return std::unexpected(frame.error());
  }
  error_code ec;
  net::write(stream, net::buffer(*frame), ec);
  return MakeStatus(ec);
}

// Coroutine variants

template <typename AsyncReadStream>
Result<std::string> AsyncDecode(AsyncReadStream &stream,
                                net::yield_context yield) {
  Header header{};
  error_code ec;
  std::size_t got = net::async_read(stream, net::buffer(header), yield[ec]);
  if (UPECHO_UNLIKELY(ec)) {
    return std::unexpected(MapReadError(ec, got, false));
  }
  std::string payload(ParseHeader(header), '\0');
  if (!payload.empty()) {
    got = net::async_read(stream, net::buffer(payload), yield[ec]);
    if (UPECHO_UNLIKELY(ec)) {
      return std::unexpected(MapReadError(ec, got, true));
    }
  }
  return FinishPayload(std::move(payload));
}

template <typename AsyncWriteStream>
Status AsyncWriteFrame(AsyncWriteStream &stream, std::string_view text,
                       net::yield_context yield) {
  auto frame = Encode(text);
  if (!frame) {
    return std::unexpected(frame.error());
  }
  error_code ec;
  net::async_write(stream, net::buffer(*frame), yield[ec]);
  return MakeStatus(ec);
}

} // namespace upecho::wire
