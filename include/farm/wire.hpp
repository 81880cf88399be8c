/**
 * @file wire.hpp
 * @brief Frame codec and blocking stream I/O for the process transport.
 *
 * Every frame is a 14-byte header followed by `length` payload bytes:
 *
 *   offset  size  field
 *   0       4     magic   (kFrameMagic, "FRM\1")
 *   4       4     length  (payload bytes)
 *   8       2     type    (FrameType)
 *   10      4     sender  (worker id, kDispatcherSender for the dispatcher)
 *
 * Payloads:
 *   kJob    : parameter f64 | count u32
 *   kBatch  : count u32 | count x f64
 *   kStop, kAbort, kExited, kRelease : empty
 *
 * Fields are memcpy'd in host byte order (little-endian on every supported
 * target); both ends of a socket pair always live on the same host.
 */

#ifndef FARM_WIRE_HPP_
#define FARM_WIRE_HPP_

#include "farm/messages.hpp"
#include "farm/platform.hpp"
#include "farm/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <utility>
#include <vector>

#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(MSG_NOSIGNAL)
#define FARM_WIRE_NOSIGNAL MSG_NOSIGNAL
#else
#define FARM_WIRE_NOSIGNAL 0
#endif

/// Largest batch a single kBatch frame may carry.
#ifndef FARM_WIRE_MAX_BATCH_VALUES
#define FARM_WIRE_MAX_BATCH_VALUES 1048576U
#endif

namespace farm {
namespace wire {

// ============================================================================
// Frame layout
// ============================================================================

inline constexpr uint32_t kFrameMagic = 0x46524D01;  ///< "FRM\1"
inline constexpr uint32_t kHeaderSize = 14;          ///< 4 + 4 + 2 + 4
inline constexpr uint32_t kDispatcherSender = 0xFFFFFFFFU;
inline constexpr uint32_t kMaxBatchValues = FARM_WIRE_MAX_BATCH_VALUES;
inline constexpr uint32_t kMaxFramePayload = 4U + kMaxBatchValues * 8U;
inline constexpr uint32_t kJobPayloadSize = 8U + 4U;

enum class FrameType : uint16_t {
  kJob = 1,
  kStop = 2,
  kAbort = 3,
  kBatch = 4,
  kExited = 5,   ///< worker left its loop and waits for release
  kRelease = 6   ///< dispatcher ends the rendezvous
};

struct FrameHeader {
  uint32_t magic;
  uint32_t length;
  uint16_t type;
  uint32_t sender;
};

inline void EncodeHeader(const FrameHeader& hdr, uint8_t* buf) noexcept {
  std::memcpy(buf + 0, &hdr.magic, 4);
  std::memcpy(buf + 4, &hdr.length, 4);
  std::memcpy(buf + 8, &hdr.type, 2);
  std::memcpy(buf + 10, &hdr.sender, 4);
}

inline FrameHeader DecodeHeader(const uint8_t* buf) noexcept {
  FrameHeader hdr;
  std::memcpy(&hdr.magic, buf + 0, 4);
  std::memcpy(&hdr.length, buf + 4, 4);
  std::memcpy(&hdr.type, buf + 8, 2);
  std::memcpy(&hdr.sender, buf + 10, 4);
  return hdr;
}

inline bool IsKnownType(uint16_t type) noexcept {
  return type >= static_cast<uint16_t>(FrameType::kJob) &&
         type <= static_cast<uint16_t>(FrameType::kRelease);
}

// ============================================================================
// Stream I/O
// ============================================================================

/// @brief Write all @p size bytes. A closed peer is kTransportFailure.
inline expected<void, FarmError> WriteFull(int fd, const void* data, size_t size) noexcept {
  const auto* p = static_cast<const uint8_t*>(data);
  while (size > 0U) {
    const ssize_t n = ::send(fd, p, size, FARM_WIRE_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return expected<void, FarmError>::error(FarmError::kTransportFailure);
    }
    p += n;
    size -= static_cast<size_t>(n);
  }
  return expected<void, FarmError>::success();
}

/// @brief Read exactly @p size bytes. EOF before that is kTransportFailure.
inline expected<void, FarmError> ReadFull(int fd, void* data, size_t size) noexcept {
  auto* p = static_cast<uint8_t*>(data);
  while (size > 0U) {
    const ssize_t n = ::recv(fd, p, size, 0);
    if (n == 0) return expected<void, FarmError>::error(FarmError::kTransportFailure);
    if (n < 0) {
      if (errno == EINTR) continue;
      return expected<void, FarmError>::error(FarmError::kTransportFailure);
    }
    p += n;
    size -= static_cast<size_t>(n);
  }
  return expected<void, FarmError>::success();
}

// ============================================================================
// Frames
// ============================================================================

inline expected<void, FarmError> SendFrame(int fd, FrameType type, uint32_t sender,
                                           const uint8_t* payload, uint32_t length) {
  if (length > kMaxFramePayload) {
    return expected<void, FarmError>::error(FarmError::kProtocolViolation);
  }
  std::vector<uint8_t> frame(kHeaderSize + length);
  EncodeHeader(FrameHeader{kFrameMagic, length, static_cast<uint16_t>(type), sender},
               frame.data());
  if (length > 0U) std::memcpy(frame.data() + kHeaderSize, payload, length);
  return WriteFull(fd, frame.data(), frame.size());
}

/**
 * @brief Best-effort control frame that never blocks (abort path).
 * @return true if the whole header went out.
 */
inline bool TrySendControl(int fd, FrameType type, uint32_t sender) noexcept {
  uint8_t buf[kHeaderSize];
  EncodeHeader(FrameHeader{kFrameMagic, 0U, static_cast<uint16_t>(type), sender}, buf);
  const ssize_t n = ::send(fd, buf, sizeof(buf), MSG_DONTWAIT | FARM_WIRE_NOSIGNAL);
  return n == static_cast<ssize_t>(sizeof(buf));
}

/**
 * @brief Read one frame. Bad magic, unknown type or an oversized length is a
 * kProtocolViolation; a closed or broken stream is a kTransportFailure.
 */
inline expected<void, FarmError> RecvFrame(int fd, FrameHeader& hdr,
                                           std::vector<uint8_t>& payload) {
  uint8_t buf[kHeaderSize];
  auto r = ReadFull(fd, buf, sizeof(buf));
  if (!r.has_value()) return r;

  hdr = DecodeHeader(buf);
  if (FARM_UNLIKELY(hdr.magic != kFrameMagic || !IsKnownType(hdr.type) ||
                    hdr.length > kMaxFramePayload)) {
    return expected<void, FarmError>::error(FarmError::kProtocolViolation);
  }
  payload.resize(hdr.length);
  if (hdr.length == 0U) return expected<void, FarmError>::success();
  return ReadFull(fd, payload.data(), hdr.length);
}

// ============================================================================
// WorkUnit <-> frame
// ============================================================================

inline expected<void, FarmError> SendUnit(int fd, const WorkUnit& unit) {
  switch (unit.kind) {
    case UnitKind::kJob: {
      uint8_t payload[kJobPayloadSize];
      std::memcpy(payload, &unit.parameter, 8);
      std::memcpy(payload + 8, &unit.count, 4);
      return SendFrame(fd, FrameType::kJob, kDispatcherSender, payload, sizeof(payload));
    }
    case UnitKind::kStop:
      return SendFrame(fd, FrameType::kStop, kDispatcherSender, nullptr, 0U);
    case UnitKind::kAbort:
      return SendFrame(fd, FrameType::kAbort, kDispatcherSender, nullptr, 0U);
  }
  return expected<void, FarmError>::error(FarmError::kProtocolViolation);
}

inline expected<WorkUnit, FarmError> DecodeUnit(const FrameHeader& hdr,
                                                const std::vector<uint8_t>& payload) {
  switch (static_cast<FrameType>(hdr.type)) {
    case FrameType::kJob: {
      if (payload.size() != kJobPayloadSize) break;
      WorkUnit unit;
      unit.kind = UnitKind::kJob;
      std::memcpy(&unit.parameter, payload.data(), 8);
      std::memcpy(&unit.count, payload.data() + 8, 4);
      return expected<WorkUnit, FarmError>::success(unit);
    }
    case FrameType::kStop:
      if (!payload.empty()) break;
      return expected<WorkUnit, FarmError>::success(WorkUnit::Stop());
    case FrameType::kAbort:
      if (!payload.empty()) break;
      return expected<WorkUnit, FarmError>::success(WorkUnit::Abort());
    default:
      break;
  }
  return expected<WorkUnit, FarmError>::error(FarmError::kProtocolViolation);
}

// ============================================================================
// ResultBatch <-> frame
// ============================================================================

inline expected<void, FarmError> SendBatch(int fd, const ResultBatch& batch) {
  if (batch.values.size() > kMaxBatchValues) {
    return expected<void, FarmError>::error(FarmError::kProtocolViolation);
  }
  const auto count = static_cast<uint32_t>(batch.values.size());
  std::vector<uint8_t> payload(4U + static_cast<size_t>(count) * 8U);
  std::memcpy(payload.data(), &count, 4);
  if (count > 0U) std::memcpy(payload.data() + 4, batch.values.data(), count * 8U);
  return SendFrame(fd, FrameType::kBatch, batch.producer.value(), payload.data(),
                   static_cast<uint32_t>(payload.size()));
}

inline expected<ResultBatch, FarmError> DecodeBatch(const FrameHeader& hdr,
                                                    const std::vector<uint8_t>& payload) {
  if (static_cast<FrameType>(hdr.type) != FrameType::kBatch || payload.size() < 4U) {
    return expected<ResultBatch, FarmError>::error(FarmError::kProtocolViolation);
  }
  uint32_t count = 0;
  std::memcpy(&count, payload.data(), 4);
  if (payload.size() != 4U + static_cast<size_t>(count) * 8U) {
    return expected<ResultBatch, FarmError>::error(FarmError::kProtocolViolation);
  }
  ResultBatch batch;
  batch.producer = WorkerId(hdr.sender);
  batch.values.resize(count);
  if (count > 0U) std::memcpy(batch.values.data(), payload.data() + 4, count * 8U);
  return expected<ResultBatch, FarmError>::success(std::move(batch));
}

}  // namespace wire
}  // namespace farm

#endif  // FARM_WIRE_HPP_
