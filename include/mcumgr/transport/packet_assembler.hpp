#pragma once
/**
 * @file packet_assembler.hpp
 * @brief Reassembles SMP packets that a stream link delivers in fragments.
 *
 * BLE notifications and serial reads hand over arbitrary slices of a packet.
 * The assembler buffers them, asks the response builder how long the packet
 * is once a header is present, and releases exactly one packet at a time.
 * Bytes beyond the current packet stay buffered for the next one.
 */

#include <cstddef>
#include <cstdint>
#include <vector>
#include "mcumgr/error.hpp"
#include "mcumgr/scheme.hpp"

namespace mcumgr::transport {

class PacketAssembler {
public:
  explicit PacketAssembler(Scheme scheme = Scheme::StandardBle) : scheme_(scheme) {}

  /**
   * @brief Append @p n received bytes.
   * @return true once a full packet is buffered; take it with `pop()`.
   *         On a header that cannot be parsed the buffer is dropped and
   *         `last_error()` reports why.
   */
  bool feed(const uint8_t* data, std::size_t n);

  /// Move the completed packet into @p out. False when none is ready.
  bool pop(std::vector<uint8_t>& out);

  /// Bytes still needed for the packet in progress; 0 when unknown or complete.
  std::size_t missing() const;

  void reset() { buf_.clear(); expected_ = 0; last_error_ = Error(); }

  const Error& last_error() const { return last_error_; }

private:
  bool update_expected();

  Scheme               scheme_;
  std::vector<uint8_t> buf_;
  std::size_t          expected_{0};
  Error                last_error_;
};

} // namespace mcumgr::transport
