/**
 * @page mcumgr-serial-io-hdr mcumgr Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move console-framed SMP packets.
 *
 * @details
 * PURPOSE
 * -------
 * The minimal POSIX surface the serial transport needs: acquire a descriptor,
 * write one framed packet, read one framed packet within a deadline, close.
 * Framing lives in console_framing.hpp; this file only does syscalls.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   LinuxSerial::send() -> write_frame() -> read_frame()
 *                     \-> console_framing.hpp (lines, base64, crc16)
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user needs the dialout group.
 * - Shell output printed by the device between frames is skipped by the
 *   decoder, so a shared console UART works.
 * - Concurrency: one fd per transport; the transport serialises access.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mcumgr {

/// Outcome of a read_frame() call.
enum class IoStatus : uint8_t { Ok = 0, Timeout, Closed, Error };

/**
 * @brief Open @p dev, switch it to raw 8N1 at @p baud, absorb boot chatter.
 *
 * Unknown baud values fall back to 115200. Sleeps @p boot_delay_ms after
 * opening for USB CDC devices that reset on open, then flushes.
 *
 * @return File descriptor, or -1 when open or termios setup fails.
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief Console-frame one SMP packet and write all of it.
 * @return false on a packet too long to frame or a write error.
 */
bool write_frame(int fd, const std::vector<uint8_t>& packet);

/**
 * @brief Read until one complete, CRC-checked packet arrives or @p timeout_ms passes.
 *
 * @param out Receives the packet (header + CBOR body). Cleared at entry.
 */
IoStatus read_frame(int fd, std::vector<uint8_t>& out, int timeout_ms = 3000);

/// Discard bytes received but not yet read (late replies, shell chatter).
void flush_input(int fd);

/// Close a descriptor from open_serial(). Negative values are ignored.
void close_serial(int fd);

} // namespace mcumgr
