// ============================================================================
// serial_io.cpp : implementation for serial_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "serial_io.hpp"          // open_serial(), write_frame(), read_frame(), flush_input(), close_serial()
#include "console_framing.hpp"    // console::encode() and decoder for line framing

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>                // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>               // ::read, ::write, ::close, usleep, isatty
#include <termios.h>              // termios struct + raw mode helpers
#include <poll.h>                 // poll(2) for deadline-based waits
#include <cerrno>                 // EINTR, EAGAIN
#include <chrono>                 // steady_clock deadline in read_frame()

namespace mcumgr {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - Disables echo, line buffering, CR/LF translation and flow control (8N1).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
// - Flushes both input/output buffers after applying settings.
//
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // wipe into raw 8N1 mode
    cfsetispeed(&tio, baud);                      // set baud in/out
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // disable hardware flow control
    tio.c_cc[VMIN]  = 0;                          // no minimum chars per read
    tio.c_cc[VTIME] = 0;                          // no interbyte timer (we use poll)

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;  // apply immediately
    tcflush(fd, TCIOFLUSH);                       // flush in/out buffers
    return true;
}

// ---------------------------------------------------------------------------
// to_speed()
// ----------
// Map a baud integer onto its termios constant. The high rates are not
// defined everywhere, hence the guards. Anything unknown becomes 115200.
// ---------------------------------------------------------------------------
static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
#ifdef B921600
        case 921600: return B921600;
#endif
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port at the requested baud.
// - Applies O_NOCTTY (don't steal controlling terminal) and O_NONBLOCK.
// - Calls set_raw(); a port that refuses raw mode is closed again.
// - Sleeps boot_delay_ms to allow USB CDC devices to reset on open.
// - Flushes boot chatter after the delay.
//
// Returns: file descriptor (>=0) or -1 on failure.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;                        // open failed (perm, missing, etc.)

    if (!set_raw(fd, to_speed(baud))) {           // not a tty, or termios refused
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // drop any reboot chatter
    return fd;
}

// ---------------------------------------------------------------------------
// write_frame()
// -------------
// Console-frame one SMP packet and write all of it to the serial fd.
// - Lines can exceed the driver buffer for large packets, so keep writing
//   until everything is out.
// - EAGAIN waits up to one second for POLLOUT before giving up.
//
// Returns: true if the entire frame was written, false otherwise.
// ---------------------------------------------------------------------------
bool write_frame(int fd, const std::vector<uint8_t>& packet) {
    std::vector<uint8_t> out;
    if (!console::encode(packet.data(), packet.size(), out)) return false;   // too long for len16

    std::size_t done = 0;
    while (done < out.size()) {
        ssize_t w = ::write(fd, out.data() + done, out.size() - done);
        if (w > 0) { done += static_cast<std::size_t>(w); continue; }    // partial write, keep going
        if (w < 0 && errno == EINTR) continue;                          // signal, retry
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, 1000) <= 0) return false;                // driver stuck
            continue;
        }
        return false;                                                   // real I/O error
    }
    return true;
}

// ---------------------------------------------------------------------------
// read_frame()
// ------------
// Read loop that assembles exactly one console frame.
// - One overall deadline; every poll() waits only for what is left of it.
// - Bytes are read one at a time so nothing of a following frame is consumed.
// - Shell output between frames is skipped by the decoder.
// - Pending input is consumed before a hang-up is reported.
//
// Returns: Ok with the packet in `out`, Timeout, Closed, or Error.
// ---------------------------------------------------------------------------
IoStatus read_frame(int fd, std::vector<uint8_t>& out, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    console::decoder dec;
    out.clear();
    uint8_t byte = 0;
    pollfd pfd{fd, POLLIN, 0};

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (left <= 0) return IoStatus::Timeout;

        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) return IoStatus::Timeout;     // nothing more arrived in time
        if (pr < 0) {
            if (errno == EINTR) continue;          // signal, poll again
            return IoStatus::Error;
        }
        if (!(pfd.revents & POLLIN)) {
            if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return IoStatus::Closed;  // unplugged
            continue;
        }

        ssize_t n = ::read(fd, &byte, 1);
        if (n == 1) {
            if (dec.feed(byte, out)) return IoStatus::Ok;   // CRC-checked packet complete
        } else if (n == 0) {
            return IoStatus::Closed;               // EOF: peer closed
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return IoStatus::Error;
        }
    }
}

// ---------------------------------------------------------------------------
// flush_input()
// -------------
// Drops whatever the driver has queued on the receive side. Pipes and other
// non-tty descriptors have no input queue to flush; for those this is a no-op.
// ---------------------------------------------------------------------------
void flush_input(int fd) {
    if (fd < 0) return;
    if (::isatty(fd)) tcflush(fd, TCIFLUSH);      // receive queue only; pending writes stay
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace mcumgr
